/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ComputeProcess.cpp

Abstract:

    This file contains the compute process implementation.

--*/

#include "ComputeProcess.h"
#include <format>
#include "ComputeSystem.h"
#include "HcsErrors.h"
#include "JsonUtils.h"

using vmshim::hcs::ComputeProcess;
using vmshim::hcs::ProcessExitState;
using vmshim::hcs::ProcessStdio;

ComputeProcess::ComputeProcess(
    std::shared_ptr<HcsContext> Context, std::weak_ptr<ComputeSystem> System, std::string SystemId, std::uint32_t Pid, HcsHandle Handle) :
    m_context(std::move(Context)), m_system(std::move(System)), m_systemId(std::move(SystemId)), m_pid(Pid), m_handle(Handle)
{
}

ComputeProcess::~ComputeProcess()
{
    try
    {
        Close();
    }
    VMSHIM_CATCH_LOG()

    if (m_token != 0)
    {
        m_context->Dispatcher->Unregister(m_token);
    }

    // Wakes the force unblock thread if it is still in its grace period.
    m_exitSignal.Close(ProcessExitState{-1, std::make_exception_ptr(ProcessException(m_systemId, m_pid, "Wait", VMSHIM_E_ALREADY_CLOSED))});

    if (m_exitWatcher.joinable())
    {
        m_exitWatcher.join();
    }

    if (m_forceUnblock.joinable())
    {
        m_forceUnblock.join();
    }
}

std::shared_ptr<ComputeProcess> ComputeProcess::Attach(
    std::shared_ptr<HcsContext> Context,
    std::weak_ptr<ComputeSystem> System,
    std::string SystemId,
    std::uint32_t Pid,
    HcsHandle Handle,
    HcsProcessInformation* Stdio)
{
    std::shared_ptr<ComputeProcess> process(new ComputeProcess(std::move(Context), std::move(System), std::move(SystemId), Pid, Handle));
    if (Stdio != nullptr)
    {
        process->m_stdin = std::move(Stdio->StdInput);
        process->m_stdout = std::move(Stdio->StdOutput);
        process->m_stderr = std::move(Stdio->StdError);
    }

    auto closeOnFailure = scope_exit_log([&]() { process->Close(); });

    process->RegisterCallbackLockHeld();
    process->m_exitWatcher = std::thread(&ComputeProcess::ExitWatcher, process.get(), process->m_token);

    closeOnFailure.release();
    return process;
}

std::uint32_t ComputeProcess::Pid() const noexcept
{
    return m_pid;
}

const std::string& ComputeProcess::SystemId() const noexcept
{
    return m_systemId;
}

std::shared_ptr<vmshim::hcs::ComputeSystem> ComputeProcess::System() const
{
    return m_system.lock();
}

void ComputeProcess::ThrowIfClosedLockHeld(const char* Operation) const
{
    if (m_handle == 0)
    {
        throw ProcessException(m_systemId, m_pid, Operation, VMSHIM_E_ALREADY_CLOSED);
    }
}

void ComputeProcess::RegisterCallbackLockHeld()
{
    const auto token = m_context->Dispatcher->Register(m_systemId, m_pid);
    auto unregister = scope_exit([&]() { m_context->Dispatcher->Unregister(token); });

    HcsHandle callbackHandle = 0;
    const auto result = m_context->Service->RegisterProcessCallback(m_handle, m_context->Dispatcher->CallbackFor(token), callbackHandle);
    if (Failed(result))
    {
        throw ProcessException(m_systemId, m_pid, "RegisterCallback", result);
    }

    unregister.release();
    m_token = token;
    m_callbackHandle = callbackHandle;
}

void ComputeProcess::UnregisterCallbackLockHeld()
{
    if (m_callbackHandle != 0)
    {
        VMSHIM_THROW_IF_FAILED(m_context->Service->UnregisterProcessCallback(m_callbackHandle));
        m_callbackHandle = 0;
    }

    if (m_token != 0)
    {
        m_context->Dispatcher->Unregister(m_token);
        m_token = 0;
    }
}

void ComputeProcess::ExitWatcher(NotificationToken Token) noexcept
try
{
    log::g_threadName = std::format("process-watcher {}:{}", m_systemId, m_pid);
    log::OperationScope scope("vmshim::Process::waitBackground", std::format("{} pid {}", m_systemId, m_pid));

    ProcessExitState state;
    const auto notification = m_context->Dispatcher->Wait(Token, NotificationKind::ProcessExited);
    if (Failed(notification.Result))
    {
        const auto error = notification.Result == VMSHIM_E_HANDLE_CLOSED ? VMSHIM_E_ALREADY_CLOSED : notification.Result;
        state.Error = std::make_exception_ptr(ProcessException(m_systemId, m_pid, "Wait", error, notification.Data));
        LOG_ERROR("Failed wait for process {} in {}: {}", m_pid, m_systemId, ErrorCodeToString(error));
    }
    else
    {
        std::shared_lock lock(m_handleLock);

        // Close may have won the race for the handle.
        if (m_handle != 0)
        {
            std::string properties;
            const auto result = m_context->Service->GetProcessProperties(m_handle, properties);
            if (Failed(result.Result))
            {
                state.Error = std::make_exception_ptr(ProcessException(m_systemId, m_pid, "Wait", result.Result, result.Events));
            }
            else
            {
                try
                {
                    const auto status = shared::FromJson<ProcessStatus>(properties);
                    if (status.LastWaitResult != 0)
                    {
                        LOG_WARNING("Non-zero last wait result {} for process {} in {}", status.LastWaitResult, m_pid, m_systemId);
                    }
                    else
                    {
                        state.ExitCode = static_cast<int>(status.ExitCode);
                    }
                }
                catch (...)
                {
                    state.Error = std::make_exception_ptr(ProcessException(m_systemId, m_pid, "Wait", ResultFromCaughtException()));
                }
            }
        }
    }

    m_exitSignal.Close(std::move(state));
}
catch (...)
{
    VMSHIM_LOG_CAUGHT_EXCEPTION();
    m_exitSignal.Close(ProcessExitState{-1, std::current_exception()});
}

bool ComputeProcess::ProcessSignalResult(const char* Operation, const HostResult& Result)
{
    if (Succeeded(Result.Result))
    {
        return true;
    }

    if (Result.Result == VMSHIM_HCS_E_INVALID_STATE || Result.Result == VMSHIM_HCS_E_SYSTEM_NOT_FOUND || Result.Result == VMSHIM_E_ELEMENT_NOT_FOUND)
    {
        // The process is gone but the exit notification may never arrive.
        if (!m_exitSignal.IsClosed())
        {
            StartForceUnblock(Result.Result);
        }

        return false;
    }

    throw ProcessException(m_systemId, m_pid, Operation, Result.Result, Result.Events);
}

void ComputeProcess::StartForceUnblock(HResult Error)
{
    std::call_once(m_forceUnblockOnce, [&]() {
        m_forceUnblock = std::thread([this, Error]() {
            log::g_threadName = std::format("force-unblock {}:{}", m_systemId, m_pid);
            if (m_exitSignal.WaitFor(m_context->Timeouts.ForceUnblockGracePeriod).has_value())
            {
                return;
            }

            if (m_exitSignal.Close(ProcessExitState{-1, std::make_exception_ptr(ProcessException(m_systemId, m_pid, "Wait", Error))}))
            {
                LOG_WARNING("Force unblocking waits for process {} in {}: {}", m_pid, m_systemId, ErrorCodeToString(Error));
            }
        });
    });
}

bool ComputeProcess::Signal(const nlohmann::json& Options)
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::Process::Signal", std::format("{} pid {}", m_systemId, m_pid));

    ThrowIfClosedLockHeld("Signal");

    const auto options = Options.dump();
    LOG_DEBUG("HCS Process Signal Options [{}:{}]: {}", m_systemId, m_pid, options);

    return ProcessSignalResult("Signal", m_context->Service->SignalProcess(m_handle, options));
}

bool ComputeProcess::Kill()
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::Process::Kill", std::format("{} pid {}", m_systemId, m_pid));

    ThrowIfClosedLockHeld("Kill");

    return ProcessSignalResult("Kill", m_context->Service->TerminateProcess(m_handle));
}

void ComputeProcess::ModifyLockHeld(const char* Operation, const ProcessModifyRequest& Request)
{
    const auto settings = shared::ToJson(Request);
    const auto result = m_context->Service->ModifyProcess(m_handle, settings);
    if (Failed(result.Result))
    {
        throw ProcessException(m_systemId, m_pid, Operation, result.Result, result.Events);
    }
}

void ComputeProcess::ResizeConsole(std::uint16_t Width, std::uint16_t Height)
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::Process::ResizeConsole", std::format("{} pid {}", m_systemId, m_pid));

    ThrowIfClosedLockHeld("ResizeConsole");

    ProcessModifyRequest request;
    request.Operation = c_processModifyConsoleSize;
    request.ConsoleSize = hcs::ConsoleSize{Height, Width};
    ModifyLockHeld("ResizeConsole", request);
}

void ComputeProcess::CloseStdin()
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::Process::CloseStdin", std::format("{} pid {}", m_systemId, m_pid));

    ThrowIfClosedLockHeld("CloseStdin");

    ProcessModifyRequest request;
    request.Operation = c_processModifyCloseHandle;
    request.CloseHandle = hcs::CloseHandle{c_processStdIn};
    ModifyLockHeld("CloseStdin", request);

    std::lock_guard stdioLock(m_stdioLock);
    if (m_stdin && !m_stdinClosed && !m_stdioClosed)
    {
        m_stdin->Close();
    }

    m_stdinClosed = true;
}

ProcessStdio ComputeProcess::Stdio() const
{
    std::lock_guard lock(m_stdioLock);
    if (m_stdioClosed)
    {
        return {};
    }

    return {m_stdinClosed ? nullptr : m_stdin.get(), m_stdout.get(), m_stderr.get()};
}

vmshim::hcs::HcsProcessInformation ComputeProcess::StdioLegacy()
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::Process::StdioLegacy", std::format("{} pid {}", m_systemId, m_pid));

    ThrowIfClosedLockHeld("StdioLegacy");

    HcsProcessInformation information;
    const auto result = m_context->Service->GetProcessInfo(m_handle, information);
    if (Failed(result.Result))
    {
        throw ProcessException(m_systemId, m_pid, "StdioLegacy", result.Result, result.Events);
    }

    return information;
}

void ComputeProcess::Wait()
{
    const auto state = m_exitSignal.Wait();
    if (state.Error)
    {
        std::rethrow_exception(state.Error);
    }
}

ProcessExitState ComputeProcess::WaitForExit()
{
    return m_exitSignal.Wait();
}

int ComputeProcess::ExitCode()
{
    const auto state = m_exitSignal.TryGet();
    if (!state.has_value())
    {
        throw ProcessException(m_systemId, m_pid, "ExitCode", VMSHIM_E_INVALID_PROCESS_STATE);
    }

    if (state->Error)
    {
        std::rethrow_exception(state->Error);
    }

    return state->ExitCode;
}

void ComputeProcess::CloseStdio() noexcept
{
    std::lock_guard lock(m_stdioLock);
    if (m_stdioClosed)
    {
        return;
    }

    for (auto* stream : {m_stdinClosed ? nullptr : m_stdin.get(), m_stdout.get(), m_stderr.get()})
    {
        if (stream != nullptr)
        {
            try
            {
                stream->Close();
            }
            VMSHIM_CATCH_LOG()
        }
    }

    m_stdinClosed = true;
    m_stdioClosed = true;
}

void ComputeProcess::Close()
{
    std::unique_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::Process::Close", std::format("{} pid {}", m_systemId, m_pid));

    if (m_handle == 0)
    {
        return;
    }

    CloseStdio();

    try
    {
        UnregisterCallbackLockHeld();
    }
    catch (...)
    {
        throw ProcessException(m_systemId, m_pid, "Close", ResultFromCaughtException());
    }

    const auto result = m_context->Service->CloseProcess(m_handle);
    if (Failed(result))
    {
        throw ProcessException(m_systemId, m_pid, "Close", result);
    }

    m_handle = 0;
    m_exitSignal.Close(ProcessExitState{-1, std::make_exception_ptr(ProcessException(m_systemId, m_pid, "Wait", VMSHIM_E_ALREADY_CLOSED))});
}
