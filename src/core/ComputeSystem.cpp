/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ComputeSystem.cpp

Abstract:

    This file contains the compute system implementation.

    Every operation except Close holds the handle lock shared. Close holds it
    exclusively so that the handle is retired exactly once. A watcher thread,
    started once per attached handle, waits for the exit notification and
    publishes the terminal state through the exit signal.

--*/

#include "ComputeSystem.h"
#include <format>
#include "ComputeProcess.h"
#include "HcsErrors.h"
#include "stringshared.h"

using vmshim::hcs::ComputeProcess;
using vmshim::hcs::ComputeSystem;
using vmshim::hcs::ContainerProperties;
using vmshim::hcs::SystemExitState;

namespace vmshim::hcs {

namespace {

    constexpr auto c_systemTypeContainer = "container";
    constexpr auto c_osLinux = "linux";
    constexpr auto c_osWindows = "windows";

} // namespace

} // namespace vmshim::hcs

ComputeSystem::ComputeSystem(std::shared_ptr<HcsContext> Context, std::string Id) : m_context(std::move(Context)), m_id(std::move(Id))
{
}

ComputeSystem::~ComputeSystem()
{
    try
    {
        Close();
    }
    VMSHIM_CATCH_LOG()

    // Wakes the exit watcher even if Close failed.
    if (m_token != 0)
    {
        m_context->Dispatcher->Unregister(m_token);
    }

    if (m_exitWatcher.joinable())
    {
        m_exitWatcher.join();
    }
}

std::shared_ptr<ComputeSystem> ComputeSystem::Create(std::shared_ptr<HcsContext> Context, const std::string& Id, const nlohmann::json& Document)
{
    log::OperationScope scope("vmshim::ComputeSystem::Create", Id);

    std::shared_ptr<ComputeSystem> system(new ComputeSystem(Context, Id));

    const auto document = Document.dump();
    LOG_DEBUG("HCS ComputeSystem Document [{}]: {}", Id, document);

    HcsHandle handle = 0;
    const auto createResult = Context->Service->CreateComputeSystem(Id, document, handle);
    const auto resultClass = ClassifyResult(createResult.Result);
    if (resultClass != ResultClass::Success && resultClass != ResultClass::Pending)
    {
        throw SystemException(Id, "Create", document, createResult.Result, createResult.Events);
    }

    system->m_handle = handle;
    auto closeOnFailure = scope_exit_log([&]() { system->Close(); });

    try
    {
        system->RegisterCallbackLockHeld();
    }
    catch (...)
    {
        const auto error = ResultFromCaughtException();

        // Don't leak a half-created system on the host.
        try
        {
            system->Terminate();
        }
        VMSHIM_CATCH_LOG()

        throw SystemException(Id, "Create", {}, error);
    }

    const auto completion =
        Context->Dispatcher->ProcessAsyncResult(createResult, system->m_token, NotificationKind::SystemCreateCompleted, Context->Timeouts.SystemCreate);

    if (Failed(completion.Result))
    {
        if (IsTimeout(completion.Result))
        {
            try
            {
                system->Terminate();
            }
            VMSHIM_CATCH_LOG()
        }

        throw SystemException(Id, "Create", document, completion.Result, completion.Data);
    }

    system->StartExitWatcher();
    system->CacheProperties();

    closeOnFailure.release();
    return system;
}

std::shared_ptr<ComputeSystem> ComputeSystem::Open(std::shared_ptr<HcsContext> Context, const std::string& Id)
{
    log::OperationScope scope("vmshim::ComputeSystem::Open", Id);

    std::shared_ptr<ComputeSystem> system(new ComputeSystem(Context, Id));

    HcsHandle handle = 0;
    const auto result = Context->Service->OpenComputeSystem(Id, handle);
    if (Failed(result.Result))
    {
        throw SystemException(Id, "Open", {}, result.Result, result.Events);
    }

    system->m_handle = handle;
    auto closeOnFailure = scope_exit_log([&]() { system->Close(); });

    try
    {
        system->RegisterCallbackLockHeld();
    }
    catch (...)
    {
        throw SystemException(Id, "Open", {}, ResultFromCaughtException());
    }

    system->StartExitWatcher();
    system->CacheProperties();

    closeOnFailure.release();
    return system;
}

std::vector<ContainerProperties> ComputeSystem::Enumerate(const HcsContext& Context, const ComputeSystemQuery& Query)
{
    log::OperationScope scope("vmshim::GetComputeSystems", {});

    const auto query = shared::ToJson(Query);
    LOG_DEBUG("HCS ComputeSystem Query: {}", query);

    std::string computeSystems;
    const auto result = Context.Service->EnumerateComputeSystems(query, computeSystems);
    if (Failed(result.Result))
    {
        throw HcsException(result.Result, "vmshim::GetComputeSystems", result.Events);
    }

    if (computeSystems.empty())
    {
        throw HcsException(VMSHIM_E_UNEXPECTED_VALUE, "vmshim::GetComputeSystems");
    }

    try
    {
        return nlohmann::json::parse(computeSystems).get<std::vector<ContainerProperties>>();
    }
    catch (const nlohmann::json::exception& e)
    {
        LOG_ERROR("Failed to deserialize compute systems: '{}'. Error: {}", computeSystems, e.what());
        throw HcsException(VMSHIM_E_INVALID_JSON, "vmshim::GetComputeSystems");
    }
}

const std::string& ComputeSystem::Id() const noexcept
{
    return m_id;
}

const std::string& ComputeSystem::Os() const noexcept
{
    return m_os;
}

bool ComputeSystem::IsOci() const noexcept
{
    return m_os == c_osLinux && m_type == c_systemTypeContainer;
}

void ComputeSystem::ThrowIfClosedLockHeld(const char* Operation) const
{
    if (m_handle == 0)
    {
        throw SystemException(m_id, Operation, {}, VMSHIM_E_ALREADY_CLOSED);
    }
}

void ComputeSystem::RegisterCallbackLockHeld()
{
    const auto token = m_context->Dispatcher->Register(m_id);
    auto unregister = scope_exit([&]() { m_context->Dispatcher->Unregister(token); });

    HcsHandle callbackHandle = 0;
    VMSHIM_THROW_IF_FAILED(m_context->Service->RegisterComputeSystemCallback(m_handle, m_context->Dispatcher->CallbackFor(token), callbackHandle));

    unregister.release();
    m_token = token;
    m_callbackHandle = callbackHandle;
}

void ComputeSystem::UnregisterCallbackLockHeld()
{
    if (m_callbackHandle != 0)
    {
        // The host waits for the callbacks in progress to complete.
        VMSHIM_THROW_IF_FAILED(m_context->Service->UnregisterComputeSystemCallback(m_callbackHandle));
        m_callbackHandle = 0;
    }

    if (m_token != 0)
    {
        m_context->Dispatcher->Unregister(m_token);
        m_token = 0;
    }
}

void ComputeSystem::StartExitWatcher()
{
    m_exitWatcher = std::thread(&ComputeSystem::ExitWatcher, this, m_token);
}

void ComputeSystem::ExitWatcher(NotificationToken Token) noexcept
try
{
    log::g_threadName = std::format("exit-watcher {}", m_id);
    log::OperationScope scope("vmshim::ComputeSystem::WaitBackground", m_id);

    SystemExitState state;
    const auto notification = m_context->Dispatcher->Wait(Token, NotificationKind::SystemExited);
    if (!notification.Data.empty())
    {
        try
        {
            state.Status = shared::FromJson<SystemExitStatus>(notification.Data);
        }
        VMSHIM_CATCH_LOG_MSG("Failed to parse the system exit status")
    }

    if (notification.Result == VMSHIM_HCS_E_UNEXPECTED_EXIT)
    {
        LOG_INFO("vmshim::ComputeSystem::WaitBackground - unexpected system exit [{}]", m_id);
        state.UnexpectedExitError = std::make_exception_ptr(SystemException(m_id, "Wait", {}, notification.Result, notification.Data));
    }
    else if (notification.Result == VMSHIM_E_HANDLE_CLOSED)
    {
        state.WaitError = std::make_exception_ptr(SystemException(m_id, "Wait", {}, VMSHIM_E_ALREADY_CLOSED));
    }
    else if (Failed(notification.Result))
    {
        state.WaitError = std::make_exception_ptr(SystemException(m_id, "Wait", {}, notification.Result, notification.Data));
    }

    m_exitSignal.Close(std::move(state));
}
catch (...)
{
    VMSHIM_LOG_CAUGHT_EXCEPTION();
    m_exitSignal.Close(SystemExitState{std::current_exception(), {}, {}});
}

void ComputeSystem::CacheProperties()
{
    const auto properties = Properties();
    m_type = shared::string::ToLower(properties.SystemType);
    m_os = shared::string::ToLower(properties.RuntimeOsType);

    // Hosts that predate reporting the OS only ran Windows containers.
    if (m_os.empty() && m_type == c_systemTypeContainer)
    {
        m_os = c_osWindows;
    }
}

void ComputeSystem::Start()
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::ComputeSystem::Start", m_id);

    ThrowIfClosedLockHeld("Start");

    const auto admission = m_context->Throttle->Admit();

    m_context->Dispatcher->Reset(m_token, NotificationKind::SystemStartCompleted);
    const auto result = m_context->Service->StartComputeSystem(m_handle, {});
    const auto completion =
        m_context->Dispatcher->ProcessAsyncResult(result, m_token, NotificationKind::SystemStartCompleted, m_context->Timeouts.SystemStart);

    if (Failed(completion.Result))
    {
        if (IsTimeout(completion.Result))
        {
            try
            {
                StopLockHeld("Terminate", true);
            }
            VMSHIM_CATCH_LOG()
        }

        throw SystemException(m_id, "Start", {}, completion.Result, completion.Data);
    }
}

void ComputeSystem::Shutdown()
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::ComputeSystem::Shutdown", m_id);

    StopLockHeld("Shutdown", false);
}

void ComputeSystem::Terminate()
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::ComputeSystem::Terminate", m_id);

    StopLockHeld("Terminate", true);
}

void ComputeSystem::StopLockHeld(const char* Operation, bool Force)
{
    // The exit itself is observed by the exit watcher.
    if (m_handle == 0)
    {
        return;
    }

    const auto result = Force ? m_context->Service->TerminateComputeSystem(m_handle, {}) : m_context->Service->ShutdownComputeSystem(m_handle, {});
    switch (ClassifyResult(result.Result))
    {
    case ResultClass::Success:
    case ResultClass::Pending:
    case ResultClass::AlreadyInDesiredState:
        return;

    case ResultClass::NotFound:
        if (result.Result == VMSHIM_HCS_E_SYSTEM_NOT_FOUND)
        {
            return;
        }

        break;

    default:
        break;
    }

    throw SystemException(m_id, Operation, {}, result.Result, result.Events);
}

void ComputeSystem::Pause()
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::ComputeSystem::Pause", m_id);

    ThrowIfClosedLockHeld("Pause");

    m_context->Dispatcher->Reset(m_token, NotificationKind::SystemPauseCompleted);
    const auto result = m_context->Service->PauseComputeSystem(m_handle, {});
    const auto completion =
        m_context->Dispatcher->ProcessAsyncResult(result, m_token, NotificationKind::SystemPauseCompleted, m_context->Timeouts.SystemPause);

    if (Failed(completion.Result))
    {
        throw SystemException(m_id, "Pause", {}, completion.Result, completion.Data);
    }
}

void ComputeSystem::Resume()
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::ComputeSystem::Resume", m_id);

    ThrowIfClosedLockHeld("Resume");

    m_context->Dispatcher->Reset(m_token, NotificationKind::SystemResumeCompleted);
    const auto result = m_context->Service->ResumeComputeSystem(m_handle, {});
    const auto completion =
        m_context->Dispatcher->ProcessAsyncResult(result, m_token, NotificationKind::SystemResumeCompleted, m_context->Timeouts.SystemResume);

    if (Failed(completion.Result))
    {
        throw SystemException(m_id, "Resume", {}, completion.Result, completion.Data);
    }
}

ContainerProperties ComputeSystem::Properties(const std::vector<PropertyType>& Types)
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::ComputeSystem::Properties", m_id);

    ThrowIfClosedLockHeld("Properties");

    const auto query = shared::ToJson(PropertyQuery{Types});

    std::string properties;
    const auto result = m_context->Service->GetComputeSystemProperties(m_handle, query, properties);
    if (Failed(result.Result))
    {
        throw SystemException(m_id, "Properties", {}, result.Result, result.Events);
    }

    if (properties.empty())
    {
        throw SystemException(m_id, "Properties", {}, VMSHIM_E_UNEXPECTED_VALUE);
    }

    try
    {
        return shared::FromJson<ContainerProperties>(properties);
    }
    catch (...)
    {
        throw SystemException(m_id, "Properties", {}, ResultFromCaughtException());
    }
}

void ComputeSystem::Modify(const nlohmann::json& Settings)
{
    const auto lock = LockHandleShared();
    ModifyLockHeld(lock, Settings);
}

std::shared_lock<std::shared_mutex> ComputeSystem::LockHandleShared()
{
    return std::shared_lock(m_handleLock);
}

void ComputeSystem::ModifyLockHeld(const std::shared_lock<std::shared_mutex>& Lock, const nlohmann::json& Settings)
{
    VMSHIM_THROW_HR_IF(VMSHIM_E_INVALIDARG, !Lock.owns_lock() || Lock.mutex() != &m_handleLock);

    log::OperationScope scope("vmshim::ComputeSystem::Modify", m_id);

    ThrowIfClosedLockHeld("Modify");

    const auto request = Settings.dump();
    LOG_DEBUG("HCS ComputeSystem Modify Document [{}]: {}", m_id, request);

    const auto result = m_context->Service->ModifyComputeSystem(m_handle, request);
    if (Failed(result.Result))
    {
        throw SystemException(m_id, "Modify", request, result.Result, result.Events);
    }
}

std::shared_ptr<ComputeProcess> ComputeSystem::CreateProcess(const nlohmann::json& Parameters)
{
    return CreateProcessImpl("vmshim::ComputeSystem::CreateProcess", Parameters, true);
}

std::shared_ptr<ComputeProcess> ComputeSystem::CreateProcessNoStdio(const nlohmann::json& Parameters)
{
    return CreateProcessImpl("vmshim::ComputeSystem::CreateProcessNoStdio", Parameters, false);
}

std::shared_ptr<ComputeProcess> ComputeSystem::CreateProcessImpl(const char* Operation, const nlohmann::json& Parameters, bool KeepStdio)
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope(Operation, m_id);

    ThrowIfClosedLockHeld("CreateProcess");

    const auto configuration = Parameters.dump();
    LOG_DEBUG("HCS ComputeSystem Process Document [{}]: {}", m_id, configuration);

    HcsProcessInformation information;
    HcsHandle process = 0;
    const auto result = m_context->Service->CreateProcess(m_handle, configuration, information, process);
    if (Failed(result.Result))
    {
        throw SystemException(m_id, "CreateProcess", configuration, result.Result, result.Events);
    }

    LOG_DEBUG("HCS ComputeSystem CreateProcess PID [{}]: {}", m_id, information.ProcessId);

    if (!KeepStdio)
    {
        for (auto* stream : {&information.StdInput, &information.StdOutput, &information.StdError})
        {
            if (*stream)
            {
                try
                {
                    (*stream)->Close();
                }
                VMSHIM_CATCH_LOG()

                stream->reset();
            }
        }
    }

    try
    {
        return ComputeProcess::Attach(m_context, weak_from_this(), m_id, information.ProcessId, process, KeepStdio ? &information : nullptr);
    }
    catch (...)
    {
        throw SystemException(m_id, "CreateProcess", {}, ResultFromCaughtException());
    }
}

std::shared_ptr<ComputeProcess> ComputeSystem::OpenProcess(std::uint32_t Pid)
{
    std::shared_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::ComputeSystem::OpenProcess", std::format("{} pid {}", m_id, Pid));

    ThrowIfClosedLockHeld("OpenProcess");

    HcsHandle process = 0;
    const auto result = m_context->Service->OpenProcess(m_handle, Pid, process);
    if (Failed(result.Result))
    {
        throw SystemException(m_id, "OpenProcess", {}, result.Result, result.Events);
    }

    try
    {
        return ComputeProcess::Attach(m_context, weak_from_this(), m_id, Pid, process);
    }
    catch (...)
    {
        throw SystemException(m_id, "OpenProcess", {}, ResultFromCaughtException());
    }
}

void ComputeSystem::Wait()
{
    const auto state = m_exitSignal.Wait();
    if (state.WaitError)
    {
        std::rethrow_exception(state.WaitError);
    }
}

SystemExitState ComputeSystem::WaitForExit()
{
    return m_exitSignal.Wait();
}

std::exception_ptr ComputeSystem::ExitError()
{
    const auto state = m_exitSignal.TryGet();
    if (!state.has_value())
    {
        return std::make_exception_ptr(SystemException(m_id, "ExitError", {}, VMSHIM_E_NOT_EXITED));
    }

    if (state->WaitError)
    {
        return state->WaitError;
    }

    return state->UnexpectedExitError;
}

void ComputeSystem::Close()
{
    std::unique_lock lock(m_handleLock);
    log::OperationScope scope("vmshim::ComputeSystem::Close", m_id);

    if (m_handle == 0)
    {
        return;
    }

    try
    {
        UnregisterCallbackLockHeld();
    }
    catch (...)
    {
        throw SystemException(m_id, "Close", {}, ResultFromCaughtException());
    }

    const auto result = m_context->Service->CloseComputeSystem(m_handle);
    if (Failed(result))
    {
        throw SystemException(m_id, "Close", {}, result);
    }

    m_handle = 0;
    m_exitSignal.Close(SystemExitState{std::make_exception_ptr(SystemException(m_id, "Wait", {}, VMSHIM_E_ALREADY_CLOSED)), {}, {}});
}
