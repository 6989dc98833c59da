/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ComputeProcess.h

Abstract:

    This file contains the handle to a process running inside a compute
    system and its lifecycle operations.

--*/

#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include "ExitSignal.h"
#include "HcsContext.h"
#include "hcs_schema.h"

namespace vmshim::hcs {

class ComputeSystem;

struct ProcessExitState
{
    int ExitCode = -1;
    std::exception_ptr Error;
};

// Streams owned by the process. Valid until the process object is destroyed.
struct ProcessStdio
{
    IProcessStream* StdInput = nullptr;
    IProcessStream* StdOutput = nullptr;
    IProcessStream* StdError = nullptr;
};

class ComputeProcess
{
public:
    // Registers for the exit notification and starts the exit watcher. The process
    // handle is closed if this fails.
    static std::shared_ptr<ComputeProcess> Attach(
        std::shared_ptr<HcsContext> Context,
        std::weak_ptr<ComputeSystem> System,
        std::string SystemId,
        std::uint32_t Pid,
        HcsHandle Handle,
        HcsProcessInformation* Stdio = nullptr);

    ~ComputeProcess();

    ComputeProcess(const ComputeProcess&) = delete;
    ComputeProcess& operator=(const ComputeProcess&) = delete;

    std::uint32_t Pid() const noexcept;

    const std::string& SystemId() const noexcept;

    // Null once the owning compute system is gone.
    std::shared_ptr<ComputeSystem> System() const;

    // Returns false without error when the process is already gone.
    bool Signal(const nlohmann::json& Options);

    // Requests termination without waiting for the exit. Returns false without error when the process is already gone.
    bool Kill();

    void ResizeConsole(std::uint16_t Width, std::uint16_t Height);

    void CloseStdin();

    // Null streams for processes created without stdio. Closed by Close().
    ProcessStdio Stdio() const;

    // Fresh streams owned by the caller. Closing them does not close the process.
    HcsProcessInformation StdioLegacy();

    // Blocks until the process exits and rethrows the wait error, if any.
    void Wait();

    ProcessExitState WaitForExit();

    // Non-blocking. Throws VMSHIM_E_INVALID_PROCESS_STATE while the process runs.
    int ExitCode();

    // Releases the handle and the stdio streams without killing the process.
    void Close();

private:
    ComputeProcess(std::shared_ptr<HcsContext> Context, std::weak_ptr<ComputeSystem> System, std::string SystemId, std::uint32_t Pid, HcsHandle Handle);

    void ThrowIfClosedLockHeld(const char* Operation) const;

    void RegisterCallbackLockHeld();

    void UnregisterCallbackLockHeld();

    void ExitWatcher(NotificationToken Token) noexcept;

    bool ProcessSignalResult(const char* Operation, const HostResult& Result);

    void StartForceUnblock(HResult Error);

    void ModifyLockHeld(const char* Operation, const ProcessModifyRequest& Request);

    void CloseStdio() noexcept;

    const std::shared_ptr<HcsContext> m_context;
    const std::weak_ptr<ComputeSystem> m_system;
    const std::string m_systemId;
    const std::uint32_t m_pid;

    mutable std::shared_mutex m_handleLock;
    HcsHandle m_handle = 0;
    HcsHandle m_callbackHandle = 0;
    NotificationToken m_token = 0;

    // The streams stay allocated until destruction so that pointers handed out by Stdio() remain valid.
    mutable std::mutex m_stdioLock;
    std::unique_ptr<IProcessStream> m_stdin;
    std::unique_ptr<IProcessStream> m_stdout;
    std::unique_ptr<IProcessStream> m_stderr;
    bool m_stdinClosed = false;
    bool m_stdioClosed = false;

    ExitSignal<ProcessExitState> m_exitSignal;
    std::thread m_exitWatcher;
    std::once_flag m_forceUnblockOnce;
    std::thread m_forceUnblock;
};

} // namespace vmshim::hcs
