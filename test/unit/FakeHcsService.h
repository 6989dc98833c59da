/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    FakeHcsService.h

Abstract:

    This file contains a scriptable in-memory host compute service used by
    the unit tests.

--*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "HcsContext.h"
#include "HostComputeService.h"

namespace vmshim::test {

struct FakeStreamState
{
    std::atomic<int> CloseCount{0};
    std::string Written;
};

class FakeStream : public hcs::IProcessStream
{
public:
    explicit FakeStream(std::shared_ptr<FakeStreamState> State) : m_state(std::move(State))
    {
    }

    size_t Read(gsl::span<std::byte> Buffer) override;

    size_t Write(gsl::span<const std::byte> Buffer) override;

    void Close() override;

private:
    std::shared_ptr<FakeStreamState> m_state;
};

// Every result can be overridden before the call that consumes it. Completions of
// pending system operations are delivered through the registered callback, or queued
// until one is registered.
class FakeHcsService : public hcs::IHostComputeService
{
public:
    HResult CreateResult = VMSHIM_HCS_E_OPERATION_PENDING;
    bool CompleteCreate = true;
    HResult CreateCompletion = VMSHIM_S_OK;

    HResult OpenResult = VMSHIM_S_OK;

    HResult StartResult = VMSHIM_HCS_E_OPERATION_PENDING;
    bool CompleteStart = true;
    HResult StartCompletion = VMSHIM_S_OK;
    std::chrono::milliseconds StartDelay{0};

    HResult PauseResult = VMSHIM_HCS_E_OPERATION_PENDING;
    bool CompletePause = true;
    HResult ResumeResult = VMSHIM_HCS_E_OPERATION_PENDING;
    bool CompleteResume = true;

    HResult ShutdownResult = VMSHIM_S_OK;
    HResult TerminateResult = VMSHIM_S_OK;

    // Successful shutdown and terminate requests report the exit like the host does.
    bool StopFiresExit = true;

    HResult PropertiesResult = VMSHIM_S_OK;
    bool EmptyProperties = false;
    std::string SystemType = "VirtualMachine";
    std::string RuntimeOsType = "Linux";

    HResult ModifyResult = VMSHIM_S_OK;
    std::chrono::milliseconds ModifyDelay{0};
    std::string EnumerateDocument = "[]";

    HResult UnregisterCallbackResult = VMSHIM_S_OK;

    HResult CreateProcessResult = VMSHIM_S_OK;
    bool ProvideStdio = true;
    HResult SignalResult = VMSHIM_S_OK;
    HResult TerminateProcessResult = VMSHIM_S_OK;
    HResult ModifyProcessResult = VMSHIM_S_OK;
    HResult ProcessPropertiesResult = VMSHIM_S_OK;
    std::uint32_t ProcessExitCode = 0;
    std::int32_t ProcessLastWaitResult = 0;

    std::atomic<int> CreateCalls{0};
    std::atomic<int> StartCalls{0};
    std::atomic<int> StartInProgress{0};
    std::atomic<int> MaxStartInProgress{0};
    std::atomic<int> ShutdownCalls{0};
    std::atomic<int> TerminateCalls{0};
    std::atomic<int> CloseSystemCalls{0};
    std::atomic<int> CloseProcessCalls{0};
    std::atomic<int> SignalCalls{0};
    std::atomic<int> TerminateProcessCalls{0};

    std::vector<std::string> ModifyRequests() const;

    std::vector<std::string> ProcessModifyRequests() const;

    std::string LastCreateDocument() const;

    std::string LastPropertyQuery() const;

    hcs::HcsHandle LastSystem() const;

    hcs::HcsHandle LastProcess() const;

    std::shared_ptr<FakeStreamState> Stdin(hcs::HcsHandle Process) const;

    std::shared_ptr<FakeStreamState> Stdout(hcs::HcsHandle Process) const;

    bool IsOpen(hcs::HcsHandle Handle) const;

    size_t OpenHandles() const;

    void FireSystemExited(hcs::HcsHandle System, HResult Result = VMSHIM_S_OK, const std::string& Data = {});

    void FireProcessExited(hcs::HcsHandle Process);

    void FireServiceDisconnect(hcs::HcsHandle Handle);

    void Fire(hcs::HcsHandle Handle, hcs::NotificationKind Kind, HResult Result, const std::string& Data = {});

    hcs::HostResult CreateComputeSystem(const std::string& Id, const std::string& Configuration, hcs::HcsHandle& System) override;

    hcs::HostResult OpenComputeSystem(const std::string& Id, hcs::HcsHandle& System) override;

    hcs::HostResult StartComputeSystem(hcs::HcsHandle System, const std::string& Options) override;

    hcs::HostResult ShutdownComputeSystem(hcs::HcsHandle System, const std::string& Options) override;

    hcs::HostResult TerminateComputeSystem(hcs::HcsHandle System, const std::string& Options) override;

    hcs::HostResult PauseComputeSystem(hcs::HcsHandle System, const std::string& Options) override;

    hcs::HostResult ResumeComputeSystem(hcs::HcsHandle System, const std::string& Options) override;

    hcs::HostResult GetComputeSystemProperties(hcs::HcsHandle System, const std::string& Query, std::string& Properties) override;

    hcs::HostResult ModifyComputeSystem(hcs::HcsHandle System, const std::string& Configuration) override;

    hcs::HostResult EnumerateComputeSystems(const std::string& Query, std::string& ComputeSystems) override;

    HResult CloseComputeSystem(hcs::HcsHandle System) override;

    HResult RegisterComputeSystemCallback(hcs::HcsHandle System, hcs::HcsNotificationCallback Callback, hcs::HcsHandle& CallbackHandle) override;

    HResult UnregisterComputeSystemCallback(hcs::HcsHandle CallbackHandle) override;

    hcs::HostResult CreateProcess(hcs::HcsHandle System, const std::string& Parameters, hcs::HcsProcessInformation& Information, hcs::HcsHandle& Process) override;

    hcs::HostResult OpenProcess(hcs::HcsHandle System, std::uint32_t ProcessId, hcs::HcsHandle& Process) override;

    hcs::HostResult SignalProcess(hcs::HcsHandle Process, const std::string& Options) override;

    hcs::HostResult TerminateProcess(hcs::HcsHandle Process) override;

    hcs::HostResult ModifyProcess(hcs::HcsHandle Process, const std::string& Settings) override;

    hcs::HostResult GetProcessProperties(hcs::HcsHandle Process, std::string& Properties) override;

    hcs::HostResult GetProcessInfo(hcs::HcsHandle Process, hcs::HcsProcessInformation& Information) override;

    HResult CloseProcess(hcs::HcsHandle Process) override;

    HResult RegisterProcessCallback(hcs::HcsHandle Process, hcs::HcsNotificationCallback Callback, hcs::HcsHandle& CallbackHandle) override;

    HResult UnregisterProcessCallback(hcs::HcsHandle CallbackHandle) override;

private:
    struct Pending
    {
        hcs::NotificationKind Kind;
        HResult Result;
        std::string Data;
    };

    struct HandleState
    {
        std::string Id;
        std::uint32_t Pid = 0;
        bool Open = true;
        hcs::HcsNotificationCallback Callback;
        std::vector<Pending> Queued;
        std::shared_ptr<FakeStreamState> Stdin;
        std::shared_ptr<FakeStreamState> Stdout;
        std::shared_ptr<FakeStreamState> Stderr;
    };

    hcs::HcsHandle NewHandleLockHeld(std::string Id, std::uint32_t Pid);

    HResult RegisterCallback(hcs::HcsHandle Handle, hcs::HcsNotificationCallback Callback, hcs::HcsHandle& CallbackHandle);

    void FillStdioLockHeld(HandleState& State, hcs::HcsProcessInformation& Information);

    mutable std::mutex m_lock;
    std::map<hcs::HcsHandle, HandleState> m_handles;
    hcs::HcsHandle m_nextHandle = 100;
    std::uint32_t m_nextPid = 1000;
    hcs::HcsHandle m_lastSystem = 0;
    hcs::HcsHandle m_lastProcess = 0;
    std::vector<std::string> m_modifyRequests;
    std::vector<std::string> m_processModifyRequests;
    std::string m_lastCreateDocument;
    std::string m_lastPropertyQuery;
};

// Short timeouts so that tests exercising them complete quickly.
inline config::ShimConfig TestConfig(int MaxParallelStart = 0)
{
    config::ShimConfig config;
    config.MaxParallelStart = MaxParallelStart;
    config.Timeouts.SystemCreate = std::chrono::milliseconds(2000);
    config.Timeouts.SystemStart = std::chrono::milliseconds(2000);
    config.Timeouts.SystemPause = std::chrono::milliseconds(2000);
    config.Timeouts.SystemResume = std::chrono::milliseconds(2000);
    config.Timeouts.ForceUnblockGracePeriod = std::chrono::milliseconds(100);
    config.LogLevel = log::Level::Warning;
    return config;
}

// Returns the error code the callable failed with, VMSHIM_S_OK if it returned.
template <typename TFunction>
HResult ErrorOf(TFunction&& Function)
{
    try
    {
        Function();
    }
    catch (const ResultException& e)
    {
        return e.GetErrorCode();
    }

    return VMSHIM_S_OK;
}

inline HResult ErrorOf(const std::exception_ptr& Exception)
{
    return Exception ? ResultFromExceptionPtr(Exception) : VMSHIM_S_OK;
}

} // namespace vmshim::test
