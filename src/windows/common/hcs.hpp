/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    hcs.hpp

Abstract:

    This file contains the host compute service binding over ComputeCore.

--*/

#pragma once

#include <windows.h>
#include <ComputeCore.h>
#include <wil/resource.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "HostComputeService.h"

namespace vmshim::windows::common::hcs {

using unique_hcs_operation = wil::unique_any<HCS_OPERATION, decltype(&HcsCloseOperation), HcsCloseOperation>;

using unique_hcs_system = wil::unique_any<HCS_SYSTEM, decltype(&HcsCloseComputeSystem), HcsCloseComputeSystem>;

using unique_hcs_process = wil::unique_any<HCS_PROCESS, decltype(&HcsCloseProcess), HcsCloseProcess>;

unique_hcs_operation CreateOperation(_In_opt_ void* Context = nullptr, _In_opt_ HCS_OPERATION_COMPLETION Callback = nullptr);

std::wstring ToWide(const std::string& String);

std::string ToUtf8(_In_opt_ PCWSTR String);

// Implements the host boundary over HcsXxx. Create, Start, Pause and Resume complete
// asynchronously through the callback registered for the compute system.
class HcsService : public vmshim::hcs::IHostComputeService
{
public:
    HcsService() = default;
    ~HcsService() override;

    HcsService(const HcsService&) = delete;
    HcsService& operator=(const HcsService&) = delete;

    vmshim::hcs::HostResult CreateComputeSystem(const std::string& Id, const std::string& Configuration, vmshim::hcs::HcsHandle& System) override;

    vmshim::hcs::HostResult OpenComputeSystem(const std::string& Id, vmshim::hcs::HcsHandle& System) override;

    vmshim::hcs::HostResult StartComputeSystem(vmshim::hcs::HcsHandle System, const std::string& Options) override;

    vmshim::hcs::HostResult ShutdownComputeSystem(vmshim::hcs::HcsHandle System, const std::string& Options) override;

    vmshim::hcs::HostResult TerminateComputeSystem(vmshim::hcs::HcsHandle System, const std::string& Options) override;

    vmshim::hcs::HostResult PauseComputeSystem(vmshim::hcs::HcsHandle System, const std::string& Options) override;

    vmshim::hcs::HostResult ResumeComputeSystem(vmshim::hcs::HcsHandle System, const std::string& Options) override;

    vmshim::hcs::HostResult GetComputeSystemProperties(vmshim::hcs::HcsHandle System, const std::string& Query, std::string& Properties) override;

    vmshim::hcs::HostResult ModifyComputeSystem(vmshim::hcs::HcsHandle System, const std::string& Configuration) override;

    vmshim::hcs::HostResult EnumerateComputeSystems(const std::string& Query, std::string& ComputeSystems) override;

    HResult CloseComputeSystem(vmshim::hcs::HcsHandle System) override;

    HResult RegisterComputeSystemCallback(
        vmshim::hcs::HcsHandle System, vmshim::hcs::HcsNotificationCallback Callback, vmshim::hcs::HcsHandle& CallbackHandle) override;

    HResult UnregisterComputeSystemCallback(vmshim::hcs::HcsHandle CallbackHandle) override;

    vmshim::hcs::HostResult CreateProcess(
        vmshim::hcs::HcsHandle System,
        const std::string& Parameters,
        vmshim::hcs::HcsProcessInformation& Information,
        vmshim::hcs::HcsHandle& Process) override;

    vmshim::hcs::HostResult OpenProcess(vmshim::hcs::HcsHandle System, std::uint32_t ProcessId, vmshim::hcs::HcsHandle& Process) override;

    vmshim::hcs::HostResult SignalProcess(vmshim::hcs::HcsHandle Process, const std::string& Options) override;

    vmshim::hcs::HostResult TerminateProcess(vmshim::hcs::HcsHandle Process) override;

    vmshim::hcs::HostResult ModifyProcess(vmshim::hcs::HcsHandle Process, const std::string& Settings) override;

    vmshim::hcs::HostResult GetProcessProperties(vmshim::hcs::HcsHandle Process, std::string& Properties) override;

    vmshim::hcs::HostResult GetProcessInfo(vmshim::hcs::HcsHandle Process, vmshim::hcs::HcsProcessInformation& Information) override;

    HResult CloseProcess(vmshim::hcs::HcsHandle Process) override;

    HResult RegisterProcessCallback(
        vmshim::hcs::HcsHandle Process, vmshim::hcs::HcsNotificationCallback Callback, vmshim::hcs::HcsHandle& CallbackHandle) override;

    HResult UnregisterProcessCallback(vmshim::hcs::HcsHandle CallbackHandle) override;

private:
    struct PendingNotification
    {
        vmshim::hcs::NotificationKind Kind;
        HResult Result;
        std::string Data;
    };

    // Owns the native handle and the notifications that arrived before a callback was registered.
    struct HandleEntry
    {
        unique_hcs_system System;
        unique_hcs_process Process;

        std::mutex Lock;
        vmshim::hcs::HcsNotificationCallback Callback;
        std::vector<PendingNotification> Pending;
    };

    struct OperationContext
    {
        std::shared_ptr<HandleEntry> Entry;
        vmshim::hcs::NotificationKind Kind;
    };

    static void CALLBACK OnEvent(_In_ HCS_EVENT* Event, _In_opt_ void* Context);

    static void CALLBACK OnOperationCompleted(_In_ HCS_OPERATION Operation, _In_opt_ void* Context);

    static void Deliver(HandleEntry& Entry, vmshim::hcs::NotificationKind Kind, HResult Result, std::string Data);

    vmshim::hcs::HcsHandle Insert(std::shared_ptr<HandleEntry> Entry);

    std::shared_ptr<HandleEntry> Find(vmshim::hcs::HcsHandle Handle) const;

    std::shared_ptr<HandleEntry> Remove(vmshim::hcs::HcsHandle Handle);

    vmshim::hcs::HostResult StartAsyncOperation(
        vmshim::hcs::HcsHandle System,
        vmshim::hcs::NotificationKind Kind,
        const std::string& Options,
        HRESULT(WINAPI* Operation)(HCS_SYSTEM, HCS_OPERATION, PCWSTR));

    mutable std::mutex m_lock;
    std::map<vmshim::hcs::HcsHandle, std::shared_ptr<HandleEntry>> m_handles;
    vmshim::hcs::HcsHandle m_nextHandle = 1;
};

} // namespace vmshim::windows::common::hcs
