/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    HostComputeService.h

Abstract:

    This file contains the boundary to the host compute service. Every call
    takes UTF-8 JSON documents and opaque handles and returns the host result
    code together with the optional JSON event list.

--*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <gsl/gsl>
#include "shimresult.h"

namespace vmshim::hcs {

// Opaque host handle. Zero means closed.
using HcsHandle = std::uint64_t;

struct HostResult
{
    HResult Result = VMSHIM_S_OK;
    std::string Events;
};

// Asynchronous events delivered by the host for a compute system or process handle.
enum class NotificationKind
{
    SystemCreateCompleted,
    SystemStartCompleted,
    SystemPauseCompleted,
    SystemResumeCompleted,
    SystemExited,
    ProcessExited,
    ServiceDisconnect,
};

inline constexpr size_t c_notificationKindCount = 7;

const char* NotificationKindToString(NotificationKind Kind) noexcept;

using HcsNotificationCallback = std::function<void(NotificationKind Kind, HResult Result, const std::string& Data)>;

// One side of a process standard stream.
class IProcessStream
{
public:
    virtual ~IProcessStream() = default;

    // Returns the number of bytes read, zero at end of stream.
    virtual size_t Read(gsl::span<std::byte> Buffer) = 0;

    virtual size_t Write(gsl::span<const std::byte> Buffer) = 0;

    virtual void Close() = 0;
};

struct HcsProcessInformation
{
    std::uint32_t ProcessId = 0;
    std::unique_ptr<IProcessStream> StdInput;
    std::unique_ptr<IProcessStream> StdOutput;
    std::unique_ptr<IProcessStream> StdError;
};

class IHostComputeService
{
public:
    virtual ~IHostComputeService() = default;

    virtual HostResult CreateComputeSystem(const std::string& Id, const std::string& Configuration, HcsHandle& System) = 0;

    virtual HostResult OpenComputeSystem(const std::string& Id, HcsHandle& System) = 0;

    virtual HostResult StartComputeSystem(HcsHandle System, const std::string& Options) = 0;

    virtual HostResult ShutdownComputeSystem(HcsHandle System, const std::string& Options) = 0;

    virtual HostResult TerminateComputeSystem(HcsHandle System, const std::string& Options) = 0;

    virtual HostResult PauseComputeSystem(HcsHandle System, const std::string& Options) = 0;

    virtual HostResult ResumeComputeSystem(HcsHandle System, const std::string& Options) = 0;

    virtual HostResult GetComputeSystemProperties(HcsHandle System, const std::string& Query, std::string& Properties) = 0;

    virtual HostResult ModifyComputeSystem(HcsHandle System, const std::string& Configuration) = 0;

    virtual HostResult EnumerateComputeSystems(const std::string& Query, std::string& ComputeSystems) = 0;

    virtual HResult CloseComputeSystem(HcsHandle System) = 0;

    // Completions of operations issued before the registration are delivered once it happens.
    virtual HResult RegisterComputeSystemCallback(HcsHandle System, HcsNotificationCallback Callback, HcsHandle& CallbackHandle) = 0;

    // Returns once every callback in progress has completed.
    virtual HResult UnregisterComputeSystemCallback(HcsHandle CallbackHandle) = 0;

    virtual HostResult CreateProcess(HcsHandle System, const std::string& Parameters, HcsProcessInformation& Information, HcsHandle& Process) = 0;

    virtual HostResult OpenProcess(HcsHandle System, std::uint32_t ProcessId, HcsHandle& Process) = 0;

    virtual HostResult SignalProcess(HcsHandle Process, const std::string& Options) = 0;

    virtual HostResult TerminateProcess(HcsHandle Process) = 0;

    virtual HostResult ModifyProcess(HcsHandle Process, const std::string& Settings) = 0;

    virtual HostResult GetProcessProperties(HcsHandle Process, std::string& Properties) = 0;

    virtual HostResult GetProcessInfo(HcsHandle Process, HcsProcessInformation& Information) = 0;

    virtual HResult CloseProcess(HcsHandle Process) = 0;

    virtual HResult RegisterProcessCallback(HcsHandle Process, HcsNotificationCallback Callback, HcsHandle& CallbackHandle) = 0;

    virtual HResult UnregisterProcessCallback(HcsHandle CallbackHandle) = 0;
};

} // namespace vmshim::hcs
