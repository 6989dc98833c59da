/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    UtilityVm.h

Abstract:

    This file contains the utility VM: a compute system together with the
    ref-counted shares and devices attached to it.

--*/

#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include "ComputeSystem.h"
#include "ResourceLedger.h"
#include "ScsiDiskKind.h"
#include "VPMemDeviceKind.h"
#include "VSmbShareKind.h"

namespace vmshim::uvm {

inline constexpr auto c_osLinux = "linux";
inline constexpr auto c_osWindows = "windows";

struct UtilityVmOptions
{
    // Defaults to a generated GUID.
    std::string Id;

    // Defaults to the executable name.
    std::string Owner;

    // "linux" or "windows".
    std::string OperatingSystem;

    // Compute system document. Its Owner is overwritten.
    nlohmann::json Document = nlohmann::json::object();

    std::uint32_t ScsiControllerCount = 1;
    std::uint32_t VPMemMaximumCount = c_maxVPMemDevices;
};

struct VPMemAttachment
{
    std::uint32_t DeviceNumber = 0;
    std::string UvmPath;
};

struct ScsiAttachment
{
    std::uint32_t Controller = 0;
    std::uint32_t Lun = 0;
    std::string UvmPath;
};

class UtilityVm
{
public:
    static std::shared_ptr<UtilityVm> Create(std::shared_ptr<hcs::HcsContext> Context, UtilityVmOptions Options);

    UtilityVm(const UtilityVm&) = delete;
    UtilityVm& operator=(const UtilityVm&) = delete;

    const std::string& Id() const noexcept;

    const std::string& Os() const noexcept;

    const std::string& Owner() const noexcept;

    std::shared_ptr<hcs::ComputeSystem> System() const noexcept;

    void Start();

    void Terminate();

    void Wait();

    std::exception_ptr ExitError();

    // Best-effort terminate, then release the compute system handle.
    void Close();

    // Windows guests only.
    void AddShare(const std::string& HostPath, const nlohmann::json& GuestRequest, const std::optional<hcs::VirtualSmbShareOptions>& Options);

    void RemoveShare(const std::string& HostPath);

    std::string GetShareGuestPath(const std::string& HostPath);

    // Linux guests only. The device is mounted in the guest when exposed or given a path.
    VPMemAttachment AddDevice(const std::string& HostPath, const std::string& UvmPath, bool Expose);

    void RemoveDevice(const std::string& HostPath);

    ScsiAttachment AddScsiDisk(const std::string& HostPath, const std::string& UvmPath, bool ReadOnly);

    void RemoveScsiDisk(const std::string& HostPath);

private:
    UtilityVm(std::string Id, std::string Owner, std::string Os, const UtilityVmOptions& Options);

    void ThrowIfNotOs(const char* Os) const;

    // The returned function borrows HandleLock.
    ModifyFunction ModifyLockHeld(const std::shared_lock<std::shared_mutex>& HandleLock);

    const std::string m_id;
    const std::string m_owner;
    const std::string m_os;
    std::shared_ptr<hcs::ComputeSystem> m_system;

    // Acquired after the compute system handle lock, never before.
    std::mutex m_resourceLock;
    VSmbShareKind m_shareKind;
    ResourceLedger<std::string, VSmbShareMetadata> m_shares;
    VPMemDeviceKind m_deviceKind;
    ResourceLedger<std::uint32_t, VPMemDeviceMetadata> m_devices;
    ScsiDiskKind m_scsiKind;
    ResourceLedger<ScsiLocation, ScsiDiskMetadata> m_scsiDisks;
};

} // namespace vmshim::uvm
