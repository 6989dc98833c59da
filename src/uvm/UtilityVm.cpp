/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    UtilityVm.cpp

Abstract:

    This file contains the utility VM implementation.

--*/

#include "UtilityVm.h"
#include <filesystem>
#include <format>
#include <system_error>
#include "HcsErrors.h"
#include "stringshared.h"

using vmshim::uvm::ScsiAttachment;
using vmshim::uvm::UtilityVm;
using vmshim::uvm::VPMemAttachment;

namespace {

constexpr auto c_defaultOwner = "vmshim";

std::string ExecutableName()
{
    std::error_code error;
    const auto path = std::filesystem::read_symlink("/proc/self/exe", error);
    if (error || path.filename().empty())
    {
        return c_defaultOwner;
    }

    return path.filename().string();
}

} // namespace

UtilityVm::UtilityVm(std::string Id, std::string Owner, std::string Os, const UtilityVmOptions& Options) :
    m_id(std::move(Id)),
    m_owner(std::move(Owner)),
    m_os(std::move(Os)),
    m_shares(m_shareKind),
    m_deviceKind(Options.VPMemMaximumCount),
    m_devices(m_deviceKind),
    m_scsiKind(Options.ScsiControllerCount, m_os == c_osLinux),
    m_scsiDisks(m_scsiKind)
{
}

std::shared_ptr<UtilityVm> UtilityVm::Create(std::shared_ptr<hcs::HcsContext> Context, UtilityVmOptions Options)
{
    VMSHIM_THROW_HR_IF_MSG(
        VMSHIM_E_INVALIDARG,
        Options.OperatingSystem != c_osLinux && Options.OperatingSystem != c_osWindows,
        "Unsupported operating system '{}'",
        Options.OperatingSystem);

    if (Options.Id.empty())
    {
        Options.Id = shared::string::GenerateGuid();
    }

    if (Options.Owner.empty())
    {
        Options.Owner = ExecutableName();
    }

    log::OperationScope scope("vmshim::UtilityVm::Create", Options.Id);

    std::shared_ptr<UtilityVm> vm(new UtilityVm(Options.Id, Options.Owner, Options.OperatingSystem, Options));

    Options.Document["Owner"] = Options.Owner;
    vm->m_system = hcs::ComputeSystem::Create(std::move(Context), Options.Id, Options.Document);

    return vm;
}

const std::string& UtilityVm::Id() const noexcept
{
    return m_id;
}

const std::string& UtilityVm::Os() const noexcept
{
    return m_os;
}

const std::string& UtilityVm::Owner() const noexcept
{
    return m_owner;
}

std::shared_ptr<vmshim::hcs::ComputeSystem> UtilityVm::System() const noexcept
{
    return m_system;
}

void UtilityVm::Start()
{
    m_system->Start();
}

void UtilityVm::Terminate()
{
    m_system->Terminate();
}

void UtilityVm::Wait()
{
    m_system->Wait();
}

std::exception_ptr UtilityVm::ExitError()
{
    return m_system->ExitError();
}

void UtilityVm::Close()
{
    log::OperationScope scope("vmshim::UtilityVm::Close", m_id);

    try
    {
        m_system->Terminate();
    }
    VMSHIM_CATCH_LOG()

    m_system->Close();
}

void UtilityVm::ThrowIfNotOs(const char* Os) const
{
    VMSHIM_THROW_HR_IF_MSG(VMSHIM_E_NOT_SUPPORTED, m_os != Os, "Operation requires a {} utility VM, {} is {}", Os, m_id, m_os);
}

vmshim::uvm::ModifyFunction UtilityVm::ModifyLockHeld(const std::shared_lock<std::shared_mutex>& HandleLock)
{
    return [this, &HandleLock](const nlohmann::json& Request) { m_system->ModifyLockHeld(HandleLock, Request); };
}

void UtilityVm::AddShare(const std::string& HostPath, const nlohmann::json& GuestRequest, const std::optional<hcs::VirtualSmbShareOptions>& Options)
{
    log::OperationScope scope("vmshim::UtilityVm::AddShare", std::format("{} {}", m_id, HostPath));

    ThrowIfNotOs(c_osWindows);
    VMSHIM_THROW_HR_IF(VMSHIM_E_INVALIDARG, HostPath.empty());

    const auto handleLock = m_system->LockHandleShared();
    std::lock_guard lock(m_resourceLock);
    m_shares.AddLockHeld(HostPath, VSmbShareMetadata{GuestRequest, Options}, ModifyLockHeld(handleLock));
}

void UtilityVm::RemoveShare(const std::string& HostPath)
{
    log::OperationScope scope("vmshim::UtilityVm::RemoveShare", std::format("{} {}", m_id, HostPath));

    ThrowIfNotOs(c_osWindows);

    const auto handleLock = m_system->LockHandleShared();
    std::lock_guard lock(m_resourceLock);
    m_shares.RemoveLockHeld(HostPath, ModifyLockHeld(handleLock));
}

std::string UtilityVm::GetShareGuestPath(const std::string& HostPath)
{
    VMSHIM_THROW_HR_IF_MSG(VMSHIM_E_INVALIDARG, HostPath.empty(), "No host path passed to GetShareGuestPath for {}", m_id);

    std::lock_guard lock(m_resourceLock);
    return VSmbShareKind::GuestPath(m_shares.FindLockHeld(HostPath).Identity);
}

VPMemAttachment UtilityVm::AddDevice(const std::string& HostPath, const std::string& UvmPath, bool Expose)
{
    log::OperationScope scope("vmshim::UtilityVm::AddDevice", std::format("{} {}", m_id, HostPath));

    ThrowIfNotOs(c_osLinux);

    const auto handleLock = m_system->LockHandleShared();
    std::lock_guard lock(m_resourceLock);
    const auto attachment = m_devices.AddLockHeld(HostPath, VPMemDeviceMetadata{UvmPath, Expose}, ModifyLockHeld(handleLock));

    return {attachment.Identity, attachment.Metadata.UvmPath};
}

void UtilityVm::RemoveDevice(const std::string& HostPath)
{
    log::OperationScope scope("vmshim::UtilityVm::RemoveDevice", std::format("{} {}", m_id, HostPath));

    ThrowIfNotOs(c_osLinux);

    const auto handleLock = m_system->LockHandleShared();
    std::lock_guard lock(m_resourceLock);
    m_devices.RemoveLockHeld(HostPath, ModifyLockHeld(handleLock));
}

ScsiAttachment UtilityVm::AddScsiDisk(const std::string& HostPath, const std::string& UvmPath, bool ReadOnly)
{
    log::OperationScope scope("vmshim::UtilityVm::AddScsiDisk", std::format("{} {}", m_id, HostPath));

    VMSHIM_THROW_HR_IF(VMSHIM_E_INVALIDARG, HostPath.empty());

    const auto handleLock = m_system->LockHandleShared();
    std::lock_guard lock(m_resourceLock);
    const auto attachment = m_scsiDisks.AddLockHeld(HostPath, ScsiDiskMetadata{UvmPath, ReadOnly}, ModifyLockHeld(handleLock));

    return {attachment.Identity.Controller, attachment.Identity.Lun, attachment.Metadata.UvmPath};
}

void UtilityVm::RemoveScsiDisk(const std::string& HostPath)
{
    log::OperationScope scope("vmshim::UtilityVm::RemoveScsiDisk", std::format("{} {}", m_id, HostPath));

    const auto handleLock = m_system->LockHandleShared();
    std::lock_guard lock(m_resourceLock);
    m_scsiDisks.RemoveLockHeld(HostPath, ModifyLockHeld(handleLock));
}
