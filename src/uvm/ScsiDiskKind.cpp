/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ScsiDiskKind.cpp

Abstract:

    This file contains the SCSI virtual disk resource kind implementation.

--*/

#include "ScsiDiskKind.h"
#include <format>
#include "guest_schema.h"
#include "hcs_schema.h"

using vmshim::uvm::ScsiDiskKind;
using vmshim::uvm::ScsiDiskMetadata;
using vmshim::uvm::ScsiLocation;

ScsiDiskKind::ScsiDiskKind(std::uint32_t ControllerCount, bool LinuxGuest) : m_linuxGuest(LinuxGuest)
{
    VMSHIM_THROW_HR_IF_MSG(
        VMSHIM_E_INVALIDARG,
        ControllerCount > c_maxScsiControllers,
        "{} SCSI controllers requested, at most {} are supported",
        ControllerCount,
        c_maxScsiControllers);

    m_controllers.reserve(ControllerCount);
    for (std::uint32_t i = 0; i < ControllerCount; i++)
    {
        m_controllers.emplace_back(c_lunsPerScsiController);
    }
}

std::string ScsiDiskKind::ResourcePath(const ScsiLocation& Location)
{
    return std::format("VirtualMachine/Devices/Scsi/{}/Attachments/{}", Location.Controller, Location.Lun);
}

const char* ScsiDiskKind::Name() const noexcept
{
    return "SCSI disk";
}

ScsiLocation ScsiDiskKind::AllocateIdentity(const std::string& HostPath, const ScsiDiskMetadata&)
{
    for (std::uint32_t controller = 0; controller < m_controllers.size(); controller++)
    {
        const auto lun = m_controllers[controller].TryAllocate(HostPath);
        if (lun.has_value())
        {
            return {controller, lun.value()};
        }
    }

    VMSHIM_THROW_HR_MSG(VMSHIM_E_NO_FREE_SLOT, "No free SCSI location for {} on {} controllers", HostPath, m_controllers.size());
}

void ScsiDiskKind::ReleaseIdentity(const ScsiLocation& Location) noexcept
{
    if (Location.Controller < m_controllers.size())
    {
        m_controllers[Location.Controller].Release(Location.Lun);
    }
}

nlohmann::json ScsiDiskKind::BuildAddRequest(const std::string& HostPath, const ScsiLocation& Location, ScsiDiskMetadata& Metadata)
{
    hcs::ModifySettingRequest<hcs::Attachment> request;
    request.ResourcePath = ResourcePath(Location);
    request.RequestType = hcs::ModifyRequestType::Add;
    request.Settings.Type = hcs::AttachmentType::VirtualDisk;
    request.Settings.Path = HostPath;
    request.Settings.ReadOnly = Metadata.ReadOnly;

    if (m_linuxGuest && !Metadata.UvmPath.empty())
    {
        hcs::guest::LCOWMappedVirtualDisk disk;
        disk.MountPath = Metadata.UvmPath;
        disk.Lun = static_cast<std::uint8_t>(Location.Lun);
        disk.Controller = static_cast<std::uint8_t>(Location.Controller);
        disk.ReadOnly = Metadata.ReadOnly;
        request.HostedSettings = nlohmann::json(disk);
    }

    return request;
}

nlohmann::json ScsiDiskKind::BuildRemoveRequest(const std::string&, const ScsiLocation& Location, const ScsiDiskMetadata& Metadata)
{
    hcs::ModifySettingRequest<void> request;
    request.ResourcePath = ResourcePath(Location);
    request.RequestType = hcs::ModifyRequestType::Remove;

    if (m_linuxGuest && !Metadata.UvmPath.empty())
    {
        hcs::guest::LCOWMappedVirtualDisk disk;
        disk.MountPath = Metadata.UvmPath;
        disk.Lun = static_cast<std::uint8_t>(Location.Lun);
        disk.Controller = static_cast<std::uint8_t>(Location.Controller);
        disk.ReadOnly = Metadata.ReadOnly;
        request.HostedSettings = nlohmann::json(disk);
    }

    return request;
}
