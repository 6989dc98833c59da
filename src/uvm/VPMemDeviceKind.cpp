/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    VPMemDeviceKind.cpp

Abstract:

    This file contains the virtual persistent memory device resource kind
    implementation.

--*/

#include "VPMemDeviceKind.h"
#include <format>
#include "guest_schema.h"
#include "hcs_schema.h"

using vmshim::uvm::DeviceSlotTable;
using vmshim::uvm::VPMemDeviceKind;
using vmshim::uvm::VPMemDeviceMetadata;

VPMemDeviceKind::VPMemDeviceKind(std::uint32_t MaximumCount) : m_slots(MaximumCount)
{
}

std::string VPMemDeviceKind::ResourcePath(std::uint32_t DeviceNumber)
{
    return std::format("VirtualMachine/Devices/VirtualPMem/Devices/{}", DeviceNumber);
}

const char* VPMemDeviceKind::Name() const noexcept
{
    return "VPMem device";
}

std::uint32_t VPMemDeviceKind::AllocateIdentity(const std::string& HostPath, const VPMemDeviceMetadata&)
{
    return m_slots.Allocate(HostPath);
}

void VPMemDeviceKind::ReleaseIdentity(const std::uint32_t& DeviceNumber) noexcept
{
    m_slots.Release(DeviceNumber);
}

nlohmann::json VPMemDeviceKind::BuildAddRequest(const std::string& HostPath, const std::uint32_t& DeviceNumber, VPMemDeviceMetadata& Metadata)
{
    hcs::ModifySettingRequest<hcs::VirtualPMemDevice> request;
    request.ResourcePath = ResourcePath(DeviceNumber);
    request.RequestType = hcs::ModifyRequestType::Add;
    request.Settings.HostPath = HostPath;
    request.Settings.ReadOnly = true;
    request.Settings.ImageFormat = hcs::VirtualPMemImageFormat::Vhd1;

    if (Metadata.Expose || !Metadata.UvmPath.empty())
    {
        if (Metadata.UvmPath.empty())
        {
            Metadata.UvmPath = std::format("/tmp/v{}", DeviceNumber);
        }

        request.HostedSettings = nlohmann::json(hcs::guest::LCOWMappedVPMemDevice{DeviceNumber, Metadata.UvmPath});
    }

    return request;
}

nlohmann::json VPMemDeviceKind::BuildRemoveRequest(const std::string&, const std::uint32_t& DeviceNumber, const VPMemDeviceMetadata& Metadata)
{
    hcs::ModifySettingRequest<void> request;
    request.ResourcePath = ResourcePath(DeviceNumber);
    request.RequestType = hcs::ModifyRequestType::Remove;

    // The guest unmounts the device before it is removed.
    if (!Metadata.UvmPath.empty())
    {
        request.HostedSettings = nlohmann::json(hcs::guest::LCOWMappedVPMemDevice{DeviceNumber, Metadata.UvmPath});
    }

    return request;
}

const DeviceSlotTable& VPMemDeviceKind::Slots() const noexcept
{
    return m_slots;
}
