/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    VPMemDeviceKind.h

Abstract:

    This file contains the virtual persistent memory device resource kind
    used by Linux utility VMs to expose read-only layers.

--*/

#pragma once

#include <cstdint>
#include <string>
#include "DeviceSlotTable.h"
#include "ResourceLedger.h"

namespace vmshim::uvm {

inline constexpr std::uint32_t c_maxVPMemDevices = 128;

struct VPMemDeviceMetadata
{
    // Guest mount path. Empty when the device is not exposed.
    std::string UvmPath;
    bool Expose = false;
};

class VPMemDeviceKind : public IResourceKind<std::uint32_t, VPMemDeviceMetadata>
{
public:
    explicit VPMemDeviceKind(std::uint32_t MaximumCount = c_maxVPMemDevices);

    static std::string ResourcePath(std::uint32_t DeviceNumber);

    const char* Name() const noexcept override;

    std::uint32_t AllocateIdentity(const std::string& HostPath, const VPMemDeviceMetadata& Metadata) override;

    void ReleaseIdentity(const std::uint32_t& DeviceNumber) noexcept override;

    nlohmann::json BuildAddRequest(const std::string& HostPath, const std::uint32_t& DeviceNumber, VPMemDeviceMetadata& Metadata) override;

    nlohmann::json BuildRemoveRequest(const std::string& HostPath, const std::uint32_t& DeviceNumber, const VPMemDeviceMetadata& Metadata) override;

    const DeviceSlotTable& Slots() const noexcept;

private:
    DeviceSlotTable m_slots;
};

} // namespace vmshim::uvm
