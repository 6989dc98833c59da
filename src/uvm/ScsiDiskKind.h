/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ScsiDiskKind.h

Abstract:

    This file contains the SCSI virtual disk resource kind.

--*/

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "DeviceSlotTable.h"
#include "ResourceLedger.h"

namespace vmshim::uvm {

inline constexpr std::uint32_t c_maxScsiControllers = 4;
inline constexpr std::uint32_t c_lunsPerScsiController = 64;

struct ScsiLocation
{
    std::uint32_t Controller = 0;
    std::uint32_t Lun = 0;
};

struct ScsiDiskMetadata
{
    std::string UvmPath;
    bool ReadOnly = false;
};

class ScsiDiskKind : public IResourceKind<ScsiLocation, ScsiDiskMetadata>
{
public:
    // Guest mount requests are only sent to Linux guests.
    ScsiDiskKind(std::uint32_t ControllerCount, bool LinuxGuest);

    static std::string ResourcePath(const ScsiLocation& Location);

    const char* Name() const noexcept override;

    // First free LUN, scanning the controllers in order.
    ScsiLocation AllocateIdentity(const std::string& HostPath, const ScsiDiskMetadata& Metadata) override;

    void ReleaseIdentity(const ScsiLocation& Location) noexcept override;

    nlohmann::json BuildAddRequest(const std::string& HostPath, const ScsiLocation& Location, ScsiDiskMetadata& Metadata) override;

    nlohmann::json BuildRemoveRequest(const std::string& HostPath, const ScsiLocation& Location, const ScsiDiskMetadata& Metadata) override;

private:
    std::vector<DeviceSlotTable> m_controllers;
    bool m_linuxGuest;
};

} // namespace vmshim::uvm
