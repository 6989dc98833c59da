/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    VSmbShareKind.h

Abstract:

    This file contains the virtual SMB share resource kind used by Windows
    utility VMs.

--*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "ResourceLedger.h"
#include "hcs_schema.h"

namespace vmshim::uvm {

struct VSmbShareMetadata
{
    // Kept for the caller, never sent to the host.
    nlohmann::json GuestRequest;
    std::optional<hcs::VirtualSmbShareOptions> Options;
};

class VSmbShareKind : public IResourceKind<std::string, VSmbShareMetadata>
{
public:
    static constexpr auto c_resourcePath = "VirtualMachine/Devices/VirtualSmb/Shares";

    static std::string GuestPath(const std::string& ShareName);

    const char* Name() const noexcept override;

    // Share names are never reused, even if the host rejected the share.
    std::string AllocateIdentity(const std::string& HostPath, const VSmbShareMetadata& Metadata) override;

    void ReleaseIdentity(const std::string& ShareName) noexcept override;

    nlohmann::json BuildAddRequest(const std::string& HostPath, const std::string& ShareName, VSmbShareMetadata& Metadata) override;

    nlohmann::json BuildRemoveRequest(const std::string& HostPath, const std::string& ShareName, const VSmbShareMetadata& Metadata) override;

private:
    std::uint64_t m_counter = 0;
};

} // namespace vmshim::uvm
