/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    VSmbShareKind.cpp

Abstract:

    This file contains the virtual SMB share resource kind implementation.

--*/

#include "VSmbShareKind.h"
#include <format>

using vmshim::uvm::VSmbShareKind;
using vmshim::uvm::VSmbShareMetadata;

namespace {

constexpr auto c_vsmbGuestPathPrefix = R"(\\?\VMSMB\VSMB-{dcc079ae-60ba-4d07-847c-3493609c0870}\)";

} // namespace

std::string VSmbShareKind::GuestPath(const std::string& ShareName)
{
    return c_vsmbGuestPathPrefix + ShareName;
}

const char* VSmbShareKind::Name() const noexcept
{
    return "VSMB share";
}

std::string VSmbShareKind::AllocateIdentity(const std::string&, const VSmbShareMetadata&)
{
    return std::format("s{:x}", ++m_counter);
}

void VSmbShareKind::ReleaseIdentity(const std::string&) noexcept
{
}

nlohmann::json VSmbShareKind::BuildAddRequest(const std::string& HostPath, const std::string& ShareName, VSmbShareMetadata& Metadata)
{
    hcs::ModifySettingRequest<hcs::VirtualSmbShare> request;
    request.ResourcePath = c_resourcePath;
    request.RequestType = hcs::ModifyRequestType::Add;
    request.Settings.Name = ShareName;
    request.Settings.Path = HostPath;
    request.Settings.Options = Metadata.Options;

    return request;
}

nlohmann::json VSmbShareKind::BuildRemoveRequest(const std::string&, const std::string& ShareName, const VSmbShareMetadata&)
{
    hcs::ModifySettingRequest<hcs::VirtualSmbShare> request;
    request.ResourcePath = c_resourcePath;
    request.RequestType = hcs::ModifyRequestType::Remove;
    request.Settings.Name = ShareName;

    return request;
}
