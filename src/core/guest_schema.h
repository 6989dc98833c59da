/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    guest_schema.h

Abstract:

    This file contains the resource descriptors that are forwarded to the
    guest through the host compute service.

--*/

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "JsonUtils.h"

namespace vmshim::hcs::guest {

struct Layer
{
    std::string Id;
    std::string Path;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Layer, Id, Path);
};

// For Windows guests the layers are applied as a filter at ContainerRootPath and
// ScratchPath is ignored. For Linux guests the layers and ScratchPath are unioned
// at ContainerRootPath.
struct CombinedLayers
{
    std::string ContainerRootPath;
    std::vector<Layer> Layers;
    std::string ScratchPath;
};

inline void to_json(nlohmann::json& j, const CombinedLayers& layers)
{
    j = nlohmann::json::object();
    if (!layers.ContainerRootPath.empty())
    {
        j["ContainerRootPath"] = layers.ContainerRootPath;
    }

    if (!layers.Layers.empty())
    {
        j["Layers"] = layers.Layers;
    }

    if (!layers.ScratchPath.empty())
    {
        j["ScratchPath"] = layers.ScratchPath;
    }
}

inline void from_json(const nlohmann::json& j, CombinedLayers& layers)
{
    layers.ContainerRootPath = j.value("ContainerRootPath", std::string{});
    layers.Layers = j.value("Layers", std::vector<Layer>{});
    layers.ScratchPath = j.value("ScratchPath", std::string{});
}

// SCSI attached disk, mounted at MountPath in the guest.
struct LCOWMappedVirtualDisk
{
    std::string MountPath;
    std::uint8_t Lun{};
    std::uint8_t Controller{};
    bool ReadOnly{};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(LCOWMappedVirtualDisk, MountPath, Lun, Controller, ReadOnly);
};

// Plan 9 share.
struct LCOWMappedDirectory
{
    std::string MountPath;
    std::int32_t Port{};
    std::string ShareName;
    bool ReadOnly{};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(LCOWMappedDirectory, MountPath, Port, ShareName, ReadOnly);
};

// Read-only layer over VPMem.
struct LCOWMappedVPMemDevice
{
    std::uint32_t DeviceNumber{};
    std::string MountPath;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(LCOWMappedVPMemDevice, DeviceNumber, MountPath);
};

enum class ResourceType
{
    MappedDirectory,
    MappedVirtualDisk,
    Network,
    CombinedLayers,
    VPMemDevice
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ResourceType,
    {
        {ResourceType::MappedDirectory, "MappedDirectory"},
        {ResourceType::MappedVirtualDisk, "MappedVirtualDisk"},
        {ResourceType::Network, "Network"},
        {ResourceType::CombinedLayers, "CombinedLayers"},
        {ResourceType::VPMemDevice, "VPMemDevice"},
    })

struct GuestRequest
{
    std::string RequestType;
    guest::ResourceType ResourceType{};
    nlohmann::json Settings;
};

inline void to_json(nlohmann::json& j, const GuestRequest& request)
{
    j = nlohmann::json{{"RequestType", request.RequestType}, {"ResourceType", request.ResourceType}};
    if (!request.Settings.is_null())
    {
        j["Settings"] = request.Settings;
    }
}

inline void from_json(const nlohmann::json& j, GuestRequest& request)
{
    j.at("RequestType").get_to(request.RequestType);
    j.at("ResourceType").get_to(request.ResourceType);
    if (j.contains("Settings"))
    {
        request.Settings = j.at("Settings");
    }
}

struct SignalProcessOptionsLcow
{
    int Signal{};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(SignalProcessOptionsLcow, Signal);
};

enum class SignalValueWcow
{
    CtrlC,
    CtrlBreak,
    CtrlClose,
    CtrlLogOff,
    CtrlShutdown
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    SignalValueWcow,
    {
        {SignalValueWcow::CtrlC, "CtrlC"},
        {SignalValueWcow::CtrlBreak, "CtrlBreak"},
        {SignalValueWcow::CtrlClose, "CtrlClose"},
        {SignalValueWcow::CtrlLogOff, "CtrlLogOff"},
        {SignalValueWcow::CtrlShutdown, "CtrlShutdown"},
    })

struct SignalProcessOptionsWcow
{
    SignalValueWcow Signal{};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(SignalProcessOptionsWcow, Signal);
};

} // namespace vmshim::hcs::guest
