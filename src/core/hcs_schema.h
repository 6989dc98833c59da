/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    hcs_schema.h

Abstract:

    This file contains the host compute service schema definitions.

--*/

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "JsonUtils.h"

#define OMIT_IF_EMPTY(Json, Object, Value) \
    if ((Object).Value.has_value()) \
    { \
        Json[#Value] = (Object).Value.value(); \
    }

#define ASSIGN_IF_PRESENT(Json, Object, Value) \
    if (Json.contains(#Value)) \
    { \
        (Object).Value = Json.at(#Value).get_to((Object).Value); \
    }

namespace vmshim::hcs {

enum class ModifyRequestType
{
    Add,
    Update,
    Remove
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ModifyRequestType,
    {
        {ModifyRequestType::Add, "Add"},
        {ModifyRequestType::Update, "Update"},
        {ModifyRequestType::Remove, "Remove"},
    })

template <typename TSettings>
struct ModifySettingRequest
{
    std::string ResourcePath;
    ModifyRequestType RequestType{};
    TSettings Settings{};
    std::optional<nlohmann::json> HostedSettings;
};

template <>
struct ModifySettingRequest<void>
{
    ModifySettingRequest() = default;
    std::string ResourcePath;
    ModifyRequestType RequestType{};
    std::optional<nlohmann::json> HostedSettings;
};

template <typename TSettings>
inline void to_json(nlohmann::json& j, const ModifySettingRequest<TSettings>& request)
{
    j = nlohmann::json{{"ResourcePath", request.ResourcePath}, {"RequestType", request.RequestType}};

    if constexpr (!std::is_same_v<TSettings, void>)
    {
        j["Settings"] = request.Settings;
    }

    OMIT_IF_EMPTY(j, request, HostedSettings);
}

template <typename TSettings>
inline void from_json(const nlohmann::json& j, ModifySettingRequest<TSettings>& request)
{
    j.at("ResourcePath").get_to(request.ResourcePath);
    j.at("RequestType").get_to(request.RequestType);

    if constexpr (!std::is_same_v<TSettings, void>)
    {
        j.at("Settings").get_to(request.Settings);
    }

    if (j.contains("HostedSettings"))
    {
        request.HostedSettings = j.at("HostedSettings");
    }
}

enum class AttachmentType
{
    VirtualDisk,
    PassThru
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    AttachmentType,
    {
        {AttachmentType::VirtualDisk, "VirtualDisk"},
        {AttachmentType::PassThru, "PassThru"},
    })

struct Attachment
{
    AttachmentType Type{};
    std::string Path;
    bool ReadOnly{};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Attachment, Type, Path, ReadOnly);
};

enum class PropertyType
{
    Statistics,
    ProcessList,
    MappedVirtualDisk,
    GuestConnection
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    PropertyType,
    {
        {PropertyType::Statistics, "Statistics"},
        {PropertyType::ProcessList, "ProcessList"},
        {PropertyType::MappedVirtualDisk, "MappedVirtualDisk"},
        {PropertyType::GuestConnection, "GuestConnection"},
    })

struct PropertyQuery
{
    std::vector<PropertyType> PropertyTypes;
};

inline void to_json(nlohmann::json& j, const PropertyQuery& query)
{
    j = nlohmann::json::object();
    if (!query.PropertyTypes.empty())
    {
        j["PropertyTypes"] = query.PropertyTypes;
    }
}

inline void from_json(const nlohmann::json& j, PropertyQuery& query)
{
    ASSIGN_IF_PRESENT(j, query, PropertyTypes);
}

struct ContainerProperties
{
    std::string Id;
    std::string State;
    std::string Name;
    std::string SystemType;
    std::string RuntimeOsType;
    std::string Owner;
    std::string RuntimeId;
    bool Stopped{};
    std::string ExitType;
};

inline void to_json(nlohmann::json& j, const ContainerProperties& properties)
{
    j = nlohmann::json{
        {"Id", properties.Id},
        {"State", properties.State},
        {"Name", properties.Name},
        {"SystemType", properties.SystemType},
        {"Owner", properties.Owner},
        {"RuntimeId", properties.RuntimeId},
        {"Stopped", properties.Stopped}};

    if (!properties.RuntimeOsType.empty())
    {
        j["RuntimeOsType"] = properties.RuntimeOsType;
    }

    if (!properties.ExitType.empty())
    {
        j["ExitType"] = properties.ExitType;
    }
}

inline void from_json(const nlohmann::json& j, ContainerProperties& properties)
{
    ASSIGN_IF_PRESENT(j, properties, Id);
    ASSIGN_IF_PRESENT(j, properties, State);
    ASSIGN_IF_PRESENT(j, properties, Name);
    ASSIGN_IF_PRESENT(j, properties, SystemType);
    ASSIGN_IF_PRESENT(j, properties, RuntimeOsType);
    ASSIGN_IF_PRESENT(j, properties, Owner);
    ASSIGN_IF_PRESENT(j, properties, RuntimeId);
    ASSIGN_IF_PRESENT(j, properties, Stopped);
    ASSIGN_IF_PRESENT(j, properties, ExitType);
}

struct ComputeSystemQuery
{
    std::vector<std::string> Ids;
    std::vector<std::string> Types;
    std::vector<std::string> Names;
    std::vector<std::string> Owners;
};

inline void to_json(nlohmann::json& j, const ComputeSystemQuery& query)
{
    j = nlohmann::json::object();
    if (!query.Ids.empty())
    {
        j["Ids"] = query.Ids;
    }

    if (!query.Types.empty())
    {
        j["Types"] = query.Types;
    }

    if (!query.Names.empty())
    {
        j["Names"] = query.Names;
    }

    if (!query.Owners.empty())
    {
        j["Owners"] = query.Owners;
    }
}

inline void from_json(const nlohmann::json& j, ComputeSystemQuery& query)
{
    ASSIGN_IF_PRESENT(j, query, Ids);
    ASSIGN_IF_PRESENT(j, query, Types);
    ASSIGN_IF_PRESENT(j, query, Names);
    ASSIGN_IF_PRESENT(j, query, Owners);
}

struct ProcessStatus
{
    std::uint32_t ProcessId{};
    bool Exited{};
    std::uint32_t ExitCode{};
    std::int32_t LastWaitResult{};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ProcessStatus, ProcessId, Exited, ExitCode, LastWaitResult);
};

inline constexpr auto c_processModifyConsoleSize = "ConsoleSize";
inline constexpr auto c_processModifyCloseHandle = "CloseHandle";
inline constexpr auto c_processStdIn = "StdIn";

struct ConsoleSize
{
    std::uint16_t Height{};
    std::uint16_t Width{};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ConsoleSize, Height, Width);
};

struct CloseHandle
{
    std::string Handle;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(CloseHandle, Handle);
};

struct ProcessModifyRequest
{
    std::string Operation;
    std::optional<hcs::ConsoleSize> ConsoleSize;
    std::optional<hcs::CloseHandle> CloseHandle;
};

inline void to_json(nlohmann::json& j, const ProcessModifyRequest& request)
{
    j = nlohmann::json{{"Operation", request.Operation}};
    OMIT_IF_EMPTY(j, request, ConsoleSize);
    OMIT_IF_EMPTY(j, request, CloseHandle);
}

inline void from_json(const nlohmann::json& j, ProcessModifyRequest& request)
{
    j.at("Operation").get_to(request.Operation);
    ASSIGN_IF_PRESENT(j, request, ConsoleSize);
    ASSIGN_IF_PRESENT(j, request, CloseHandle);
}

// Only the options that are set are sent to the host.
struct VirtualSmbShareOptions
{
    bool ReadOnly{};
    bool ShareRead{};
    bool CacheIo{};
    bool NoOplocks{};
    bool TakeBackupPrivilege{};
    bool UseShareRootIdentity{};
    bool NoDirectmap{};
    bool SingleFileMapping{};
    bool SingleDirectoryMapping{};
    bool PseudoOplocks{};
    bool PseudoDirnotify{};
};

#define SET_IF_TRUE(Json, Object, Value) \
    if ((Object).Value) \
    { \
        Json[#Value] = true; \
    }

#define READ_FLAG(Json, Object, Value) (Object).Value = Json.value(#Value, false);

inline void to_json(nlohmann::json& j, const VirtualSmbShareOptions& options)
{
    j = nlohmann::json::object();
    SET_IF_TRUE(j, options, ReadOnly);
    SET_IF_TRUE(j, options, ShareRead);
    SET_IF_TRUE(j, options, CacheIo);
    SET_IF_TRUE(j, options, NoOplocks);
    SET_IF_TRUE(j, options, TakeBackupPrivilege);
    SET_IF_TRUE(j, options, UseShareRootIdentity);
    SET_IF_TRUE(j, options, NoDirectmap);
    SET_IF_TRUE(j, options, SingleFileMapping);
    SET_IF_TRUE(j, options, SingleDirectoryMapping);
    SET_IF_TRUE(j, options, PseudoOplocks);
    SET_IF_TRUE(j, options, PseudoDirnotify);
}

inline void from_json(const nlohmann::json& j, VirtualSmbShareOptions& options)
{
    READ_FLAG(j, options, ReadOnly);
    READ_FLAG(j, options, ShareRead);
    READ_FLAG(j, options, CacheIo);
    READ_FLAG(j, options, NoOplocks);
    READ_FLAG(j, options, TakeBackupPrivilege);
    READ_FLAG(j, options, UseShareRootIdentity);
    READ_FLAG(j, options, NoDirectmap);
    READ_FLAG(j, options, SingleFileMapping);
    READ_FLAG(j, options, SingleDirectoryMapping);
    READ_FLAG(j, options, PseudoOplocks);
    READ_FLAG(j, options, PseudoDirnotify);
}

#undef SET_IF_TRUE
#undef READ_FLAG

struct VirtualSmbShare
{
    std::string Name;
    std::string Path;
    std::optional<VirtualSmbShareOptions> Options;
};

inline void to_json(nlohmann::json& j, const VirtualSmbShare& share)
{
    j = nlohmann::json{{"Name", share.Name}};
    if (!share.Path.empty())
    {
        j["Path"] = share.Path;
    }

    OMIT_IF_EMPTY(j, share, Options);
}

inline void from_json(const nlohmann::json& j, VirtualSmbShare& share)
{
    j.at("Name").get_to(share.Name);
    ASSIGN_IF_PRESENT(j, share, Path);
    ASSIGN_IF_PRESENT(j, share, Options);
}

enum class VirtualPMemImageFormat
{
    Vhdx,
    Vhd1
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    VirtualPMemImageFormat,
    {
        {VirtualPMemImageFormat::Vhdx, "Vhdx"},
        {VirtualPMemImageFormat::Vhd1, "Vhd1"},
    })

struct VirtualPMemDevice
{
    std::string HostPath;
    bool ReadOnly{};
    VirtualPMemImageFormat ImageFormat{};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(VirtualPMemDevice, HostPath, ReadOnly, ImageFormat);
};

enum class NotificationType
{
    None,
    GracefulExit,
    ForcedExit,
    UnexpectedExit,
    Unknown
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    NotificationType,
    {
        {NotificationType::None, "None"},
        {NotificationType::GracefulExit, "GracefulExit"},
        {NotificationType::ForcedExit, "ForcedExit"},
        {NotificationType::UnexpectedExit, "UnexpectedExit"},
        {NotificationType::Unknown, "Unknown"},
    })

struct SystemExitStatus
{
    int32_t Status{};
    std::optional<NotificationType> ExitType;
};

inline void to_json(nlohmann::json& j, const SystemExitStatus& s)
{
    j = nlohmann::json{{"Status", s.Status}};
    OMIT_IF_EMPTY(j, s, ExitType);
}

inline void from_json(const nlohmann::json& j, SystemExitStatus& s)
{
    s.Status = j.at("Status").get<int32_t>();
    ASSIGN_IF_PRESENT(j, s, ExitType);
}

} // namespace vmshim::hcs

#undef OMIT_IF_EMPTY
#undef ASSIGN_IF_PRESENT
