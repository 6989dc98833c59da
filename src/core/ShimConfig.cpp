/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ShimConfig.cpp

Abstract:

    This file contains the settings loader.

--*/

#include "ShimConfig.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "configfile.h"
#include "stringshared.h"

using vmshim::config::ShimConfig;

namespace {

const std::map<std::string, vmshim::log::Level, vmshim::shared::string::CaseInsensitiveCompare> c_logLevels{
    {"error", vmshim::log::Level::Error},
    {"warning", vmshim::log::Level::Warning},
    {"info", vmshim::log::Level::Info},
    {"debug", vmshim::log::Level::Debug},
};

std::optional<int> ReadEnvironmentInt(const char* Name)
{
    const char* value = std::getenv(Name);
    if (value == nullptr || *value == '\0')
    {
        return {};
    }

    auto parsed = vmshim::shared::string::ParseInt(value);
    if (!parsed.has_value())
    {
        LOG_WARNING("Ignoring invalid value '{}' for {}", value, Name);
    }

    return parsed;
}

// Only positive values override.
void OverrideSeconds(const char* Name, std::optional<int>& Seconds)
{
    const auto value = ReadEnvironmentInt(Name);
    if (value.has_value() && value.value() > 0)
    {
        Seconds = value;
    }
}

} // namespace

ShimConfig ShimConfig::Load(const char* Path)
{
    ShimConfig config;
    if (Path == nullptr)
    {
        Path = std::getenv(c_configEnvironment);
    }

    if (Path != nullptr && *Path != '\0')
    {
        config.ParseConfigFile(Path);
    }

    config.ApplyEnvironment();
    return config;
}

void ShimConfig::ParseConfigFile(const char* Path)
{
    int forceUnblockMs = static_cast<int>(c_defaultForceUnblockGracePeriod.count());
    ConfigKeyPresence forceUnblockPresence = ConfigKeyPresence::Absent;

    std::vector<ConfigKey> keys = {
        ConfigKey("start.maxParallel", MaxParallelStart),
        ConfigKey("timeout.operations", m_operationsSeconds),
        ConfigKey("timeout.systemCreate", m_systemCreateSeconds),
        ConfigKey("timeout.systemStart", m_systemStartSeconds),
        ConfigKey("timeout.systemPause", m_systemPauseSeconds),
        ConfigKey("timeout.systemResume", m_systemResumeSeconds),
        ConfigKey("process.forceUnblockMs", forceUnblockMs, &forceUnblockPresence),
        ConfigKey("log.level", c_logLevels, LogLevel),
    };

    std::unique_ptr<FILE, decltype(&fclose)> file(fopen(Path, "r"), &fclose);
    if (!file)
    {
        const auto error = errno;
        if (error != ENOENT)
        {
            LOG_WARNING("Failed to open config file {}: {}", Path, strerror(error));
        }

        return;
    }

    if (::ParseConfigFile(keys, file.get(), (CFG_SKIP_INVALID_LINES | CFG_SKIP_UNKNOWN_VALUES), Path) != 0)
    {
        LOG_WARNING("Failed to read config file {}", Path);
    }

    if (forceUnblockPresence == ConfigKeyPresence::Present)
    {
        if (forceUnblockMs > 0)
        {
            Timeouts.ForceUnblockGracePeriod = std::chrono::milliseconds(forceUnblockMs);
        }
        else
        {
            LOG_WARNING("Ignoring non-positive process.forceUnblockMs {} in {}", forceUnblockMs, Path);
        }
    }

    ResolveTimeouts();
}

void ShimConfig::ApplyEnvironment()
{
    const auto maxParallel = ReadEnvironmentInt(c_maxParallelStartEnvironment);
    if (maxParallel.has_value() && maxParallel.value() >= 0)
    {
        MaxParallelStart = maxParallel.value();
    }

    OverrideSeconds(c_timeoutOperationsEnvironment, m_operationsSeconds);
    OverrideSeconds(c_timeoutSystemCreateEnvironment, m_systemCreateSeconds);
    OverrideSeconds(c_timeoutSystemStartEnvironment, m_systemStartSeconds);
    OverrideSeconds(c_timeoutSystemPauseEnvironment, m_systemPauseSeconds);
    OverrideSeconds(c_timeoutSystemResumeEnvironment, m_systemResumeSeconds);

    ResolveTimeouts();
}

void ShimConfig::ResolveTimeouts()
{
    auto toDuration = [](const std::optional<int>& Seconds, std::chrono::milliseconds Default) -> std::chrono::milliseconds {
        if (Seconds.has_value() && Seconds.value() > 0)
        {
            return std::chrono::seconds(Seconds.value());
        }

        return Default;
    };

    const auto operations = toDuration(m_operationsSeconds, c_defaultOperationTimeout);
    Timeouts.SystemCreate = toDuration(m_systemCreateSeconds, operations);
    Timeouts.SystemStart = toDuration(m_systemStartSeconds, operations);
    Timeouts.SystemPause = toDuration(m_systemPauseSeconds, operations);
    Timeouts.SystemResume = toDuration(m_systemResumeSeconds, operations);
}
