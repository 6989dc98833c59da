/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ShimConfig.h

Abstract:

    This file contains the process-wide settings: start throttling, operation
    timeouts and log verbosity.

--*/

#pragma once

#include <chrono>
#include <optional>
#include "shimlog.h"

namespace vmshim::config {

inline constexpr auto c_configEnvironment = "VMSHIM_CONFIG";
inline constexpr auto c_maxParallelStartEnvironment = "VMSHIM_MAX_PARALLEL_START";
inline constexpr auto c_timeoutOperationsEnvironment = "VMSHIM_TIMEOUT_OPERATIONS";
inline constexpr auto c_timeoutSystemCreateEnvironment = "VMSHIM_TIMEOUT_SYSTEMCREATE";
inline constexpr auto c_timeoutSystemStartEnvironment = "VMSHIM_TIMEOUT_SYSTEMSTART";
inline constexpr auto c_timeoutSystemPauseEnvironment = "VMSHIM_TIMEOUT_SYSTEMPAUSE";
inline constexpr auto c_timeoutSystemResumeEnvironment = "VMSHIM_TIMEOUT_SYSTEMRESUME";

inline constexpr std::chrono::seconds c_defaultOperationTimeout{240};
inline constexpr std::chrono::milliseconds c_defaultForceUnblockGracePeriod{1000};

struct OperationTimeouts
{
    std::chrono::milliseconds SystemCreate{c_defaultOperationTimeout};
    std::chrono::milliseconds SystemStart{c_defaultOperationTimeout};
    std::chrono::milliseconds SystemPause{c_defaultOperationTimeout};
    std::chrono::milliseconds SystemResume{c_defaultOperationTimeout};

    // How long a process wait stays blocked after the host reported the process gone.
    std::chrono::milliseconds ForceUnblockGracePeriod{c_defaultForceUnblockGracePeriod};
};

class ShimConfig
{
public:
    // Parses Path (or the file named by VMSHIM_CONFIG when Path is null), then applies
    // the environment overrides. A missing file leaves the defaults in place.
    static ShimConfig Load(const char* Path = nullptr);

    void ParseConfigFile(const char* Path);

    void ApplyEnvironment();

    // Zero or less means unlimited.
    int MaxParallelStart = 0;
    OperationTimeouts Timeouts;
    log::Level LogLevel = log::Level::Info;

private:
    void ResolveTimeouts();

    std::optional<int> m_operationsSeconds;
    std::optional<int> m_systemCreateSeconds;
    std::optional<int> m_systemStartSeconds;
    std::optional<int> m_systemPauseSeconds;
    std::optional<int> m_systemResumeSeconds;
};

} // namespace vmshim::config
