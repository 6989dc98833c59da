/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    Logging.cpp

Abstract:

    This file contains the log sink used by the LOG_* macros.

--*/

#include "shimlog.h"

#ifdef WIN32
#include <io.h>
#include <process.h>
#else
#include <unistd.h>
#endif

#include <atomic>
#include <cstdio>

namespace vmshim::log {

std::atomic<int> g_LogFd{2};
std::atomic<Level> g_LogLevel{Level::Info};
thread_local std::string g_threadName = "main";

namespace {
    std::atomic<LogFunction*> g_exceptionCallback{nullptr};
}

int ProcessId() noexcept
{
#ifdef WIN32
    return _getpid();
#else
    return static_cast<int>(getpid());
#endif
}

void WriteLine(std::string_view Line) noexcept
{
    const int fd = g_LogFd.load(std::memory_order_relaxed);

#ifdef WIN32
    _write(fd, Line.data(), static_cast<unsigned int>(Line.size()));
#else
    while (!Line.empty())
    {
        const auto written = write(fd, Line.data(), Line.size());
        if (written <= 0)
        {
            return;
        }

        Line.remove_prefix(static_cast<size_t>(written));
    }
#endif
}

int InitializeLogging(int Fd, Level Severity, LogFunction* ExceptionCallback) noexcept
{
    if (Fd < 0)
    {
        return -1;
    }

    g_LogFd.store(Fd, std::memory_order_relaxed);
    g_LogLevel.store(Severity, std::memory_order_relaxed);
    g_exceptionCallback.store(ExceptionCallback);
    return 0;
}

void LogException(const char* Message, const char* Description) noexcept
{
    const auto callback = g_exceptionCallback.load();
    if (callback != nullptr)
    {
        callback(Message, Description);
        return;
    }

    LOG_ERROR("{}{}{}", Message == nullptr ? "" : Message, Message != nullptr && Description != nullptr ? ": " : "", Description == nullptr ? "" : Description);
}

const char* LevelToString(Level Severity) noexcept
{
    switch (Severity)
    {
    case Level::Error:
        return "error";
    case Level::Warning:
        return "warning";
    case Level::Info:
        return "info";
    case Level::Debug:
        return "debug";
    }

    return "unknown";
}

} // namespace vmshim::log
