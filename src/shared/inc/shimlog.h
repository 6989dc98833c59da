/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    shimlog.h

Abstract:

    This file contains the logging macros and the operation scope helper.

--*/

#pragma once

#include <atomic>
#include <exception>
#include <format>
#include <string>
#include <string_view>
#include "shimresult.h"

namespace vmshim::log {

enum class Level
{
    Error = 3,
    Warning = 4,
    Info = 6,
    Debug = 7
};

extern std::atomic<int> g_LogFd;
extern std::atomic<Level> g_LogLevel;
extern thread_local std::string g_threadName;

int ProcessId() noexcept;

void WriteLine(std::string_view Line) noexcept;

inline bool IsEnabled(Level Severity) noexcept
{
    return static_cast<int>(Severity) <= static_cast<int>(g_LogLevel.load(std::memory_order_relaxed));
}

template <typename... Args>
void LogImpl(Level Severity, const std::format_string<Args...>& format, Args&&... args) noexcept
try
{
    if (!IsEnabled(Severity))
    {
        return;
    }

    auto logline = std::format(format, std::forward<Args>(args)...);
    if (logline.empty())
    {
        return;
    }

    if (logline.back() != '\n')
    {
        logline.push_back('\n');
    }

    WriteLine(logline);
}
catch (...)
{
    // Nothing can be reported if formatting the log line itself failed.
}

int InitializeLogging(int Fd, Level Severity, LogFunction* ExceptionCallback = nullptr) noexcept;

void LogException(const char* Message, const char* Description) noexcept;

const char* LevelToString(Level Severity) noexcept;

// Logs the begin and end of a host operation. The end line reports an error
// when the scope is left by an exception.
class OperationScope
{
public:
    OperationScope(const char* Operation, std::string_view Id) :
        m_operation(Operation), m_id(Id), m_exceptions(std::uncaught_exceptions())
    {
        LogImpl(Level::Debug, "<7>vmshim ({} - {}) DEBUG: {} - Begin Operation [{}]", ProcessId(), g_threadName, m_operation, m_id);
    }

    ~OperationScope()
    {
        if (std::uncaught_exceptions() > m_exceptions)
        {
            LogImpl(Level::Error, "<3>vmshim ({} - {}) ERROR: {} - End Operation - Error [{}]", ProcessId(), g_threadName, m_operation, m_id);
        }
        else
        {
            LogImpl(Level::Debug, "<7>vmshim ({} - {}) DEBUG: {} - End Operation - Success [{}]", ProcessId(), g_threadName, m_operation, m_id);
        }
    }

    OperationScope(const OperationScope&) = delete;
    OperationScope& operator=(const OperationScope&) = delete;

private:
    const char* m_operation;
    std::string m_id;
    int m_exceptions;
};

} // namespace vmshim::log

#define LOG_ERROR(str, ...) \
    { \
        ::vmshim::log::LogImpl( \
            ::vmshim::log::Level::Error, \
            "<3>vmshim ({} - {}) ERROR: {}:{}: " str "\n", \
            ::vmshim::log::ProcessId(), \
            ::vmshim::log::g_threadName, \
            __FUNCTION__, \
            __LINE__, \
            ##__VA_ARGS__); \
    }

#define LOG_WARNING(str, ...) \
    { \
        ::vmshim::log::LogImpl( \
            ::vmshim::log::Level::Warning, "<4>vmshim ({} - {}) WARNING: " str "\n", ::vmshim::log::ProcessId(), ::vmshim::log::g_threadName, ##__VA_ARGS__); \
    }

#define LOG_INFO(str, ...) \
    { \
        ::vmshim::log::LogImpl( \
            ::vmshim::log::Level::Info, "<6>vmshim ({} - {}): " str "\n", ::vmshim::log::ProcessId(), ::vmshim::log::g_threadName, ##__VA_ARGS__); \
    }

#define LOG_DEBUG(str, ...) \
    { \
        ::vmshim::log::LogImpl( \
            ::vmshim::log::Level::Debug, \
            "<7>vmshim ({} - {}) DEBUG: {}: " str "\n", \
            ::vmshim::log::ProcessId(), \
            ::vmshim::log::g_threadName, \
            __FUNCTION__, \
            ##__VA_ARGS__); \
    }
