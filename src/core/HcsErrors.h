/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    HcsErrors.h

Abstract:

    This file contains the exceptions raised for failed host compute service
    calls and the helpers classifying host result codes.

--*/

#pragma once

#include <cstdint>
#include <exception>
#include <source_location>
#include <string>
#include "shimresult.h"

namespace vmshim::hcs {

enum class ResultClass
{
    Success,
    Pending,
    AlreadyInDesiredState,
    NotFound,
    Failure
};

ResultClass ClassifyResult(HResult Result) noexcept;

// The compute system, process or element no longer exists on the host.
bool IsNotExist(HResult Result) noexcept;

bool IsAlreadyClosed(HResult Result) noexcept;

bool IsAlreadyStopped(HResult Result) noexcept;

bool IsPending(HResult Result) noexcept;

bool IsTimeout(HResult Result) noexcept;

bool IsNotAttached(HResult Result) noexcept;

class HcsException : public ResultException
{
public:
    HcsException(
        HResult Result, std::string Operation, std::string Events = {}, const std::source_location& Location = std::source_location::current());

    const std::string& Operation() const noexcept
    {
        return m_operation;
    }

    const std::string& Events() const noexcept
    {
        return m_events;
    }

private:
    std::string m_operation;
    std::string m_events;
};

class SystemException : public HcsException
{
public:
    SystemException(
        std::string SystemId,
        std::string Operation,
        std::string Extra,
        HResult Result,
        std::string Events = {},
        const std::source_location& Location = std::source_location::current());

    const std::string& SystemId() const noexcept
    {
        return m_systemId;
    }

    // The request document that was sent to the host, if any.
    const std::string& Extra() const noexcept
    {
        return m_extra;
    }

private:
    std::string m_systemId;
    std::string m_extra;
};

class ProcessException : public HcsException
{
public:
    ProcessException(
        std::string SystemId,
        std::uint32_t Pid,
        std::string Operation,
        HResult Result,
        std::string Events = {},
        const std::source_location& Location = std::source_location::current());

    const std::string& SystemId() const noexcept
    {
        return m_systemId;
    }

    std::uint32_t Pid() const noexcept
    {
        return m_pid;
    }

private:
    std::string m_systemId;
    std::uint32_t m_pid;
};

} // namespace vmshim::hcs
