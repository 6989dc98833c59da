/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    HcsErrors.cpp

Abstract:

    This file contains the host compute service exceptions and result
    classification helpers.

--*/

#include "HcsErrors.h"
#include <format>

namespace vmshim::hcs {

ResultClass ClassifyResult(HResult Result) noexcept
{
    if (Result == VMSHIM_HCS_E_OPERATION_PENDING)
    {
        return ResultClass::Pending;
    }

    if (Succeeded(Result))
    {
        return ResultClass::Success;
    }

    if (Result == VMSHIM_HCS_E_SYSTEM_ALREADY_STOPPED)
    {
        return ResultClass::AlreadyInDesiredState;
    }

    if (IsNotExist(Result))
    {
        return ResultClass::NotFound;
    }

    return ResultClass::Failure;
}

bool IsNotExist(HResult Result) noexcept
{
    return Result == VMSHIM_HCS_E_SYSTEM_NOT_FOUND || Result == VMSHIM_E_ELEMENT_NOT_FOUND || Result == VMSHIM_E_PROC_NOT_FOUND;
}

bool IsAlreadyClosed(HResult Result) noexcept
{
    return Result == VMSHIM_E_ALREADY_CLOSED;
}

bool IsAlreadyStopped(HResult Result) noexcept
{
    return Result == VMSHIM_HCS_E_SYSTEM_ALREADY_STOPPED || Result == VMSHIM_E_ELEMENT_NOT_FOUND || Result == VMSHIM_E_PROC_NOT_FOUND;
}

bool IsPending(HResult Result) noexcept
{
    return Result == VMSHIM_HCS_E_OPERATION_PENDING;
}

bool IsTimeout(HResult Result) noexcept
{
    return Result == VMSHIM_E_TIMEOUT;
}

bool IsNotAttached(HResult Result) noexcept
{
    return Result == VMSHIM_E_NOT_ATTACHED;
}

HcsException::HcsException(HResult Result, std::string Operation, std::string Events, const std::source_location& Location) :
    ResultException(Result, details::ToFailureInfo(Location)), m_operation(std::move(Operation)), m_events(std::move(Events))
{
    auto description = std::format("{}: {}", m_operation, ErrorCodeToString(Result));
    if (!m_events.empty())
    {
        description += std::format("\nevents: {}", m_events);
    }

    SetDescription(std::move(description));
}

SystemException::SystemException(
    std::string SystemId, std::string Operation, std::string Extra, HResult Result, std::string Events, const std::source_location& Location) :
    HcsException(Result, std::move(Operation), std::move(Events), Location), m_systemId(std::move(SystemId)), m_extra(std::move(Extra))
{
    auto description = std::format("{} {}: {}", HcsException::Operation(), m_systemId, ErrorCodeToString(Result));
    if (!HcsException::Events().empty())
    {
        description += std::format("\nevents: {}", HcsException::Events());
    }

    if (!m_extra.empty())
    {
        description += std::format("\n(extra info: {})", m_extra);
    }

    SetDescription(std::move(description));
}

ProcessException::ProcessException(
    std::string SystemId, std::uint32_t Pid, std::string Operation, HResult Result, std::string Events, const std::source_location& Location) :
    HcsException(Result, std::move(Operation), std::move(Events), Location), m_systemId(std::move(SystemId)), m_pid(Pid)
{
    auto description = std::format("{} {} pid {}: {}", HcsException::Operation(), m_systemId, m_pid, ErrorCodeToString(Result));
    if (!HcsException::Events().empty())
    {
        description += std::format("\nevents: {}", HcsException::Events());
    }

    SetDescription(std::move(description));
}

} // namespace vmshim::hcs
