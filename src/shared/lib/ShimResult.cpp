/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ShimResult.cpp

Abstract:

    This file contains the result exception and the error code descriptions.

--*/

#include "shimresult.h"
#include "shimlog.h"

namespace vmshim {

ResultException::ResultException(HResult result, details::FailureInfo info, std::string message) :
    m_Result{result}, m_Info{info}, m_Message{std::move(message)}
{
    SetDescription(m_Message.empty() ? std::string{ErrorCodeToString(m_Result)} : std::format("{}: {}", m_Message, ErrorCodeToString(m_Result)));
}

void ResultException::SetDescription(std::string description)
{
    m_What = std::format(
        "{} (0x{:08x}) @{}:{} ({})", description, static_cast<std::uint32_t>(m_Result), m_Info.File == nullptr ? "" : m_Info.File, m_Info.Line, m_Info.Function == nullptr ? "" : m_Info.Function);
}

const char* ErrorCodeToString(HResult Result) noexcept
{
    switch (Result)
    {
    case VMSHIM_S_OK:
        return "success";
    case VMSHIM_E_UNEXPECTED:
        return "unexpected failure";
    case VMSHIM_E_INVALIDARG:
        return "invalid argument";
    case VMSHIM_E_OUTOFMEMORY:
        return "out of memory";
    case VMSHIM_E_ALREADY_CLOSED:
        return "the handle has already been closed";
    case VMSHIM_E_TIMEOUT:
        return "timeout waiting for notification";
    case VMSHIM_E_INVALID_PROCESS_STATE:
        return "the process is in an invalid state for the attempted operation";
    case VMSHIM_E_NOT_EXITED:
        return "the compute system has not exited";
    case VMSHIM_E_NOT_ATTACHED:
        return "the resource is not attached";
    case VMSHIM_E_NO_FREE_SLOT:
        return "no free attachment slot";
    case VMSHIM_E_HANDLE_CLOSED:
        return "the handle generating this notification has been closed";
    case VMSHIM_E_UNEXPECTED_CONTAINER_EXIT:
        return "unexpected container exit";
    case VMSHIM_E_UNEXPECTED_PROCESS_ABORT:
        return "lost communication with compute service";
    case VMSHIM_E_NOT_SUPPORTED:
        return "not supported for this guest operating system";
    case VMSHIM_E_UNEXPECTED_VALUE:
        return "unexpected value returned from the compute service";
    case VMSHIM_E_INVALID_JSON:
        return "invalid json document";
    case VMSHIM_HCS_E_INVALID_STATE:
        return "the requested virtual machine or container operation is not valid in the current state";
    case VMSHIM_HCS_E_UNEXPECTED_EXIT:
        return "the virtual machine or container exited unexpectedly";
    case VMSHIM_HCS_E_INVALID_JSON:
        return "the json document is invalid";
    case VMSHIM_HCS_E_SYSTEM_NOT_FOUND:
        return "a virtual machine or container with the specified identifier does not exist";
    case VMSHIM_HCS_E_SYSTEM_ALREADY_EXISTS:
        return "a virtual machine or container with the specified identifier already exists";
    case VMSHIM_HCS_E_SYSTEM_ALREADY_STOPPED:
        return "the virtual machine or container with the specified identifier is not running";
    case VMSHIM_HCS_E_OPERATION_PENDING:
        return "the operation is pending";
    case VMSHIM_E_ELEMENT_NOT_FOUND:
        return "element not found";
    case VMSHIM_E_PROC_NOT_FOUND:
        return "the specified procedure could not be found";
    }

    return "unknown error";
}

HResult ResultFromExceptionPtr(const std::exception_ptr& Exception) noexcept
{
    if (!Exception)
    {
        return VMSHIM_S_OK;
    }

    try
    {
        std::rethrow_exception(Exception);
    }
    catch (...)
    {
        return ResultFromCaughtException();
    }
}

namespace details {

    void LogFailure(const char* message, const char* exceptionDescription) noexcept
    {
        log::LogException(message, exceptionDescription);
    }

    void LogCaughtException(const char* message) noexcept
    {
        try
        {
            throw;
        }
        catch (const std::exception& ex)
        {
            LogFailure(message, ex.what());
        }
        catch (...)
        {
            LogFailure(message, nullptr);
        }
    }

} // namespace details

} // namespace vmshim
