/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    shimresult.h

Abstract:

    This file contains the error codes, the result exception type and the
    throw / catch helpers used across vmshim.

--*/

#pragma once

#include <cstdint>
#include <exception>
#include <format>
#include <new>
#include <source_location>
#include <string>
#include <type_traits>
#include <utility>

namespace vmshim {

using HResult = std::int32_t;

inline constexpr bool Succeeded(HResult Result) noexcept
{
    return Result >= 0;
}

inline constexpr bool Failed(HResult Result) noexcept
{
    return Result < 0;
}

inline constexpr HResult MakeShimError(std::uint32_t Code) noexcept
{
    return static_cast<HResult>(0x80040300u | (Code & 0xFFu));
}

} // namespace vmshim

#define VMSHIM_S_OK (static_cast<vmshim::HResult>(0))
#define VMSHIM_E_UNEXPECTED (static_cast<vmshim::HResult>(0x8000FFFFu))
#define VMSHIM_E_INVALIDARG (static_cast<vmshim::HResult>(0x80070057u))
#define VMSHIM_E_OUTOFMEMORY (static_cast<vmshim::HResult>(0x8007000Eu))

#define VMSHIM_E_ALREADY_CLOSED vmshim::MakeShimError(0x01)
#define VMSHIM_E_TIMEOUT vmshim::MakeShimError(0x02)
#define VMSHIM_E_INVALID_PROCESS_STATE vmshim::MakeShimError(0x03)
#define VMSHIM_E_NOT_EXITED vmshim::MakeShimError(0x04)
#define VMSHIM_E_NOT_ATTACHED vmshim::MakeShimError(0x05)
#define VMSHIM_E_NO_FREE_SLOT vmshim::MakeShimError(0x06)
#define VMSHIM_E_HANDLE_CLOSED vmshim::MakeShimError(0x07)
#define VMSHIM_E_UNEXPECTED_CONTAINER_EXIT vmshim::MakeShimError(0x08)
#define VMSHIM_E_UNEXPECTED_PROCESS_ABORT vmshim::MakeShimError(0x09)
#define VMSHIM_E_NOT_SUPPORTED vmshim::MakeShimError(0x0A)
#define VMSHIM_E_UNEXPECTED_VALUE vmshim::MakeShimError(0x0B)
#define VMSHIM_E_INVALID_JSON vmshim::MakeShimError(0x0C)

// Host compute service codes, with their winerror values.
#define VMSHIM_HCS_E_INVALID_STATE (static_cast<vmshim::HResult>(0x80370105u))
#define VMSHIM_HCS_E_UNEXPECTED_EXIT (static_cast<vmshim::HResult>(0x80370106u))
#define VMSHIM_HCS_E_INVALID_JSON (static_cast<vmshim::HResult>(0x8037010Du))
#define VMSHIM_HCS_E_SYSTEM_NOT_FOUND (static_cast<vmshim::HResult>(0x8037010Eu))
#define VMSHIM_HCS_E_SYSTEM_ALREADY_EXISTS (static_cast<vmshim::HResult>(0x8037010Fu))
#define VMSHIM_HCS_E_SYSTEM_ALREADY_STOPPED (static_cast<vmshim::HResult>(0x80370110u))
#define VMSHIM_HCS_E_OPERATION_PENDING (static_cast<vmshim::HResult>(0xC0370103u))
#define VMSHIM_E_ELEMENT_NOT_FOUND (static_cast<vmshim::HResult>(0x80070490u))
#define VMSHIM_E_PROC_NOT_FOUND (static_cast<vmshim::HResult>(0x8007007Fu))

namespace vmshim {

// Returns a short description for a library or host error code.
const char* ErrorCodeToString(HResult Result) noexcept;

typedef void LogFunction(const char* message, const char* exceptionDescription) noexcept;

namespace details {
    struct FailureInfo
    {
        const char* File;
        int Line;
        const char* Function;
    };

    inline FailureInfo ToFailureInfo(const std::source_location& Location) noexcept
    {
        return {Location.file_name(), static_cast<int>(Location.line()), Location.function_name()};
    }
} // namespace details

class ResultException : public std::exception
{
public:
    ResultException(HResult result, details::FailureInfo info, std::string message = {});

    const char* what() const noexcept override
    {
        return m_What.c_str();
    }

    HResult GetErrorCode() const noexcept
    {
        return m_Result;
    }

    const std::string& GetMessage() const noexcept
    {
        return m_Message;
    }

    const details::FailureInfo& GetFailureInfo() const noexcept
    {
        return m_Info;
    }

protected:
    // Used by derived types that compose their own description.
    void SetDescription(std::string description);

private:
    HResult m_Result;
    details::FailureInfo m_Info;
    std::string m_Message;
    std::string m_What;
};

namespace details {
    template <typename TLambda>
    class lambda_call
    {
    public:
        lambda_call(const lambda_call&) = delete;
        lambda_call& operator=(const lambda_call&) = delete;
        lambda_call& operator=(lambda_call&& other) = delete;

        explicit lambda_call(TLambda&& lambda) noexcept : m_lambda(std::move(lambda))
        {
            static_assert(std::is_same<decltype(lambda()), void>::value, "scope_exit lambdas must not have a return value");
        }

        lambda_call(lambda_call&& other) noexcept : m_lambda(std::move(other.m_lambda)), m_call(other.m_call)
        {
            other.m_call = false;
        }

        ~lambda_call() noexcept
        {
            reset();
        }

        // Ensures the scope_exit lambda will not be called
        void release() noexcept
        {
            m_call = false;
        }

        // Executes the scope_exit lambda immediately if not yet run; ensures it will not run again
        void reset() noexcept
        {
            if (m_call)
            {
                m_call = false;
                m_lambda();
            }
        }

        explicit operator bool() const noexcept
        {
            return m_call;
        }

    protected:
        TLambda m_lambda;
        bool m_call = true;
    };

    void LogFailure(const char* message, const char* exceptionDescription) noexcept;

    void LogCaughtException(const char* message) noexcept;

    template <typename TLambda>
    class lambda_call_log
    {
    public:
        lambda_call_log(const lambda_call_log&) = delete;
        lambda_call_log& operator=(const lambda_call_log&) = delete;

        explicit lambda_call_log(TLambda&& lambda) noexcept : m_lambda(std::move(lambda))
        {
        }

        lambda_call_log(lambda_call_log&& other) noexcept : m_lambda(std::move(other.m_lambda)), m_call(other.m_call)
        {
            other.m_call = false;
        }

        ~lambda_call_log() noexcept
        {
            reset();
        }

        void release() noexcept
        {
            m_call = false;
        }

        void reset() noexcept
        {
            if (m_call)
            {
                m_call = false;
                try
                {
                    m_lambda();
                }
                catch (...)
                {
                    LogCaughtException("scope_exit_log");
                }
            }
        }

    private:
        TLambda m_lambda;
        bool m_call = true;
    };

    [[noreturn]] inline void Throw(HResult error, FailureInfo info, std::string message = {})
    {
        throw ::vmshim::ResultException(error, info, std::move(message));
    }
} // namespace details

template <typename TLambda>
[[nodiscard]] inline auto scope_exit(TLambda&& lambda) noexcept
{
    return details::lambda_call<TLambda>(std::forward<TLambda>(lambda));
}

// Same as scope_exit, but exceptions thrown by the lambda are logged instead of terminating.
template <typename TLambda>
[[nodiscard]] inline auto scope_exit_log(TLambda&& lambda) noexcept
{
    return details::lambda_call_log<TLambda>(std::forward<TLambda>(lambda));
}

inline HResult ResultFromCaughtException() noexcept
{
    try
    {
        throw;
    }
    catch (const ResultException& ex)
    {
        return ex.GetErrorCode();
    }
    catch (const std::bad_alloc&)
    {
        return VMSHIM_E_OUTOFMEMORY;
    }
    catch (...)
    {
    }

    // Unknown exception type.
    return VMSHIM_E_UNEXPECTED;
}

// Returns the code carried by a stored exception, or S_OK for a null pointer.
HResult ResultFromExceptionPtr(const std::exception_ptr& Exception) noexcept;

} // namespace vmshim

#define __VMSHIM_ERROR_INFO \
    ::vmshim::details::FailureInfo \
    { \
        __FILE__, __LINE__, __FUNCTION__ \
    }

#define VMSHIM_THROW_HR(Error) ::vmshim::details::Throw((Error), __VMSHIM_ERROR_INFO)
#define VMSHIM_THROW_HR_MSG(Error, Format, ...) \
    ::vmshim::details::Throw((Error), __VMSHIM_ERROR_INFO, std::format(Format, ##__VA_ARGS__))
#define VMSHIM_THROW_HR_IF(Error, Condition) \
    if ((Condition)) \
    { \
        VMSHIM_THROW_HR(Error); \
    }
#define VMSHIM_THROW_HR_IF_MSG(Error, Condition, Format, ...) \
    if ((Condition)) \
    { \
        VMSHIM_THROW_HR_MSG(Error, Format, ##__VA_ARGS__); \
    }
#define VMSHIM_THROW_IF_FAILED(Result) \
    { \
        const ::vmshim::HResult __result = (Result); \
        if (::vmshim::Failed(__result)) \
        { \
            VMSHIM_THROW_HR(__result); \
        } \
    }

#define VMSHIM_LOG_CAUGHT_EXCEPTION() ::vmshim::details::LogCaughtException(__FUNCTION__);
#define VMSHIM_LOG_CAUGHT_EXCEPTION_MSG(msg) ::vmshim::details::LogCaughtException(msg);
#define VMSHIM_CATCH_RETURN() \
    catch (...) \
    { \
        return ::vmshim::ResultFromCaughtException(); \
    }

#define VMSHIM_CATCH_LOG() \
    catch (...) \
    { \
        VMSHIM_LOG_CAUGHT_EXCEPTION(); \
    }
#define VMSHIM_CATCH_LOG_MSG(msg) \
    catch (...) \
    { \
        VMSHIM_LOG_CAUGHT_EXCEPTION_MSG(msg); \
    }
