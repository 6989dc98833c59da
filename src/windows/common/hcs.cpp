/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    hcs.cpp

Abstract:

    This file contains the host compute service binding definitions.

--*/

#include "hcs.hpp"
#include <wil/result.h>
#include "HcsErrors.h"
#include "JsonUtils.h"
#include "hcs_schema.h"
#include "shimlog.h"

using vmshim::hcs::HcsHandle;
using vmshim::hcs::HcsNotificationCallback;
using vmshim::hcs::HcsProcessInformation;
using vmshim::hcs::HostResult;
using vmshim::hcs::NotificationKind;
using vmshim::windows::common::hcs::HcsService;

namespace {

// Read or write side of a process standard handle.
class HandleStream : public vmshim::hcs::IProcessStream
{
public:
    explicit HandleStream(HANDLE Handle) : m_handle(Handle)
    {
    }

    size_t Read(gsl::span<std::byte> Buffer) override
    {
        DWORD bytesRead = 0;
        if (!::ReadFile(m_handle.get(), Buffer.data(), gsl::narrow_cast<DWORD>(Buffer.size()), &bytesRead, nullptr))
        {
            const auto error = ::GetLastError();
            THROW_LAST_ERROR_IF(error != ERROR_BROKEN_PIPE && error != ERROR_HANDLE_EOF);
            return 0;
        }

        return bytesRead;
    }

    size_t Write(gsl::span<const std::byte> Buffer) override
    {
        DWORD bytesWritten = 0;
        THROW_IF_WIN32_BOOL_FALSE(::WriteFile(m_handle.get(), Buffer.data(), gsl::narrow_cast<DWORD>(Buffer.size()), &bytesWritten, nullptr));

        return bytesWritten;
    }

    void Close() override
    {
        m_handle.reset();
    }

private:
    wil::unique_handle m_handle;
};

std::unique_ptr<vmshim::hcs::IProcessStream> MakeStream(HANDLE Handle)
{
    if (Handle == nullptr || Handle == INVALID_HANDLE_VALUE)
    {
        return {};
    }

    return std::make_unique<HandleStream>(Handle);
}

void FillProcessInformation(const HCS_PROCESS_INFORMATION& Native, HcsProcessInformation& Information)
{
    Information.ProcessId = Native.ProcessId;
    Information.StdInput = MakeStream(Native.StdInput);
    Information.StdOutput = MakeStream(Native.StdOutput);
    Information.StdError = MakeStream(Native.StdError);
}

// Waits for a synchronous operation and returns its result document.
HostResult WaitForResult(HCS_OPERATION Operation, std::string* ResultDocument = nullptr)
{
    wil::unique_cotaskmem_string resultDocument;
    const auto result = ::HcsWaitForOperationResult(Operation, INFINITE, &resultDocument);

    HostResult hostResult{static_cast<vmshim::HResult>(result), {}};
    if (FAILED(result))
    {
        hostResult.Events = vmshim::windows::common::hcs::ToUtf8(resultDocument.get());
    }
    else if (ResultDocument != nullptr)
    {
        *ResultDocument = vmshim::windows::common::hcs::ToUtf8(resultDocument.get());
    }

    return hostResult;
}

} // namespace

vmshim::windows::common::hcs::unique_hcs_operation vmshim::windows::common::hcs::CreateOperation(_In_opt_ void* Context, _In_opt_ HCS_OPERATION_COMPLETION Callback)
{
    unique_hcs_operation operation(::HcsCreateOperation(Context, Callback));
    THROW_LAST_ERROR_IF_MSG(!operation, "HcsCreateOperation");

    return operation;
}

std::wstring vmshim::windows::common::hcs::ToWide(const std::string& String)
{
    if (String.empty())
    {
        return {};
    }

    const int size = ::MultiByteToWideChar(CP_UTF8, 0, String.data(), gsl::narrow_cast<int>(String.size()), nullptr, 0);
    THROW_LAST_ERROR_IF(size == 0);

    std::wstring wide(size, L'\0');
    THROW_LAST_ERROR_IF(::MultiByteToWideChar(CP_UTF8, 0, String.data(), gsl::narrow_cast<int>(String.size()), wide.data(), size) == 0);

    return wide;
}

std::string vmshim::windows::common::hcs::ToUtf8(_In_opt_ PCWSTR String)
{
    if (String == nullptr || *String == L'\0')
    {
        return {};
    }

    const int size = ::WideCharToMultiByte(CP_UTF8, 0, String, -1, nullptr, 0, nullptr, nullptr);
    THROW_LAST_ERROR_IF(size == 0);

    std::string utf8(size, '\0');
    THROW_LAST_ERROR_IF(::WideCharToMultiByte(CP_UTF8, 0, String, -1, utf8.data(), size, nullptr, nullptr) == 0);

    utf8.resize(size - 1);
    return utf8;
}

HcsService::~HcsService()
{
    std::map<HcsHandle, std::shared_ptr<HandleEntry>> handles;
    {
        std::lock_guard lock(m_lock);
        handles.swap(m_handles);
    }

    if (!handles.empty())
    {
        LOG_WARNING("{} host handles still open at shutdown", handles.size());
    }
}

HcsHandle HcsService::Insert(std::shared_ptr<HandleEntry> Entry)
{
    std::lock_guard lock(m_lock);
    const auto handle = m_nextHandle++;
    m_handles.emplace(handle, std::move(Entry));

    return handle;
}

std::shared_ptr<HcsService::HandleEntry> HcsService::Find(HcsHandle Handle) const
{
    std::lock_guard lock(m_lock);
    const auto it = m_handles.find(Handle);
    THROW_HR_IF(E_HANDLE, it == m_handles.end());

    return it->second;
}

std::shared_ptr<HcsService::HandleEntry> HcsService::Remove(HcsHandle Handle)
{
    std::lock_guard lock(m_lock);
    const auto it = m_handles.find(Handle);
    THROW_HR_IF(E_HANDLE, it == m_handles.end());

    auto entry = std::move(it->second);
    m_handles.erase(it);
    return entry;
}

void HcsService::Deliver(HandleEntry& Entry, NotificationKind Kind, HResult Result, std::string Data)
{
    std::lock_guard lock(Entry.Lock);
    if (!Entry.Callback)
    {
        Entry.Pending.emplace_back(PendingNotification{Kind, Result, std::move(Data)});
        return;
    }

    // The dispatcher never blocks, so the callback runs under the entry lock.
    Entry.Callback(Kind, Result, Data);
}

void CALLBACK HcsService::OnEvent(_In_ HCS_EVENT* Event, _In_opt_ void* Context)
try
{
    auto* entry = static_cast<HandleEntry*>(Context);
    auto data = ToUtf8(Event->EventData);

    switch (Event->Type)
    {
    case HcsEventSystemExited:
    {
        HResult result = VMSHIM_S_OK;
        if (!data.empty())
        {
            const auto status = vmshim::shared::FromJson<vmshim::hcs::SystemExitStatus>(data);
            if (status.ExitType == vmshim::hcs::NotificationType::UnexpectedExit)
            {
                result = VMSHIM_HCS_E_UNEXPECTED_EXIT;
            }
        }

        Deliver(*entry, NotificationKind::SystemExited, result, std::move(data));
        break;
    }

    case HcsEventProcessExited:
        Deliver(*entry, NotificationKind::ProcessExited, VMSHIM_S_OK, std::move(data));
        break;

    case HcsEventServiceDisconnect:
        Deliver(*entry, NotificationKind::ServiceDisconnect, VMSHIM_S_OK, std::move(data));
        break;

    default:
        LOG_DEBUG("Ignoring host event {}", static_cast<int>(Event->Type));
        break;
    }
}
CATCH_LOG()

void CALLBACK HcsService::OnOperationCompleted(_In_ HCS_OPERATION Operation, _In_opt_ void* Context)
try
{
    std::unique_ptr<OperationContext> context(static_cast<OperationContext*>(Context));
    unique_hcs_operation operation(Operation);

    wil::unique_cotaskmem_string resultDocument;
    const auto result = ::HcsGetOperationResult(Operation, &resultDocument);
    Deliver(*context->Entry, context->Kind, static_cast<HResult>(result), ToUtf8(resultDocument.get()));
}
CATCH_LOG()

HostResult HcsService::StartAsyncOperation(HcsHandle System, NotificationKind Kind, const std::string& Options, HRESULT(WINAPI* Operation)(HCS_SYSTEM, HCS_OPERATION, PCWSTR))
try
{
    auto entry = Find(System);
    auto context = std::make_unique<OperationContext>(OperationContext{entry, Kind});
    auto operation = CreateOperation(context.get(), &HcsService::OnOperationCompleted);

    const auto options = ToWide(Options);
    const auto result = Operation(entry->System.get(), operation.get(), options.empty() ? nullptr : options.c_str());
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    // Released by the completion callback.
    context.release();
    operation.release();
    return {VMSHIM_HCS_E_OPERATION_PENDING, {}};
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::CreateComputeSystem(const std::string& Id, const std::string& Configuration, HcsHandle& System)
try
{
    auto entry = std::make_shared<HandleEntry>();
    auto context = std::make_unique<OperationContext>(OperationContext{entry, NotificationKind::SystemCreateCompleted});
    auto operation = CreateOperation(context.get(), &HcsService::OnOperationCompleted);

    const auto result = ::HcsCreateComputeSystem(ToWide(Id).c_str(), ToWide(Configuration).c_str(), operation.get(), nullptr, &entry->System);
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    context.release();
    operation.release();

    THROW_IF_FAILED(::HcsSetComputeSystemCallback(entry->System.get(), HcsEventOptionNone, entry.get(), &HcsService::OnEvent));

    System = Insert(std::move(entry));
    return {VMSHIM_HCS_E_OPERATION_PENDING, {}};
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::OpenComputeSystem(const std::string& Id, HcsHandle& System)
try
{
    auto entry = std::make_shared<HandleEntry>();
    const auto result = ::HcsOpenComputeSystem(ToWide(Id).c_str(), GENERIC_ALL, &entry->System);
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    THROW_IF_FAILED(::HcsSetComputeSystemCallback(entry->System.get(), HcsEventOptionNone, entry.get(), &HcsService::OnEvent));

    System = Insert(std::move(entry));
    return {};
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::StartComputeSystem(HcsHandle System, const std::string& Options)
{
    return StartAsyncOperation(System, NotificationKind::SystemStartCompleted, Options, &::HcsStartComputeSystem);
}

HostResult HcsService::PauseComputeSystem(HcsHandle System, const std::string& Options)
{
    return StartAsyncOperation(System, NotificationKind::SystemPauseCompleted, Options, &::HcsPauseComputeSystem);
}

HostResult HcsService::ResumeComputeSystem(HcsHandle System, const std::string& Options)
{
    return StartAsyncOperation(System, NotificationKind::SystemResumeCompleted, Options, &::HcsResumeComputeSystem);
}

HostResult HcsService::ShutdownComputeSystem(HcsHandle System, const std::string& Options)
try
{
    const auto entry = Find(System);
    const auto operation = CreateOperation();
    const auto options = ToWide(Options);
    const auto result = ::HcsShutDownComputeSystem(entry->System.get(), operation.get(), options.empty() ? nullptr : options.c_str());
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    return WaitForResult(operation.get());
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::TerminateComputeSystem(HcsHandle System, const std::string& Options)
try
{
    const auto entry = Find(System);
    const auto operation = CreateOperation();
    const auto options = ToWide(Options);
    const auto result = ::HcsTerminateComputeSystem(entry->System.get(), operation.get(), options.empty() ? nullptr : options.c_str());
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    return WaitForResult(operation.get());
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::GetComputeSystemProperties(HcsHandle System, const std::string& Query, std::string& Properties)
try
{
    const auto entry = Find(System);
    const auto operation = CreateOperation();
    const auto query = ToWide(Query);
    const auto result = ::HcsGetComputeSystemProperties(entry->System.get(), operation.get(), query.empty() ? nullptr : query.c_str());
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    return WaitForResult(operation.get(), &Properties);
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::ModifyComputeSystem(HcsHandle System, const std::string& Configuration)
try
{
    const auto entry = Find(System);
    const auto operation = CreateOperation();
    const auto result = ::HcsModifyComputeSystem(entry->System.get(), operation.get(), ToWide(Configuration).c_str(), nullptr);
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    return WaitForResult(operation.get());
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::EnumerateComputeSystems(const std::string& Query, std::string& ComputeSystems)
try
{
    const auto operation = CreateOperation();
    const auto result = ::HcsEnumerateComputeSystems(ToWide(Query).c_str(), operation.get());
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    return WaitForResult(operation.get(), &ComputeSystems);
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

vmshim::HResult HcsService::CloseComputeSystem(HcsHandle System)
try
{
    auto entry = Remove(System);

    // Returns once the event callbacks in progress have completed.
    entry->System.reset();
    return VMSHIM_S_OK;
}
CATCH_RETURN()

vmshim::HResult HcsService::RegisterComputeSystemCallback(HcsHandle System, HcsNotificationCallback Callback, HcsHandle& CallbackHandle)
try
{
    const auto entry = Find(System);

    std::lock_guard lock(entry->Lock);
    THROW_HR_IF(E_ILLEGAL_STATE_CHANGE, static_cast<bool>(entry->Callback));

    entry->Callback = std::move(Callback);
    for (auto& pending : entry->Pending)
    {
        entry->Callback(pending.Kind, pending.Result, pending.Data);
    }

    entry->Pending.clear();
    CallbackHandle = System;
    return VMSHIM_S_OK;
}
CATCH_RETURN()

vmshim::HResult HcsService::UnregisterComputeSystemCallback(HcsHandle CallbackHandle)
try
{
    const auto entry = Find(CallbackHandle);

    std::lock_guard lock(entry->Lock);
    entry->Callback = nullptr;
    return VMSHIM_S_OK;
}
CATCH_RETURN()

HostResult HcsService::CreateProcess(HcsHandle System, const std::string& Parameters, HcsProcessInformation& Information, HcsHandle& Process)
try
{
    const auto systemEntry = Find(System);
    const auto operation = CreateOperation();

    auto entry = std::make_shared<HandleEntry>();
    const auto result = ::HcsCreateProcess(systemEntry->System.get(), ToWide(Parameters).c_str(), operation.get(), nullptr, &entry->Process);
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    HCS_PROCESS_INFORMATION processInformation{};
    wil::unique_cotaskmem_string resultDocument;
    const auto waitResult = ::HcsWaitForOperationResultAndProcessInfo(operation.get(), INFINITE, &processInformation, &resultDocument);
    if (FAILED(waitResult))
    {
        return {static_cast<HResult>(waitResult), ToUtf8(resultDocument.get())};
    }

    FillProcessInformation(processInformation, Information);
    THROW_IF_FAILED(::HcsSetProcessCallback(entry->Process.get(), HcsEventOptionNone, entry.get(), &HcsService::OnEvent));

    Process = Insert(std::move(entry));
    return {};
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::OpenProcess(HcsHandle System, std::uint32_t ProcessId, HcsHandle& Process)
try
{
    const auto systemEntry = Find(System);

    auto entry = std::make_shared<HandleEntry>();
    const auto result = ::HcsOpenProcess(systemEntry->System.get(), ProcessId, GENERIC_ALL, &entry->Process);
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    THROW_IF_FAILED(::HcsSetProcessCallback(entry->Process.get(), HcsEventOptionNone, entry.get(), &HcsService::OnEvent));

    Process = Insert(std::move(entry));
    return {};
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::SignalProcess(HcsHandle Process, const std::string& Options)
try
{
    const auto entry = Find(Process);
    const auto operation = CreateOperation();
    const auto result = ::HcsSignalProcess(entry->Process.get(), operation.get(), ToWide(Options).c_str());
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    return WaitForResult(operation.get());
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::TerminateProcess(HcsHandle Process)
try
{
    const auto entry = Find(Process);
    const auto operation = CreateOperation();
    const auto result = ::HcsTerminateProcess(entry->Process.get(), operation.get(), nullptr);
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    return WaitForResult(operation.get());
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::ModifyProcess(HcsHandle Process, const std::string& Settings)
try
{
    const auto entry = Find(Process);
    const auto operation = CreateOperation();
    const auto result = ::HcsModifyProcess(entry->Process.get(), operation.get(), ToWide(Settings).c_str());
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    return WaitForResult(operation.get());
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::GetProcessProperties(HcsHandle Process, std::string& Properties)
try
{
    const auto entry = Find(Process);
    const auto operation = CreateOperation();
    const auto result = ::HcsGetProcessProperties(entry->Process.get(), operation.get(), nullptr);
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    return WaitForResult(operation.get(), &Properties);
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

HostResult HcsService::GetProcessInfo(HcsHandle Process, HcsProcessInformation& Information)
try
{
    const auto entry = Find(Process);
    const auto operation = CreateOperation();
    const auto result = ::HcsGetProcessInfo(entry->Process.get(), operation.get());
    if (FAILED(result))
    {
        return {static_cast<HResult>(result), {}};
    }

    HCS_PROCESS_INFORMATION processInformation{};
    wil::unique_cotaskmem_string resultDocument;
    const auto waitResult = ::HcsWaitForOperationResultAndProcessInfo(operation.get(), INFINITE, &processInformation, &resultDocument);
    if (FAILED(waitResult))
    {
        return {static_cast<HResult>(waitResult), ToUtf8(resultDocument.get())};
    }

    FillProcessInformation(processInformation, Information);
    return {};
}
catch (...)
{
    return {static_cast<HResult>(wil::ResultFromCaughtException()), {}};
}

vmshim::HResult HcsService::CloseProcess(HcsHandle Process)
try
{
    auto entry = Remove(Process);
    entry->Process.reset();
    return VMSHIM_S_OK;
}
CATCH_RETURN()

vmshim::HResult HcsService::RegisterProcessCallback(HcsHandle Process, HcsNotificationCallback Callback, HcsHandle& CallbackHandle)
{
    return RegisterComputeSystemCallback(Process, std::move(Callback), CallbackHandle);
}

vmshim::HResult HcsService::UnregisterProcessCallback(HcsHandle CallbackHandle)
{
    return UnregisterComputeSystemCallback(CallbackHandle);
}
