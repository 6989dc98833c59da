/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    FakeHcsService.cpp

Abstract:

    This file contains the in-memory host compute service implementation.

--*/

#include "FakeHcsService.h"
#include <algorithm>
#include <thread>
#include <nlohmann/json.hpp>

using vmshim::test::FakeHcsService;
using vmshim::test::FakeStream;
using namespace vmshim::hcs;

size_t FakeStream::Read(gsl::span<std::byte>)
{
    return 0;
}

size_t FakeStream::Write(gsl::span<const std::byte> Buffer)
{
    m_state->Written.append(reinterpret_cast<const char*>(Buffer.data()), Buffer.size());
    return Buffer.size();
}

void FakeStream::Close()
{
    m_state->CloseCount++;
}

HcsHandle FakeHcsService::NewHandleLockHeld(std::string Id, std::uint32_t Pid)
{
    const auto handle = m_nextHandle++;
    auto& state = m_handles[handle];
    state.Id = std::move(Id);
    state.Pid = Pid;
    return handle;
}

void FakeHcsService::FillStdioLockHeld(HandleState& State, HcsProcessInformation& Information)
{
    Information.ProcessId = State.Pid;
    if (!ProvideStdio)
    {
        return;
    }

    State.Stdin = std::make_shared<FakeStreamState>();
    State.Stdout = std::make_shared<FakeStreamState>();
    State.Stderr = std::make_shared<FakeStreamState>();
    Information.StdInput = std::make_unique<FakeStream>(State.Stdin);
    Information.StdOutput = std::make_unique<FakeStream>(State.Stdout);
    Information.StdError = std::make_unique<FakeStream>(State.Stderr);
}

void FakeHcsService::Fire(HcsHandle Handle, NotificationKind Kind, HResult Result, const std::string& Data)
{
    HcsNotificationCallback callback;
    {
        std::lock_guard lock(m_lock);
        const auto it = m_handles.find(Handle);
        if (it == m_handles.end() || !it->second.Open)
        {
            return;
        }

        if (!it->second.Callback)
        {
            it->second.Queued.push_back({Kind, Result, Data});
            return;
        }

        callback = it->second.Callback;
    }

    callback(Kind, Result, Data);
}

void FakeHcsService::FireSystemExited(HcsHandle System, HResult Result, const std::string& Data)
{
    Fire(System, NotificationKind::SystemExited, Result, Data);
}

void FakeHcsService::FireProcessExited(HcsHandle Process)
{
    Fire(Process, NotificationKind::ProcessExited, VMSHIM_S_OK);
}

void FakeHcsService::FireServiceDisconnect(HcsHandle Handle)
{
    Fire(Handle, NotificationKind::ServiceDisconnect, VMSHIM_S_OK);
}

std::vector<std::string> FakeHcsService::ModifyRequests() const
{
    std::lock_guard lock(m_lock);
    return m_modifyRequests;
}

std::vector<std::string> FakeHcsService::ProcessModifyRequests() const
{
    std::lock_guard lock(m_lock);
    return m_processModifyRequests;
}

std::string FakeHcsService::LastCreateDocument() const
{
    std::lock_guard lock(m_lock);
    return m_lastCreateDocument;
}

std::string FakeHcsService::LastPropertyQuery() const
{
    std::lock_guard lock(m_lock);
    return m_lastPropertyQuery;
}

HcsHandle FakeHcsService::LastSystem() const
{
    std::lock_guard lock(m_lock);
    return m_lastSystem;
}

HcsHandle FakeHcsService::LastProcess() const
{
    std::lock_guard lock(m_lock);
    return m_lastProcess;
}

std::shared_ptr<vmshim::test::FakeStreamState> FakeHcsService::Stdin(HcsHandle Process) const
{
    std::lock_guard lock(m_lock);
    const auto it = m_handles.find(Process);
    return it == m_handles.end() ? nullptr : it->second.Stdin;
}

std::shared_ptr<vmshim::test::FakeStreamState> FakeHcsService::Stdout(HcsHandle Process) const
{
    std::lock_guard lock(m_lock);
    const auto it = m_handles.find(Process);
    return it == m_handles.end() ? nullptr : it->second.Stdout;
}

bool FakeHcsService::IsOpen(HcsHandle Handle) const
{
    std::lock_guard lock(m_lock);
    const auto it = m_handles.find(Handle);
    return it != m_handles.end() && it->second.Open;
}

size_t FakeHcsService::OpenHandles() const
{
    std::lock_guard lock(m_lock);
    return std::count_if(m_handles.begin(), m_handles.end(), [](const auto& Entry) { return Entry.second.Open; });
}

HostResult FakeHcsService::CreateComputeSystem(const std::string& Id, const std::string& Configuration, HcsHandle& System)
{
    CreateCalls++;

    std::lock_guard lock(m_lock);
    m_lastCreateDocument = Configuration;
    if (Failed(CreateResult) && CreateResult != VMSHIM_HCS_E_OPERATION_PENDING)
    {
        return {CreateResult, R"([{"Message":"create failed"}])"};
    }

    System = NewHandleLockHeld(Id, 0);
    m_lastSystem = System;
    if (CreateResult == VMSHIM_HCS_E_OPERATION_PENDING && CompleteCreate)
    {
        m_handles[System].Queued.push_back({NotificationKind::SystemCreateCompleted, CreateCompletion, {}});
    }

    return {CreateResult, {}};
}

HostResult FakeHcsService::OpenComputeSystem(const std::string& Id, HcsHandle& System)
{
    std::lock_guard lock(m_lock);
    if (Failed(OpenResult))
    {
        return {OpenResult, {}};
    }

    System = NewHandleLockHeld(Id, 0);
    m_lastSystem = System;
    return {};
}

HostResult FakeHcsService::StartComputeSystem(HcsHandle System, const std::string&)
{
    StartCalls++;

    const auto inProgress = ++StartInProgress;
    int observed = MaxStartInProgress.load();
    while (inProgress > observed && !MaxStartInProgress.compare_exchange_weak(observed, inProgress))
    {
    }

    if (StartDelay.count() > 0)
    {
        std::this_thread::sleep_for(StartDelay);
    }

    StartInProgress--;

    if (StartResult == VMSHIM_HCS_E_OPERATION_PENDING && CompleteStart)
    {
        Fire(System, NotificationKind::SystemStartCompleted, StartCompletion);
    }

    return {StartResult, {}};
}

HostResult FakeHcsService::ShutdownComputeSystem(HcsHandle System, const std::string&)
{
    ShutdownCalls++;
    if (Succeeded(ShutdownResult) && StopFiresExit)
    {
        FireSystemExited(System, VMSHIM_S_OK, R"({"Status":0,"ExitType":"GracefulExit"})");
    }

    return {ShutdownResult, {}};
}

HostResult FakeHcsService::TerminateComputeSystem(HcsHandle System, const std::string&)
{
    TerminateCalls++;
    if (Succeeded(TerminateResult) && StopFiresExit)
    {
        FireSystemExited(System, VMSHIM_S_OK, R"({"Status":0,"ExitType":"ForcedExit"})");
    }

    return {TerminateResult, {}};
}

HostResult FakeHcsService::PauseComputeSystem(HcsHandle System, const std::string&)
{
    if (PauseResult == VMSHIM_HCS_E_OPERATION_PENDING && CompletePause)
    {
        Fire(System, NotificationKind::SystemPauseCompleted, VMSHIM_S_OK);
    }

    return {PauseResult, {}};
}

HostResult FakeHcsService::ResumeComputeSystem(HcsHandle System, const std::string&)
{
    if (ResumeResult == VMSHIM_HCS_E_OPERATION_PENDING && CompleteResume)
    {
        Fire(System, NotificationKind::SystemResumeCompleted, VMSHIM_S_OK);
    }

    return {ResumeResult, {}};
}

HostResult FakeHcsService::GetComputeSystemProperties(HcsHandle System, const std::string& Query, std::string& Properties)
{
    std::lock_guard lock(m_lock);
    m_lastPropertyQuery = Query;
    if (Failed(PropertiesResult))
    {
        return {PropertiesResult, {}};
    }

    if (!EmptyProperties)
    {
        nlohmann::json properties{{"Id", m_handles[System].Id}, {"State", "Running"}, {"SystemType", SystemType}};
        if (!RuntimeOsType.empty())
        {
            properties["RuntimeOsType"] = RuntimeOsType;
        }

        Properties = properties.dump();
    }

    return {};
}

HostResult FakeHcsService::ModifyComputeSystem(HcsHandle, const std::string& Configuration)
{
    if (ModifyDelay.count() > 0)
    {
        std::this_thread::sleep_for(ModifyDelay);
    }

    std::lock_guard lock(m_lock);
    if (Failed(ModifyResult))
    {
        return {ModifyResult, R"([{"Message":"modify failed"}])"};
    }

    m_modifyRequests.push_back(Configuration);
    return {};
}

HostResult FakeHcsService::EnumerateComputeSystems(const std::string& Query, std::string& ComputeSystems)
{
    std::lock_guard lock(m_lock);
    m_lastPropertyQuery = Query;
    ComputeSystems = EnumerateDocument;
    return {};
}

vmshim::HResult FakeHcsService::CloseComputeSystem(HcsHandle System)
{
    CloseSystemCalls++;

    std::lock_guard lock(m_lock);
    const auto it = m_handles.find(System);
    if (it == m_handles.end() || !it->second.Open)
    {
        return VMSHIM_E_INVALIDARG;
    }

    it->second.Open = false;
    return VMSHIM_S_OK;
}

vmshim::HResult FakeHcsService::RegisterCallback(HcsHandle Handle, HcsNotificationCallback Callback, HcsHandle& CallbackHandle)
{
    std::vector<Pending> queued;
    {
        std::lock_guard lock(m_lock);
        const auto it = m_handles.find(Handle);
        if (it == m_handles.end() || !it->second.Open)
        {
            return VMSHIM_E_INVALIDARG;
        }

        it->second.Callback = Callback;
        queued.swap(it->second.Queued);
    }

    for (const auto& pending : queued)
    {
        Callback(pending.Kind, pending.Result, pending.Data);
    }

    CallbackHandle = Handle;
    return VMSHIM_S_OK;
}

vmshim::HResult FakeHcsService::RegisterComputeSystemCallback(HcsHandle System, HcsNotificationCallback Callback, HcsHandle& CallbackHandle)
{
    return RegisterCallback(System, std::move(Callback), CallbackHandle);
}

vmshim::HResult FakeHcsService::UnregisterComputeSystemCallback(HcsHandle CallbackHandle)
{
    std::lock_guard lock(m_lock);
    if (Failed(UnregisterCallbackResult))
    {
        return UnregisterCallbackResult;
    }

    const auto it = m_handles.find(CallbackHandle);
    if (it != m_handles.end())
    {
        it->second.Callback = nullptr;
    }

    return VMSHIM_S_OK;
}

HostResult FakeHcsService::CreateProcess(HcsHandle System, const std::string&, HcsProcessInformation& Information, HcsHandle& Process)
{
    std::lock_guard lock(m_lock);
    if (Failed(CreateProcessResult))
    {
        return {CreateProcessResult, R"([{"Message":"create process failed"}])"};
    }

    Process = NewHandleLockHeld(m_handles[System].Id, m_nextPid++);
    m_lastProcess = Process;
    FillStdioLockHeld(m_handles[Process], Information);
    return {};
}

HostResult FakeHcsService::OpenProcess(HcsHandle System, std::uint32_t ProcessId, HcsHandle& Process)
{
    std::lock_guard lock(m_lock);
    Process = NewHandleLockHeld(m_handles[System].Id, ProcessId);
    m_lastProcess = Process;
    return {};
}

HostResult FakeHcsService::SignalProcess(HcsHandle, const std::string&)
{
    SignalCalls++;
    return {SignalResult, {}};
}

HostResult FakeHcsService::TerminateProcess(HcsHandle)
{
    TerminateProcessCalls++;
    return {TerminateProcessResult, {}};
}

HostResult FakeHcsService::ModifyProcess(HcsHandle, const std::string& Settings)
{
    std::lock_guard lock(m_lock);
    if (Failed(ModifyProcessResult))
    {
        return {ModifyProcessResult, {}};
    }

    m_processModifyRequests.push_back(Settings);
    return {};
}

HostResult FakeHcsService::GetProcessProperties(HcsHandle Process, std::string& Properties)
{
    std::lock_guard lock(m_lock);
    if (Failed(ProcessPropertiesResult))
    {
        return {ProcessPropertiesResult, {}};
    }

    Properties = nlohmann::json{
        {"ProcessId", m_handles[Process].Pid}, {"Exited", true}, {"ExitCode", ProcessExitCode}, {"LastWaitResult", ProcessLastWaitResult}}
                     .dump();
    return {};
}

HostResult FakeHcsService::GetProcessInfo(HcsHandle Process, HcsProcessInformation& Information)
{
    std::lock_guard lock(m_lock);
    FillStdioLockHeld(m_handles[Process], Information);
    return {};
}

vmshim::HResult FakeHcsService::CloseProcess(HcsHandle Process)
{
    CloseProcessCalls++;

    std::lock_guard lock(m_lock);
    const auto it = m_handles.find(Process);
    if (it == m_handles.end() || !it->second.Open)
    {
        return VMSHIM_E_INVALIDARG;
    }

    it->second.Open = false;
    return VMSHIM_S_OK;
}

vmshim::HResult FakeHcsService::RegisterProcessCallback(HcsHandle Process, HcsNotificationCallback Callback, HcsHandle& CallbackHandle)
{
    return RegisterCallback(Process, std::move(Callback), CallbackHandle);
}

vmshim::HResult FakeHcsService::UnregisterProcessCallback(HcsHandle CallbackHandle)
{
    return UnregisterComputeSystemCallback(CallbackHandle);
}
