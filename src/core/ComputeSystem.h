/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ComputeSystem.h

Abstract:

    This file contains the compute system (virtual machine or container)
    handle and its lifecycle operations.

--*/

#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include "ExitSignal.h"
#include "HcsContext.h"
#include "hcs_schema.h"

namespace vmshim::hcs {

class ComputeProcess;

struct SystemExitState
{
    // Null on a clean exit.
    std::exception_ptr WaitError;

    // Set when the host reported an unexpected exit. Kept apart from WaitError.
    std::exception_ptr UnexpectedExitError;

    std::optional<SystemExitStatus> Status;
};

class ComputeSystem : public std::enable_shared_from_this<ComputeSystem>
{
public:
    static std::shared_ptr<ComputeSystem> Create(std::shared_ptr<HcsContext> Context, const std::string& Id, const nlohmann::json& Document);

    static std::shared_ptr<ComputeSystem> Open(std::shared_ptr<HcsContext> Context, const std::string& Id);

    static std::vector<ContainerProperties> Enumerate(const HcsContext& Context, const ComputeSystemQuery& Query);

    ~ComputeSystem();

    ComputeSystem(const ComputeSystem&) = delete;
    ComputeSystem& operator=(const ComputeSystem&) = delete;

    const std::string& Id() const noexcept;

    // "linux" or "windows".
    const std::string& Os() const noexcept;

    bool IsOci() const noexcept;

    void Start();

    void Shutdown();

    void Terminate();

    void Pause();

    void Resume();

    ContainerProperties Properties(const std::vector<PropertyType>& Types = {});

    void Modify(const nlohmann::json& Settings);

    // Lets a caller hold the handle lock across its own lock before calling ModifyLockHeld.
    std::shared_lock<std::shared_mutex> LockHandleShared();

    void ModifyLockHeld(const std::shared_lock<std::shared_mutex>& Lock, const nlohmann::json& Settings);

    std::shared_ptr<ComputeProcess> CreateProcess(const nlohmann::json& Parameters);

    // The standard handles of the process are closed immediately.
    std::shared_ptr<ComputeProcess> CreateProcessNoStdio(const nlohmann::json& Parameters);

    std::shared_ptr<ComputeProcess> OpenProcess(std::uint32_t Pid);

    // Blocks until the system exits and rethrows the terminal error, if any.
    void Wait();

    SystemExitState WaitForExit();

    // Non-blocking. Returns VMSHIM_E_NOT_EXITED while the system runs, null after a clean exit.
    std::exception_ptr ExitError();

    void Close();

private:
    ComputeSystem(std::shared_ptr<HcsContext> Context, std::string Id);

    void ThrowIfClosedLockHeld(const char* Operation) const;

    void RegisterCallbackLockHeld();

    void UnregisterCallbackLockHeld();

    void StartExitWatcher();

    void ExitWatcher(NotificationToken Token) noexcept;

    void CacheProperties();

    void StopLockHeld(const char* Operation, bool Force);

    std::shared_ptr<ComputeProcess> CreateProcessImpl(const char* Operation, const nlohmann::json& Parameters, bool KeepStdio);

    const std::shared_ptr<HcsContext> m_context;
    const std::string m_id;
    std::string m_os;
    std::string m_type;

    mutable std::shared_mutex m_handleLock;
    HcsHandle m_handle = 0;
    HcsHandle m_callbackHandle = 0;
    NotificationToken m_token = 0;

    ExitSignal<SystemExitState> m_exitSignal;
    std::thread m_exitWatcher;
};

} // namespace vmshim::hcs
