/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    NotificationDispatcher.cpp

Abstract:

    This file contains the notification registry implementation.

    Completion notifications (create, start, pause, resume) fill a one-value
    slot that is consumed by the waiter. Terminal notifications (system exit,
    process exit, service disconnect) are latched so that every current and
    future waiter observes them.

--*/

#include "NotificationDispatcher.h"
#include "HcsErrors.h"
#include "shimlog.h"

namespace vmshim::hcs {

const char* NotificationKindToString(NotificationKind Kind) noexcept
{
    switch (Kind)
    {
    case NotificationKind::SystemCreateCompleted:
        return "SystemCreateCompleted";
    case NotificationKind::SystemStartCompleted:
        return "SystemStartCompleted";
    case NotificationKind::SystemPauseCompleted:
        return "SystemPauseCompleted";
    case NotificationKind::SystemResumeCompleted:
        return "SystemResumeCompleted";
    case NotificationKind::SystemExited:
        return "SystemExited";
    case NotificationKind::ProcessExited:
        return "ProcessExited";
    case NotificationKind::ServiceDisconnect:
        return "ServiceDisconnect";
    }

    return "Unknown";
}

bool NotificationDispatcher::IsLatched(NotificationKind Kind) noexcept
{
    return Kind == NotificationKind::SystemExited || Kind == NotificationKind::ProcessExited || Kind == NotificationKind::ServiceDisconnect;
}

NotificationToken NotificationDispatcher::Register(std::string_view SystemId, std::optional<std::uint32_t> ProcessId)
{
    auto entry = std::make_shared<Entry>();
    entry->SystemId = SystemId;
    entry->ProcessId = ProcessId;

    std::lock_guard lock(m_lock);
    const auto token = m_nextToken++;
    m_entries.emplace(token, std::move(entry));

    LOG_DEBUG("Registered notification token {} for {}", token, SystemId);
    return token;
}

NotificationResult NotificationDispatcher::Wait(NotificationToken Token, NotificationKind Kind, std::optional<std::chrono::milliseconds> Timeout)
{
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard lock(m_lock);
        const auto it = m_entries.find(Token);
        if (it != m_entries.end())
        {
            entry = it->second;
        }
    }

    if (!entry)
    {
        LOG_ERROR("Invalid notification token {} while waiting for {}", Token, NotificationKindToString(Kind));
        return {VMSHIM_E_HANDLE_CLOSED, {}};
    }

    const auto kindIndex = static_cast<size_t>(Kind);
    const auto exitedIndex = static_cast<size_t>(NotificationKind::SystemExited);
    const auto disconnectIndex = static_cast<size_t>(NotificationKind::ServiceDisconnect);

    std::optional<NotificationResult> result;
    auto ready = [&]() {
        auto& slot = entry->Slots[kindIndex];
        if (slot.has_value())
        {
            result = slot.value();
            if (!IsLatched(Kind))
            {
                slot.reset();
            }

            return true;
        }

        if (Kind != NotificationKind::SystemExited && entry->Slots[exitedIndex].has_value())
        {
            result.emplace(NotificationResult{VMSHIM_E_UNEXPECTED_CONTAINER_EXIT, entry->Slots[exitedIndex]->Data});
            return true;
        }

        if (Kind != NotificationKind::ServiceDisconnect && entry->Slots[disconnectIndex].has_value())
        {
            result.emplace(NotificationResult{VMSHIM_E_UNEXPECTED_PROCESS_ABORT, {}});
            return true;
        }

        if (entry->Closed)
        {
            result.emplace(NotificationResult{VMSHIM_E_HANDLE_CLOSED, {}});
            return true;
        }

        return false;
    };

    std::unique_lock lock(entry->Lock);
    if (Timeout.has_value())
    {
        if (!entry->Changed.wait_for(lock, Timeout.value(), ready))
        {
            return {VMSHIM_E_TIMEOUT, {}};
        }
    }
    else
    {
        entry->Changed.wait(lock, ready);
    }

    return result.value();
}

void NotificationDispatcher::Dispatch(NotificationToken Token, NotificationKind Kind, HResult Result, const std::string& Data)
{
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard lock(m_lock);
        const auto it = m_entries.find(Token);
        if (it == m_entries.end() || it->second->Closing)
        {
            LOG_DEBUG("Dropping {} for unknown notification token {}", NotificationKindToString(Kind), Token);
            return;
        }

        entry = it->second;
        entry->InFlight++;
    }

    auto drained = scope_exit([&]() {
        std::lock_guard lock(m_lock);
        if (--entry->InFlight == 0)
        {
            m_drained.notify_all();
        }
    });

    std::lock_guard lock(entry->Lock);
    auto& slot = entry->Slots[static_cast<size_t>(Kind)];
    if (slot.has_value())
    {
        LOG_DEBUG("Dropping duplicate {} for {} (token {})", NotificationKindToString(Kind), entry->SystemId, Token);
        return;
    }

    slot.emplace(NotificationResult{Result, Data});
    entry->Changed.notify_all();
}

void NotificationDispatcher::Reset(NotificationToken Token, NotificationKind Kind)
{
    if (IsLatched(Kind))
    {
        return;
    }

    std::shared_ptr<Entry> entry;
    {
        std::lock_guard lock(m_lock);
        const auto it = m_entries.find(Token);
        if (it == m_entries.end())
        {
            return;
        }

        entry = it->second;
    }

    std::lock_guard lock(entry->Lock);
    auto& slot = entry->Slots[static_cast<size_t>(Kind)];
    if (slot.has_value())
    {
        LOG_DEBUG("Dropping stale {} for {} (token {})", NotificationKindToString(Kind), entry->SystemId, Token);
        slot.reset();
    }
}

void NotificationDispatcher::Unregister(NotificationToken Token)
{
    std::shared_ptr<Entry> entry;
    {
        std::unique_lock lock(m_lock);
        const auto it = m_entries.find(Token);
        if (it == m_entries.end())
        {
            return;
        }

        entry = it->second;
        entry->Closing = true;
        m_drained.wait(lock, [&]() { return entry->InFlight == 0; });
        m_entries.erase(Token);
    }

    {
        std::lock_guard lock(entry->Lock);
        entry->Closed = true;
    }

    entry->Changed.notify_all();
    LOG_DEBUG("Unregistered notification token {} for {}", Token, entry->SystemId);
}

NotificationResult NotificationDispatcher::ProcessAsyncResult(
    const HostResult& Result, NotificationToken Token, NotificationKind Kind, std::optional<std::chrono::milliseconds> Timeout)
{
    if (!IsPending(Result.Result))
    {
        return {Result.Result, Result.Events};
    }

    auto waited = Wait(Token, Kind, Timeout);
    if (waited.Data.empty())
    {
        waited.Data = Result.Events;
    }

    return waited;
}

HcsNotificationCallback NotificationDispatcher::CallbackFor(NotificationToken Token)
{
    return [this, Token](NotificationKind Kind, HResult Result, const std::string& Data) { Dispatch(Token, Kind, Result, Data); };
}

size_t NotificationDispatcher::RegisteredCount() const
{
    std::lock_guard lock(m_lock);
    return m_entries.size();
}

} // namespace vmshim::hcs
