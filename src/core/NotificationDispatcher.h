/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    NotificationDispatcher.h

Abstract:

    This file contains the registry that routes host notifications to the
    operations waiting for them.

--*/

#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include "HostComputeService.h"

namespace vmshim::hcs {

struct NotificationResult
{
    HResult Result = VMSHIM_S_OK;
    std::string Data;
};

using NotificationToken = std::uint64_t;

class NotificationDispatcher
{
public:
    NotificationDispatcher() = default;
    ~NotificationDispatcher() = default;

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    NotificationToken Register(std::string_view SystemId, std::optional<std::uint32_t> ProcessId = {});

    // Blocks until Kind is delivered for Token, the timeout elapses, the system exits or
    // the host connection is lost, or the token is unregistered. No timeout waits forever.
    NotificationResult Wait(NotificationToken Token, NotificationKind Kind, std::optional<std::chrono::milliseconds> Timeout = {});

    // Never blocks on waiters. A notification for an unknown or closing token is dropped.
    void Dispatch(NotificationToken Token, NotificationKind Kind, HResult Result, const std::string& Data = {});

    // Drops a completion left over from an earlier operation whose waiter timed out. Latched kinds are kept.
    void Reset(NotificationToken Token, NotificationKind Kind);

    // Returns once every dispatch in progress for Token has completed. Waiters observe HANDLE_CLOSED.
    void Unregister(NotificationToken Token);

    // Waits for Kind if the host reported the operation as pending, otherwise returns the host result.
    NotificationResult ProcessAsyncResult(
        const HostResult& Result, NotificationToken Token, NotificationKind Kind, std::optional<std::chrono::milliseconds> Timeout = {});

    // Returns a host callback that dispatches to Token.
    HcsNotificationCallback CallbackFor(NotificationToken Token);

    size_t RegisteredCount() const;

private:
    struct Entry
    {
        std::string SystemId;
        std::optional<std::uint32_t> ProcessId;

        std::mutex Lock;
        std::condition_variable Changed;
        std::array<std::optional<NotificationResult>, c_notificationKindCount> Slots;
        bool Closed = false;

        // Guarded by the registry lock.
        bool Closing = false;
        size_t InFlight = 0;
    };

    static bool IsLatched(NotificationKind Kind) noexcept;

    mutable std::mutex m_lock;
    std::condition_variable m_drained;
    std::map<NotificationToken, std::shared_ptr<Entry>> m_entries;
    NotificationToken m_nextToken = 1;
};

} // namespace vmshim::hcs
