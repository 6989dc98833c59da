/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ExitSignal.h

Abstract:

    This file contains the single-use signal that publishes the terminal
    state of a compute system or process to every waiter.

--*/

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace vmshim::hcs {

/**
 * @brief Signal that transitions from open to closed exactly once and carries
 * the value it was closed with.
 *
 * @tparam T Terminal state published to the waiters.
 */
template <typename T>
class ExitSignal
{
public:
    ExitSignal() = default;

    ExitSignal(const ExitSignal&) = delete;
    ExitSignal& operator=(const ExitSignal&) = delete;

    /**
     * @brief Close the signal with the given value. Only the first caller wins.
     *
     * @param[in] Value Terminal state.
     * @return true if this call closed the signal.
     */
    bool Close(T Value)
    {
        bool expected = false;
        if (!m_closing.compare_exchange_strong(expected, true))
        {
            return false;
        }

        {
            std::lock_guard lock(m_mutex);
            m_value.emplace(std::move(Value));
        }

        m_cv.notify_all();
        return true;
    }

    /**
     * @brief Block until the signal is closed.
     *
     * @return The value the signal was closed with.
     */
    T Wait() const
    {
        std::unique_lock lock(m_mutex);
        m_cv.wait(lock, [this]() { return m_value.has_value(); });
        return m_value.value();
    }

    /**
     * @brief Block until the signal is closed or the timeout elapses.
     *
     * @param[in] Timeout Duration to wait before returning empty.
     * @return Either the value or std::nullopt on timeout.
     */
    template <typename TDuration>
    std::optional<T> WaitFor(TDuration Timeout) const
    {
        std::unique_lock lock(m_mutex);
        if (!m_cv.wait_for(lock, Timeout, [this]() { return m_value.has_value(); }))
        {
            return std::nullopt;
        }

        return m_value;
    }

    // Non-blocking.
    std::optional<T> TryGet() const
    {
        std::lock_guard lock(m_mutex);
        return m_value;
    }

    bool IsClosed() const
    {
        std::lock_guard lock(m_mutex);
        return m_value.has_value();
    }

private:
    std::atomic<bool> m_closing{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    std::optional<T> m_value;
};

} // namespace vmshim::hcs
