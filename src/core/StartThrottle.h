/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    StartThrottle.h

Abstract:

    This file contains the admission gate bounding the number of compute
    system starts in flight.

    Waiters poll for a free slot. There is no ordering among waiters.

--*/

#pragma once

#include <chrono>
#include <mutex>

namespace vmshim::hcs {

class StartThrottle
{
public:
    static constexpr std::chrono::milliseconds c_defaultPollInterval{100};

    class Admission
    {
    public:
        explicit Admission(StartThrottle* Throttle) noexcept : m_throttle(Throttle)
        {
        }

        Admission(Admission&& Other) noexcept : m_throttle(Other.m_throttle)
        {
            Other.m_throttle = nullptr;
        }

        Admission(const Admission&) = delete;
        Admission& operator=(const Admission&) = delete;
        Admission& operator=(Admission&&) = delete;

        ~Admission()
        {
            if (m_throttle != nullptr)
            {
                m_throttle->Release();
            }
        }

    private:
        StartThrottle* m_throttle;
    };

    // A maximum of zero or less admits every caller without counting.
    explicit StartThrottle(int MaxParallel, std::chrono::milliseconds PollInterval = c_defaultPollInterval);

    StartThrottle(const StartThrottle&) = delete;
    StartThrottle& operator=(const StartThrottle&) = delete;

    void Acquire();

    void Release();

    [[nodiscard]] Admission Admit();

    int MaxParallel() const noexcept;

    int InProgress() const;

private:
    const int m_maxParallel;
    const std::chrono::milliseconds m_pollInterval;
    mutable std::mutex m_lock;
    int m_inProgress = 0;
};

} // namespace vmshim::hcs
