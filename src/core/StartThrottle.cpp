/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    StartThrottle.cpp

Abstract:

    This file contains the start admission gate implementation.

--*/

#include "StartThrottle.h"
#include <thread>
#include "shimlog.h"

namespace vmshim::hcs {

StartThrottle::StartThrottle(int MaxParallel, std::chrono::milliseconds PollInterval) :
    m_maxParallel(MaxParallel), m_pollInterval(PollInterval)
{
}

void StartThrottle::Acquire()
{
    if (m_maxParallel <= 0)
    {
        return;
    }

    bool logged = false;
    for (;;)
    {
        {
            std::lock_guard lock(m_lock);
            if (m_inProgress < m_maxParallel)
            {
                m_inProgress++;
                return;
            }
        }

        if (!logged)
        {
            LOG_DEBUG("Start throttled, {} of {} starts in progress", InProgress(), m_maxParallel);
            logged = true;
        }

        std::this_thread::sleep_for(m_pollInterval);
    }
}

void StartThrottle::Release()
{
    if (m_maxParallel <= 0)
    {
        return;
    }

    std::lock_guard lock(m_lock);
    if (m_inProgress > 0)
    {
        m_inProgress--;
    }
}

StartThrottle::Admission StartThrottle::Admit()
{
    Acquire();
    return Admission{this};
}

int StartThrottle::MaxParallel() const noexcept
{
    return m_maxParallel;
}

int StartThrottle::InProgress() const
{
    std::lock_guard lock(m_lock);
    return m_inProgress;
}

} // namespace vmshim::hcs
