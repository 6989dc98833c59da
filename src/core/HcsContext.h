/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    HcsContext.h

Abstract:

    This file contains the collaborators shared by every compute system and
    process created through one host connection.

--*/

#pragma once

#include <memory>
#include "HostComputeService.h"
#include "NotificationDispatcher.h"
#include "ShimConfig.h"
#include "StartThrottle.h"

namespace vmshim::hcs {

struct HcsContext
{
    std::shared_ptr<IHostComputeService> Service;
    std::shared_ptr<NotificationDispatcher> Dispatcher;
    std::shared_ptr<StartThrottle> Throttle;
    config::OperationTimeouts Timeouts;

    static std::shared_ptr<HcsContext> Create(std::shared_ptr<IHostComputeService> Service, const config::ShimConfig& Config)
    {
        auto context = std::make_shared<HcsContext>();
        context->Service = std::move(Service);
        context->Dispatcher = std::make_shared<NotificationDispatcher>();
        context->Throttle = std::make_shared<StartThrottle>(Config.MaxParallelStart);
        context->Timeouts = Config.Timeouts;
        return context;
    }
};

} // namespace vmshim::hcs
