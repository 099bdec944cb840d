/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "poll_policy.h"
#include "config/configuration_provider.h"

namespace YubiKeyChalResp {
namespace Core {

PollPolicy PollPolicy::fromConfiguration(const Shared::ConfigurationProvider &config)
{
    PollPolicy policy;
    policy.pollIntervalMs = config.pollIntervalMs();
    policy.maxAttempts = config.maxPollAttempts();
    policy.touchWaitAttempts = config.touchWaitAttempts();
    return policy;
}

} // namespace Core
} // namespace YubiKeyChalResp
