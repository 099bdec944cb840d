/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "config/configuration_keys.h"

namespace YubiKeyChalResp {
namespace Shared {
class ConfigurationProvider;
}

namespace Core {

/**
 * @brief Bounds of the engine's polling loops
 *
 * maxAttempts caps the not-ready reads of one wait; reads showing the
 * touch-wait flag are charged to touchWaitAttempts instead, so a token
 * waiting for its button gets a longer budget than a busy one. Budgets
 * below 1 count as 1 and a negative interval polls without sleeping.
 */
struct PollPolicy {
    int pollIntervalMs = Shared::ConfigKeys::DEFAULT_POLL_INTERVAL_MS;
    int maxAttempts = Shared::ConfigKeys::DEFAULT_MAX_POLL_ATTEMPTS;
    int touchWaitAttempts = Shared::ConfigKeys::DEFAULT_TOUCH_WAIT_ATTEMPTS;

    /**
     * @brief Builds a policy from engine configuration
     */
    static PollPolicy fromConfiguration(const Shared::ConfigurationProvider &config);
};

} // namespace Core
} // namespace YubiKeyChalResp
