/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

namespace YubiKeyChalResp {
namespace Shared {

/**
 * @brief Pure interface for accessing engine configuration
 *
 * Components depend on this abstraction rather than on KConfig, so tests
 * can substitute fixed values.
 *
 * @note Concrete implementations (EngineConfiguration) inherit from both
 *       QObject and ConfigurationProvider to provide change notifications
 */
class ConfigurationProvider
{
public:
    virtual ~ConfigurationProvider() = default;

    /**
     * @brief Reloads configuration from storage
     */
    virtual void reload() = 0;

    /**
     * @brief Delay between two status reads while polling
     * @return Interval in milliseconds
     */
    virtual int pollIntervalMs() const = 0;

    /**
     * @brief Number of not-ready status reads tolerated per wait
     */
    virtual int maxPollAttempts() const = 0;

    /**
     * @brief Number of status reads tolerated while the token waits for a touch
     */
    virtual int touchWaitAttempts() const = 0;

    /**
     * @brief Timeout of a single USB control transfer
     * @return Timeout in milliseconds
     */
    virtual int usbTimeoutMs() const = 0;
};

} // namespace Shared
} // namespace YubiKeyChalResp
