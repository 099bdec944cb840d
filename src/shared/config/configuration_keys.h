/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

namespace YubiKeyChalResp {
namespace Shared {
namespace ConfigKeys {

/**
 * @brief Configuration file, group and key names
 *
 * IMPORTANT: Do not change these values as they are persisted in user configuration files.
 */

constexpr const char *CONFIG_FILE_NAME = "yubikey-chalresprc";
constexpr const char *PROTOCOL_GROUP = "Protocol";

// Polling
constexpr const char *POLL_INTERVAL_MS = "PollIntervalMs";
constexpr const char *MAX_POLL_ATTEMPTS = "MaxPollAttempts";
constexpr const char *TOUCH_WAIT_ATTEMPTS = "TouchWaitAttempts";

// Transport
constexpr const char *USB_TIMEOUT_MS = "UsbTimeoutMs";

// Defaults
constexpr int DEFAULT_POLL_INTERVAL_MS = 10;
constexpr int DEFAULT_MAX_POLL_ATTEMPTS = 100;
constexpr int DEFAULT_TOUCH_WAIT_ATTEMPTS = 1500;
constexpr int DEFAULT_USB_TIMEOUT_MS = 2000;

} // namespace ConfigKeys
} // namespace Shared
} // namespace YubiKeyChalResp
