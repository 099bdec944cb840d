/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QLoggingCategory>

namespace YubiKeyChalResp {
namespace Core {

/**
 * @brief Qt Logging Categories for the challenge-response engine
 *
 * Control via environment:
 *   QT_LOGGING_RULES="yubikey.chalresp.*=true"
 */

// Wire protocol
Q_DECLARE_LOGGING_CATEGORY(ChalRespProtocolLog)

// Slot configuration records
Q_DECLARE_LOGGING_CATEGORY(ChalRespConfigLog)

// Host-side transforms
Q_DECLARE_LOGGING_CATEGORY(ChalRespCryptoLog)

// Facade
Q_DECLARE_LOGGING_CATEGORY(ChalRespSessionLog)

// Engine settings
Q_DECLARE_LOGGING_CATEGORY(ChalRespSettingsLog)

// USB transport and discovery
Q_DECLARE_LOGGING_CATEGORY(ChalRespUsbLog)

} // namespace Core
} // namespace YubiKeyChalResp
