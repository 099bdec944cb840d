/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef YUBIKEY_CHALRESP_SECURE_LOGGING_H
#define YUBIKEY_CHALRESP_SECURE_LOGGING_H

#include <QString>
#include <QByteArray>

namespace YubiKeyChalResp {
namespace Shared {

/**
 * @brief Utility functions for logging without exposing sensitive data.
 *
 * SECURITY POLICY:
 * - NEVER log HMAC secrets, AES keys or configuration payloads
 * - NEVER log challenge responses or decrypted OTP fields
 * - NEVER log complete frames or report contents
 * - Mask serial numbers (show only last 4 digits)
 */
namespace SecureLogging {

/**
 * @brief Returns a safe representation of byte array for logging.
 * Only shows length, never content.
 */
inline QString safeByteInfo(const QByteArray &data)
{
    return QStringLiteral("[%1 bytes]").arg(data.length());
}

/**
 * @brief Returns masked serial number (shows only last 4 digits).
 */
inline QString maskSerial(quint32 serial)
{
    if (serial == 0) {
        return QStringLiteral("(none)");
    }
    const QString serialStr = QString::number(serial);
    if (serialStr.length() <= 4) {
        return serialStr;
    }
    return QStringLiteral("****%1").arg(serialStr.right(4));
}

/**
 * @brief Returns command description without payload bytes.
 * @param command Frame command byte
 */
inline QString commandDescription(quint8 command)
{
    switch (command) {
    case 0x01: return QStringLiteral("PROGRAM_SLOT1");
    case 0x03: return QStringLiteral("PROGRAM_SLOT2");
    case 0x04: return QStringLiteral("UPDATE_SLOT1");
    case 0x05: return QStringLiteral("UPDATE_SLOT2");
    case 0x06: return QStringLiteral("SWAP_SLOTS");
    case 0x10: return QStringLiteral("DEVICE_SERIAL");
    case 0x11: return QStringLiteral("DEVICE_CONFIG");
    case 0x1c: return QStringLiteral("READ_CONFIG1");
    case 0x1d: return QStringLiteral("READ_CONFIG2");
    case 0x20: return QStringLiteral("CHALLENGE_OTP1");
    case 0x28: return QStringLiteral("CHALLENGE_OTP2");
    case 0x30: return QStringLiteral("CHALLENGE_HMAC1");
    case 0x38: return QStringLiteral("CHALLENGE_HMAC2");
    default: return QStringLiteral("CMD_0x%1").arg(command, 2, 16, QLatin1Char('0'));
    }
}

/**
 * @brief Returns the report flag byte as hex for logging.
 * Flag bytes carry no secret data.
 */
inline QString flagInfo(quint8 flags)
{
    return QStringLiteral("0x%1").arg(flags, 2, 16, QLatin1Char('0'));
}

} // namespace SecureLogging

} // namespace Shared
} // namespace YubiKeyChalResp

#endif // YUBIKEY_CHALRESP_SECURE_LOGGING_H
