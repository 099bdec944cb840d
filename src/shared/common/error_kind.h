/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>

namespace YubiKeyChalResp {
namespace Shared {

/**
 * @brief Stable failure categories reported by every operation
 *
 * Use these for programmatic error comparison instead of comparing
 * the human-readable message carried next to them in Result.
 */
enum class ErrorKind : quint8 {
    None = 0,          ///< No error (successful result)
    NotFound,          ///< No matching device attached
    IoError,           ///< Transport failure (device removed, permission denied, short transfer)
    ChecksumMismatch,  ///< Frame or response corrupted in transit
    Timeout,           ///< Poll attempt budget exhausted
    InvalidArgument,   ///< Payload/challenge outside protocol size limits
    InvalidKeyLength,  ///< Secret material has the wrong size for the mode
    CorruptToken,      ///< Decoded OTP block failed its internal checksum
    DeviceRejected     ///< Device finished a write without committing it
};

/**
 * @brief Gets identifier-style name of an error kind
 * @param kind Error kind
 * @return Name such as "Timeout" or "ChecksumMismatch"
 */
QString errorKindName(ErrorKind kind);

} // namespace Shared
} // namespace YubiKeyChalResp
