/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "error_kind.h"

namespace YubiKeyChalResp {
namespace Shared {

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return QStringLiteral("None");
    case ErrorKind::NotFound:
        return QStringLiteral("NotFound");
    case ErrorKind::IoError:
        return QStringLiteral("IoError");
    case ErrorKind::ChecksumMismatch:
        return QStringLiteral("ChecksumMismatch");
    case ErrorKind::Timeout:
        return QStringLiteral("Timeout");
    case ErrorKind::InvalidArgument:
        return QStringLiteral("InvalidArgument");
    case ErrorKind::InvalidKeyLength:
        return QStringLiteral("InvalidKeyLength");
    case ErrorKind::CorruptToken:
        return QStringLiteral("CorruptToken");
    case ErrorKind::DeviceRejected:
        return QStringLiteral("DeviceRejected");
    }
    return QStringLiteral("Unknown");
}

} // namespace Shared
} // namespace YubiKeyChalResp
