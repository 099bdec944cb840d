/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "firmware_version.h"

namespace YubiKeyChalResp {
namespace Shared {

namespace {
constexpr FirmwareVersion CHALLENGE_RESPONSE_SINCE(2, 2, 0);
constexpr FirmwareVersion SLOT_UPDATE_SINCE(2, 3, 0);
constexpr FirmwareVersion SERIAL_READOUT_SINCE(2, 2, 0);
} // namespace

bool FirmwareVersion::supportsChallengeResponse() const noexcept
{
    return *this >= CHALLENGE_RESPONSE_SINCE;
}

bool FirmwareVersion::supportsSlotUpdate() const noexcept
{
    return *this >= SLOT_UPDATE_SINCE;
}

bool FirmwareVersion::supportsSerialReadout() const noexcept
{
    return *this >= SERIAL_READOUT_SINCE;
}

QString FirmwareVersion::toString() const
{
    return QStringLiteral("%1.%2.%3").arg(major()).arg(minor()).arg(build());
}

} // namespace Shared
} // namespace YubiKeyChalResp
