/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <QtGlobal>

namespace YubiKeyChalResp {
namespace Shared {

/**
 * @brief Firmware version reported in the first three status bytes
 *
 * Stored packed as 0x00MMmmbb so ordering is a plain integer compare.
 * Feature queries follow the firmware releases that introduced them.
 */
class FirmwareVersion
{
public:
    constexpr FirmwareVersion() noexcept = default;
    constexpr FirmwareVersion(quint8 major, quint8 minor, quint8 build) noexcept
        : m_packed((static_cast<quint32>(major) << 16) | (static_cast<quint32>(minor) << 8) | build)
    {
    }

    [[nodiscard]] constexpr int major() const noexcept { return static_cast<int>((m_packed >> 16) & 0xff); }
    [[nodiscard]] constexpr int minor() const noexcept { return static_cast<int>((m_packed >> 8) & 0xff); }
    [[nodiscard]] constexpr int build() const noexcept { return static_cast<int>(m_packed & 0xff); }

    /// A token that never filled the status bytes reports 0.0.0
    [[nodiscard]] constexpr bool isValid() const noexcept { return m_packed != 0; }

    /// HMAC-SHA1 and Yubico OTP challenge-response (2.2)
    [[nodiscard]] bool supportsChallengeResponse() const noexcept;
    /// UpdateSlot and SwapSlots commands (2.3)
    [[nodiscard]] bool supportsSlotUpdate() const noexcept;
    /// DeviceSerial command (2.2)
    [[nodiscard]] bool supportsSerialReadout() const noexcept;

    [[nodiscard]] QString toString() const;

    constexpr bool operator==(const FirmwareVersion &other) const noexcept { return m_packed == other.m_packed; }
    constexpr bool operator!=(const FirmwareVersion &other) const noexcept { return m_packed != other.m_packed; }
    constexpr bool operator<(const FirmwareVersion &other) const noexcept { return m_packed < other.m_packed; }
    constexpr bool operator>=(const FirmwareVersion &other) const noexcept { return m_packed >= other.m_packed; }

private:
    quint32 m_packed = 0;
};

} // namespace Shared
} // namespace YubiKeyChalResp
