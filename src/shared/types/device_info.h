/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <optional>

namespace YubiKeyChalResp {
namespace Shared {

/**
 * @brief Identity of an attached token
 *
 * Produced by device discovery and owned by the caller for the whole
 * session. The report size is a property of the device generation: legacy
 * keys use narrower feature reports than current firmware, and the protocol
 * engine sizes its chunking from it.
 */
struct DeviceInfo {
    static constexpr int DEFAULT_REPORT_SIZE = 8;

    QString name;                  ///< USB product string (may be empty)
    std::optional<quint32> serial; ///< Serial number if the token exposes it
    quint16 vendorId = 0;
    quint16 productId = 0;
    quint8 busNumber = 0;
    quint8 deviceAddress = 0;
    int reportSize = DEFAULT_REPORT_SIZE;

    /**
     * @brief Human-readable label "name (vvvv:pppp)"
     */
    QString displayName() const;

    bool operator==(const DeviceInfo &other) const;
};

/**
 * @brief Checks whether a USB id pair belongs to a supported token
 *
 * Covers Yubico keys with the OTP interface, OnlyKey and Nitrokey 3.
 */
bool isSupportedToken(quint16 vendorId, quint16 productId);

} // namespace Shared
} // namespace YubiKeyChalResp
