/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device_info.h"

#include <array>
#include <utility>

namespace YubiKeyChalResp {
namespace Shared {

namespace {

constexpr quint16 YUBICO_VENDOR_ID = 0x1050;
constexpr quint16 ONLYKEY_VENDOR_ID = 0x1d50;
constexpr quint16 NITROKEY_VENDOR_ID = 0x20a0;

// Yubico product ids exposing the OTP (keyboard) interface
constexpr std::array<quint16, 11> YUBICO_OTP_PRODUCT_IDS = {
    0x0010, // YubiKey (v1/v2)
    0x0110, // NEO OTP
    0x0111, // NEO OTP+CCID
    0x0114, // NEO OTP+FIDO
    0x0116, // NEO OTP+FIDO+CCID
    0x0401, // YubiKey 4/5 OTP
    0x0403, // YubiKey 4/5 OTP+FIDO
    0x0405, // YubiKey 4/5 OTP+CCID
    0x0407, // YubiKey 4/5 OTP+FIDO+CCID
    0x0410, // YubiKey Plus
    0x0420  // YubiKey Bio
};

// (vendor, product) pairs of compatible non-Yubico tokens
constexpr std::array<std::pair<quint16, quint16>, 2> COMPATIBLE_TOKENS = {{
    {ONLYKEY_VENDOR_ID, 0x60fc},
    {NITROKEY_VENDOR_ID, 0x42b2},
}};

} // namespace

QString DeviceInfo::displayName() const
{
    const QString ids = QStringLiteral("%1:%2")
                            .arg(vendorId, 4, 16, QLatin1Char('0'))
                            .arg(productId, 4, 16, QLatin1Char('0'));
    if (name.isEmpty()) {
        return ids;
    }
    return QStringLiteral("%1 (%2)").arg(name, ids);
}

bool DeviceInfo::operator==(const DeviceInfo &other) const
{
    return vendorId == other.vendorId
        && productId == other.productId
        && busNumber == other.busNumber
        && deviceAddress == other.deviceAddress;
}

bool isSupportedToken(quint16 vendorId, quint16 productId)
{
    if (vendorId == YUBICO_VENDOR_ID) {
        for (const quint16 pid : YUBICO_OTP_PRODUCT_IDS) {
            if (pid == productId) {
                return true;
            }
        }
        return false;
    }

    for (const auto &[vid, pid] : COMPATIBLE_TOKENS) {
        if (vid == vendorId && pid == productId) {
            return true;
        }
    }
    return false;
}

} // namespace Shared
} // namespace YubiKeyChalResp
