/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>

namespace YubiKeyChalResp {
namespace Core {

/**
 * @brief CRC16 used by the token firmware
 *
 * ISO/IEC 13239 variant: reflected polynomial 0x8408, initial value 0xFFFF,
 * no final XOR. Check value for "123456789" is 0x6F91.
 *
 * Device structures store the one's complement of the CRC, little-endian,
 * after the data it protects. Running the CRC over data followed by that
 * trailer yields RESIDUAL_OK.
 */
class Crc16
{
public:
    static constexpr quint16 INITIAL_VALUE = 0xffff;
    static constexpr quint16 POLYNOMIAL = 0x8408;
    static constexpr quint16 RESIDUAL_OK = 0xf0b8;

    [[nodiscard]] static quint16 compute(const QByteArray &data);
    [[nodiscard]] static quint16 compute(const char *data, qsizetype length);

    /**
     * @brief Checks data that ends with its complemented little-endian CRC
     */
    [[nodiscard]] static bool isResidualOk(const QByteArray &dataWithCrc);

private:
    Crc16() = delete;
};

} // namespace Core
} // namespace YubiKeyChalResp
