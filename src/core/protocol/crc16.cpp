/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "crc16.h"

namespace YubiKeyChalResp {
namespace Core {

quint16 Crc16::compute(const QByteArray &data)
{
    return compute(data.constData(), data.size());
}

quint16 Crc16::compute(const char *data, qsizetype length)
{
    quint16 crc = INITIAL_VALUE;
    for (qsizetype i = 0; i < length; ++i) {
        crc ^= static_cast<quint8>(data[i]);
        for (int bit = 0; bit < 8; ++bit) {
            const bool carry = (crc & 0x0001) != 0;
            crc >>= 1;
            if (carry) {
                crc ^= POLYNOMIAL;
            }
        }
    }
    return crc;
}

bool Crc16::isResidualOk(const QByteArray &dataWithCrc)
{
    return dataWithCrc.size() >= 2 && compute(dataWithCrc) == RESIDUAL_OK;
}

} // namespace Core
} // namespace YubiKeyChalResp
