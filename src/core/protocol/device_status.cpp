/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device_status.h"

namespace YubiKeyChalResp {
namespace Core {

Result<DeviceStatus> DeviceStatus::fromReport(const QByteArray &report)
{
    // Everything up to the program sequence, plus the trailing flag byte
    if (report.size() < PROGRAM_SEQUENCE_OFFSET + 2) {
        return Result<DeviceStatus>::error(ErrorKind::InvalidArgument,
                                           QStringLiteral("Status report too short: %1 bytes")
                                               .arg(report.size()));
    }

    // Narrow reports carry fewer status bytes; missing ones read as zero
    const int dataSize = static_cast<int>(report.size()) - 1;
    const auto byteAt = [&report, dataSize](int index) -> quint8 {
        return index < dataSize ? static_cast<quint8>(report.at(index)) : 0;
    };

    DeviceStatus status;
    status.m_version = FirmwareVersion(byteAt(STATUS_OFFSET), byteAt(STATUS_OFFSET + 1), byteAt(STATUS_OFFSET + 2));
    status.m_programSequence = byteAt(PROGRAM_SEQUENCE_OFFSET);
    status.m_touchLevel = static_cast<quint16>(byteAt(TOUCH_LEVEL_OFFSET) | (byteAt(TOUCH_LEVEL_OFFSET + 1) << 8));
    status.m_flags = static_cast<quint8>(report.at(dataSize));
    return Result<DeviceStatus>::success(status);
}

bool DeviceStatus::isSlotConfigured(Slot slot) const
{
    if (m_programSequence == 0) {
        return false;
    }
    const quint16 mask = slot == Slot::Slot1 ? SLOT1_VALID : SLOT2_VALID;
    return (m_touchLevel & mask) != 0;
}

} // namespace Core
} // namespace YubiKeyChalResp
