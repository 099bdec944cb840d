/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "types/protocol_types.h"
#include "types/firmware_version.h"

#include <QByteArray>

namespace YubiKeyChalResp {
namespace Core {
using namespace YubiKeyChalResp::Shared;

/**
 * @brief Status block the token returns on a plain report read
 *
 * Report layout: byte 0 is unused, bytes 1..6 hold the status
 * (major, minor, build, program sequence, touch level u16 LE) and the
 * last byte is the report flag byte. Reports narrower than 8 bytes
 * truncate the status; the program sequence must still be present.
 */
class DeviceStatus
{
public:
    static constexpr int STATUS_OFFSET = 1;
    static constexpr int STATUS_SIZE = 6;
    static constexpr int PROGRAM_SEQUENCE_OFFSET = 4;
    static constexpr int TOUCH_LEVEL_OFFSET = 5;

    static constexpr quint16 SLOT1_VALID = 0x01;
    static constexpr quint16 SLOT2_VALID = 0x02;

    DeviceStatus() = default;

    /**
     * @brief Parses a status report
     * @param report One report as read from the transport
     * @return Status, or InvalidArgument if the report ends before the program sequence
     */
    static Result<DeviceStatus> fromReport(const QByteArray &report);

    const FirmwareVersion &version() const { return m_version; }
    quint8 programSequence() const { return m_programSequence; }
    quint16 touchLevel() const { return m_touchLevel; }
    quint8 flags() const { return m_flags; }

    /**
     * @brief Whether the touch level marks the slot as programmed
     *
     * A program sequence of 0 means no slot holds a configuration,
     * whatever the touch level says.
     */
    bool isSlotConfigured(Slot slot) const;

private:
    FirmwareVersion m_version;
    quint8 m_programSequence = 0;
    quint16 m_touchLevel = 0;
    quint8 m_flags = 0;
};

} // namespace Core
} // namespace YubiKeyChalResp
