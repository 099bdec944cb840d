/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "types/protocol_types.h"
#include "utils/secure_memory.h"

#include <QByteArray>

namespace YubiKeyChalResp {
namespace Core {
using namespace YubiKeyChalResp::Shared;

/// Ticket flag byte
namespace TicketFlags {
constexpr quint8 CHAL_RESP = 0x40;
}

/// Configuration flag byte. Bit 0x04 means HMAC_LT64 in HMAC mode and
/// PACING_10MS otherwise.
namespace ConfigFlags {
constexpr quint8 PACING_10MS = 0x04;
constexpr quint8 HMAC_LT64 = 0x04;
constexpr quint8 CHAL_BTN_TRIG = 0x08;
constexpr quint8 CHAL_YUBICO = 0x20;
constexpr quint8 CHAL_HMAC = 0x22;
}

/// Extended flag byte
namespace ExtendedFlags {
constexpr quint8 SERIAL_API_VISIBLE = 0x04;
constexpr quint8 ALLOW_UPDATE = 0x20;
}

/**
 * @brief Behavior switches of a challenge-response slot
 */
struct SlotFlags {
    bool requireTouch = false;            ///< Token waits for a button press before answering
    bool variableLengthChallenge = false; ///< HMAC only: challenges shorter than 64 bytes
    bool pacing10ms = false;              ///< OTP only: 10 ms minimum response delay

    bool operator==(const SlotFlags &other) const
    {
        return requireTouch == other.requireTouch
            && variableLengthChallenge == other.variableLengthChallenge
            && pacing10ms == other.pacing10ms;
    }
};

/**
 * @brief Slot configuration record written by program/update commands
 *
 * Record layout (52 bytes):
 *   [0..16)  fixed public id (unused, zero)
 *   [16..22) uid / private id
 *   [22..38) AES key, or the first 16 bytes of the HMAC secret
 *   [38..44) access code (unused, zero)
 *   [44]     fixed size
 *   [45]     extended flags
 *   [46]     ticket flags
 *   [47]     configuration flags
 *   [48..50) reserved
 *   [50..52) ~CRC16 over bytes 0..50, little-endian
 *
 * For HMAC-SHA1 the last 4 secret bytes go into uid[0..4].
 *
 * Move-only; the record holds key material and is wiped on destruction.
 */
class SlotConfiguration
{
public:
    static constexpr int RECORD_SIZE = 52;
    static constexpr int ACCESS_CODE_SIZE = 6;
    static constexpr int PAYLOAD_SIZE = 64;

    static constexpr int FIXED_OFFSET = 0;
    static constexpr int UID_OFFSET = 16;
    static constexpr int UID_SIZE = 6;
    static constexpr int KEY_OFFSET = 22;
    static constexpr int KEY_SIZE = 16;
    static constexpr int ACC_CODE_OFFSET = 38;
    static constexpr int FIXED_SIZE_OFFSET = 44;
    static constexpr int EXT_FLAGS_OFFSET = 45;
    static constexpr int TKT_FLAGS_OFFSET = 46;
    static constexpr int CFG_FLAGS_OFFSET = 47;
    static constexpr int CRC_OFFSET = 50;

    static constexpr int HMAC_SECRET_SIZE = 20;
    static constexpr int AES_SECRET_SIZE = 16;

    SlotConfiguration() = default;

    /**
     * @brief Builds a configuration record
     * @param mode Transform the slot performs
     * @param secret 20-byte HMAC secret or 16-byte AES key; consumed
     * @param flags Behavior switches
     * @param privateId OTP private id (6 bytes, empty for zeros); ignored for HMAC
     * @return Record; InvalidKeyLength for a wrong secret size,
     *         InvalidArgument for a flag the mode does not support or
     *         a malformed private id
     */
    static Result<SlotConfiguration> build(Mode mode,
                                           SecureBytes secret,
                                           const SlotFlags &flags = SlotFlags(),
                                           const QByteArray &privateId = QByteArray());

    /**
     * @brief Configuration that erases a slot
     */
    static SlotConfiguration empty();

    bool isEmpty() const { return m_record.isEmpty(); }
    Mode mode() const { return m_mode; }
    SlotFlags flags() const { return m_flags; }

    /**
     * @brief The 52-byte record (empty for an erase configuration)
     */
    const QByteArray &record() const { return m_record.data(); }

    quint8 extendedFlags() const { return recordByte(EXT_FLAGS_OFFSET); }
    quint8 ticketFlags() const { return recordByte(TKT_FLAGS_OFFSET); }
    quint8 configFlags() const { return recordByte(CFG_FLAGS_OFFSET); }

    /**
     * @brief 64-byte frame payload: record, access code, zero padding
     *
     * All zero for an erase configuration.
     */
    SecureBytes toPayload() const;

private:
    quint8 recordByte(int offset) const;

    SecureBytes m_record;
    Mode m_mode = Mode::Sha1;
    SlotFlags m_flags;
};

} // namespace Core
} // namespace YubiKeyChalResp
