/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "slot_configuration.h"
#include "../logging_categories.h"
#include "../protocol/crc16.h"

#include <cstring>

namespace YubiKeyChalResp {
namespace Core {

Result<SlotConfiguration> SlotConfiguration::build(Mode mode,
                                                   SecureBytes secret,
                                                   const SlotFlags &flags,
                                                   const QByteArray &privateId)
{
    const int expectedSize = mode == Mode::Sha1 ? HMAC_SECRET_SIZE : AES_SECRET_SIZE;
    if (secret.size() != expectedSize) {
        qCDebug(ChalRespConfigLog) << "Rejecting" << secret.size() << "byte secret for" << modeName(mode);
        return Result<SlotConfiguration>::error(ErrorKind::InvalidKeyLength,
                                                QStringLiteral("%1 secret must be %2 bytes, got %3")
                                                    .arg(modeName(mode))
                                                    .arg(expectedSize)
                                                    .arg(secret.size()));
    }

    if (mode == Mode::Sha1 && flags.pacing10ms) {
        return Result<SlotConfiguration>::error(ErrorKind::InvalidArgument,
                                                QStringLiteral("10 ms pacing is not available in HMAC-SHA1 mode"));
    }
    if (mode == Mode::Otp && flags.variableLengthChallenge) {
        return Result<SlotConfiguration>::error(ErrorKind::InvalidArgument,
                                                QStringLiteral("Yubico OTP mode takes fixed 6-byte challenges"));
    }
    if (mode == Mode::Otp && !privateId.isEmpty() && privateId.size() != UID_SIZE) {
        return Result<SlotConfiguration>::error(ErrorKind::InvalidArgument,
                                                QStringLiteral("Private id must be %1 bytes, got %2")
                                                    .arg(UID_SIZE)
                                                    .arg(privateId.size()));
    }

    QByteArray record(RECORD_SIZE, '\0');
    char *data = record.data();
    quint8 cfgFlags = 0;

    if (mode == Mode::Sha1) {
        std::memcpy(data + KEY_OFFSET, secret.constData(), KEY_SIZE);
        std::memcpy(data + UID_OFFSET, secret.constData() + KEY_SIZE, HMAC_SECRET_SIZE - KEY_SIZE);
        cfgFlags = ConfigFlags::CHAL_HMAC;
        if (flags.variableLengthChallenge) {
            cfgFlags |= ConfigFlags::HMAC_LT64;
        }
    } else {
        std::memcpy(data + KEY_OFFSET, secret.constData(), KEY_SIZE);
        if (!privateId.isEmpty()) {
            std::memcpy(data + UID_OFFSET, privateId.constData(), UID_SIZE);
        }
        cfgFlags = ConfigFlags::CHAL_YUBICO;
        if (flags.pacing10ms) {
            cfgFlags |= ConfigFlags::PACING_10MS;
        }
    }
    if (flags.requireTouch) {
        cfgFlags |= ConfigFlags::CHAL_BTN_TRIG;
    }
    secret.wipe();

    record[EXT_FLAGS_OFFSET] = static_cast<char>(ExtendedFlags::SERIAL_API_VISIBLE | ExtendedFlags::ALLOW_UPDATE);
    record[TKT_FLAGS_OFFSET] = static_cast<char>(TicketFlags::CHAL_RESP);
    record[CFG_FLAGS_OFFSET] = static_cast<char>(cfgFlags);

    const quint16 crc = static_cast<quint16>(~Crc16::compute(record.constData(), CRC_OFFSET));
    record[CRC_OFFSET] = static_cast<char>(crc & 0xff);
    record[CRC_OFFSET + 1] = static_cast<char>((crc >> 8) & 0xff);

    SlotConfiguration config;
    config.m_record = SecureBytes(std::move(record));
    config.m_mode = mode;
    config.m_flags = flags;

    qCDebug(ChalRespConfigLog) << "Built" << modeName(mode) << "configuration, cfg flags"
                               << QString::number(cfgFlags, 16);
    return Result<SlotConfiguration>::success(std::move(config));
}

SlotConfiguration SlotConfiguration::empty()
{
    return SlotConfiguration();
}

SecureBytes SlotConfiguration::toPayload() const
{
    QByteArray payload(PAYLOAD_SIZE, '\0');
    if (!m_record.isEmpty()) {
        // Access code after the record stays zero
        std::memcpy(payload.data(), m_record.constData(), RECORD_SIZE);
    }
    return SecureBytes(std::move(payload));
}

quint8 SlotConfiguration::recordByte(int offset) const
{
    if (m_record.size() != RECORD_SIZE) {
        return 0;
    }
    return static_cast<quint8>(m_record.data().at(offset));
}

} // namespace Core
} // namespace YubiKeyChalResp
