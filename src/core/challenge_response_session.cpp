/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "challenge_response_session.h"
#include "logging_categories.h"
#include "protocol/crc16.h"
#include "protocol/frame_codec.h"
#include "config/configuration_provider.h"
#include "utils/secure_logging.h"
#include "utils/secure_memory.h"

namespace YubiKeyChalResp {
namespace Core {

ChallengeResponseSession::ChallengeResponseSession(IReportTransport *transport,
                                                   const PollPolicy &policy,
                                                   ProtocolEngine::Sleeper sleeper)
    : m_engine(transport, policy, std::move(sleeper))
{
}

ChallengeResponseSession::ChallengeResponseSession(IReportTransport *transport,
                                                   const ConfigurationProvider &config)
    : m_engine(transport, PollPolicy::fromConfiguration(config))
{
}

void ChallengeResponseSession::setPollPolicy(const PollPolicy &policy)
{
    m_engine.setPolicy(policy);
}

PollPolicy ChallengeResponseSession::pollPolicy() const
{
    return m_engine.policy();
}

Result<QByteArray> ChallengeResponseSession::challengeResponse(Slot slot, Mode mode,
                                                               const QByteArray &challenge,
                                                               bool variableSize)
{
    if (mode == Mode::Sha1) {
        return challengeResponseHmac(slot, challenge, variableSize);
    }
    return challengeResponseOtp(slot, challenge);
}

Result<QByteArray> ChallengeResponseSession::challengeResponseHmac(Slot slot, const QByteArray &challenge,
                                                                   bool variableSize)
{
    if (challenge.size() > Frame::PAYLOAD_SIZE) {
        return Result<QByteArray>::error(ErrorKind::InvalidArgument,
                                         QStringLiteral("HMAC challenge must be at most %1 bytes, got %2")
                                             .arg(Frame::PAYLOAD_SIZE)
                                             .arg(challenge.size()));
    }
    if (!variableSize && challenge.size() != Frame::PAYLOAD_SIZE) {
        return Result<QByteArray>::error(ErrorKind::InvalidArgument,
                                         QStringLiteral("Fixed-size HMAC slot needs a %1 byte challenge, got %2")
                                             .arg(Frame::PAYLOAD_SIZE)
                                             .arg(challenge.size()));
    }

    // The token strips trailing bytes equal to the last one; pad with a
    // value that differs from the challenge's final byte
    const char padding = challenge.endsWith('\0') ? '\xff' : '\0';
    QByteArray payload(Frame::PAYLOAD_SIZE, padding);
    payload.replace(0, challenge.size(), challenge);

    qCDebug(ChalRespSessionLog) << "HMAC challenge on" << slotName(slot)
                                << SecureLogging::safeByteInfo(challenge);

    auto response = exchange(challengeCommand(slot, Mode::Sha1), payload, HMAC_RESPONSE_SIZE);
    if (response.isError()) {
        return response;
    }

    QByteArray bytes = response.takeValue();
    if (!Crc16::isResidualOk(bytes)) {
        SecureMemory::wipeByteArray(bytes);
        qCWarning(ChalRespSessionLog) << "HMAC response checksum mismatch";
        return Result<QByteArray>::error(ErrorKind::ChecksumMismatch,
                                         QStringLiteral("HMAC response checksum mismatch"));
    }
    bytes.truncate(HmacSha1::DIGEST_SIZE);
    return Result<QByteArray>::success(bytes);
}

Result<QByteArray> ChallengeResponseSession::challengeResponseOtp(Slot slot, const QByteArray &challenge)
{
    if (challenge.size() != OTP_CHALLENGE_SIZE) {
        return Result<QByteArray>::error(ErrorKind::InvalidArgument,
                                         QStringLiteral("OTP challenge must be %1 bytes, got %2")
                                             .arg(OTP_CHALLENGE_SIZE)
                                             .arg(challenge.size()));
    }

    qCDebug(ChalRespSessionLog) << "OTP challenge on" << slotName(slot);

    auto response = exchange(challengeCommand(slot, Mode::Otp), challenge, OTP_RESPONSE_SIZE);
    if (response.isError()) {
        return response;
    }

    QByteArray bytes = response.takeValue();
    if (!Crc16::isResidualOk(bytes)) {
        SecureMemory::wipeByteArray(bytes);
        qCWarning(ChalRespSessionLog) << "OTP response checksum mismatch";
        return Result<QByteArray>::error(ErrorKind::ChecksumMismatch,
                                         QStringLiteral("OTP response checksum mismatch"));
    }
    bytes.truncate(OtpToken::SIZE);
    return Result<QByteArray>::success(bytes);
}

Result<bool> ChallengeResponseSession::verifyHmacResponse(const QByteArray &response, const HmacKey &key,
                                                          const QByteArray &challenge)
{
    return HmacSha1::verify(response, key, challenge);
}

Result<OtpToken> ChallengeResponseSession::verifyOtpResponse(const QByteArray &response, const AesKey &key,
                                                             const QByteArray &challenge)
{
    auto token = OtpToken::decrypt(key, response);
    if (token.isError()) {
        return token;
    }
    if (!HmacSha1::constantTimeEquals(token.value().privateId(), challenge)) {
        qCWarning(ChalRespSessionLog) << "OTP response does not answer the challenge";
        return Result<OtpToken>::error(ErrorKind::CorruptToken,
                                       QStringLiteral("OTP private id does not match the challenge"));
    }
    return token;
}

Result<DeviceStatus> ChallengeResponseSession::writeConfiguration(Slot slot, SlotConfiguration &&config)
{
    qCDebug(ChalRespSessionLog) << "Programming" << slotName(slot);
    return program(programCommand(slot), std::move(config));
}

Result<DeviceStatus> ChallengeResponseSession::updateConfiguration(Slot slot, SlotConfiguration &&config)
{
    qCDebug(ChalRespSessionLog) << "Updating" << slotName(slot);
    return program(updateCommand(slot), std::move(config));
}

Result<DeviceStatus> ChallengeResponseSession::eraseSlot(Slot slot)
{
    qCDebug(ChalRespSessionLog) << "Erasing" << slotName(slot);
    return program(programCommand(slot), SlotConfiguration::empty());
}

Result<DeviceStatus> ChallengeResponseSession::swapSlots()
{
    qCDebug(ChalRespSessionLog) << "Swapping slots";
    return program(Command::SwapSlots, SlotConfiguration::empty());
}

Result<DeviceStatus> ChallengeResponseSession::program(Command command, SlotConfiguration &&config)
{
    // Takes ownership so the record is wiped when this call returns
    const SlotConfiguration owned(std::move(config));
    const SecureBytes payload = owned.toPayload();

    auto encoded = FrameCodec::encode(command, payload.data());
    if (encoded.isError()) {
        return Result<DeviceStatus>::propagate(encoded);
    }
    Frame frame = encoded.takeValue();

    auto result = m_engine.writeProgrammingFrame(frame);
    frame.wipe();

    if (result.isError()) {
        qCWarning(ChalRespSessionLog) << SecureLogging::commandDescription(static_cast<quint8>(command))
                                      << "failed:" << errorKindName(result.errorKind())
                                      << (result.isOutcomeUnknown() ? "(outcome unknown)" : "");
    }
    return result;
}

Result<QByteArray> ChallengeResponseSession::exchange(Command command, const QByteArray &payload,
                                                      int expectedBytes)
{
    auto encoded = FrameCodec::encode(command, payload);
    if (encoded.isError()) {
        return Result<QByteArray>::propagate(encoded);
    }
    return m_engine.exchange(encoded.value(), expectedBytes);
}

Result<DeviceStatus> ChallengeResponseSession::readStatus()
{
    return m_engine.readStatus();
}

Result<bool> ChallengeResponseSession::isConfigured(Slot slot)
{
    const auto status = m_engine.readStatus();
    if (status.isError()) {
        return Result<bool>::propagate(status);
    }
    return Result<bool>::success(status.value().isSlotConfigured(slot));
}

Result<quint32> ChallengeResponseSession::readSerial()
{
    auto response = exchange(Command::DeviceSerial, QByteArray(), SERIAL_RESPONSE_SIZE);
    if (response.isError()) {
        return Result<quint32>::propagate(response);
    }

    const QByteArray bytes = response.value();
    if (!Crc16::isResidualOk(bytes)) {
        qCWarning(ChalRespSessionLog) << "Serial response checksum mismatch";
        return Result<quint32>::error(ErrorKind::ChecksumMismatch,
                                      QStringLiteral("Serial response checksum mismatch"));
    }

    const quint32 serial = (static_cast<quint32>(static_cast<quint8>(bytes.at(0))) << 24)
        | (static_cast<quint32>(static_cast<quint8>(bytes.at(1))) << 16)
        | (static_cast<quint32>(static_cast<quint8>(bytes.at(2))) << 8)
        | static_cast<quint32>(static_cast<quint8>(bytes.at(3)));
    qCDebug(ChalRespSessionLog) << "Serial" << SecureLogging::maskSerial(serial);
    return Result<quint32>::success(serial);
}

} // namespace Core
} // namespace YubiKeyChalResp
