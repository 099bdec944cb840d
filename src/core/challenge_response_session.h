/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "types/protocol_types.h"
#include "protocol/device_status.h"
#include "protocol/poll_policy.h"
#include "protocol/protocol_engine.h"
#include "configuration/slot_configuration.h"
#include "crypto/hmac_sha1.h"
#include "crypto/otp_token.h"

#include <QByteArray>

namespace YubiKeyChalResp {
namespace Shared {
class ConfigurationProvider;
}

namespace Core {
using namespace YubiKeyChalResp::Shared;

class IReportTransport;

/**
 * @brief Challenge-response and slot programming on one token
 *
 * Validates arguments, builds frames and checks response checksums;
 * the wire work is delegated to the owned ProtocolEngine.
 *
 * Ownership:
 * - Does NOT own the transport (passed in constructor)
 * - Owns the ProtocolEngine
 *
 * Thread Safety:
 * - Calls are serialized by the engine; use one session per token
 */
class ChallengeResponseSession
{
public:
    static constexpr int HMAC_RESPONSE_SIZE = 22;  ///< Digest + CRC
    static constexpr int OTP_RESPONSE_SIZE = 18;   ///< AES block + CRC
    static constexpr int SERIAL_RESPONSE_SIZE = 6; ///< Big-endian serial + CRC
    static constexpr int OTP_CHALLENGE_SIZE = 6;

    /**
     * @param transport Report channel of the opened token (non-owning)
     * @param policy Polling bounds
     * @param sleeper Poll delay, QThread::msleep if empty
     */
    explicit ChallengeResponseSession(IReportTransport *transport,
                                      const PollPolicy &policy = PollPolicy(),
                                      ProtocolEngine::Sleeper sleeper = ProtocolEngine::Sleeper());

    ChallengeResponseSession(IReportTransport *transport, const ConfigurationProvider &config);

    /**
     * @brief Replaces the polling bounds, e.g. after a configuration reload
     */
    void setPollPolicy(const PollPolicy &policy);
    PollPolicy pollPolicy() const;

    /**
     * @brief Sends a challenge to a slot and returns the response
     * @param variableSize HMAC only: whether the slot was programmed for
     *        variable-length challenges
     * @return 20-byte HMAC digest or 16-byte encrypted OTP block
     */
    Result<QByteArray> challengeResponse(Slot slot, Mode mode, const QByteArray &challenge,
                                         bool variableSize = true);

    /**
     * @brief HMAC-SHA1 challenge-response
     *
     * Variable-size slots take up to 64 bytes; the challenge is padded with
     * 0x00, or 0xFF if it ends in 0x00, and the token strips the padding.
     * Fixed-size slots take exactly 64 bytes.
     *
     * @return 20-byte digest; InvalidArgument for a bad challenge length,
     *         ChecksumMismatch if the response checksum is damaged
     */
    Result<QByteArray> challengeResponseHmac(Slot slot, const QByteArray &challenge, bool variableSize = true);

    /**
     * @brief Yubico OTP challenge-response
     * @param challenge Exactly 6 bytes
     * @return 16-byte encrypted OTP block
     */
    Result<QByteArray> challengeResponseOtp(Slot slot, const QByteArray &challenge);

    /**
     * @brief Checks an HMAC response against the secret held by the host
     */
    static Result<bool> verifyHmacResponse(const QByteArray &response, const HmacKey &key,
                                           const QByteArray &challenge);

    /**
     * @brief Decrypts an OTP response and checks it answers the challenge
     * @return Decoded token; CorruptToken if its checksum fails or its
     *         private id differs from the challenge
     */
    static Result<OtpToken> verifyOtpResponse(const QByteArray &response, const AesKey &key,
                                              const QByteArray &challenge);

    /**
     * @brief Programs a slot with a full configuration
     *
     * Mutates the token and is not idempotent: each successful call
     * advances the program sequence. A failure flagged outcomeUnknown
     * must be followed by readStatus() before retrying.
     *
     * @param config Consumed and wiped
     * @return Status after the write
     */
    Result<DeviceStatus> writeConfiguration(Slot slot, SlotConfiguration &&config);

    /**
     * @brief Updates the flags of a slot programmed with ALLOW_UPDATE
     */
    Result<DeviceStatus> updateConfiguration(Slot slot, SlotConfiguration &&config);

    /**
     * @brief Erases a slot
     */
    Result<DeviceStatus> eraseSlot(Slot slot);

    /**
     * @brief Exchanges the configurations of slot 1 and slot 2
     */
    Result<DeviceStatus> swapSlots();

    Result<DeviceStatus> readStatus();

    /**
     * @brief Whether a slot holds a configuration
     */
    Result<bool> isConfigured(Slot slot);

    /**
     * @brief Reads the serial number
     *
     * Requires the token to expose its serial over the API.
     */
    Result<quint32> readSerial();

private:
    Result<DeviceStatus> program(Command command, SlotConfiguration &&config);
    Result<QByteArray> exchange(Command command, const QByteArray &payload, int expectedBytes);

    ProtocolEngine m_engine;
};

} // namespace Core
} // namespace YubiKeyChalResp
