/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "utils/secure_memory.h"

#include <QByteArray>

namespace YubiKeyChalResp {
namespace Core {
using namespace YubiKeyChalResp::Shared;

/**
 * @brief 20-byte HMAC-SHA1 slot secret
 *
 * Move-only; the bytes are wiped when the key is destroyed.
 */
class HmacKey
{
public:
    static constexpr int SIZE = 20;

    HmacKey() = default;

    /**
     * @brief Takes a secret of exactly SIZE bytes
     * @param bytes Secret, wiped by this call
     * @return Key, or InvalidKeyLength
     */
    static Result<HmacKey> fromBytes(QByteArray bytes);

    /**
     * @brief Generates a key from the system CSPRNG
     */
    static HmacKey generate();

    bool isNull() const { return m_secret.isEmpty(); }
    const QByteArray &bytes() const { return m_secret.data(); }

    /**
     * @brief Independent copy of the secret for a configuration call
     */
    SecureBytes toSecureBytes() const;

private:
    explicit HmacKey(SecureBytes secret) : m_secret(std::move(secret)) {}

    SecureBytes m_secret;
};

/**
 * @brief Host-side HMAC-SHA1 (RFC 2104)
 *
 * Mirrors the token's challenge-response computation so a caller that
 * holds the slot secret can check the token's answer.
 */
class HmacSha1
{
public:
    static constexpr int DIGEST_SIZE = 20;
    static constexpr int MAX_CHALLENGE_SIZE = 64;

    /**
     * @brief Plain HMAC-SHA1 over arbitrary key and message
     */
    static QByteArray compute(const QByteArray &key, const QByteArray &message);

    /**
     * @brief Response a slot programmed with key gives for challenge
     * @return 20-byte digest, or InvalidArgument if the challenge exceeds 64 bytes
     */
    static Result<QByteArray> compute(const HmacKey &key, const QByteArray &challenge);

    /**
     * @brief Compares a token response with the expected digest
     * @return true if equal; InvalidArgument for a malformed challenge
     *
     * The comparison runs in constant time.
     */
    static Result<bool> verify(const QByteArray &response, const HmacKey &key, const QByteArray &challenge);

    /**
     * @brief Constant-time byte comparison
     */
    static bool constantTimeEquals(const QByteArray &a, const QByteArray &b);

private:
    HmacSha1() = delete;
};

} // namespace Core
} // namespace YubiKeyChalResp
