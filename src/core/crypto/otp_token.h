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
 * @brief 16-byte AES-128 slot key for Yubico OTP mode
 *
 * Move-only; the bytes are wiped when the key is destroyed.
 */
class AesKey
{
public:
    static constexpr int SIZE = 16;

    AesKey() = default;

    /**
     * @brief Takes a key of exactly SIZE bytes
     * @param bytes Key material, wiped by this call
     * @return Key, or InvalidKeyLength
     */
    static Result<AesKey> fromBytes(QByteArray bytes);

    /**
     * @brief Generates a key from the system CSPRNG
     */
    static AesKey generate();

    bool isNull() const { return m_secret.isEmpty(); }
    const QByteArray &bytes() const { return m_secret.data(); }

    /**
     * @brief Independent copy of the key for a configuration call
     */
    SecureBytes toSecureBytes() const;

private:
    explicit AesKey(SecureBytes secret) : m_secret(std::move(secret)) {}

    SecureBytes m_secret;
};

/**
 * @brief Single-block AES-128 (ECB, no padding) through OpenSSL
 */
class Aes128
{
public:
    static constexpr int BLOCK_SIZE = 16;

    /**
     * @return Ciphertext; InvalidKeyLength or InvalidArgument on wrong sizes,
     *         IoError if OpenSSL fails
     */
    static Result<QByteArray> encryptBlock(const QByteArray &key, const QByteArray &block);
    static Result<QByteArray> decryptBlock(const QByteArray &key, const QByteArray &block);

private:
    Aes128() = delete;
};

/**
 * @brief Decoded Yubico OTP block
 *
 * Layout (16 bytes, little-endian):
 *   [0..6)   private id
 *   [6..8)   usage counter
 *   [8..11)  timestamp (low 16 bits, then high 8 bits)
 *   [11]     session counter
 *   [12..14) random
 *   [14..16) ~CRC16 over bytes 0..14
 *
 * In challenge-response mode the token places the 6-byte challenge in
 * the private id field.
 */
class OtpToken
{
public:
    static constexpr int SIZE = 16;
    static constexpr int PRIVATE_ID_SIZE = 6;
    static constexpr int CRC_OFFSET = 14;
    static constexpr quint32 TIMESTAMP_MASK = 0x00ffffff;

    OtpToken() = default;

    QByteArray privateId() const { return m_privateId; }
    quint16 useCounter() const { return m_useCounter; }
    quint32 timestamp() const { return m_timestamp; }
    quint8 sessionCounter() const { return m_sessionCounter; }
    quint16 random() const { return m_random; }
    quint16 checksum() const { return m_checksum; }

    void setPrivateId(const QByteArray &privateId);
    void setUseCounter(quint16 counter) { m_useCounter = counter; }
    void setTimestamp(quint32 timestamp) { m_timestamp = timestamp & TIMESTAMP_MASK; }
    void setSessionCounter(quint8 counter) { m_sessionCounter = counter; }
    void setRandom(quint16 random) { m_random = random; }

    /**
     * @brief Serializes the block and seals it with its checksum
     *
     * Updates checksum() to the value written.
     */
    QByteArray toBytes();

    /**
     * @brief Parses a plaintext block
     * @return Token; InvalidArgument for a wrong size, CorruptToken if
     *         the checksum does not match
     */
    static Result<OtpToken> parse(const QByteArray &block);

    /**
     * @brief Serializes and encrypts the block
     */
    Result<QByteArray> encrypt(const AesKey &key);

    /**
     * @brief Decrypts and parses a block returned by the token
     */
    static Result<OtpToken> decrypt(const AesKey &key, const QByteArray &ciphertext);

private:
    QByteArray m_privateId = QByteArray(PRIVATE_ID_SIZE, '\0');
    quint16 m_useCounter = 0;
    quint32 m_timestamp = 0;
    quint8 m_sessionCounter = 0;
    quint16 m_random = 0;
    quint16 m_checksum = 0;
};

} // namespace Core
} // namespace YubiKeyChalResp
