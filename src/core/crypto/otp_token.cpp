/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "otp_token.h"
#include "../logging_categories.h"
#include "../protocol/crc16.h"

#include <QRandomGenerator>

#include <openssl/evp.h>

#include <memory>

namespace YubiKeyChalResp {
namespace Core {

namespace {

using CipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

Result<QByteArray> runCipher(const QByteArray &key, const QByteArray &block, bool encrypt)
{
    if (key.size() != AesKey::SIZE) {
        return Result<QByteArray>::error(ErrorKind::InvalidKeyLength,
                                         QStringLiteral("AES-128 key must be %1 bytes, got %2")
                                             .arg(AesKey::SIZE)
                                             .arg(key.size()));
    }
    if (block.size() != Aes128::BLOCK_SIZE) {
        return Result<QByteArray>::error(ErrorKind::InvalidArgument,
                                         QStringLiteral("AES block must be %1 bytes, got %2")
                                             .arg(Aes128::BLOCK_SIZE)
                                             .arg(block.size()));
    }

    CipherContextPtr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return Result<QByteArray>::error(ErrorKind::IoError, QStringLiteral("EVP_CIPHER_CTX_new failed"));
    }

    const auto *keyData = reinterpret_cast<const unsigned char *>(key.constData());
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr, keyData, nullptr, encrypt ? 1 : 0) != 1
        || EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != 1) {
        qCWarning(ChalRespCryptoLog) << "AES-128 initialization failed";
        return Result<QByteArray>::error(ErrorKind::IoError, QStringLiteral("AES-128 initialization failed"));
    }

    QByteArray out(Aes128::BLOCK_SIZE * 2, '\0');
    auto *outData = reinterpret_cast<unsigned char *>(out.data());
    int written = 0;
    int finalWritten = 0;
    if (EVP_CipherUpdate(ctx.get(), outData, &written,
                         reinterpret_cast<const unsigned char *>(block.constData()), Aes128::BLOCK_SIZE) != 1
        || EVP_CipherFinal_ex(ctx.get(), outData + written, &finalWritten) != 1
        || written + finalWritten != Aes128::BLOCK_SIZE) {
        SecureMemory::wipeByteArray(out);
        qCWarning(ChalRespCryptoLog) << "AES-128 block operation failed";
        return Result<QByteArray>::error(ErrorKind::IoError, QStringLiteral("AES-128 block operation failed"));
    }

    out.truncate(Aes128::BLOCK_SIZE);
    return Result<QByteArray>::success(out);
}

void putLe16(QByteArray &buffer, int offset, quint16 value)
{
    buffer[offset] = static_cast<char>(value & 0xff);
    buffer[offset + 1] = static_cast<char>((value >> 8) & 0xff);
}

quint16 le16(const QByteArray &buffer, int offset)
{
    return static_cast<quint16>(static_cast<quint8>(buffer.at(offset))
                                | (static_cast<quint8>(buffer.at(offset + 1)) << 8));
}

} // namespace

Result<AesKey> AesKey::fromBytes(QByteArray bytes)
{
    if (bytes.size() != SIZE) {
        const qsizetype size = bytes.size();
        SecureMemory::wipeByteArray(bytes);
        return Result<AesKey>::error(ErrorKind::InvalidKeyLength,
                                     QStringLiteral("AES-128 key must be %1 bytes, got %2")
                                         .arg(SIZE)
                                         .arg(size));
    }
    return Result<AesKey>::success(AesKey(SecureBytes(std::move(bytes))));
}

AesKey AesKey::generate()
{
    QByteArray bytes(SIZE, '\0');
    QRandomGenerator::system()->fillRange(reinterpret_cast<quint32 *>(bytes.data()),
                                          SIZE / sizeof(quint32));
    return AesKey(SecureBytes(std::move(bytes)));
}

SecureBytes AesKey::toSecureBytes() const
{
    return SecureBytes(QByteArray(m_secret.constData(), m_secret.size()));
}

Result<QByteArray> Aes128::encryptBlock(const QByteArray &key, const QByteArray &block)
{
    return runCipher(key, block, true);
}

Result<QByteArray> Aes128::decryptBlock(const QByteArray &key, const QByteArray &block)
{
    return runCipher(key, block, false);
}

void OtpToken::setPrivateId(const QByteArray &privateId)
{
    m_privateId = privateId.left(PRIVATE_ID_SIZE);
    if (m_privateId.size() < PRIVATE_ID_SIZE) {
        m_privateId.append(QByteArray(PRIVATE_ID_SIZE - m_privateId.size(), '\0'));
    }
}

QByteArray OtpToken::toBytes()
{
    QByteArray block(SIZE, '\0');
    for (int i = 0; i < PRIVATE_ID_SIZE; ++i) {
        block[i] = m_privateId.at(i);
    }
    putLe16(block, 6, m_useCounter);
    putLe16(block, 8, static_cast<quint16>(m_timestamp & 0xffff));
    block[10] = static_cast<char>((m_timestamp >> 16) & 0xff);
    block[11] = static_cast<char>(m_sessionCounter);
    putLe16(block, 12, m_random);

    m_checksum = static_cast<quint16>(~Crc16::compute(block.constData(), CRC_OFFSET));
    putLe16(block, CRC_OFFSET, m_checksum);
    return block;
}

Result<OtpToken> OtpToken::parse(const QByteArray &block)
{
    if (block.size() != SIZE) {
        return Result<OtpToken>::error(ErrorKind::InvalidArgument,
                                       QStringLiteral("OTP block must be %1 bytes, got %2")
                                           .arg(SIZE)
                                           .arg(block.size()));
    }

    if (!Crc16::isResidualOk(block)) {
        qCDebug(ChalRespCryptoLog) << "OTP block checksum mismatch";
        return Result<OtpToken>::error(ErrorKind::CorruptToken,
                                       QStringLiteral("OTP block checksum mismatch"));
    }

    OtpToken token;
    token.m_privateId = block.left(PRIVATE_ID_SIZE);
    token.m_useCounter = le16(block, 6);
    token.m_timestamp = le16(block, 8) | (static_cast<quint32>(static_cast<quint8>(block.at(10))) << 16);
    token.m_sessionCounter = static_cast<quint8>(block.at(11));
    token.m_random = le16(block, 12);
    token.m_checksum = le16(block, CRC_OFFSET);
    return Result<OtpToken>::success(token);
}

Result<QByteArray> OtpToken::encrypt(const AesKey &key)
{
    QByteArray plain = toBytes();
    auto cipher = Aes128::encryptBlock(key.bytes(), plain);
    SecureMemory::wipeByteArray(plain);
    return cipher;
}

Result<OtpToken> OtpToken::decrypt(const AesKey &key, const QByteArray &ciphertext)
{
    auto plain = Aes128::decryptBlock(key.bytes(), ciphertext);
    if (plain.isError()) {
        return Result<OtpToken>::propagate(plain);
    }
    QByteArray block = plain.takeValue();
    auto token = parse(block);
    SecureMemory::wipeByteArray(block);
    return token;
}

} // namespace Core
} // namespace YubiKeyChalResp
