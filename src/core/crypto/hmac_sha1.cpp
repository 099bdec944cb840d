/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "hmac_sha1.h"
#include "../logging_categories.h"
#include "utils/secure_logging.h"

#include <QCryptographicHash>
#include <QMessageAuthenticationCode>
#include <QRandomGenerator>

namespace YubiKeyChalResp {
namespace Core {

Result<HmacKey> HmacKey::fromBytes(QByteArray bytes)
{
    if (bytes.size() != SIZE) {
        const qsizetype size = bytes.size();
        SecureMemory::wipeByteArray(bytes);
        return Result<HmacKey>::error(ErrorKind::InvalidKeyLength,
                                      QStringLiteral("HMAC-SHA1 key must be %1 bytes, got %2")
                                          .arg(SIZE)
                                          .arg(size));
    }
    return Result<HmacKey>::success(HmacKey(SecureBytes(std::move(bytes))));
}

HmacKey HmacKey::generate()
{
    QByteArray bytes(SIZE, '\0');
    QRandomGenerator::system()->fillRange(reinterpret_cast<quint32 *>(bytes.data()),
                                          SIZE / sizeof(quint32));
    return HmacKey(SecureBytes(std::move(bytes)));
}

SecureBytes HmacKey::toSecureBytes() const
{
    return SecureBytes(QByteArray(m_secret.constData(), m_secret.size()));
}

QByteArray HmacSha1::compute(const QByteArray &key, const QByteArray &message)
{
    return QMessageAuthenticationCode::hash(message, key, QCryptographicHash::Sha1);
}

Result<QByteArray> HmacSha1::compute(const HmacKey &key, const QByteArray &challenge)
{
    if (key.isNull()) {
        return Result<QByteArray>::error(ErrorKind::InvalidKeyLength, QStringLiteral("Empty HMAC key"));
    }
    if (challenge.size() > MAX_CHALLENGE_SIZE) {
        qCDebug(ChalRespCryptoLog) << "Challenge too long:" << SecureLogging::safeByteInfo(challenge);
        return Result<QByteArray>::error(ErrorKind::InvalidArgument,
                                         QStringLiteral("Challenge of %1 bytes exceeds %2 byte maximum")
                                             .arg(challenge.size())
                                             .arg(MAX_CHALLENGE_SIZE));
    }
    return Result<QByteArray>::success(compute(key.bytes(), challenge));
}

Result<bool> HmacSha1::verify(const QByteArray &response, const HmacKey &key, const QByteArray &challenge)
{
    auto expected = compute(key, challenge);
    if (expected.isError()) {
        return Result<bool>::propagate(expected);
    }
    QByteArray digest = expected.takeValue();
    const bool matches = constantTimeEquals(response, digest);
    SecureMemory::wipeByteArray(digest);
    if (!matches) {
        qCDebug(ChalRespCryptoLog) << "HMAC response does not match";
    }
    return Result<bool>::success(matches);
}

bool HmacSha1::constantTimeEquals(const QByteArray &a, const QByteArray &b)
{
    if (a.size() != b.size()) {
        return false;
    }
    quint8 diff = 0;
    for (qsizetype i = 0; i < a.size(); ++i) {
        diff |= static_cast<quint8>(a.at(i) ^ b.at(i));
    }
    return diff == 0;
}

} // namespace Core
} // namespace YubiKeyChalResp
