/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "shared/utils/secure_memory.h"

#include <QtTest>
#include <QByteArray>

#include <cstring>

using namespace YubiKeyChalResp::Shared;

/**
 * @brief Tests for SecureMemory utility class
 *
 * Verifies secure wiping of key material and the SecureBytes owner.
 */
class TestSecureMemory : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void cleanupTestCase();

    // secureZero() tests
    void testSecureZero_Buffer();
    void testSecureZero_NullPointer();

    // wipeByteArray() tests
    void testWipeByteArray_EmptyArray();
    void testWipeByteArray_NonEmptyArray();
    void testWipeByteArray_SharedCopyUntouched();

    // SecureBytes RAII tests
    void testSecureBytes_DefaultConstructor();
    void testSecureBytes_TakesDeepCopy();
    void testSecureBytes_MoveSemantics();
    void testSecureBytes_MoveAssignment();
    void testSecureBytes_Wipe();
};

void TestSecureMemory::initTestCase()
{
    qDebug() << "Starting SecureMemory tests";
}

void TestSecureMemory::cleanupTestCase()
{
    qDebug() << "SecureMemory tests completed";
}

// ========== secureZero() Tests ==========

void TestSecureMemory::testSecureZero_Buffer()
{
    char buffer[16];
    std::memset(buffer, 0x5a, sizeof(buffer));

    SecureMemory::secureZero(buffer, sizeof(buffer));

    for (const char c : buffer) {
        QCOMPARE(c, '\0');
    }
}

void TestSecureMemory::testSecureZero_NullPointer()
{
    // Must not crash
    SecureMemory::secureZero(nullptr, 32);
    QVERIFY(true);
}

// ========== wipeByteArray() Tests ==========

void TestSecureMemory::testWipeByteArray_EmptyArray()
{
    QByteArray empty;
    SecureMemory::wipeByteArray(empty);
    QVERIFY(empty.isEmpty());
}

void TestSecureMemory::testWipeByteArray_NonEmptyArray()
{
    QByteArray key = QByteArray::fromHex("0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b");
    SecureMemory::wipeByteArray(key);
    QVERIFY(key.isEmpty());
}

void TestSecureMemory::testWipeByteArray_SharedCopyUntouched()
{
    const QByteArray original("secret-bytes");
    QByteArray copy = original;

    SecureMemory::wipeByteArray(copy);

    QVERIFY(copy.isEmpty());
    QCOMPARE(original, QByteArray("secret-bytes"));
}

// ========== SecureBytes Tests ==========

void TestSecureMemory::testSecureBytes_DefaultConstructor()
{
    SecureBytes bytes;
    QVERIFY(bytes.isEmpty());
    QCOMPARE(bytes.size(), qsizetype(0));
}

void TestSecureMemory::testSecureBytes_TakesDeepCopy()
{
    QByteArray source("0123456789abcdef");
    const QByteArray expected = QByteArray("0123456789abcdef");

    SecureBytes bytes(source);

    QCOMPARE(bytes.data(), expected);
    QCOMPARE(bytes.size(), qsizetype(16));
    // The caller's copy is left intact; the owned buffer is independent
    QVERIFY(bytes.constData() != source.constData());
}

void TestSecureMemory::testSecureBytes_MoveSemantics()
{
    SecureBytes first(QByteArray("key material"));
    SecureBytes second(std::move(first));

    QCOMPARE(second.data(), QByteArray("key material"));
    QVERIFY(first.isEmpty()); // NOLINT(bugprone-use-after-move)
}

void TestSecureMemory::testSecureBytes_MoveAssignment()
{
    SecureBytes first(QByteArray("first"));
    SecureBytes second(QByteArray("second"));

    second = std::move(first);

    QCOMPARE(second.data(), QByteArray("first"));
}

void TestSecureMemory::testSecureBytes_Wipe()
{
    SecureBytes bytes(QByteArray(20, '\x42'));
    QCOMPARE(bytes.size(), qsizetype(20));

    bytes.wipe();

    QVERIFY(bytes.isEmpty());
}

QTEST_MAIN(TestSecureMemory)
#include "test_secure_memory.moc"
