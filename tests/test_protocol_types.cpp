/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QtTest>
#include "shared/types/protocol_types.h"
#include "shared/types/device_info.h"
#include "shared/types/firmware_version.h"

using namespace YubiKeyChalResp::Shared;

/**
 * @brief Unit tests for slot/mode/command helpers, DeviceInfo and FirmwareVersion
 */
class TestProtocolTypes : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // Slot parsing
    void testSlotFromString();
    void testSlotFromInt();

    // Command selection
    void testChallengeCommand();
    void testProgramAndUpdateCommands();
    void testIsKnownCommand();
    void testIsProgrammingCommand();

    // DeviceInfo
    void testSupportedTokens();
    void testDisplayName();
    void testDeviceEquality();

    // FirmwareVersion
    void testVersionCompare();
    void testVersionFeatures();
};

void TestProtocolTypes::testSlotFromString()
{
    QCOMPARE(slotFromString(QStringLiteral("1")).value(), Slot::Slot1);
    QCOMPARE(slotFromString(QStringLiteral(" 2 ")).value(), Slot::Slot2);
    QVERIFY(!slotFromString(QStringLiteral("3")).has_value());
    QVERIFY(!slotFromString(QString()).has_value());
}

void TestProtocolTypes::testSlotFromInt()
{
    QCOMPARE(slotFromInt(1).value(), Slot::Slot1);
    QCOMPARE(slotFromInt(2).value(), Slot::Slot2);
    QVERIFY(!slotFromInt(0).has_value());
}

void TestProtocolTypes::testChallengeCommand()
{
    QCOMPARE(challengeCommand(Slot::Slot1, Mode::Sha1), Command::ChallengeHmac1);
    QCOMPARE(challengeCommand(Slot::Slot2, Mode::Sha1), Command::ChallengeHmac2);
    QCOMPARE(challengeCommand(Slot::Slot1, Mode::Otp), Command::ChallengeOtp1);
    QCOMPARE(challengeCommand(Slot::Slot2, Mode::Otp), Command::ChallengeOtp2);
}

void TestProtocolTypes::testProgramAndUpdateCommands()
{
    QCOMPARE(static_cast<quint8>(programCommand(Slot::Slot1)), quint8(0x01));
    QCOMPARE(static_cast<quint8>(programCommand(Slot::Slot2)), quint8(0x03));
    QCOMPARE(static_cast<quint8>(updateCommand(Slot::Slot1)), quint8(0x04));
    QCOMPARE(static_cast<quint8>(updateCommand(Slot::Slot2)), quint8(0x05));
}

void TestProtocolTypes::testIsKnownCommand()
{
    QVERIFY(isKnownCommand(0x10));
    QVERIFY(isKnownCommand(0x38));
    QVERIFY(!isKnownCommand(0x00));
    QVERIFY(!isKnownCommand(0x02));
    QVERIFY(!isKnownCommand(0xff));
}

void TestProtocolTypes::testIsProgrammingCommand()
{
    QVERIFY(isProgrammingCommand(Command::ProgramSlot2));
    QVERIFY(isProgrammingCommand(Command::SwapSlots));
    QVERIFY(!isProgrammingCommand(Command::DeviceSerial));
    QVERIFY(!isProgrammingCommand(Command::ChallengeHmac1));
}

void TestProtocolTypes::testSupportedTokens()
{
    QVERIFY(isSupportedToken(0x1050, 0x0407));
    QVERIFY(isSupportedToken(0x1050, 0x0010));
    QVERIFY(isSupportedToken(0x1d50, 0x60fc));
    // FIDO-only YubiKey has no OTP interface
    QVERIFY(!isSupportedToken(0x1050, 0x0402));
    QVERIFY(!isSupportedToken(0x046d, 0xc52b));
}

void TestProtocolTypes::testDisplayName()
{
    DeviceInfo info;
    info.vendorId = 0x1050;
    info.productId = 0x0407;
    QCOMPARE(info.displayName(), QStringLiteral("1050:0407"));

    info.name = QStringLiteral("YubiKey OTP+FIDO+CCID");
    QCOMPARE(info.displayName(), QStringLiteral("YubiKey OTP+FIDO+CCID (1050:0407)"));
}

void TestProtocolTypes::testDeviceEquality()
{
    DeviceInfo first;
    first.vendorId = 0x1050;
    first.productId = 0x0407;
    first.busNumber = 3;
    first.deviceAddress = 12;

    DeviceInfo second = first;
    second.serial = 1234567;
    QVERIFY(first == second);

    second.deviceAddress = 13;
    QVERIFY(!(first == second));
}

void TestProtocolTypes::testVersionCompare()
{
    QVERIFY(FirmwareVersion(2, 2, 0) >= FirmwareVersion(2, 2, 0));
    QVERIFY(FirmwareVersion(2, 1, 9) < FirmwareVersion(2, 2, 0));
    QVERIFY(FirmwareVersion(5, 4, 3) != FirmwareVersion(5, 4, 2));
    QCOMPARE(FirmwareVersion(5, 4, 3).toString(), QStringLiteral("5.4.3"));
    QVERIFY(!FirmwareVersion().isValid());
    QCOMPARE(FirmwareVersion(5, 4, 3).major(), 5);
    QCOMPARE(FirmwareVersion(5, 4, 3).build(), 3);
}

void TestProtocolTypes::testVersionFeatures()
{
    const FirmwareVersion old(2, 1, 9);
    QVERIFY(!old.supportsChallengeResponse());
    QVERIFY(!old.supportsSerialReadout());
    QVERIFY(!old.supportsSlotUpdate());

    const FirmwareVersion chalResp(2, 2, 0);
    QVERIFY(chalResp.supportsChallengeResponse());
    QVERIFY(chalResp.supportsSerialReadout());
    QVERIFY(!chalResp.supportsSlotUpdate());

    QVERIFY(FirmwareVersion(2, 3, 0).supportsSlotUpdate());
    QVERIFY(FirmwareVersion(5, 4, 3).supportsSlotUpdate());
}

QTEST_MAIN(TestProtocolTypes)
#include "test_protocol_types.moc"
