/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QtTest>
#include "core/protocol/protocol_engine.h"
#include "core/protocol/frame_codec.h"
#include "mocks/scripted_report_transport.h"

using namespace YubiKeyChalResp::Core;
using namespace YubiKeyChalResp::Shared;

/**
 * @brief Unit tests for ProtocolEngine
 *
 * Drives the engine against a scripted report transport and checks the
 * polling budgets, chunk handling and write commit detection.
 */
class TestProtocolEngine : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();

    // Polling
    void testReadStatus_Idle();
    void testReadStatus_BusyThenReady();
    void testReadStatus_BusyExhaustsBudget();
    void testReadStatus_IoErrorNotRetried();
    void testReadStatus_ReportSizeTooSmall();
    void testReadStatus_NoTransport();
    void testReadStatus_NegativeIntervalClamped();

    // Writing
    void testWriteFrame_SkipsZeroChunks();
    void testWriteFrame_WaitsBeforeEachChunk();
    void testWriteProgrammingFrame_SequenceAdvances();
    void testWriteProgrammingFrame_Rejected();
    void testWriteProgrammingFrame_EraseLastSlot();
    void testWriteProgrammingFrame_FinalWriteFailsOutcomeUnknown();
    void testWriteProgrammingFrame_EarlyWriteFailsOutcomeKnown();
    void testWriteProgrammingFrame_CommitTimeoutOutcomeUnknown();
    void testAwaitProgramSequenceChange_Advanced();
    void testAwaitProgramSequenceChange_Unchanged();
    void testAwaitProgramSequenceChange_EraseToZero();
    void testAwaitProgramSequenceChange_TimeoutOutcomeUnknown();

    // Exchange
    void testExchange_CollectsChunks();
    void testExchange_TouchUsesTouchBudget();
    void testExchange_TouchBudgetExhausted();
    void testExchange_ShortResponse();
    void testExchange_NoResponse();
    void testExchange_InvalidExpectedLength();

    // Reset
    void testWriteReset_SendsResetReport();
    void testWriteReset_WriteFails();

private:
    static constexpr int REPORT_SIZE = 8;
    static constexpr int CHUNKS = 10;

    ProtocolEngine::Sleeper countingSleeper();
    static Frame fullFrame(Command command);

    int m_sleeps = 0;
    QList<int> m_sleepDurations;
};

void TestProtocolEngine::init()
{
    m_sleeps = 0;
    m_sleepDurations.clear();
}

ProtocolEngine::Sleeper TestProtocolEngine::countingSleeper()
{
    return [this](int milliseconds) {
        ++m_sleeps;
        m_sleepDurations.append(milliseconds);
    };
}

Frame TestProtocolEngine::fullFrame(Command command)
{
    // Non-zero payload so no chunk is skipped
    auto encoded = FrameCodec::encode(command, QByteArray(Frame::PAYLOAD_SIZE, '\x11'));
    return encoded.value();
}

// ========== Polling Tests ==========

void TestProtocolEngine::testReadStatus_Idle()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.setIdleReport(transport.report(0, 9, 0x0001));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto status = engine.readStatus();
    QVERIFY(status.isSuccess());
    QCOMPARE(status.value().programSequence(), quint8(9));
    QVERIFY(status.value().isSlotConfigured(Slot::Slot1));
    QCOMPARE(transport.readCount(), 1);
    QCOMPARE(m_sleeps, 0);
}

void TestProtocolEngine::testReadStatus_BusyThenReady()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReports(transport.report(ReportFlags::SLOT_WRITE), 2);
    PollPolicy policy;
    policy.maxAttempts = 3;
    ProtocolEngine engine(&transport, policy, countingSleeper());

    auto status = engine.readStatus();
    QVERIFY(status.isSuccess());
    QCOMPARE(transport.readCount(), 3);
    QCOMPARE(m_sleeps, 2);
}

void TestProtocolEngine::testReadStatus_BusyExhaustsBudget()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReports(transport.report(ReportFlags::SLOT_WRITE), 5);
    PollPolicy policy;
    policy.maxAttempts = 3;
    ProtocolEngine engine(&transport, policy, countingSleeper());

    auto status = engine.readStatus();
    QVERIFY(status.isError());
    QCOMPARE(status.errorKind(), ErrorKind::Timeout);
    QVERIFY(!status.isOutcomeUnknown());
    // Never more reads than the budget, no sleep after the last one
    QCOMPARE(transport.readCount(), 3);
    QCOMPARE(m_sleeps, 2);
}

void TestProtocolEngine::testReadStatus_IoErrorNotRetried()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReadError();
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto status = engine.readStatus();
    QCOMPARE(status.errorKind(), ErrorKind::IoError);
    QCOMPARE(transport.readCount(), 1);
    QCOMPARE(m_sleeps, 0);
}

void TestProtocolEngine::testReadStatus_ReportSizeTooSmall()
{
    ScriptedReportTransport transport(FrameCodec::MIN_REPORT_SIZE - 1);
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto status = engine.readStatus();
    QCOMPARE(status.errorKind(), ErrorKind::InvalidArgument);
    QCOMPARE(transport.readCount(), 0);
}

void TestProtocolEngine::testReadStatus_NoTransport()
{
    ProtocolEngine engine(nullptr, PollPolicy(), countingSleeper());

    auto status = engine.readStatus();
    QCOMPARE(status.errorKind(), ErrorKind::IoError);
}

void TestProtocolEngine::testReadStatus_NegativeIntervalClamped()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReports(transport.report(ReportFlags::SLOT_WRITE), 2);
    PollPolicy policy;
    policy.pollIntervalMs = -5;
    ProtocolEngine engine(&transport, policy, countingSleeper());

    auto status = engine.readStatus();
    QVERIFY(status.isSuccess());
    QCOMPARE(m_sleeps, 2);
    QCOMPARE(m_sleepDurations, QList<int>({0, 0}));
}

// ========== Writing Tests ==========

void TestProtocolEngine::testWriteFrame_SkipsZeroChunks()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    // All-zero payload: only the first chunk and the one carrying command and CRC go out
    auto encoded = FrameCodec::encode(Command::ProgramSlot1, QByteArray());
    QVERIFY(encoded.isSuccess());

    auto written = engine.writeFrame(encoded.value());
    QVERIFY(written.isSuccess());

    const QList<QByteArray> writes = transport.writes();
    QCOMPARE(writes.size(), qsizetype(2));
    QCOMPARE(static_cast<quint8>(writes.at(0).at(REPORT_SIZE - 1)), quint8(0x80));
    QCOMPARE(static_cast<quint8>(writes.at(1).at(REPORT_SIZE - 1)), quint8(0x80 | (CHUNKS - 1)));
    // Last chunk starts at frame offset 63: zero, command, CRC low, CRC high, filler
    QCOMPARE(writes.at(1).left(REPORT_SIZE - 1), QByteArray::fromHex("000107cc000000"));
}

void TestProtocolEngine::testWriteFrame_WaitsBeforeEachChunk()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto written = engine.writeFrame(fullFrame(Command::ChallengeHmac1));
    QVERIFY(written.isSuccess());
    QCOMPARE(transport.writeCount(), CHUNKS);
    QCOMPARE(transport.readCount(), CHUNKS);
}

void TestProtocolEngine::testWriteProgrammingFrame_SequenceAdvances()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    // Status read plus one ready read per chunk, then the committed status
    transport.queueReports(transport.report(0, 4), 1 + CHUNKS);
    transport.queueReport(transport.report(ReportFlags::SLOT_WRITE, 4));
    transport.queueReport(transport.report(0, 5, 0x0001));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto status = engine.writeProgrammingFrame(fullFrame(Command::ProgramSlot1));
    QVERIFY(status.isSuccess());
    QCOMPARE(status.value().programSequence(), quint8(5));
    QCOMPARE(transport.pendingReads(), 0);
    QCOMPARE(m_sleeps, 1);
}

void TestProtocolEngine::testWriteProgrammingFrame_Rejected()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.setIdleReport(transport.report(0, 4, 0x0001));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto status = engine.writeProgrammingFrame(fullFrame(Command::ProgramSlot1));
    QVERIFY(status.isError());
    QCOMPARE(status.errorKind(), ErrorKind::DeviceRejected);
    QVERIFY(!status.isOutcomeUnknown());
}

void TestProtocolEngine::testWriteProgrammingFrame_EraseLastSlot()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    // Erasing the only configured slot returns the sequence to 0; the
    // empty frame goes out in two chunks
    transport.queueReports(transport.report(0, 0), 3);
    transport.setIdleReport(transport.report(0, 0));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto encoded = FrameCodec::encode(Command::ProgramSlot2, QByteArray());
    QVERIFY(encoded.isSuccess());

    auto status = engine.writeProgrammingFrame(encoded.value());
    QVERIFY(status.isSuccess());
    QCOMPARE(status.value().programSequence(), quint8(0));
}

void TestProtocolEngine::testWriteProgrammingFrame_FinalWriteFailsOutcomeUnknown()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.failWriteAt(CHUNKS);
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto status = engine.writeProgrammingFrame(fullFrame(Command::ProgramSlot1));
    QCOMPARE(status.errorKind(), ErrorKind::IoError);
    QVERIFY(status.isOutcomeUnknown());
}

void TestProtocolEngine::testWriteProgrammingFrame_EarlyWriteFailsOutcomeKnown()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.failWriteAt(3);
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto status = engine.writeProgrammingFrame(fullFrame(Command::ProgramSlot1));
    QCOMPARE(status.errorKind(), ErrorKind::IoError);
    QVERIFY(!status.isOutcomeUnknown());
    QCOMPARE(transport.writeCount(), 3);
}

void TestProtocolEngine::testWriteProgrammingFrame_CommitTimeoutOutcomeUnknown()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReports(transport.report(0, 4), 1 + CHUNKS);
    transport.setIdleReport(transport.report(ReportFlags::SLOT_WRITE, 4));
    PollPolicy policy;
    policy.maxAttempts = 4;
    ProtocolEngine engine(&transport, policy, countingSleeper());

    auto status = engine.writeProgrammingFrame(fullFrame(Command::ProgramSlot1));
    QCOMPARE(status.errorKind(), ErrorKind::Timeout);
    QVERIFY(status.isOutcomeUnknown());
    QCOMPARE(transport.readCount(), 1 + CHUNKS + 4);
}

void TestProtocolEngine::testAwaitProgramSequenceChange_Advanced()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReport(transport.report(ReportFlags::SLOT_WRITE, 7));
    transport.queueReport(transport.report(0, 8, 0x0003));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto status = engine.awaitProgramSequenceChange(7);
    QVERIFY(status.isSuccess());
    QCOMPARE(status.value().programSequence(), quint8(8));
    QCOMPARE(transport.readCount(), 2);
    QCOMPARE(transport.writeCount(), 0);
}

void TestProtocolEngine::testAwaitProgramSequenceChange_Unchanged()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.setIdleReport(transport.report(0, 7, 0x0001));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto status = engine.awaitProgramSequenceChange(7);
    QCOMPARE(status.errorKind(), ErrorKind::DeviceRejected);
    QVERIFY(!status.isOutcomeUnknown());
}

void TestProtocolEngine::testAwaitProgramSequenceChange_EraseToZero()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.setIdleReport(transport.report(0, 0));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    // Sequence already 0 only counts as committed for an erase
    QVERIFY(engine.awaitProgramSequenceChange(0, true).isSuccess());
    QCOMPARE(engine.awaitProgramSequenceChange(0, false).errorKind(), ErrorKind::DeviceRejected);
}

void TestProtocolEngine::testAwaitProgramSequenceChange_TimeoutOutcomeUnknown()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.setIdleReport(transport.report(ReportFlags::SLOT_WRITE, 7));
    PollPolicy policy;
    policy.maxAttempts = 3;
    ProtocolEngine engine(&transport, policy, countingSleeper());

    auto status = engine.awaitProgramSequenceChange(7);
    QCOMPARE(status.errorKind(), ErrorKind::Timeout);
    QVERIFY(status.isOutcomeUnknown());
    QCOMPARE(transport.readCount(), 3);
}

// ========== Exchange Tests ==========

void TestProtocolEngine::testExchange_CollectsChunks()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    const QByteArray expected = QByteArray::fromHex("00112233445566778899aabbccddeeff0102030405");
    transport.queueReports(transport.report(0), CHUNKS);
    transport.queueReport(transport.report(ReportFlags::SLOT_WRITE));
    transport.queueReport(transport.dataReport(expected.mid(0, 7), ReportFlags::RESP_PENDING | 0));
    transport.queueReport(transport.dataReport(expected.mid(7, 7), ReportFlags::RESP_PENDING | 1));
    transport.queueReport(transport.dataReport(expected.mid(14, 7), ReportFlags::RESP_PENDING | 2));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto response = engine.exchange(fullFrame(Command::ChallengeHmac1), 20);
    QVERIFY(response.isSuccess());
    QCOMPARE(response.value(), expected.left(20));

    // Response read mode ends with the reset report
    const QByteArray reset = transport.writes().constLast();
    QCOMPARE(static_cast<quint8>(reset.at(REPORT_SIZE - 1)), ReportFlags::WRITE_RESET);
    QCOMPARE(transport.pendingReads(), 0);
}

void TestProtocolEngine::testExchange_TouchUsesTouchBudget()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReports(transport.report(0), CHUNKS);
    transport.queueReports(transport.report(ReportFlags::RESP_TIMEOUT_WAIT | 1), 3);
    transport.queueReport(transport.dataReport(QByteArray(7, 'a'), ReportFlags::RESP_PENDING | 0));
    PollPolicy policy;
    policy.maxAttempts = 2;
    policy.touchWaitAttempts = 4;
    ProtocolEngine engine(&transport, policy, countingSleeper());

    auto response = engine.exchange(fullFrame(Command::ChallengeHmac2), 7);
    QVERIFY(response.isSuccess());
    QCOMPARE(response.value(), QByteArray(7, 'a'));
    QCOMPARE(m_sleeps, 3);
}

void TestProtocolEngine::testExchange_TouchBudgetExhausted()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReports(transport.report(0), CHUNKS);
    transport.setIdleReport(transport.report(ReportFlags::RESP_TIMEOUT_WAIT | 1));
    PollPolicy policy;
    policy.maxAttempts = 50;
    policy.touchWaitAttempts = 4;
    ProtocolEngine engine(&transport, policy, countingSleeper());

    auto response = engine.exchange(fullFrame(Command::ChallengeHmac2), 7);
    QCOMPARE(response.errorKind(), ErrorKind::Timeout);
    QCOMPARE(transport.readCount(), CHUNKS + 4);
    QCOMPARE(m_sleeps, 3);
}

void TestProtocolEngine::testExchange_ShortResponse()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReports(transport.report(0), CHUNKS);
    transport.queueReport(transport.dataReport(QByteArray(7, 'a'), ReportFlags::RESP_PENDING | 0));
    // Sequence wraps to 0: the token has nothing more
    transport.queueReport(transport.report(ReportFlags::RESP_PENDING));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto response = engine.exchange(fullFrame(Command::ChallengeHmac1), 14);
    QCOMPARE(response.errorKind(), ErrorKind::IoError);
    // Reset is still sent
    QCOMPARE(static_cast<quint8>(transport.writes().constLast().at(REPORT_SIZE - 1)), ReportFlags::WRITE_RESET);
}

void TestProtocolEngine::testExchange_NoResponse()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    PollPolicy policy;
    policy.maxAttempts = 5;
    ProtocolEngine engine(&transport, policy, countingSleeper());

    auto response = engine.exchange(fullFrame(Command::DeviceSerial), 6);
    QCOMPARE(response.errorKind(), ErrorKind::Timeout);
    QCOMPARE(transport.readCount(), CHUNKS + 5);
}

void TestProtocolEngine::testExchange_InvalidExpectedLength()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    auto response = engine.exchange(fullFrame(Command::DeviceSerial), 0);
    QCOMPARE(response.errorKind(), ErrorKind::InvalidArgument);
    QCOMPARE(transport.writeCount(), 0);
}

// ========== Reset Tests ==========

void TestProtocolEngine::testWriteReset_SendsResetReport()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.queueReport(transport.report(ReportFlags::SLOT_WRITE));
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    QVERIFY(engine.writeReset().isSuccess());

    QByteArray expected(REPORT_SIZE, '\0');
    expected[REPORT_SIZE - 1] = static_cast<char>(ReportFlags::WRITE_RESET);
    QCOMPARE(transport.writes(), QList<QByteArray>({expected}));
    // Waits until the token leaves the busy state
    QCOMPARE(transport.readCount(), 2);
}

void TestProtocolEngine::testWriteReset_WriteFails()
{
    ScriptedReportTransport transport(REPORT_SIZE);
    transport.failWriteAt(1);
    ProtocolEngine engine(&transport, PollPolicy(), countingSleeper());

    QCOMPARE(engine.writeReset().errorKind(), ErrorKind::IoError);
    QCOMPARE(transport.readCount(), 0);
}

QTEST_MAIN(TestProtocolEngine)
#include "test_protocol_engine.moc"
