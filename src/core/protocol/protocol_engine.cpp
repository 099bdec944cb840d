/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "protocol_engine.h"
#include "i_report_transport.h"
#include "../logging_categories.h"
#include "utils/secure_logging.h"
#include "utils/secure_memory.h"

#include <QMutexLocker>
#include <QThread>

namespace YubiKeyChalResp {
namespace Core {

namespace {

bool isAllZero(const QByteArray &data, int length)
{
    for (int i = 0; i < length; ++i) {
        if (data.at(i) != '\0') {
            return false;
        }
    }
    return true;
}

quint8 flagByte(const QByteArray &report)
{
    return report.isEmpty() ? 0 : static_cast<quint8>(report.at(report.size() - 1));
}

} // namespace

ProtocolEngine::ProtocolEngine(IReportTransport *transport, PollPolicy policy, Sleeper sleeper)
    : m_transport(transport)
    , m_policy(policy)
    , m_sleeper(std::move(sleeper))
{
    if (!m_sleeper) {
        m_sleeper = [](int milliseconds) {
            QThread::msleep(static_cast<unsigned long>(milliseconds));
        };
    }
}

PollPolicy ProtocolEngine::policy() const
{
    QMutexLocker locker(&m_mutex);
    return m_policy;
}

void ProtocolEngine::setPolicy(const PollPolicy &policy)
{
    QMutexLocker locker(&m_mutex);
    m_policy = policy;
}

Result<void> ProtocolEngine::checkReportSize() const
{
    if (!m_transport) {
        return Result<void>::error(ErrorKind::IoError, QStringLiteral("No transport"));
    }
    const int size = m_transport->reportSize();
    if (size < FrameCodec::MIN_REPORT_SIZE) {
        return Result<void>::error(ErrorKind::InvalidArgument,
                                   QStringLiteral("Report size %1 below minimum of %2")
                                       .arg(size)
                                       .arg(FrameCodec::MIN_REPORT_SIZE));
    }
    return Result<void>::success();
}

Result<QByteArray> ProtocolEngine::waitFor(const FlagPredicate &predicate, bool touchAware, const char *what)
{
    const int busyBudget = qMax(1, m_policy.maxAttempts);
    const int touchBudget = qMax(1, m_policy.touchWaitAttempts);
    const int interval = qMax(0, m_policy.pollIntervalMs);
    int busyReads = 0;
    int touchReads = 0;
    bool touchLogged = false;

    for (;;) {
        auto readResult = m_transport->readReport();
        if (readResult.isError()) {
            qCWarning(ChalRespProtocolLog) << "Report read failed while waiting for" << what
                                           << ":" << readResult.error();
            return readResult;
        }

        const quint8 flags = flagByte(readResult.value());
        if (predicate(flags)) {
            return readResult;
        }

        if (touchAware && (flags & ReportFlags::RESP_TIMEOUT_WAIT) != 0) {
            if (!touchLogged) {
                qCDebug(ChalRespProtocolLog) << "Token waits for touch";
                touchLogged = true;
            }
            if (++touchReads >= touchBudget) {
                qCWarning(ChalRespProtocolLog) << "No touch after" << touchReads << "polls";
                return Result<QByteArray>::error(ErrorKind::Timeout,
                                                 QStringLiteral("Timed out waiting for touch"));
            }
        } else if (++busyReads >= busyBudget) {
            qCWarning(ChalRespProtocolLog) << "Timed out waiting for" << what
                                           << "last flags" << SecureLogging::flagInfo(flags);
            return Result<QByteArray>::error(ErrorKind::Timeout,
                                             QStringLiteral("Timed out waiting for %1")
                                                 .arg(QLatin1String(what)));
        }

        m_sleeper(interval);
    }
}

Result<QByteArray> ProtocolEngine::waitWriteReady()
{
    return waitFor([](quint8 flags) { return (flags & ReportFlags::SLOT_WRITE) == 0; },
                   false, "write ready");
}

Result<DeviceStatus> ProtocolEngine::readStatus()
{
    QMutexLocker locker(&m_mutex);
    const auto sizeCheck = checkReportSize();
    if (sizeCheck.isError()) {
        return Result<DeviceStatus>::propagate(sizeCheck);
    }
    return readStatusLocked();
}

Result<DeviceStatus> ProtocolEngine::readStatusLocked()
{
    const auto report = waitWriteReady();
    if (report.isError()) {
        return Result<DeviceStatus>::propagate(report);
    }
    return DeviceStatus::fromReport(report.value());
}

Result<void> ProtocolEngine::writeFrame(const Frame &frame)
{
    QMutexLocker locker(&m_mutex);
    const auto sizeCheck = checkReportSize();
    if (sizeCheck.isError()) {
        return sizeCheck;
    }
    return writeFrameLocked(frame, false);
}

Result<void> ProtocolEngine::writeFrameLocked(const Frame &frame, bool finalChunkMutates)
{
    if (frame.isNull()) {
        return Result<void>::error(ErrorKind::InvalidArgument, QStringLiteral("Empty frame"));
    }

    const int reportSize = m_transport->reportSize();
    QList<QByteArray> reports = FrameCodec::toReports(frame, reportSize);
    const int last = static_cast<int>(reports.size()) - 1;

    qCDebug(ChalRespProtocolLog) << "Writing" << SecureLogging::commandDescription(frame.commandByte())
                                 << "in" << reports.size() << "reports";

    Result<void> outcome = Result<void>::success();
    for (int seq = 0; seq <= last; ++seq) {
        QByteArray &report = reports[seq];
        if (seq != 0 && seq != last && isAllZero(report, reportSize - 1)) {
            continue;
        }

        const auto ready = waitWriteReady();
        if (ready.isError()) {
            outcome = Result<void>::propagate(ready);
            break;
        }

        const auto written = m_transport->writeReport(report);
        if (written.isError()) {
            qCWarning(ChalRespProtocolLog) << "Report write failed at chunk" << seq << ":" << written.error();
            outcome = Result<void>::error(written.errorKind(), written.error(),
                                          finalChunkMutates && seq == last);
            break;
        }
    }

    for (QByteArray &report : reports) {
        SecureMemory::wipeByteArray(report);
    }
    return outcome;
}

Result<DeviceStatus> ProtocolEngine::writeProgrammingFrame(const Frame &frame)
{
    QMutexLocker locker(&m_mutex);
    const auto sizeCheck = checkReportSize();
    if (sizeCheck.isError()) {
        return Result<DeviceStatus>::propagate(sizeCheck);
    }

    const auto before = readStatusLocked();
    if (before.isError()) {
        return before;
    }
    const quint8 previousSequence = before.value().programSequence();

    const auto written = writeFrameLocked(frame, true);
    if (written.isError()) {
        return Result<DeviceStatus>::propagate(written);
    }

    QByteArray payload = frame.payload();
    const bool erasing = frame.command() != Command::SwapSlots
        && isAllZero(payload, static_cast<int>(payload.size()));
    SecureMemory::wipeByteArray(payload);
    return awaitSequenceChangeLocked(previousSequence, erasing);
}

Result<DeviceStatus> ProtocolEngine::awaitProgramSequenceChange(quint8 previousSequence, bool erasing)
{
    QMutexLocker locker(&m_mutex);
    const auto sizeCheck = checkReportSize();
    if (sizeCheck.isError()) {
        return Result<DeviceStatus>::propagate(sizeCheck);
    }
    return awaitSequenceChangeLocked(previousSequence, erasing);
}

Result<DeviceStatus> ProtocolEngine::awaitSequenceChangeLocked(quint8 previousSequence, bool erasing)
{
    const auto report = waitWriteReady();
    if (report.isError()) {
        // The frame is on the token; whether it was applied is unknown
        return Result<DeviceStatus>::error(report.errorKind(), report.error(), true);
    }

    const auto status = DeviceStatus::fromReport(report.value());
    if (status.isError()) {
        return Result<DeviceStatus>::error(status.errorKind(), status.error(), true);
    }

    const quint8 sequence = status.value().programSequence();
    // Erasing the last configured slot resets the counter to 0
    if (sequence != previousSequence || (erasing && sequence == 0)) {
        qCDebug(ChalRespProtocolLog) << "Program sequence" << previousSequence << "->" << sequence;
        return status;
    }

    qCWarning(ChalRespProtocolLog) << "Token did not commit the write, program sequence stays at"
                                   << sequence;
    return Result<DeviceStatus>::error(ErrorKind::DeviceRejected,
                                       QStringLiteral("Token rejected the configuration (program sequence unchanged)"));
}

Result<QByteArray> ProtocolEngine::exchange(const Frame &frame, int expectedBytes)
{
    QMutexLocker locker(&m_mutex);
    const auto sizeCheck = checkReportSize();
    if (sizeCheck.isError()) {
        return Result<QByteArray>::propagate(sizeCheck);
    }
    if (expectedBytes <= 0) {
        return Result<QByteArray>::error(ErrorKind::InvalidArgument,
                                         QStringLiteral("Expected response length must be positive"));
    }

    const auto written = writeFrameLocked(frame, false);
    if (written.isError()) {
        return Result<QByteArray>::propagate(written);
    }

    // First pending report carries the first response chunk
    const auto first = waitFor([](quint8 flags) { return (flags & ReportFlags::RESP_PENDING) != 0; },
                               true, "response");
    if (first.isError()) {
        return first;
    }

    const int dataSize = m_transport->reportSize() - 1;
    QByteArray response = first.value().left(dataSize);

    while (response.size() < expectedBytes) {
        auto next = m_transport->readReport();
        if (next.isError()) {
            SecureMemory::wipeByteArray(response);
            return next;
        }
        QByteArray report = next.takeValue();
        const quint8 flags = flagByte(report);
        // Sequence back at 0 or pending flag gone: the token has no more data
        if ((flags & ReportFlags::RESP_PENDING) == 0 || (flags & ReportFlags::SEQUENCE_MASK) == 0) {
            SecureMemory::wipeByteArray(report);
            break;
        }
        response.append(report.constData(), dataSize);
        SecureMemory::wipeByteArray(report);
    }

    const auto reset = writeResetLocked();
    if (reset.isError()) {
        SecureMemory::wipeByteArray(response);
        return Result<QByteArray>::propagate(reset);
    }

    if (response.size() < expectedBytes) {
        qCWarning(ChalRespProtocolLog) << "Short response:" << SecureLogging::safeByteInfo(response)
                                       << "expected" << expectedBytes;
        SecureMemory::wipeByteArray(response);
        return Result<QByteArray>::error(ErrorKind::IoError,
                                         QStringLiteral("Token returned %1 of %2 response bytes")
                                             .arg(response.size())
                                             .arg(expectedBytes));
    }

    response.truncate(expectedBytes);
    return Result<QByteArray>::success(response);
}

Result<void> ProtocolEngine::writeReset()
{
    QMutexLocker locker(&m_mutex);
    const auto sizeCheck = checkReportSize();
    if (sizeCheck.isError()) {
        return sizeCheck;
    }
    return writeResetLocked();
}

Result<void> ProtocolEngine::writeResetLocked()
{
    QByteArray report(m_transport->reportSize(), '\0');
    report[report.size() - 1] = static_cast<char>(ReportFlags::WRITE_RESET);

    const auto written = m_transport->writeReport(report);
    if (written.isError()) {
        return written;
    }

    const auto idle = waitWriteReady();
    if (idle.isError()) {
        return Result<void>::propagate(idle);
    }
    return Result<void>::success();
}

} // namespace Core
} // namespace YubiKeyChalResp
