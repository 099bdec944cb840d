/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "frame_codec.h"
#include "crc16.h"
#include "../logging_categories.h"
#include "utils/secure_logging.h"
#include "utils/secure_memory.h"

#include <cstring>

namespace YubiKeyChalResp {
namespace Core {

quint8 Frame::commandByte() const
{
    if (m_bytes.size() != FRAME_SIZE) {
        return 0;
    }
    return static_cast<quint8>(m_bytes.at(COMMAND_OFFSET));
}

quint16 Frame::checksum() const
{
    if (m_bytes.size() != FRAME_SIZE) {
        return 0;
    }
    return static_cast<quint16>(static_cast<quint8>(m_bytes.at(CRC_OFFSET))
                                | (static_cast<quint8>(m_bytes.at(CRC_OFFSET + 1)) << 8));
}

void Frame::wipe()
{
    SecureMemory::wipeByteArray(m_bytes);
}

quint16 FrameCodec::frameChecksum(const QByteArray &payload, quint8 commandByte)
{
    QByteArray covered(Frame::PAYLOAD_SIZE + 1, '\0');
    const qsizetype length = qMin<qsizetype>(payload.size(), Frame::PAYLOAD_SIZE);
    if (length > 0) {
        std::memcpy(covered.data(), payload.constData(), static_cast<size_t>(length));
    }
    covered[Frame::COMMAND_OFFSET] = static_cast<char>(commandByte);
    const quint16 crc = Crc16::compute(covered);
    SecureMemory::wipeByteArray(covered);
    return crc;
}

Result<Frame> FrameCodec::encode(quint8 commandByte, const QByteArray &payload)
{
    if (payload.size() > Frame::PAYLOAD_SIZE) {
        qCWarning(ChalRespProtocolLog) << "Payload too long for frame:"
                                       << SecureLogging::safeByteInfo(payload);
        return Result<Frame>::error(ErrorKind::InvalidArgument,
                                    QStringLiteral("Payload of %1 bytes exceeds %2 byte maximum")
                                        .arg(payload.size())
                                        .arg(Frame::PAYLOAD_SIZE));
    }

    QByteArray bytes(Frame::FRAME_SIZE, '\0');
    if (!payload.isEmpty()) {
        std::memcpy(bytes.data(), payload.constData(), static_cast<size_t>(payload.size()));
    }
    bytes[Frame::COMMAND_OFFSET] = static_cast<char>(commandByte);

    const quint16 crc = Crc16::compute(bytes.constData(), Frame::PAYLOAD_SIZE + 1);
    bytes[Frame::CRC_OFFSET] = static_cast<char>(crc & 0xff);
    bytes[Frame::CRC_OFFSET + 1] = static_cast<char>((crc >> 8) & 0xff);

    return Result<Frame>::success(Frame(std::move(bytes)));
}

Result<Frame> FrameCodec::encode(Command command, const QByteArray &payload)
{
    return encode(static_cast<quint8>(command), payload);
}

Result<Frame> FrameCodec::decode(const QByteArray &bytes)
{
    if (bytes.size() != Frame::FRAME_SIZE) {
        return Result<Frame>::error(ErrorKind::InvalidArgument,
                                    QStringLiteral("Frame must be %1 bytes, got %2")
                                        .arg(Frame::FRAME_SIZE)
                                        .arg(bytes.size()));
    }

    const quint16 stored = static_cast<quint16>(static_cast<quint8>(bytes.at(Frame::CRC_OFFSET))
                                                | (static_cast<quint8>(bytes.at(Frame::CRC_OFFSET + 1)) << 8));
    const quint16 computed = Crc16::compute(bytes.constData(), Frame::PAYLOAD_SIZE + 1);
    if (stored != computed) {
        qCDebug(ChalRespProtocolLog) << "Frame checksum mismatch";
        return Result<Frame>::error(ErrorKind::ChecksumMismatch,
                                    QStringLiteral("Frame checksum mismatch"));
    }

    for (int i = Frame::FILLER_OFFSET; i < Frame::FRAME_SIZE; ++i) {
        if (bytes.at(i) != '\0') {
            return Result<Frame>::error(ErrorKind::ChecksumMismatch,
                                        QStringLiteral("Frame filler is not zero"));
        }
    }

    const auto commandByte = static_cast<quint8>(bytes.at(Frame::COMMAND_OFFSET));
    if (!isKnownCommand(commandByte)) {
        return Result<Frame>::error(ErrorKind::InvalidArgument,
                                    QStringLiteral("Unknown command %1")
                                        .arg(SecureLogging::commandDescription(commandByte)));
    }

    return Result<Frame>::success(Frame(QByteArray(bytes.constData(), bytes.size())));
}

int FrameCodec::reportCount(int reportSize)
{
    if (reportSize < MIN_REPORT_SIZE) {
        return 0;
    }
    const int chunk = reportSize - 1;
    return (Frame::FRAME_SIZE + chunk - 1) / chunk;
}

QList<QByteArray> FrameCodec::toReports(const Frame &frame, int reportSize)
{
    QList<QByteArray> reports;
    if (reportSize < MIN_REPORT_SIZE || frame.isNull()) {
        return reports;
    }

    const int chunk = reportSize - 1;
    const int count = reportCount(reportSize);
    const QByteArray &bytes = frame.bytes();
    reports.reserve(count);

    for (int seq = 0; seq < count; ++seq) {
        QByteArray report(reportSize, '\0');
        const int offset = seq * chunk;
        const int length = qMin(chunk, Frame::FRAME_SIZE - offset);
        std::memcpy(report.data(), bytes.constData() + offset, static_cast<size_t>(length));
        report[chunk] = static_cast<char>(ReportFlags::SLOT_WRITE | (seq & ReportFlags::SEQUENCE_MASK));
        reports.append(report);
    }
    return reports;
}

} // namespace Core
} // namespace YubiKeyChalResp
