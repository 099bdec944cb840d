/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "types/protocol_types.h"

#include <QByteArray>
#include <QList>

namespace YubiKeyChalResp {
namespace Core {
using namespace YubiKeyChalResp::Shared;

/**
 * @brief Bits of the flag byte that ends every feature report
 */
namespace ReportFlags {
constexpr quint8 SLOT_WRITE = 0x80;         ///< Write chunk marker / device busy
constexpr quint8 RESP_PENDING = 0x40;       ///< Response data available
constexpr quint8 RESP_TIMEOUT_WAIT = 0x20;  ///< Token waits for a physical touch
constexpr quint8 SEQUENCE_MASK = 0x1f;      ///< Chunk sequence number
constexpr quint8 WRITE_RESET = 0x8f;        ///< Dummy write ending a response read
} // namespace ReportFlags

/**
 * @brief One command frame as exchanged with the token
 *
 * Layout (70 bytes):
 *   [0..64)  payload, zero padded
 *   [64]     command byte (operation and slot)
 *   [65..67) CRC16 over payload and command byte, little-endian
 *   [67..70) filler, always zero
 */
class Frame
{
public:
    static constexpr int PAYLOAD_SIZE = 64;
    static constexpr int COMMAND_OFFSET = 64;
    static constexpr int CRC_OFFSET = 65;
    static constexpr int FILLER_OFFSET = 67;
    static constexpr int FRAME_SIZE = 70;

    Frame() = default;

    QByteArray payload() const { return m_bytes.left(PAYLOAD_SIZE); }
    quint8 commandByte() const;
    Command command() const { return static_cast<Command>(commandByte()); }
    quint16 checksum() const;

    /**
     * @brief Full 70-byte wire image
     */
    const QByteArray &bytes() const { return m_bytes; }

    bool isNull() const { return m_bytes.isEmpty(); }

    /**
     * @brief Zeroes the frame buffer (used after writing key material)
     */
    void wipe();

private:
    friend class FrameCodec;
    explicit Frame(QByteArray bytes) : m_bytes(std::move(bytes)) {}

    QByteArray m_bytes;
};

/**
 * @brief Stateless frame encoder/decoder
 *
 * No I/O. The protocol engine uses it to build the frames it writes and
 * the report chunks carrying them.
 */
class FrameCodec
{
public:
    /// Smallest report width whose chunk sequence stays clear of WRITE_RESET
    static constexpr int MIN_REPORT_SIZE = 6;

    /**
     * @brief Builds a frame
     * @param commandByte Command/slot selector
     * @param payload At most 64 bytes, zero padded
     * @return Frame, or InvalidArgument if the payload is too long
     */
    static Result<Frame> encode(quint8 commandByte, const QByteArray &payload);
    static Result<Frame> encode(Command command, const QByteArray &payload);

    /**
     * @brief Parses and verifies a 70-byte frame image
     * @return Frame; InvalidArgument for a wrong size or unknown command;
     *         ChecksumMismatch if the checksum or the zero filler is damaged
     */
    static Result<Frame> decode(const QByteArray &bytes);

    /**
     * @brief CRC16 over the payload (zero padded to 64 bytes) followed by the command byte
     */
    static quint16 frameChecksum(const QByteArray &payload, quint8 commandByte);

    /**
     * @brief Number of reports needed to carry one frame
     * @param reportSize Report width in bytes (>= MIN_REPORT_SIZE)
     */
    static int reportCount(int reportSize);

    /**
     * @brief Splits a frame into write reports
     *
     * Each report carries reportSize - 1 frame bytes followed by the flag
     * byte SLOT_WRITE | sequence. Reports are returned in sequence order.
     *
     * @return Reports, or an empty list if reportSize < MIN_REPORT_SIZE
     */
    static QList<QByteArray> toReports(const Frame &frame, int reportSize);

private:
    FrameCodec() = delete;
};

} // namespace Core
} // namespace YubiKeyChalResp
