/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "device_status.h"
#include "frame_codec.h"
#include "poll_policy.h"

#include <QByteArray>
#include <QMutex>

#include <functional>

namespace YubiKeyChalResp {
namespace Core {
using namespace YubiKeyChalResp::Shared;

class IReportTransport;

/**
 * @brief Write/poll/read state machine of the token's report protocol
 *
 * Moves frames to the token in report-sized chunks, waits for the token
 * between chunks, detects whether a programming write was committed and
 * collects chunked responses.
 *
 * Retry policy:
 * - Busy/not-ready reads are retried up to the PollPolicy budget, then Timeout
 * - Transport failures (IoError) are returned at once, never retried
 *
 * Ownership:
 * - Does NOT own the transport (passed in constructor)
 *
 * Thread Safety:
 * - Every public method holds the engine mutex for its whole duration,
 *   so exchanges against one token never interleave
 */
class ProtocolEngine
{
public:
    /// Blocking delay between polls; tests substitute a no-op
    using Sleeper = std::function<void(int milliseconds)>;

    /**
     * @brief Constructs engine over a report transport
     * @param transport Report channel (non-owning, must outlive the engine)
     * @param policy Polling bounds
     * @param sleeper Delay function, QThread::msleep if empty
     */
    explicit ProtocolEngine(IReportTransport *transport,
                            PollPolicy policy = PollPolicy(),
                            Sleeper sleeper = Sleeper());

    ProtocolEngine(const ProtocolEngine &) = delete;
    ProtocolEngine &operator=(const ProtocolEngine &) = delete;

    PollPolicy policy() const;
    void setPolicy(const PollPolicy &policy);

    /**
     * @brief Waits until the token is idle and reads its status
     */
    Result<DeviceStatus> readStatus();

    /**
     * @brief Writes a frame chunk by chunk
     *
     * Waits for the write flag to clear before every chunk. All-zero chunks
     * between the first and the last are skipped because the token clears
     * its buffer when a new frame starts.
     */
    Result<void> writeFrame(const Frame &frame);

    /**
     * @brief Writes a programming frame and checks that the token committed it
     *
     * Reads the program sequence, writes the frame and waits for the new
     * sequence. A Timeout or IoError once the last chunk went out is
     * flagged outcomeUnknown.
     *
     * @return Status after the write, or DeviceRejected if the program
     *         sequence did not move
     */
    Result<DeviceStatus> writeProgrammingFrame(const Frame &frame);

    /**
     * @brief Waits for a pending write to finish and checks the sequence
     * @param previousSequence Program sequence read before the write
     * @param erasing true if the written configuration was empty
     *
     * Read failures and timeouts are flagged outcomeUnknown, since the write
     * already happened. An unchanged sequence is DeviceRejected.
     */
    Result<DeviceStatus> awaitProgramSequenceChange(quint8 previousSequence, bool erasing = false);

    /**
     * @brief Writes a command frame and collects its response
     * @param frame Challenge or query frame
     * @param expectedBytes Response length including its CRC trailer
     * @return Exactly expectedBytes bytes; IoError if the token ends the
     *         response early; Timeout if it never answers
     *
     * Touch-wait reads are charged to the touch budget.
     */
    Result<QByteArray> exchange(const Frame &frame, int expectedBytes);

    /**
     * @brief Sends the reset report that ends response read mode
     */
    Result<void> writeReset();

private:
    using FlagPredicate = std::function<bool(quint8 flags)>;

    Result<void> checkReportSize() const;

    /**
     * @brief Reads reports until the flag byte satisfies the predicate
     * @param touchAware Charge touch-wait reads to the touch budget
     * @return The matching report
     */
    Result<QByteArray> waitFor(const FlagPredicate &predicate, bool touchAware, const char *what);
    Result<QByteArray> waitWriteReady();

    Result<DeviceStatus> readStatusLocked();
    Result<void> writeFrameLocked(const Frame &frame, bool finalChunkMutates);
    Result<DeviceStatus> awaitSequenceChangeLocked(quint8 previousSequence, bool erasing);
    Result<void> writeResetLocked();

    IReportTransport *m_transport;
    PollPolicy m_policy;
    Sleeper m_sleeper;
    mutable QMutex m_mutex;
};

} // namespace Core
} // namespace YubiKeyChalResp
