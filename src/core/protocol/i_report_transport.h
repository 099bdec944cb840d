/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"

#include <QByteArray>

namespace YubiKeyChalResp {
namespace Core {
using namespace YubiKeyChalResp::Shared;

/**
 * @brief Interface for the raw feature report channel of an opened token
 *
 * Decouples the protocol engine from USB: the engine only ever moves
 * fixed-size reports, and the width of those reports is a property of
 * the opened device. The USB implementation lives in chalresp_usb;
 * tests plug in emulators.
 *
 * Error cases:
 * - Device removed, permission denied, short transfer: ErrorKind::IoError
 *
 * Thread Safety:
 * - NOT thread-safe - the protocol engine serializes access with its mutex
 *
 * @see ProtocolEngine
 * @see UsbHidTransport
 */
class IReportTransport
{
public:
    virtual ~IReportTransport() = default;

    /**
     * @brief Width of one feature report in bytes, flag byte included
     */
    virtual int reportSize() const = 0;

    /**
     * @brief Reads one feature report
     * @return Exactly reportSize() bytes, or IoError
     */
    virtual Result<QByteArray> readReport() = 0;

    /**
     * @brief Writes one feature report
     * @param report Exactly reportSize() bytes
     * @return success, or IoError
     */
    virtual Result<void> writeReport(const QByteArray &report) = 0;
};

} // namespace Core
} // namespace YubiKeyChalResp
