/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "types/device_info.h"

#include <QList>

struct libusb_context;
struct libusb_device;

namespace YubiKeyChalResp {
namespace Usb {
using namespace YubiKeyChalResp::Shared;

/**
 * @brief Owns a libusb context and enumerates supported tokens
 *
 * One context per process is enough; transports opened from it must be
 * destroyed before it.
 */
class UsbContext
{
public:
    UsbContext();
    ~UsbContext();

    UsbContext(const UsbContext &) = delete;
    UsbContext &operator=(const UsbContext &) = delete;

    /**
     * @brief Whether libusb initialized successfully
     */
    bool isValid() const { return m_context != nullptr; }

    /**
     * @brief libusb error from initialization (0 if none)
     */
    int initError() const { return m_initError; }

    libusb_context *handle() const { return m_context; }

    /**
     * @brief Lists attached supported tokens
     * @return Devices in bus order; NotFound if none, IoError if the bus
     *         cannot be enumerated
     */
    Result<QList<DeviceInfo>> listDevices() const;

    /**
     * @brief Looks up the libusb device at a bus position
     * @return Referenced device (caller unrefs), or nullptr
     */
    libusb_device *findDevice(quint8 busNumber, quint8 deviceAddress) const;

private:
    libusb_context *m_context = nullptr;
    int m_initError = 0;
};

} // namespace Usb
} // namespace YubiKeyChalResp
