/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "config/configuration_keys.h"
#include "core/protocol/i_report_transport.h"
#include "types/device_info.h"

#include <QList>

#include <memory>

struct libusb_device_handle;

namespace YubiKeyChalResp {
namespace Usb {
using namespace YubiKeyChalResp::Shared;

class UsbContext;

/**
 * @brief Feature report channel over HID class control transfers
 *
 * Opening claims every interface of the token, detaching kernel drivers
 * where needed; destruction releases the interfaces and reattaches the
 * drivers it detached.
 */
class UsbHidTransport : public Core::IReportTransport
{
public:
    static constexpr quint8 HID_GET_REPORT = 0x01;
    static constexpr quint8 HID_SET_REPORT = 0x09;
    static constexpr quint16 REPORT_TYPE_FEATURE = 0x03;

    /**
     * @brief Opens and claims a discovered token
     * @param context Context the device was listed from (must outlive the transport)
     * @param info Device from UsbContext::listDevices()
     * @param timeoutMs Timeout of each control transfer
     * @return Transport; NotFound if the device is gone, IoError if it
     *         cannot be opened or claimed
     */
    static Result<std::unique_ptr<UsbHidTransport>> open(const UsbContext &context,
                                                         const DeviceInfo &info,
                                                         int timeoutMs = ConfigKeys::DEFAULT_USB_TIMEOUT_MS);

    ~UsbHidTransport() override;

    UsbHidTransport(const UsbHidTransport &) = delete;
    UsbHidTransport &operator=(const UsbHidTransport &) = delete;

    int reportSize() const override { return m_info.reportSize; }
    Result<QByteArray> readReport() override;
    Result<void> writeReport(const QByteArray &report) override;

    const DeviceInfo &deviceInfo() const { return m_info; }

private:
    UsbHidTransport(libusb_device_handle *handle, DeviceInfo info, int timeoutMs);

    struct ClaimedInterface {
        int number;
        bool driverDetached;
    };

    libusb_device_handle *m_handle;
    DeviceInfo m_info;
    int m_timeoutMs;
    QList<ClaimedInterface> m_interfaces;
};

} // namespace Usb
} // namespace YubiKeyChalResp
