/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "usb_hid_transport.h"
#include "usb_context.h"
#include "core/logging_categories.h"
#include "utils/secure_memory.h"

#include <libusb.h>

namespace YubiKeyChalResp {
namespace Usb {
using Core::ChalRespUsbLog;

namespace {

constexpr quint8 REQUEST_TYPE_IN = LIBUSB_ENDPOINT_IN | LIBUSB_REQUEST_TYPE_CLASS | LIBUSB_RECIPIENT_INTERFACE;
constexpr quint8 REQUEST_TYPE_OUT = LIBUSB_ENDPOINT_OUT | LIBUSB_REQUEST_TYPE_CLASS | LIBUSB_RECIPIENT_INTERFACE;

QString usbError(const char *operation, int code)
{
    return QStringLiteral("%1 failed: %2").arg(QLatin1String(operation), QLatin1String(libusb_error_name(code)));
}

} // namespace

UsbHidTransport::UsbHidTransport(libusb_device_handle *handle, DeviceInfo info, int timeoutMs)
    : m_handle(handle)
    , m_info(std::move(info))
    , m_timeoutMs(timeoutMs)
{
}

UsbHidTransport::~UsbHidTransport()
{
    for (const ClaimedInterface &iface : m_interfaces) {
        const int released = libusb_release_interface(m_handle, iface.number);
        if (released != LIBUSB_SUCCESS) {
            qCWarning(ChalRespUsbLog) << "Cannot release interface" << iface.number << ":"
                                      << libusb_error_name(released);
        }
        if (iface.driverDetached) {
            const int attached = libusb_attach_kernel_driver(m_handle, iface.number);
            if (attached != LIBUSB_SUCCESS) {
                qCWarning(ChalRespUsbLog) << "Cannot reattach kernel driver to interface" << iface.number
                                          << ":" << libusb_error_name(attached);
            }
        }
    }
    libusb_close(m_handle);
    qCDebug(ChalRespUsbLog) << "Closed" << m_info.displayName();
}

Result<std::unique_ptr<UsbHidTransport>> UsbHidTransport::open(const UsbContext &context,
                                                               const DeviceInfo &info,
                                                               int timeoutMs)
{
    using OpenResult = Result<std::unique_ptr<UsbHidTransport>>;

    if (info.reportSize <= 0) {
        return OpenResult::error(ErrorKind::InvalidArgument, QStringLiteral("Invalid report size"));
    }

    libusb_device *device = context.findDevice(info.busNumber, info.deviceAddress);
    if (!device) {
        return OpenResult::error(ErrorKind::NotFound,
                                 QStringLiteral("%1 is no longer attached").arg(info.displayName()));
    }

    libusb_device_handle *handle = nullptr;
    int r = libusb_open(device, &handle);
    if (r != LIBUSB_SUCCESS) {
        libusb_unref_device(device);
        qCWarning(ChalRespUsbLog) << "libusb_open failed:" << libusb_error_name(r);
        return OpenResult::error(ErrorKind::IoError, usbError("libusb_open", r));
    }

    libusb_config_descriptor *config = nullptr;
    r = libusb_get_config_descriptor(device, 0, &config);
    libusb_unref_device(device);
    if (r != LIBUSB_SUCCESS) {
        libusb_close(handle);
        return OpenResult::error(ErrorKind::IoError, usbError("libusb_get_config_descriptor", r));
    }

    // From here the transport owns the handle and undoes partial claims
    std::unique_ptr<UsbHidTransport> transport(new UsbHidTransport(handle, info, timeoutMs));

    int active = 0;
    r = libusb_get_configuration(handle, &active);
    if (r == LIBUSB_SUCCESS && active != config->bConfigurationValue) {
        r = libusb_set_configuration(handle, config->bConfigurationValue);
    }
    if (r != LIBUSB_SUCCESS) {
        libusb_free_config_descriptor(config);
        return OpenResult::error(ErrorKind::IoError, usbError("libusb_set_configuration", r));
    }

    for (int i = 0; i < config->bNumInterfaces; ++i) {
        const libusb_interface &iface = config->interface[i];
        if (iface.num_altsetting < 1) {
            continue;
        }
        const int number = iface.altsetting[0].bInterfaceNumber;

        bool detached = false;
        if (libusb_kernel_driver_active(handle, number) == 1) {
            r = libusb_detach_kernel_driver(handle, number);
            if (r != LIBUSB_SUCCESS) {
                libusb_free_config_descriptor(config);
                return OpenResult::error(ErrorKind::IoError, usbError("libusb_detach_kernel_driver", r));
            }
            detached = true;
        }

        r = libusb_claim_interface(handle, number);
        if (r != LIBUSB_SUCCESS) {
            if (detached && libusb_attach_kernel_driver(handle, number) != LIBUSB_SUCCESS) {
                qCWarning(ChalRespUsbLog) << "Cannot reattach kernel driver to interface" << number;
            }
            libusb_free_config_descriptor(config);
            qCWarning(ChalRespUsbLog) << "libusb_claim_interface" << number << "failed:" << libusb_error_name(r);
            return OpenResult::error(ErrorKind::IoError, usbError("libusb_claim_interface", r));
        }
        transport->m_interfaces.append({number, detached});
    }
    libusb_free_config_descriptor(config);

    qCDebug(ChalRespUsbLog) << "Opened" << info.displayName() << "with"
                            << transport->m_interfaces.size() << "interfaces";
    return OpenResult::success(std::move(transport));
}

Result<QByteArray> UsbHidTransport::readReport()
{
    QByteArray report(m_info.reportSize, '\0');
    const int transferred = libusb_control_transfer(m_handle, REQUEST_TYPE_IN, HID_GET_REPORT,
                                                    REPORT_TYPE_FEATURE << 8, 0,
                                                    reinterpret_cast<unsigned char *>(report.data()),
                                                    static_cast<quint16>(report.size()),
                                                    static_cast<unsigned int>(m_timeoutMs));
    if (transferred < 0) {
        return Result<QByteArray>::error(ErrorKind::IoError, usbError("GET_REPORT", transferred));
    }
    if (transferred != report.size()) {
        return Result<QByteArray>::error(ErrorKind::IoError,
                                         QStringLiteral("Short GET_REPORT: %1 of %2 bytes")
                                             .arg(transferred)
                                             .arg(report.size()));
    }
    return Result<QByteArray>::success(report);
}

Result<void> UsbHidTransport::writeReport(const QByteArray &report)
{
    if (report.size() != m_info.reportSize) {
        return Result<void>::error(ErrorKind::InvalidArgument,
                                   QStringLiteral("Report must be %1 bytes, got %2")
                                       .arg(m_info.reportSize)
                                       .arg(report.size()));
    }

    // libusb takes a mutable buffer even for OUT transfers
    QByteArray buffer(report.constData(), report.size());
    const int transferred = libusb_control_transfer(m_handle, REQUEST_TYPE_OUT, HID_SET_REPORT,
                                                    REPORT_TYPE_FEATURE << 8, 0,
                                                    reinterpret_cast<unsigned char *>(buffer.data()),
                                                    static_cast<quint16>(buffer.size()),
                                                    static_cast<unsigned int>(m_timeoutMs));
    SecureMemory::wipeByteArray(buffer);
    if (transferred < 0) {
        return Result<void>::error(ErrorKind::IoError, usbError("SET_REPORT", transferred));
    }
    if (transferred != report.size()) {
        return Result<void>::error(ErrorKind::IoError,
                                   QStringLiteral("Short SET_REPORT: %1 of %2 bytes")
                                       .arg(transferred)
                                       .arg(report.size()));
    }
    return Result<void>::success();
}

} // namespace Usb
} // namespace YubiKeyChalResp
