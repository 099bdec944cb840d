/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "usb_context.h"
#include "core/logging_categories.h"

#include <libusb.h>

namespace YubiKeyChalResp {
namespace Usb {
using Core::ChalRespUsbLog;

namespace {

QString productName(libusb_device *device, const libusb_device_descriptor &descriptor)
{
    if (descriptor.iProduct == 0) {
        return QString();
    }

    libusb_device_handle *handle = nullptr;
    const int opened = libusb_open(device, &handle);
    if (opened != LIBUSB_SUCCESS) {
        // Name is cosmetic; tokens owned by another user still get listed
        qCDebug(ChalRespUsbLog) << "Cannot open device for product string:" << libusb_error_name(opened);
        return QString();
    }

    unsigned char buffer[256] = {};
    const int length = libusb_get_string_descriptor_ascii(handle, descriptor.iProduct, buffer, sizeof(buffer));
    libusb_close(handle);
    if (length <= 0) {
        return QString();
    }
    return QString::fromLatin1(reinterpret_cast<const char *>(buffer), length);
}

} // namespace

UsbContext::UsbContext()
{
    m_initError = libusb_init(&m_context);
    if (m_initError != LIBUSB_SUCCESS) {
        qCWarning(ChalRespUsbLog) << "libusb_init failed:" << libusb_error_name(m_initError);
        m_context = nullptr;
    }
}

UsbContext::~UsbContext()
{
    if (m_context) {
        libusb_exit(m_context);
    }
}

Result<QList<DeviceInfo>> UsbContext::listDevices() const
{
    if (!m_context) {
        return Result<QList<DeviceInfo>>::error(ErrorKind::IoError,
                                                QStringLiteral("USB is not available: %1")
                                                    .arg(QLatin1String(libusb_error_name(m_initError))));
    }

    libusb_device **devices = nullptr;
    const ssize_t count = libusb_get_device_list(m_context, &devices);
    if (count < 0) {
        const char *reason = libusb_error_name(static_cast<int>(count));
        qCWarning(ChalRespUsbLog) << "libusb_get_device_list failed:" << reason;
        return Result<QList<DeviceInfo>>::error(ErrorKind::IoError,
                                                QStringLiteral("Cannot enumerate USB devices: %1")
                                                    .arg(QLatin1String(reason)));
    }

    QList<DeviceInfo> found;
    for (ssize_t i = 0; i < count; ++i) {
        libusb_device *device = devices[i];
        libusb_device_descriptor descriptor{};
        const int r = libusb_get_device_descriptor(device, &descriptor);
        if (r != LIBUSB_SUCCESS) {
            qCDebug(ChalRespUsbLog) << "Skipping device without descriptor:" << libusb_error_name(r);
            continue;
        }
        if (!isSupportedToken(descriptor.idVendor, descriptor.idProduct)) {
            continue;
        }

        DeviceInfo info;
        info.vendorId = descriptor.idVendor;
        info.productId = descriptor.idProduct;
        info.busNumber = libusb_get_bus_number(device);
        info.deviceAddress = libusb_get_device_address(device);
        info.name = productName(device, descriptor);
        qCDebug(ChalRespUsbLog) << "Found token" << info.displayName()
                                << "at" << info.busNumber << ":" << info.deviceAddress;
        found.append(info);
    }
    libusb_free_device_list(devices, 1);

    if (found.isEmpty()) {
        return Result<QList<DeviceInfo>>::error(ErrorKind::NotFound, QStringLiteral("No token attached"));
    }
    return Result<QList<DeviceInfo>>::success(found);
}

libusb_device *UsbContext::findDevice(quint8 busNumber, quint8 deviceAddress) const
{
    if (!m_context) {
        return nullptr;
    }

    libusb_device **devices = nullptr;
    const ssize_t count = libusb_get_device_list(m_context, &devices);
    if (count < 0) {
        qCWarning(ChalRespUsbLog) << "libusb_get_device_list failed:"
                                  << libusb_error_name(static_cast<int>(count));
        return nullptr;
    }

    libusb_device *match = nullptr;
    for (ssize_t i = 0; i < count; ++i) {
        if (libusb_get_bus_number(devices[i]) == busNumber
            && libusb_get_device_address(devices[i]) == deviceAddress) {
            match = libusb_ref_device(devices[i]);
            break;
        }
    }
    libusb_free_device_list(devices, 1);
    return match;
}

} // namespace Usb
} // namespace YubiKeyChalResp
