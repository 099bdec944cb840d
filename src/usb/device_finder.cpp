/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "device_finder.h"
#include "usb_context.h"
#include "usb_hid_transport.h"
#include "config/configuration_provider.h"
#include "core/challenge_response_session.h"
#include "core/logging_categories.h"
#include "utils/secure_logging.h"

namespace YubiKeyChalResp {
namespace Usb {
using Core::ChalRespUsbLog;

DeviceFinder::DeviceFinder(const UsbContext &context, const Core::PollPolicy &policy, int usbTimeoutMs)
    : m_context(context)
    , m_policy(policy)
    , m_usbTimeoutMs(usbTimeoutMs)
{
}

DeviceFinder::DeviceFinder(const UsbContext &context, const ConfigurationProvider &config)
    : DeviceFinder(context, Core::PollPolicy::fromConfiguration(config), config.usbTimeoutMs())
{
}

Result<quint32> DeviceFinder::readSerial(const DeviceInfo &info) const
{
    auto opened = UsbHidTransport::open(m_context, info, m_usbTimeoutMs);
    if (opened.isError()) {
        return Result<quint32>::propagate(opened);
    }
    const std::unique_ptr<UsbHidTransport> transport = opened.takeValue();

    Core::ChallengeResponseSession session(transport.get(), m_policy);
    return session.readSerial();
}

DeviceInfo DeviceFinder::withSerial(DeviceInfo info) const
{
    const auto serial = readSerial(info);
    if (serial.isSuccess()) {
        info.serial = serial.value();
    } else {
        qCDebug(ChalRespUsbLog) << "No serial for" << info.displayName() << ":"
                                << errorKindName(serial.errorKind()) << serial.error();
    }
    return info;
}

Result<DeviceInfo> DeviceFinder::findDevice() const
{
    const auto devices = m_context.listDevices();
    if (devices.isError()) {
        return Result<DeviceInfo>::propagate(devices);
    }
    return Result<DeviceInfo>::success(withSerial(devices.value().first()));
}

Result<QList<DeviceInfo>> DeviceFinder::findAllDevices() const
{
    const auto devices = m_context.listDevices();
    if (devices.isError()) {
        return devices;
    }

    QList<DeviceInfo> result;
    for (const DeviceInfo &info : devices.value()) {
        result.append(withSerial(info));
    }
    return Result<QList<DeviceInfo>>::success(result);
}

Result<DeviceInfo> DeviceFinder::findDeviceBySerial(quint32 serial) const
{
    const auto devices = m_context.listDevices();
    if (devices.isError()) {
        return Result<DeviceInfo>::propagate(devices);
    }

    for (const DeviceInfo &info : devices.value()) {
        const DeviceInfo candidate = withSerial(info);
        if (candidate.serial == serial) {
            return Result<DeviceInfo>::success(candidate);
        }
    }

    qCDebug(ChalRespUsbLog) << "No token with serial" << SecureLogging::maskSerial(serial);
    return Result<DeviceInfo>::error(ErrorKind::NotFound,
                                     QStringLiteral("No token with serial %1")
                                         .arg(SecureLogging::maskSerial(serial)));
}

} // namespace Usb
} // namespace YubiKeyChalResp
