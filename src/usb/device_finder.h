/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"
#include "config/configuration_keys.h"
#include "core/protocol/poll_policy.h"
#include "types/device_info.h"

#include <QList>

namespace YubiKeyChalResp {
namespace Shared {
class ConfigurationProvider;
}

namespace Usb {
using namespace YubiKeyChalResp::Shared;

class UsbContext;

/**
 * @brief Locates tokens and fills in their serial numbers
 *
 * Serials are read through a short challenge-response session on each
 * token; tokens that hide their serial are still returned, without one.
 */
class DeviceFinder
{
public:
    explicit DeviceFinder(const UsbContext &context,
                          const Core::PollPolicy &policy = Core::PollPolicy(),
                          int usbTimeoutMs = ConfigKeys::DEFAULT_USB_TIMEOUT_MS);
    DeviceFinder(const UsbContext &context, const ConfigurationProvider &config);

    /**
     * @brief First attached token
     */
    Result<DeviceInfo> findDevice() const;

    /**
     * @brief All attached tokens
     */
    Result<QList<DeviceInfo>> findAllDevices() const;

    /**
     * @brief Token with the given serial number
     * @return Device, or NotFound
     */
    Result<DeviceInfo> findDeviceBySerial(quint32 serial) const;

    /**
     * @brief Opens a token and reads its serial number
     */
    Result<quint32> readSerial(const DeviceInfo &info) const;

private:
    DeviceInfo withSerial(DeviceInfo info) const;

    const UsbContext &m_context;
    Core::PollPolicy m_policy;
    int m_usbTimeoutMs;
};

} // namespace Usb
} // namespace YubiKeyChalResp
