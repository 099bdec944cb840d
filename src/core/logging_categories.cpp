/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "logging_categories.h"

namespace YubiKeyChalResp {
namespace Core {

Q_LOGGING_CATEGORY(ChalRespProtocolLog, "yubikey.chalresp.protocol", QtWarningMsg)
Q_LOGGING_CATEGORY(ChalRespConfigLog, "yubikey.chalresp.config", QtWarningMsg)
Q_LOGGING_CATEGORY(ChalRespCryptoLog, "yubikey.chalresp.crypto", QtWarningMsg)
Q_LOGGING_CATEGORY(ChalRespSessionLog, "yubikey.chalresp.session", QtWarningMsg)
Q_LOGGING_CATEGORY(ChalRespSettingsLog, "yubikey.chalresp.settings", QtWarningMsg)
Q_LOGGING_CATEGORY(ChalRespUsbLog, "yubikey.chalresp.usb", QtWarningMsg)

} // namespace Core
} // namespace YubiKeyChalResp
