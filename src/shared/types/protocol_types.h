/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <optional>

namespace YubiKeyChalResp {
namespace Shared {

/**
 * @brief Configuration slot on the token
 */
enum class Slot : quint8 {
    Slot1 = 1,
    Slot2 = 2
};

/**
 * @brief Cryptographic transform a slot performs
 */
enum class Mode : quint8 {
    Sha1, ///< HMAC-SHA1 challenge-response
    Otp   ///< Yubico OTP (AES-128) challenge-response
};

/**
 * @brief Frame command byte
 *
 * The command byte selects both the operation and, for slot operations,
 * the slot. The firmware interprets the 64-byte payload according to it.
 */
enum class Command : quint8 {
    ProgramSlot1 = 0x01,
    ProgramSlot2 = 0x03,
    UpdateSlot1 = 0x04,
    UpdateSlot2 = 0x05,
    SwapSlots = 0x06,
    DeviceSerial = 0x10,
    DeviceConfig = 0x11,
    ReadConfig1 = 0x1c,
    ReadConfig2 = 0x1d,
    ChallengeOtp1 = 0x20,
    ChallengeOtp2 = 0x28,
    ChallengeHmac1 = 0x30,
    ChallengeHmac2 = 0x38
};

/**
 * @brief Parses a slot number ("1" or "2")
 * @return Slot, or std::nullopt for anything else
 */
std::optional<Slot> slotFromString(const QString &slotNumber);

/**
 * @brief Parses a slot number (1 or 2)
 * @return Slot, or std::nullopt for anything else
 */
std::optional<Slot> slotFromInt(int slotNumber);

/**
 * @brief Checks whether a byte is a command the engine knows
 */
bool isKnownCommand(quint8 commandByte);

/**
 * @brief Programming command (full configuration write) for a slot
 */
Command programCommand(Slot slot);

/**
 * @brief Update command (flag update, keeps secret) for a slot
 */
Command updateCommand(Slot slot);

/**
 * @brief Challenge command for a slot and transform
 */
Command challengeCommand(Slot slot, Mode mode);

/**
 * @brief Whether a command makes the token write its configuration
 *
 * These commands are acknowledged by a program sequence change rather than
 * a response.
 */
bool isProgrammingCommand(Command command);

QString slotName(Slot slot);
QString modeName(Mode mode);

} // namespace Shared
} // namespace YubiKeyChalResp
