/*
 * SPDX-FileCopyrightText: 2025 YubiKey ChalResp Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "protocol_types.h"

namespace YubiKeyChalResp {
namespace Shared {

std::optional<Slot> slotFromString(const QString &slotNumber)
{
    const QString trimmed = slotNumber.trimmed();
    if (trimmed == QLatin1String("1")) {
        return Slot::Slot1;
    }
    if (trimmed == QLatin1String("2")) {
        return Slot::Slot2;
    }
    return std::nullopt;
}

std::optional<Slot> slotFromInt(int slotNumber)
{
    switch (slotNumber) {
    case 1:
        return Slot::Slot1;
    case 2:
        return Slot::Slot2;
    default:
        return std::nullopt;
    }
}

bool isKnownCommand(quint8 commandByte)
{
    switch (static_cast<Command>(commandByte)) {
    case Command::ProgramSlot1:
    case Command::ProgramSlot2:
    case Command::UpdateSlot1:
    case Command::UpdateSlot2:
    case Command::SwapSlots:
    case Command::DeviceSerial:
    case Command::DeviceConfig:
    case Command::ReadConfig1:
    case Command::ReadConfig2:
    case Command::ChallengeOtp1:
    case Command::ChallengeOtp2:
    case Command::ChallengeHmac1:
    case Command::ChallengeHmac2:
        return true;
    }
    return false;
}

Command programCommand(Slot slot)
{
    return slot == Slot::Slot1 ? Command::ProgramSlot1 : Command::ProgramSlot2;
}

Command updateCommand(Slot slot)
{
    return slot == Slot::Slot1 ? Command::UpdateSlot1 : Command::UpdateSlot2;
}

Command challengeCommand(Slot slot, Mode mode)
{
    if (mode == Mode::Sha1) {
        return slot == Slot::Slot1 ? Command::ChallengeHmac1 : Command::ChallengeHmac2;
    }
    return slot == Slot::Slot1 ? Command::ChallengeOtp1 : Command::ChallengeOtp2;
}

bool isProgrammingCommand(Command command)
{
    return command == Command::ProgramSlot1
        || command == Command::ProgramSlot2
        || command == Command::UpdateSlot1
        || command == Command::UpdateSlot2
        || command == Command::SwapSlots;
}

QString slotName(Slot slot)
{
    return slot == Slot::Slot1 ? QStringLiteral("Slot1") : QStringLiteral("Slot2");
}

QString modeName(Mode mode)
{
    return mode == Mode::Sha1 ? QStringLiteral("Sha1") : QStringLiteral("Otp");
}

} // namespace Shared
} // namespace YubiKeyChalResp
