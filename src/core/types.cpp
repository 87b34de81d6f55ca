// src/core/types.cpp
#include "types.h"

namespace Pachislo {

std::string ToString(Outcome outcome) {
    return outcome == Outcome::WIN ? "Win" : "Lose";
}

std::string ToString(LotteryKind kind) {
    switch (kind) {
        case LotteryKind::NORMAL:        return "normal";
        case LotteryKind::RUSH:          return "rush";
        case LotteryKind::RUSH_CONTINUE: return "rush continue";
    }
    return "unknown";
}

std::string ToString(Command command) {
    switch (command) {
        case Command::START_GAME:  return "StartGame";
        case Command::LAUNCH_BALL: return "LaunchBall";
        case Command::FINISH_GAME: return "FinishGame";
    }
    return "Unknown";
}

std::string ToString(CommandStatus status) {
    switch (status) {
        case CommandStatus::OK:                 return "Ok";
        case CommandStatus::INSUFFICIENT_BALLS: return "InsufficientBalls";
        case CommandStatus::INVALID_COMMAND:    return "InvalidCommand";
    }
    return "Unknown";
}

std::string ToString(const LotteryResult& result) {
    std::string text = ToString(result.real_outcome);
    if (result.is_fake) {
        text += result.real_outcome == Outcome::WIN ? " (FakeWin)" : " (FakeLose)";
    }
    return text;
}

} // namespace Pachislo
