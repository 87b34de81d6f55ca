// src/core/game_state.cpp
#include "game_state.h"
#include <limits>
#include <stdexcept>

namespace Pachislo {

GameState::GameState() : mode_(GameMode::UNINITIALIZED), balls_(0), rush_count_(0) {
}

GameState::GameState(GameMode mode, int balls, int rush_count)
    : mode_(mode), balls_(balls), rush_count_(rush_count) {
    if (balls_ < 0) {
        throw std::invalid_argument("Ball count cannot be negative: " + std::to_string(balls_));
    }
    if (mode_ == GameMode::RUSH && rush_count_ < 1) {
        throw std::invalid_argument("Rush count must be positive: " + std::to_string(rush_count_));
    }
}

GameState GameState::Uninitialized() {
    return GameState();
}

GameState GameState::Normal(int balls) {
    return GameState(GameMode::NORMAL, balls, 0);
}

GameState GameState::Rush(int balls, int rush_count) {
    return GameState(GameMode::RUSH, balls, rush_count);
}

bool GameState::Start(const BallsConfig& config) {
    if (!IsUninitialized()) {
        return false;
    }
    *this = Normal(config.init_balls);
    return true;
}

bool GameState::ConsumeBall() {
    if (IsUninitialized() || balls_ == 0) {
        return false;
    }
    --balls_;
    return true;
}

void GameState::AddBalls(int count) {
    if (IsUninitialized()) {
        throw std::logic_error("Cannot add balls before the game has started");
    }
    if (count < 0) {
        throw std::invalid_argument("Ball increment cannot be negative");
    }
    // 超过int上限时停在上限，球数不会溢出为负数
    const int max_balls = std::numeric_limits<int>::max();
    balls_ = count > max_balls - balls_ ? max_balls : balls_ + count;
}

void GameState::EnterRush() {
    if (!IsNormal()) {
        throw std::logic_error("Rush can only be entered from Normal, current: " + ToString());
    }
    mode_ = GameMode::RUSH;
    rush_count_ = 1;
}

void GameState::ContinueRush() {
    if (!IsRush()) {
        throw std::logic_error("Rush can only be continued from Rush, current: " + ToString());
    }
    ++rush_count_;
}

void GameState::EndRush() {
    if (!IsRush()) {
        throw std::logic_error("Rush can only be ended from Rush, current: " + ToString());
    }
    mode_ = GameMode::NORMAL;
    rush_count_ = 0;
}

std::string GameState::ToString() const {
    switch (mode_) {
        case GameMode::UNINITIALIZED:
            return "Uninitialized";
        case GameMode::NORMAL:
            return "Normal { balls: " + std::to_string(balls_) + " }";
        case GameMode::RUSH:
            return "Rush { balls: " + std::to_string(balls_) +
                   ", rush_count: " + std::to_string(rush_count_) + " }";
    }
    return "Unknown";
}

bool GameState::operator==(const GameState& other) const {
    return mode_ == other.mode_ && balls_ == other.balls_ && rush_count_ == other.rush_count_;
}

std::string ToString(GameMode mode) {
    switch (mode) {
        case GameMode::UNINITIALIZED: return "Uninitialized";
        case GameMode::NORMAL:        return "Normal";
        case GameMode::RUSH:          return "Rush";
    }
    return "Unknown";
}

} // namespace Pachislo
