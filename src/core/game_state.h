// src/core/game_state.h
#pragma once

#include "types.h"
#include <string>

namespace Pachislo {

enum class GameMode {
    UNINITIALIZED,
    NORMAL,
    RUSH
};

// 游戏状态：模式、持球数和RUSH次数
class GameState {
public:
    GameState();

    static GameState Uninitialized();
    static GameState Normal(int balls);
    static GameState Rush(int balls, int rush_count);

    GameMode GetMode() const { return mode_; }
    int GetBalls() const { return balls_; }
    int GetRushCount() const { return rush_count_; }

    bool IsUninitialized() const { return mode_ == GameMode::UNINITIALIZED; }
    bool IsNormal() const { return mode_ == GameMode::NORMAL; }
    bool IsRush() const { return mode_ == GameMode::RUSH; }

    // Uninitialized -> Normal{init_balls}，已经开始时返回false
    bool Start(const BallsConfig& config);

    // 消耗一个球，没有球或未开始时返回false且不修改状态
    bool ConsumeBall();

    // 结果超过int上限时停在上限
    void AddBalls(int count);

    // Normal -> Rush{balls, 1}
    void EnterRush();

    // Rush{balls, n} -> Rush{balls, n + 1}
    void ContinueRush();

    // Rush -> Normal{balls}
    void EndRush();

    std::string ToString() const;

    bool operator==(const GameState& other) const;
    bool operator!=(const GameState& other) const { return !(*this == other); }

private:
    GameState(GameMode mode, int balls, int rush_count);

    GameMode mode_;
    int balls_;
    int rush_count_;
};

std::string ToString(GameMode mode);

struct Transition {
    std::optional<GameState> before;
    GameState after;
};

} // namespace Pachislo
