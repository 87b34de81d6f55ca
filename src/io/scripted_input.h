// src/io/scripted_input.h
#pragma once

#include "../core/game_interface.h"
#include <deque>

namespace Pachislo {

// 按预先给定的顺序提供命令，用于模拟和测试
class ScriptedInput : public GameInput {
public:
    // batch_size: 每次WaitForInput最多返回的命令数
    explicit ScriptedInput(size_t batch_size = 256);

    // 追加count次同一命令
    ScriptedInput& Add(Command command, int count = 1);

    // StartGame, launches次LaunchBall, FinishGame
    static ScriptedInput ForSession(int launches, size_t batch_size = 256);

    std::vector<Command> WaitForInput() override;
    bool IsActive() const override { return remaining_ > 0; }

    long long GetRemaining() const { return remaining_; }

private:
    struct Step {
        Command command;
        long long count;
    };

    std::deque<Step> steps_;
    size_t batch_size_;
    long long remaining_;
};

} // namespace Pachislo
