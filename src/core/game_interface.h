// src/core/game_interface.h
#pragma once

#include "types.h"
#include "game_state.h"
#include <vector>

namespace Pachislo {

// 输入端：终端、脚本或网络等
class GameInput {
public:
    virtual ~GameInput() = default;

    // 每次循环调用一次，返回按顺序执行的命令（可以为空）
    virtual std::vector<Command> WaitForInput() = 0;

    // 返回false表示不会再有输入
    virtual bool IsActive() const = 0;
};

// 输出端：接收游戏通知
class GameOutput {
public:
    virtual ~GameOutput() = default;

    // 状态变化通知
    virtual void OnTransition(const Transition& transition) = 0;

    // 游戏结束通知
    virtual void OnFinish(const GameState& final_state) = 0;

    // 抽选结果通知
    virtual void OnLotteryNormal(const LotteryReport& report) = 0;
    virtual void OnLotteryRush(const LotteryReport& report) = 0;
    virtual void OnLotteryRushContinue(const LotteryReport& report) = 0;

    // 命令被拒绝（球数不足、未开始等），状态未改变
    virtual void OnCommandRejected(Command command, CommandStatus status,
                                   const GameState& state) = 0;
};

} // namespace Pachislo
