// src/io/console_output.h
#pragma once

#include "../core/game_interface.h"
#include <ostream>

namespace Pachislo {

// 在终端显示游戏状态和转轮
class ConsoleOutput : public GameOutput {
public:
    explicit ConsoleOutput(std::ostream& out);

    void PrintWelcome();

    void OnTransition(const Transition& transition) override;
    void OnFinish(const GameState& final_state) override;
    void OnLotteryNormal(const LotteryReport& report) override;
    void OnLotteryRush(const LotteryReport& report) override;
    void OnLotteryRushContinue(const LotteryReport& report) override;
    void OnCommandRejected(Command command, CommandStatus status,
                           const GameState& state) override;

private:
    std::ostream& out_;

    void PrintLottery(const std::string& label, const LotteryReport& report);
};

} // namespace Pachislo
