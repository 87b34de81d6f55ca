// src/core/game.h
#pragma once

#include "types.h"
#include "game_state.h"
#include "game_interface.h"
#include "../lottery/lottery.h"
#include "../lottery/launch_ball_flow.h"
#include "../lottery/slot_producer.h"
#include "../utils/random_source.h"
#include <deque>
#include <memory>
#include <optional>

namespace Pachislo {

// 游戏控制器：执行命令，驱动抽选并更新状态
class Game {
public:
    // 使用随机种子的随机源
    Game(const Config& config,
         std::unique_ptr<GameInput> input,
         std::unique_ptr<GameOutput> output);

    // lottery_rng 用于启动口和抽选，slot_rng 只用于生成转轮符号
    Game(const Config& config,
         std::unique_ptr<GameInput> input,
         std::unique_ptr<GameOutput> output,
         std::unique_ptr<RandomSource> lottery_rng,
         std::unique_ptr<RandomSource> slot_rng);

    ~Game() = default;

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    // 运行到游戏结束或输入关闭
    void Run();

    // 执行一个命令，游戏结束后返回false
    bool RunStep();

    CommandStatus Execute(Command command);

    CommandStatus Start();
    CommandStatus LaunchBall();
    CommandStatus Finish();

    const GameState& GetState() const { return state_; }
    const std::optional<GameState>& GetBeforeState() const { return before_state_; }
    bool IsFinished() const { return finished_; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::unique_ptr<GameInput> input_;
    std::unique_ptr<GameOutput> output_;
    std::unique_ptr<RandomSource> lottery_rng_;
    std::unique_ptr<RandomSource> slot_rng_;

    Lottery lottery_;
    LaunchBallFlowProducer launch_flow_;
    SlotProducer<int> slot_producer_;

    GameState state_;
    std::optional<GameState> before_state_;
    bool finished_;
    std::deque<Command> command_queue_;

    // 内部方法
    static const Config& Validated(const Config& config);
    static RandomSource& Require(const std::unique_ptr<RandomSource>& rng);
    LotteryReport MakeReport(LotteryKind kind, const LotteryResult& result);
    void ResolveNormalLaunch(GameState& next);
    void ResolveRushLaunch(GameState& next);
    void Commit(const GameState& next);
    CommandStatus Reject(Command command, CommandStatus status, const std::string& reason);
};

} // namespace Pachislo
