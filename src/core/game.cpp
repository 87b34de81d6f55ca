// src/core/game.cpp
#include "game.h"
#include "config.h"
#include "../utils/logger.h"
#include <stdexcept>

namespace Pachislo {

Game::Game(const Config& config,
           std::unique_ptr<GameInput> input,
           std::unique_ptr<GameOutput> output)
    : Game(config, std::move(input), std::move(output),
           std::make_unique<Mt19937RandomSource>(),
           std::make_unique<Mt19937RandomSource>()) {
}

Game::Game(const Config& config,
           std::unique_ptr<GameInput> input,
           std::unique_ptr<GameOutput> output,
           std::unique_ptr<RandomSource> lottery_rng,
           std::unique_ptr<RandomSource> slot_rng)
    : config_(Validated(config))
    , input_(std::move(input))
    , output_(std::move(output))
    , lottery_rng_(std::move(lottery_rng))
    , slot_rng_(std::move(slot_rng))
    , lottery_(config_.probability, Require(lottery_rng_))
    , launch_flow_(config_.probability.start_hole, *lottery_rng_)
    , slot_producer_(config_.slot.reel_count, config_.slot.symbols, Require(slot_rng_))
    , state_(GameState::Uninitialized())
    , finished_(false) {

    if (!input_ || !output_) {
        throw std::invalid_argument("Game input and output cannot be null");
    }

    LOG_DEBUG("Game created (init_balls=" + std::to_string(config_.balls.init_balls) +
              ", reels=" + std::to_string(config_.slot.reel_count) + ")", "Game");
}

const Config& Game::Validated(const Config& config) {
    ConfigManager::ValidateConfig(config);
    return config;
}

RandomSource& Game::Require(const std::unique_ptr<RandomSource>& rng) {
    if (!rng) {
        throw std::invalid_argument("Game random source cannot be null");
    }
    return *rng;
}

void Game::Run() {
    LOG_INFO("Game loop started", "Game");

    while (RunStep()) {
    }

    LOG_INFO("Game loop finished, final state: " + state_.ToString(), "Game");
}

bool Game::RunStep() {
    if (finished_) {
        return false;
    }

    if (command_queue_.empty()) {
        if (!input_->IsActive()) {
            LOG_DEBUG("Input closed, finishing game", "Game");
            Finish();
            return false;
        }

        auto commands = input_->WaitForInput();
        command_queue_.insert(command_queue_.end(), commands.begin(), commands.end());
        if (command_queue_.empty()) {
            return true;
        }
    }

    Command command = command_queue_.front();
    command_queue_.pop_front();
    Execute(command);

    return !finished_;
}

CommandStatus Game::Execute(Command command) {
    switch (command) {
        case Command::START_GAME:  return Start();
        case Command::LAUNCH_BALL: return LaunchBall();
        case Command::FINISH_GAME: return Finish();
    }
    return Reject(command, CommandStatus::INVALID_COMMAND, "unknown command");
}

CommandStatus Game::Start() {
    if (finished_) {
        return Reject(Command::START_GAME, CommandStatus::INVALID_COMMAND, "game already finished");
    }

    GameState next = state_;
    if (!next.Start(config_.balls)) {
        return Reject(Command::START_GAME, CommandStatus::INVALID_COMMAND, "game already started");
    }

    LOG_INFO("Game started with " + std::to_string(next.GetBalls()) + " balls", "Game");
    Commit(next);
    return CommandStatus::OK;
}

CommandStatus Game::LaunchBall() {
    if (finished_) {
        return Reject(Command::LAUNCH_BALL, CommandStatus::INVALID_COMMAND, "game already finished");
    }
    if (state_.IsUninitialized()) {
        return Reject(Command::LAUNCH_BALL, CommandStatus::INVALID_COMMAND, "game not started");
    }

    GameState next = state_;
    if (!next.ConsumeBall()) {
        return Reject(Command::LAUNCH_BALL, CommandStatus::INSUFFICIENT_BALLS, "no balls left");
    }

    if (next.IsRush()) {
        ResolveRushLaunch(next);
    } else {
        ResolveNormalLaunch(next);
    }

    Commit(next);
    return CommandStatus::OK;
}

CommandStatus Game::Finish() {
    if (!finished_) {
        finished_ = true;
        command_queue_.clear();
        LOG_INFO("Game finished, final state: " + state_.ToString(), "Game");
    }

    // 重复调用时发送相同的结束通知
    output_->OnFinish(state_);
    return CommandStatus::OK;
}

void Game::ResolveNormalLaunch(GameState& next) {
    // 未进入启动口时不抽选，视为没有假结果的Lose
    if (!launch_flow_.Launch()) {
        LotteryReport report;
        report.kind = LotteryKind::NORMAL;
        report.result = LotteryResult(Outcome::LOSE, Outcome::LOSE);
        report.reached_start_hole = false;
        output_->OnLotteryNormal(report);
        return;
    }

    LotteryResult result = lottery_.ResolveNormal();
    output_->OnLotteryNormal(MakeReport(LotteryKind::NORMAL, result));

    // 状态只根据真实结果变化
    if (result.IsWin()) {
        next.AddBalls(config_.balls.incremental_balls);
        next.EnterRush();
        LOG_DEBUG("Entered RUSH with " + std::to_string(next.GetBalls()) + " balls", "Game");
    }
}

void Game::ResolveRushLaunch(GameState& next) {
    LotteryResult result = lottery_.ResolveRush();
    output_->OnLotteryRush(MakeReport(LotteryKind::RUSH, result));

    if (!result.IsWin()) {
        LOG_DEBUG("RUSH lost after " + std::to_string(next.GetRushCount()) + " rounds", "Game");
        next.EndRush();
        return;
    }

    next.AddBalls(config_.balls.incremental_rush);

    LotteryResult continue_result = lottery_.ResolveRushContinue(next.GetRushCount());
    output_->OnLotteryRushContinue(MakeReport(LotteryKind::RUSH_CONTINUE, continue_result));

    if (continue_result.IsWin()) {
        next.ContinueRush();
    } else {
        LOG_DEBUG("RUSH ended after " + std::to_string(next.GetRushCount()) + " rounds", "Game");
        next.EndRush();
    }
}

LotteryReport Game::MakeReport(LotteryKind kind, const LotteryResult& result) {
    LotteryReport report;
    report.kind = kind;
    report.result = result;
    report.reached_start_hole = true;

    auto [shown, reveal] = slot_producer_.ProduceReveal(result);
    report.slot = std::move(shown);
    report.reveal = std::move(reveal);
    return report;
}

void Game::Commit(const GameState& next) {
    before_state_ = state_;
    state_ = next;
    output_->OnTransition(Transition{before_state_, state_});
}

CommandStatus Game::Reject(Command command, CommandStatus status, const std::string& reason) {
    std::string message = ToString(command) + " rejected (" + ToString(status) + "): " +
                          reason + ", state: " + state_.ToString();
    // 球数不足在长时间模拟中很常见，只在DEBUG级别记录
    if (status == CommandStatus::INSUFFICIENT_BALLS) {
        LOG_DEBUG(message, "Game");
    } else {
        LOG_WARNING(message, "Game");
    }
    output_->OnCommandRejected(command, status, state_);
    return status;
}

} // namespace Pachislo
