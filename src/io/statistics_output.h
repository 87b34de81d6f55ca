// src/io/statistics_output.h
#pragma once

#include "../core/game_interface.h"
#include <string>

namespace Pachislo {

// 单个session的统计数据
struct SessionStatistics {
    int session_index;
    long long launches;             // 成功发射的次数
    long long start_hole_hits;
    long long wins_normal;
    long long wins_rush;
    long long wins_rush_continue;
    long long fake_results;         // 显示结果与真实结果不同的次数
    long long rejected_insufficient;
    long long rejected_invalid;
    long long rushes_finished;
    long long rush_count_sum;       // 每次RUSH结束时的RUSH次数之和
    int max_rush_count;
    int max_balls;
    int final_balls;
    std::string final_state;
    bool finished;

    SessionStatistics()
        : session_index(0), launches(0), start_hole_hits(0)
        , wins_normal(0), wins_rush(0), wins_rush_continue(0), fake_results(0)
        , rejected_insufficient(0), rejected_invalid(0)
        , rushes_finished(0), rush_count_sum(0), max_rush_count(0)
        , max_balls(0), final_balls(0), final_state("Uninitialized"), finished(false) {}

    double AverageRushCount() const {
        return rushes_finished > 0
            ? static_cast<double>(rush_count_sum) / static_cast<double>(rushes_finished)
            : 0.0;
    }
};

// 不显示任何内容，只统计结果
class StatisticsOutput : public GameOutput {
public:
    StatisticsOutput() = default;

    void OnTransition(const Transition& transition) override;
    void OnFinish(const GameState& final_state) override;
    void OnLotteryNormal(const LotteryReport& report) override;
    void OnLotteryRush(const LotteryReport& report) override;
    void OnLotteryRushContinue(const LotteryReport& report) override;
    void OnCommandRejected(Command command, CommandStatus status,
                           const GameState& state) override;

    const SessionStatistics& GetStatistics() const { return stats_; }
    SessionStatistics& GetStatistics() { return stats_; }

private:
    SessionStatistics stats_;

    void CountFake(const LotteryReport& report);
};

} // namespace Pachislo
