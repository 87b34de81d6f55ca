// src/io/statistics_output.cpp
#include "statistics_output.h"
#include <algorithm>

namespace Pachislo {

void StatisticsOutput::OnTransition(const Transition& transition) {
    const GameState& state = transition.after;
    stats_.max_balls = std::max(stats_.max_balls, state.GetBalls());

    // RUSH结束
    if (transition.before && transition.before->IsRush() && state.IsNormal()) {
        int rush_count = transition.before->GetRushCount();
        stats_.rushes_finished++;
        stats_.rush_count_sum += rush_count;
        stats_.max_rush_count = std::max(stats_.max_rush_count, rush_count);
    }
}

void StatisticsOutput::OnFinish(const GameState& final_state) {
    stats_.finished = true;
    stats_.final_balls = final_state.GetBalls();
    stats_.final_state = final_state.ToString();
}

void StatisticsOutput::OnLotteryNormal(const LotteryReport& report) {
    stats_.launches++;
    if (!report.reached_start_hole) {
        return;
    }

    stats_.start_hole_hits++;
    if (report.result.IsWin()) {
        stats_.wins_normal++;
    }
    CountFake(report);
}

void StatisticsOutput::OnLotteryRush(const LotteryReport& report) {
    stats_.launches++;
    if (report.result.IsWin()) {
        stats_.wins_rush++;
    }
    CountFake(report);
}

void StatisticsOutput::OnLotteryRushContinue(const LotteryReport& report) {
    if (report.result.IsWin()) {
        stats_.wins_rush_continue++;
    }
    CountFake(report);
}

void StatisticsOutput::OnCommandRejected(Command, CommandStatus status, const GameState&) {
    if (status == CommandStatus::INSUFFICIENT_BALLS) {
        stats_.rejected_insufficient++;
    } else {
        stats_.rejected_invalid++;
    }
}

void StatisticsOutput::CountFake(const LotteryReport& report) {
    if (report.result.is_fake) {
        stats_.fake_results++;
    }
}

} // namespace Pachislo
