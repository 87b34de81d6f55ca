// src/simulation/simulation_runner.cpp
#include "simulation_runner.h"
#include "report_writer.h"
#include "../core/config.h"
#include "../core/game.h"
#include "../io/scripted_input.h"
#include "../utils/logger.h"
#include "../utils/timer.h"
#include <algorithm>
#include <memory>

namespace Pachislo {

namespace {

// 转轮随机源的种子偏移，避免和抽选随机源使用相同的序列
constexpr uint64_t SLOT_SEED_OFFSET = 0x9E3779B97F4A7C15ULL;

} // namespace

SimulationRunner::SimulationRunner(const Config& config, const SimulationConfig& simulation_config)
    : config_(config), simulation_config_(simulation_config) {
    ConfigManager::ValidateConfig(config_);

    if (simulation_config_.sessions < 1) {
        throw ConfigError("Simulation needs at least one session");
    }
    if (simulation_config_.launches_per_session < 0) {
        throw ConfigError("launches_per_session cannot be negative");
    }
}

bool SimulationRunner::Run() {
    Timer timer;
    timer.Start();

    LOG_INFO("Starting simulation: " + std::to_string(simulation_config_.sessions) +
             " sessions x " + std::to_string(simulation_config_.launches_per_session) +
             " launches, seed " + std::to_string(simulation_config_.seed), "SimulationRunner");

    results_.clear();
    results_.reserve(static_cast<size_t>(simulation_config_.sessions));

    for (int i = 0; i < simulation_config_.sessions; ++i) {
        results_.push_back(RunSession(i));

        const auto& stats = results_.back();
        LOG_DEBUG("Session " + std::to_string(i) + " completed (launches: " +
                  std::to_string(stats.launches) + ", rushes: " +
                  std::to_string(stats.rushes_finished) + ", final: " + stats.final_state + ")",
                  "SimulationRunner");
    }

    summary_ = Summarize(results_);
    summary_.execution_time = timer.Stop();

    LogSummary();

    if (!simulation_config_.write_report) {
        return true;
    }
    return SaveResults();
}

SessionStatistics SimulationRunner::RunSession(int session_index) const {
    ScopedTimer timer("Session " + std::to_string(session_index), "SimulationRunner");
    uint64_t seed = simulation_config_.seed + static_cast<uint64_t>(session_index);

    auto input = std::make_unique<ScriptedInput>(
        ScriptedInput::ForSession(simulation_config_.launches_per_session));
    auto output = std::make_unique<StatisticsOutput>();
    StatisticsOutput* statistics = output.get();

    Game game(config_, std::move(input), std::move(output),
              std::make_unique<Mt19937RandomSource>(seed),
              std::make_unique<Mt19937RandomSource>(seed ^ SLOT_SEED_OFFSET));
    game.Run();

    SessionStatistics stats = statistics->GetStatistics();
    stats.session_index = session_index;
    return stats;
}

SimulationSummary SimulationRunner::Summarize(const std::vector<SessionStatistics>& results) {
    SimulationSummary summary;
    summary.total_sessions = static_cast<int>(results.size());

    double final_balls_sum = 0.0;
    for (const auto& stats : results) {
        summary.total_launches += stats.launches;
        summary.total_start_hole_hits += stats.start_hole_hits;
        summary.total_wins_normal += stats.wins_normal;
        summary.total_wins_rush += stats.wins_rush;
        summary.total_wins_rush_continue += stats.wins_rush_continue;
        summary.total_fake_results += stats.fake_results;
        summary.total_rejected_insufficient += stats.rejected_insufficient;
        summary.total_rushes_finished += stats.rushes_finished;
        summary.total_rush_count_sum += stats.rush_count_sum;
        summary.max_rush_count = std::max(summary.max_rush_count, stats.max_rush_count);
        final_balls_sum += stats.final_balls;
    }

    if (!results.empty()) {
        summary.average_final_balls = final_balls_sum / static_cast<double>(results.size());
    }
    return summary;
}

bool SimulationRunner::SaveResults() {
    LOG_INFO("Saving simulation results", "SimulationRunner");

    try {
        ReportWriter writer(simulation_config_.output_dir);
        writer.WriteSessionStats(results_);
        writer.WriteSummary(summary_, config_, simulation_config_);
        report_dir_ = writer.GetOutputDir();

        LOG_INFO("Saved " + std::to_string(results_.size()) + " session results to " +
                 report_dir_, "SimulationRunner");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception while saving results: " + std::string(e.what()), "SimulationRunner");
        return false;
    }
}

void SimulationRunner::LogSummary() const {
    LOG_INFO("Win normal: " + std::to_string(summary_.total_wins_normal) +
             ", win rush: " + std::to_string(summary_.total_wins_rush) +
             ", win rush continue: " + std::to_string(summary_.total_wins_rush_continue),
             "SimulationRunner");
    LOG_INFO("Rushes finished: " + std::to_string(summary_.total_rushes_finished) +
             ", average rush count: " + std::to_string(summary_.AverageRushCount()) +
             ", max rush count: " + std::to_string(summary_.max_rush_count),
             "SimulationRunner");
    LOG_INFO("Simulation completed in " + std::to_string(summary_.execution_time) + " seconds",
             "SimulationRunner");
}

} // namespace Pachislo
