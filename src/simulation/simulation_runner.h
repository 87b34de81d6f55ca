// src/simulation/simulation_runner.h
#pragma once

#include "../core/types.h"
#include "../io/statistics_output.h"
#include <string>
#include <vector>

namespace Pachislo {

// 所有session的汇总
struct SimulationSummary {
    int total_sessions;
    long long total_launches;
    long long total_start_hole_hits;
    long long total_wins_normal;
    long long total_wins_rush;
    long long total_wins_rush_continue;
    long long total_fake_results;
    long long total_rejected_insufficient;
    long long total_rushes_finished;
    long long total_rush_count_sum;
    int max_rush_count;
    double average_final_balls;
    double execution_time;          // 秒

    SimulationSummary()
        : total_sessions(0), total_launches(0), total_start_hole_hits(0)
        , total_wins_normal(0), total_wins_rush(0), total_wins_rush_continue(0)
        , total_fake_results(0), total_rejected_insufficient(0)
        , total_rushes_finished(0), total_rush_count_sum(0), max_rush_count(0)
        , average_final_balls(0.0), execution_time(0.0) {}

    double AverageRushCount() const {
        return total_rushes_finished > 0
            ? static_cast<double>(total_rush_count_sum) / static_cast<double>(total_rushes_finished)
            : 0.0;
    }

    double StartHoleRate() const {
        return total_launches > 0
            ? static_cast<double>(total_start_hole_hits) / static_cast<double>(total_launches)
            : 0.0;
    }
};

// 批量运行多个session并统计结果
class SimulationRunner {
public:
    SimulationRunner(const Config& config, const SimulationConfig& simulation_config);
    ~SimulationRunner() = default;

    // 运行所有session，写报告失败时返回false
    bool Run();

    // 运行单个session（种子为 seed + session_index）
    SessionStatistics RunSession(int session_index) const;

    static SimulationSummary Summarize(const std::vector<SessionStatistics>& results);

    const std::vector<SessionStatistics>& GetResults() const { return results_; }
    const SimulationSummary& GetSummary() const { return summary_; }
    const std::string& GetReportDir() const { return report_dir_; }

private:
    Config config_;
    SimulationConfig simulation_config_;

    std::vector<SessionStatistics> results_;
    SimulationSummary summary_;
    std::string report_dir_;

    bool SaveResults();
    void LogSummary() const;
};

} // namespace Pachislo
