// src/simulation/report_writer.h
#pragma once

#include "simulation_runner.h"
#include "../core/types.h"
#include <string>
#include <vector>

namespace Pachislo {

// 把模拟结果写到带时间戳的目录中
class ReportWriter {
public:
    // 创建输出目录，失败时抛出std::runtime_error
    explicit ReportWriter(const std::string& output_base_dir);
    ~ReportWriter() = default;

    // sessions/session_stats.csv
    void WriteSessionStats(const std::vector<SessionStatistics>& session_stats);

    // reports/summary.txt
    void WriteSummary(const SimulationSummary& summary, const Config& config,
                      const SimulationConfig& simulation_config);

    const std::string& GetOutputDir() const { return output_dir_; }

    static std::string SessionStatsHeader();
    static std::string SessionStatsToCSV(const SessionStatistics& stats);

private:
    std::string output_dir_;

    void InitializeOutputDirectory(const std::string& output_base_dir);
};

} // namespace Pachislo
