// src/simulation/report_writer.cpp
#include "report_writer.h"
#include "../utils/logger.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Pachislo {

ReportWriter::ReportWriter(const std::string& output_base_dir) {
    InitializeOutputDirectory(output_base_dir);
    LOG_DEBUG("ReportWriter initialized - Output directory: " + output_dir_, "ReportWriter");
}

void ReportWriter::InitializeOutputDirectory(const std::string& output_base_dir) {
    // 创建带时间戳的输出目录
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream oss;
    oss << output_base_dir << "/simulation_"
        << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");

    // 同一秒内多次运行时加序号
    std::string candidate = oss.str();
    for (int suffix = 1; std::filesystem::exists(candidate); ++suffix) {
        candidate = oss.str() + "_" + std::to_string(suffix);
    }
    output_dir_ = candidate;

    std::error_code ec;
    std::filesystem::create_directories(output_dir_ + "/sessions", ec);
    if (!ec) {
        std::filesystem::create_directories(output_dir_ + "/reports", ec);
    }
    if (ec) {
        throw std::runtime_error("Failed to create output directories under " + output_dir_ +
                                 ": " + ec.message());
    }
}

void ReportWriter::WriteSessionStats(const std::vector<SessionStatistics>& session_stats) {
    std::string path = output_dir_ + "/sessions/session_stats.csv";
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open session stats file: " + path);
    }

    file << SessionStatsHeader() << "\n";
    for (const auto& stats : session_stats) {
        file << SessionStatsToCSV(stats) << "\n";
    }

    if (!file) {
        throw std::runtime_error("Failed to write session stats file: " + path);
    }
    LOG_DEBUG("Wrote " + std::to_string(session_stats.size()) + " session stats", "ReportWriter");
}

void ReportWriter::WriteSummary(const SimulationSummary& summary, const Config& config,
                                const SimulationConfig& simulation_config) {
    std::string path = output_dir_ + "/reports/summary.txt";
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open summary file: " + path);
    }

    const auto& probability = config.probability;

    file << "Pachislo Simulation Summary\n";
    file << "===========================\n\n";
    file << "Seed: " << simulation_config.seed << "\n";
    file << "Sessions: " << summary.total_sessions << "\n";
    file << "Launches per Session: " << simulation_config.launches_per_session << "\n";
    file << "Initial Balls: " << config.balls.init_balls << "\n";
    file << "Start Hole Probability: " << probability.start_hole << "\n";
    file << "Win Probability (normal/rush/continue): " << probability.normal.win << " / "
         << probability.rush.win << " / " << probability.rush_continue.win << "\n";
    file << "Rush Continue Decay: " << probability.rush_continue_desc << "\n\n";

    file << "Total Launches: " << summary.total_launches << "\n";
    file << "Start Hole Rate: " << std::fixed << std::setprecision(4)
         << (summary.StartHoleRate() * 100) << "%\n";
    file << "Win Normal: " << summary.total_wins_normal << "\n";
    file << "Win Rush: " << summary.total_wins_rush << "\n";
    file << "Win Rush Continue: " << summary.total_wins_rush_continue << "\n";
    file << "Fake Results: " << summary.total_fake_results << "\n";
    file << "Rushes Finished: " << summary.total_rushes_finished << "\n";
    file << "Average Rush Count: " << summary.AverageRushCount() << "\n";
    file << "Max Rush Count: " << summary.max_rush_count << "\n";
    file << "Launches Rejected (no balls): " << summary.total_rejected_insufficient << "\n";
    file << "Average Final Balls: " << std::setprecision(2) << summary.average_final_balls << "\n";
    file << "Execution Time: " << summary.execution_time << " seconds\n";

    if (!file) {
        throw std::runtime_error("Failed to write summary file: " + path);
    }
}

std::string ReportWriter::SessionStatsHeader() {
    return "session_index,launches,start_hole_hits,wins_normal,wins_rush,wins_rush_continue,"
           "fake_results,rejected_insufficient,rushes_finished,avg_rush_count,max_rush_count,"
           "max_balls,final_balls,final_state";
}

std::string ReportWriter::SessionStatsToCSV(const SessionStatistics& stats) {
    std::ostringstream oss;
    oss << stats.session_index << ","
        << stats.launches << ","
        << stats.start_hole_hits << ","
        << stats.wins_normal << ","
        << stats.wins_rush << ","
        << stats.wins_rush_continue << ","
        << stats.fake_results << ","
        << stats.rejected_insufficient << ","
        << stats.rushes_finished << ","
        << std::fixed << std::setprecision(6) << stats.AverageRushCount() << ","
        << stats.max_rush_count << ","
        << stats.max_balls << ","
        << stats.final_balls << ","
        << "\"" << stats.final_state << "\"";

    return oss.str();
}

} // namespace Pachislo
