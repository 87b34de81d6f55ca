#include <gtest/gtest.h>

#include "core/config.h"
#include "simulation/report_writer.h"
#include "simulation/simulation_runner.h"
#include "utils/timer.h"
#include "capture_log_sink.h"

#include <filesystem>
#include <fstream>
#include <string>

using namespace Pachislo;

namespace {

SimulationConfig SmallSimulation() {
    SimulationConfig simulation;
    simulation.sessions = 3;
    simulation.launches_per_session = 5000;
    simulation.seed = 42;
    simulation.write_report = false;
    return simulation;
}

} // namespace

class SimulationTest : public ::testing::Test {
protected:
    ScopedLogCapture log_;
};

TEST_F(SimulationTest, SameSeedGivesSameResults) {
    Config config = ConfigManager::ExampleConfig();

    SimulationRunner first(config, SmallSimulation());
    SimulationRunner second(config, SmallSimulation());
    ASSERT_TRUE(first.Run());
    ASSERT_TRUE(second.Run());

    ASSERT_EQ(first.GetResults().size(), 3u);
    for (size_t i = 0; i < first.GetResults().size(); ++i) {
        const auto& a = first.GetResults()[i];
        const auto& b = second.GetResults()[i];
        EXPECT_EQ(a.session_index, static_cast<int>(i));
        EXPECT_EQ(a.launches, b.launches);
        EXPECT_EQ(a.wins_normal, b.wins_normal);
        EXPECT_EQ(a.wins_rush, b.wins_rush);
        EXPECT_EQ(a.rush_count_sum, b.rush_count_sum);
        EXPECT_EQ(a.final_state, b.final_state);
    }
    EXPECT_TRUE(first.GetReportDir().empty());
}

TEST_F(SimulationTest, SessionsAreFinishedAndConsistent) {
    SimulationRunner runner(ConfigManager::ExampleConfig(), SmallSimulation());
    ASSERT_TRUE(runner.Run());

    for (const auto& stats : runner.GetResults()) {
        EXPECT_TRUE(stats.finished);
        // 每次发射要么成功要么因为球数不足被拒绝
        EXPECT_EQ(stats.launches + stats.rejected_insufficient, 5000);
        EXPECT_LE(stats.start_hole_hits, stats.launches);
        EXPECT_GE(stats.final_balls, 0);
        EXPECT_EQ(stats.rejected_invalid, 0);
    }

    const SimulationSummary& summary = runner.GetSummary();
    EXPECT_EQ(summary.total_sessions, 3);
    EXPECT_GT(summary.total_launches, 0);
    EXPECT_GT(summary.StartHoleRate(), 0.05);
    EXPECT_LT(summary.StartHoleRate(), 0.2);
}

TEST_F(SimulationTest, SummarizeAggregatesSessions) {
    SessionStatistics a;
    a.launches = 10;
    a.start_hole_hits = 2;
    a.rushes_finished = 1;
    a.rush_count_sum = 3;
    a.max_rush_count = 3;
    a.final_balls = 100;

    SessionStatistics b;
    b.launches = 30;
    b.start_hole_hits = 4;
    b.rushes_finished = 2;
    b.rush_count_sum = 3;
    b.max_rush_count = 2;
    b.final_balls = 300;

    SimulationSummary summary = SimulationRunner::Summarize({a, b});
    EXPECT_EQ(summary.total_sessions, 2);
    EXPECT_EQ(summary.total_launches, 40);
    EXPECT_DOUBLE_EQ(summary.StartHoleRate(), 0.15);
    EXPECT_DOUBLE_EQ(summary.AverageRushCount(), 2.0);
    EXPECT_EQ(summary.max_rush_count, 3);
    EXPECT_DOUBLE_EQ(summary.average_final_balls, 200.0);
}

TEST_F(SimulationTest, InvalidSimulationConfigThrows) {
    SimulationConfig simulation = SmallSimulation();
    simulation.sessions = 0;
    EXPECT_THROW(SimulationRunner(ConfigManager::ExampleConfig(), simulation), ConfigError);

    Config config = ConfigManager::ExampleConfig();
    config.probability.rush.win = 2.0;
    EXPECT_THROW(SimulationRunner(config, SmallSimulation()), ConfigError);
}

TEST_F(SimulationTest, WritesReport) {
    auto base = std::filesystem::temp_directory_path() / "pachislo_simulation_test";
    std::filesystem::remove_all(base);

    SimulationConfig simulation = SmallSimulation();
    simulation.launches_per_session = 200;
    simulation.write_report = true;
    simulation.output_dir = base.string();

    SimulationRunner runner(ConfigManager::ExampleConfig(), simulation);
    ASSERT_TRUE(runner.Run());
    ASSERT_FALSE(runner.GetReportDir().empty());

    std::filesystem::path dir(runner.GetReportDir());
    ASSERT_TRUE(std::filesystem::exists(dir / "sessions" / "session_stats.csv"));
    ASSERT_TRUE(std::filesystem::exists(dir / "reports" / "summary.txt"));

    std::ifstream csv(dir / "sessions" / "session_stats.csv");
    std::string line;
    int lines = 0;
    std::getline(csv, line);
    EXPECT_EQ(line, ReportWriter::SessionStatsHeader());
    while (std::getline(csv, line)) {
        ++lines;
    }
    EXPECT_EQ(lines, 3);

    std::filesystem::remove_all(base);
}

TEST_F(SimulationTest, ReportDirectoriesDoNotCollide) {
    auto base = std::filesystem::temp_directory_path() / "pachislo_report_writer_test";
    std::filesystem::remove_all(base);

    ReportWriter first(base.string());
    ReportWriter second(base.string());
    EXPECT_NE(first.GetOutputDir(), second.GetOutputDir());

    std::filesystem::remove_all(base);
}

TEST(TimerTest, MeasuresElapsedTime) {
    Timer timer;
    EXPECT_FALSE(timer.IsRunning());
    timer.Start();
    EXPECT_TRUE(timer.IsRunning());

    double elapsed = timer.Stop();
    EXPECT_FALSE(timer.IsRunning());
    EXPECT_GE(elapsed, 0.0);
    EXPECT_DOUBLE_EQ(timer.ElapsedSeconds(), elapsed);
}
