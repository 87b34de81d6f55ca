// src/main.cpp
#include "core/config.h"
#include "core/game.h"
#include "io/console_input.h"
#include "io/console_output.h"
#include "simulation/simulation_runner.h"
#include "utils/logger.h"
#include <iostream>
#include <memory>
#include <string>

using namespace Pachislo;

void PrintUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [play|simulate] [options]\n"
              << "Modes:\n"
              << "  play                   Interactive game in the terminal (default)\n"
              << "  simulate               Run many sessions and write a report\n"
              << "Options:\n"
              << "  -c, --config <file>    Game config file (default: built-in example)\n"
              << "  -s, --seed <num>       Random seed (default: random for play)\n"
              << "  --sessions <num>       Number of sessions to simulate\n"
              << "  --launches <num>       Launches per simulated session\n"
              << "  -o, --output <dir>     Report output directory\n"
              << "  --no-report            Do not write report files\n"
              << "  -v, --verbose          Enable verbose logging\n"
              << "  -h, --help             Show this help message\n"
              << "  --log-file <file>      Log file path (default: logs/pachislo.log)\n"
              << "  --no-console           Disable console logging\n";
}

int RunPlay(const Config& config, bool has_seed, uint64_t seed) {
    auto input = std::make_unique<ConsoleInput>(std::cin);
    auto output = std::make_unique<ConsoleOutput>(std::cout);
    output->PrintWelcome();

    std::unique_ptr<Game> game;
    if (has_seed) {
        game = std::make_unique<Game>(config, std::move(input), std::move(output),
                                      std::make_unique<Mt19937RandomSource>(seed),
                                      std::make_unique<Mt19937RandomSource>(seed + 1));
    } else {
        game = std::make_unique<Game>(config, std::move(input), std::move(output));
    }

    game->Run();
    return 0;
}

int RunSimulate(const Config& config, const SimulationConfig& simulation_config) {
    SimulationRunner runner(config, simulation_config);
    bool success = runner.Run();

    const auto& summary = runner.GetSummary();
    std::cout << "Sessions: " << summary.total_sessions << "\n"
              << "Win normal: " << summary.total_wins_normal << "\n"
              << "Win rush: " << summary.total_wins_rush << "\n"
              << "Win rush continue: " << summary.total_wins_rush_continue << "\n"
              << "Total: " << (summary.total_wins_normal + summary.total_wins_rush +
                               summary.total_wins_rush_continue) << "\n"
              << "Continue count: " << summary.total_rushes_finished << "\n"
              << "Average continue: " << summary.AverageRushCount() << "\n"
              << "Max continue: " << summary.max_rush_count << "\n";
    if (!runner.GetReportDir().empty()) {
        std::cout << "Report: " << runner.GetReportDir() << "\n";
    }

    return success ? 0 : 1;
}

int main(int argc, char* argv[]) {
    // 默认参数
    std::string mode = "play";
    std::string config_file;
    std::string log_file = "logs/pachislo.log";
    std::string output_dir;
    bool has_seed = false;
    uint64_t seed = 0;
    int sessions = 0;
    int launches = -1;
    bool no_report = false;
    bool verbose = false;
    bool enable_console = true;

    // 解析命令行参数
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                PrintUsage(argv[0]);
                return 0;
            } else if (arg == "play" || arg == "simulate") {
                mode = arg;
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 < argc) {
                    config_file = argv[++i];
                } else {
                    std::cerr << "Error: " << arg << " requires a filename\n";
                    return 1;
                }
            } else if (arg == "-s" || arg == "--seed") {
                if (i + 1 < argc) {
                    seed = std::stoull(argv[++i]);
                    has_seed = true;
                } else {
                    std::cerr << "Error: " << arg << " requires a number\n";
                    return 1;
                }
            } else if (arg == "--sessions") {
                if (i + 1 < argc) {
                    sessions = std::stoi(argv[++i]);
                } else {
                    std::cerr << "Error: " << arg << " requires a number\n";
                    return 1;
                }
            } else if (arg == "--launches") {
                if (i + 1 < argc) {
                    launches = std::stoi(argv[++i]);
                } else {
                    std::cerr << "Error: " << arg << " requires a number\n";
                    return 1;
                }
            } else if (arg == "-o" || arg == "--output") {
                if (i + 1 < argc) {
                    output_dir = argv[++i];
                } else {
                    std::cerr << "Error: " << arg << " requires a directory\n";
                    return 1;
                }
            } else if (arg == "--log-file") {
                if (i + 1 < argc) {
                    log_file = argv[++i];
                } else {
                    std::cerr << "Error: " << arg << " requires a filename\n";
                    return 1;
                }
            } else if (arg == "--no-report") {
                no_report = true;
            } else if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (arg == "--no-console") {
                enable_console = false;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                PrintUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid number in arguments (" << e.what() << ")\n";
        return 1;
    }

    // 交互模式下只在控制台显示警告以上的日志
    LogLevel console_level = verbose ? LogLevel::DEBUG
                           : (mode == "play" ? LogLevel::WARNING : LogLevel::INFO);
    Logger::GetInstance().Initialize(log_file, console_level, LogLevel::DEBUG,
                                     enable_console, true);

    LOG_INFO("Pachislo starting in " + mode + " mode", "Main");

    try {
        ConfigManager config_manager;
        if (!config_file.empty()) {
            if (!config_manager.LoadConfig(config_file)) {
                LOG_ERROR("Failed to load config: " + config_file, "Main");
                return 1;
            }
        } else {
            LOG_INFO("Using built-in example config", "Main");
        }

        const Config& config = config_manager.GetGameConfig();

        if (mode == "simulate") {
            SimulationConfig simulation_config = config_manager.GetSimulationConfig();
            if (has_seed) simulation_config.seed = seed;
            if (sessions > 0) simulation_config.sessions = sessions;
            if (launches >= 0) simulation_config.launches_per_session = launches;
            if (!output_dir.empty()) simulation_config.output_dir = output_dir;
            if (no_report) simulation_config.write_report = false;

            return RunSimulate(config, simulation_config);
        }

        return RunPlay(config, has_seed, seed);

    } catch (const ConfigError& e) {
        LOG_ERROR("Invalid configuration: " + std::string(e.what()), "Main");
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()), "Main");
        return 1;
    }
}
