// src/core/config.cpp
#include "config.h"
#include "../utils/logger.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sstream>

namespace Pachislo {

namespace {

// 读取可选字段，类型不对时抛出ConfigError
template <typename T>
T ReadValue(const YAML::Node& node, const std::string& key, const T& default_value) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return default_value;
    }
    try {
        return value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for '" + key + "': " + e.what());
    }
}

std::string FormatDouble(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

ConfigManager::ConfigManager() : game_config_(ExampleConfig()) {
}

bool ConfigManager::LoadConfig(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        LOG_ERROR("Config file does not exist: " + config_path, "ConfigManager");
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);

        Config config = ParseGameConfig(root);
        ValidateConfig(config);
        SimulationConfig simulation = ParseSimulationConfig(root);

        game_config_ = std::move(config);
        simulation_config_ = std::move(simulation);

        LOG_INFO("Loaded config " + config_path + " (init_balls=" +
                 std::to_string(game_config_.balls.init_balls) + ", normal.win=" +
                 FormatDouble(game_config_.probability.normal.win) + ", decay=" +
                 game_config_.probability.rush_continue_desc + ")", "ConfigManager");
        return true;

    } catch (const ConfigError& e) {
        LOG_ERROR("Invalid config " + config_path + ": " + e.what(), "ConfigManager");
        return false;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to parse config " + config_path + ": " + e.what(), "ConfigManager");
        return false;
    }
}

Config ConfigManager::ParseGameConfig(const YAML::Node& root) {
    Config config = ExampleConfig();

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Config root must be a map");
    }

    if (root["balls"]) {
        ParseBallsConfig(root["balls"], config.balls);
    }
    if (root["probability"]) {
        ParseProbabilityConfig(root["probability"], config.probability);
    }
    if (root["slot"]) {
        ParseSlotConfig(root["slot"], config.slot);
    }

    return config;
}

SimulationConfig ConfigManager::ParseSimulationConfig(const YAML::Node& root) {
    SimulationConfig config;
    if (!root || !root.IsMap() || !root["simulation"]) {
        return config;
    }

    const YAML::Node simulation = root["simulation"];
    config.sessions = ReadValue<int>(simulation, "sessions", config.sessions);
    config.launches_per_session =
        ReadValue<int>(simulation, "launches_per_session", config.launches_per_session);
    config.seed = ReadValue<uint64_t>(simulation, "seed", config.seed);
    config.output_dir = ReadValue<std::string>(simulation, "output_dir", config.output_dir);
    config.write_report = ReadValue<bool>(simulation, "write_report", config.write_report);

    if (config.sessions < 1) {
        throw ConfigError("simulation.sessions must be positive");
    }
    if (config.launches_per_session < 0) {
        throw ConfigError("simulation.launches_per_session cannot be negative");
    }
    return config;
}

void ConfigManager::ParseBallsConfig(const YAML::Node& balls_node, BallsConfig& config) {
    config.init_balls = ReadValue<int>(balls_node, "init_balls", config.init_balls);
    config.incremental_balls = ReadValue<int>(balls_node, "incremental_balls", config.incremental_balls);
    config.incremental_rush = ReadValue<int>(balls_node, "incremental_rush", config.incremental_rush);
}

void ConfigManager::ParseProbabilityConfig(const YAML::Node& probability_node,
                                           ProbabilityConfig& config) {
    config.start_hole = ReadValue<double>(probability_node, "start_hole", config.start_hole);

    ParseSlotProbability(probability_node["normal"], "normal", config.normal);
    ParseSlotProbability(probability_node["rush"], "rush", config.rush);
    ParseSlotProbability(probability_node["rush_continue"], "rush_continue", config.rush_continue);

    if (probability_node["rush_continue_decay"]) {
        ParseDecayConfig(probability_node["rush_continue_decay"], config);
    }
}

void ConfigManager::ParseSlotProbability(const YAML::Node& node, const std::string& name,
                                         SlotProbability& probability) {
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError("probability." + name + " must be a map");
    }
    probability.win = ReadValue<double>(node, "win", probability.win);
    probability.fake_win = ReadValue<double>(node, "fake_win", probability.fake_win);
    probability.fake_lose = ReadValue<double>(node, "fake_lose", probability.fake_lose);
}

void ConfigManager::ParseDecayConfig(const YAML::Node& decay_node, ProbabilityConfig& config) {
    std::string type = ReadValue<std::string>(decay_node, "type", "geometric");

    if (type == "geometric") {
        double ratio = ReadValue<double>(decay_node, "ratio", 0.6);
        config.rush_continue_fn = MakeGeometricDecay(ratio);
        config.rush_continue_desc = "geometric(" + FormatDouble(ratio) + ")";
    } else if (type == "constant") {
        double value = ReadValue<double>(decay_node, "value", 1.0);
        config.rush_continue_fn = MakeConstantDecay(value);
        config.rush_continue_desc = "constant(" + FormatDouble(value) + ")";
    } else {
        throw ConfigError("Unknown rush_continue_decay type: " + type);
    }
}

void ConfigManager::ParseSlotConfig(const YAML::Node& slot_node, SlotConfig& config) {
    config.reel_count = ReadValue<int>(slot_node, "reel_count", config.reel_count);

    if (slot_node["symbols"]) {
        if (!slot_node["symbols"].IsSequence()) {
            throw ConfigError("slot.symbols must be a list");
        }
        config.symbols.clear();
        for (const auto& symbol : slot_node["symbols"]) {
            try {
                config.symbols.push_back(symbol.as<int>());
            } catch (const YAML::Exception& e) {
                throw ConfigError("Invalid value in 'slot.symbols': " + std::string(e.what()));
            }
        }
    }
}

void ConfigManager::ValidateProbability(double value, const std::string& name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigError("Probability '" + name + "' out of [0, 1]: " + FormatDouble(value));
    }
}

void ConfigManager::ValidateConfig(const Config& config) {
    const auto& balls = config.balls;
    if (balls.init_balls < 0) {
        throw ConfigError("balls.init_balls cannot be negative");
    }
    if (balls.incremental_balls < 0) {
        throw ConfigError("balls.incremental_balls cannot be negative");
    }
    if (balls.incremental_rush < 0) {
        throw ConfigError("balls.incremental_rush cannot be negative");
    }

    const auto& probability = config.probability;
    ValidateProbability(probability.start_hole, "start_hole");

    const std::pair<const char*, const SlotProbability*> slots[] = {
        {"normal", &probability.normal},
        {"rush", &probability.rush},
        {"rush_continue", &probability.rush_continue},
    };
    for (const auto& [name, slot] : slots) {
        std::string prefix(name);
        ValidateProbability(slot->win, prefix + ".win");
        ValidateProbability(slot->fake_win, prefix + ".fake_win");
        ValidateProbability(slot->fake_lose, prefix + ".fake_lose");
    }

    if (!probability.rush_continue_fn) {
        throw ConfigError("rush_continue_fn is not set");
    }
    for (int n = 1; n <= RUSH_CONTINUE_CHECK_DEPTH; ++n) {
        ValidateProbability(probability.rush_continue_fn(n),
                            "rush_continue_fn(" + std::to_string(n) + ")");
    }

    const auto& slot = config.slot;
    if (slot.reel_count < 2) {
        throw ConfigError("slot.reel_count must be at least 2, got " +
                          std::to_string(slot.reel_count));
    }
    std::vector<int> distinct = slot.symbols;
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    if (distinct.size() < 2) {
        throw ConfigError("slot.symbols needs at least 2 distinct symbols, got " +
                          std::to_string(distinct.size()));
    }
}

Config ConfigManager::ExampleConfig() {
    Config config;

    config.balls.init_balls = 1000;
    config.balls.incremental_balls = 15;
    config.balls.incremental_rush = 300;

    config.probability.start_hole = START_HOLE_PROBABILITY_EXAMPLE;
    config.probability.normal = SlotProbability(0.16, 0.3, 0.15);
    config.probability.rush = SlotProbability(0.48, 0.2, 0.05);
    config.probability.rush_continue = SlotProbability(0.8, 0.25, 0.1);
    // 第1次为1，之后单调递减
    config.probability.rush_continue_fn = MakeGeometricDecay(0.6);
    config.probability.rush_continue_desc = "geometric(0.6)";

    config.slot.reel_count = 3;
    config.slot.symbols = {1, 2, 3, 4, 5, 6, 7, 8, 9};

    return config;
}

RushContinueFn ConfigManager::MakeGeometricDecay(double ratio) {
    return [ratio](int n) { return std::pow(ratio, n - 1); };
}

RushContinueFn ConfigManager::MakeConstantDecay(double value) {
    return [value](int) { return value; };
}

} // namespace Pachislo
