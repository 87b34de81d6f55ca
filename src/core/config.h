// src/core/config.h
#pragma once

#include "types.h"
#include <yaml-cpp/yaml.h>
#include <string>

namespace Pachislo {

// 示例配置中球进入启动口的概率
constexpr double START_HOLE_PROBABILITY_EXAMPLE = 0.12;

// RUSH继续概率的最大检查深度
constexpr int RUSH_CONTINUE_CHECK_DEPTH = 64;

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager() = default;

    // 加载游戏配置文件（包含可选的simulation段）
    bool LoadConfig(const std::string& config_path);

    const Config& GetGameConfig() const { return game_config_; }
    const SimulationConfig& GetSimulationConfig() const { return simulation_config_; }

    // 解析YAML节点，缺少的字段使用示例配置的值，不合法时抛出ConfigError
    static Config ParseGameConfig(const YAML::Node& root);
    static SimulationConfig ParseSimulationConfig(const YAML::Node& root);

    // 检查所有字段，不合法时抛出ConfigError
    static void ValidateConfig(const Config& config);

    // 示例配置（文档和测试使用）
    static Config ExampleConfig();

    // 衰减函数
    static RushContinueFn MakeGeometricDecay(double ratio);
    static RushContinueFn MakeConstantDecay(double value);

private:
    Config game_config_;
    SimulationConfig simulation_config_;

    // YAML解析辅助方法
    static void ParseBallsConfig(const YAML::Node& balls_node, BallsConfig& config);
    static void ParseProbabilityConfig(const YAML::Node& probability_node, ProbabilityConfig& config);
    static void ParseSlotProbability(const YAML::Node& node, const std::string& name,
                                     SlotProbability& probability);
    static void ParseDecayConfig(const YAML::Node& decay_node, ProbabilityConfig& config);
    static void ParseSlotConfig(const YAML::Node& slot_node, SlotConfig& config);

    static void ValidateProbability(double value, const std::string& name);
};

} // namespace Pachislo
