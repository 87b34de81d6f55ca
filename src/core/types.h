// src/core/types.h
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Pachislo {

// 配置不合法（概率越界、符号不足等），引擎不会启动
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

// 抽选结果（真实结果和显示结果分别用这个表示）
enum class Outcome {
    LOSE = 0,
    WIN = 1
};

// 单次抽选的概率参数
struct SlotProbability {
    double win;         // 中奖概率
    double fake_win;    // 中奖时显示为未中奖的概率
    double fake_lose;   // 未中奖时显示为中奖的概率

    SlotProbability(double w = 0.0, double fw = 0.0, double fl = 0.0)
        : win(w), fake_win(fw), fake_lose(fl) {}
};

// 连续RUSH概率的衰减函数：输入RUSH次数(>=1)，输出[0,1]的系数
using RushContinueFn = std::function<double(int)>;

struct BallsConfig {
    int init_balls;         // 初始球数
    int incremental_balls;  // 通常模式中奖时增加的球数
    int incremental_rush;   // RUSH模式中奖时增加的球数

    BallsConfig(int init = 0, int incremental = 0, int rush = 0)
        : init_balls(init), incremental_balls(incremental), incremental_rush(rush) {}
};

struct ProbabilityConfig {
    double start_hole;              // 球进入启动口的概率
    SlotProbability normal;
    SlotProbability rush;
    SlotProbability rush_continue;
    RushContinueFn rush_continue_fn;
    std::string rush_continue_desc; // 衰减函数的说明（用于日志）

    ProbabilityConfig() : start_hole(0.0) {}
};

// 转轮显示配置
struct SlotConfig {
    int reel_count;
    std::vector<int> symbols;

    SlotConfig() : reel_count(3) {}
};

struct Config {
    BallsConfig balls;
    ProbabilityConfig probability;
    SlotConfig slot;
};

// 批量模拟的参数
struct SimulationConfig {
    int sessions;
    int launches_per_session;
    uint64_t seed;
    std::string output_dir;
    bool write_report;

    SimulationConfig()
        : sessions(10), launches_per_session(100000), seed(42)
        , output_dir("results"), write_report(true) {}
};

struct LotteryResult {
    Outcome real_outcome;
    Outcome displayed_outcome;
    bool is_fake;

    LotteryResult() : real_outcome(Outcome::LOSE), displayed_outcome(Outcome::LOSE), is_fake(false) {}
    LotteryResult(Outcome real, Outcome displayed)
        : real_outcome(real), displayed_outcome(displayed), is_fake(real != displayed) {}

    bool IsWin() const { return real_outcome == Outcome::WIN; }
    bool IsDisplayedWin() const { return displayed_outcome == Outcome::WIN; }
};

// 一行转轮符号
template <typename Symbol>
struct SlotLine {
    std::vector<Symbol> symbols;
    bool matched = false;
};

using SlotResult = SlotLine<int>;

enum class LotteryKind {
    NORMAL,
    RUSH,
    RUSH_CONTINUE
};

// 发送给输出端的一次抽选报告
struct LotteryReport {
    LotteryKind kind;
    LotteryResult result;
    bool reached_start_hole;
    std::optional<SlotResult> slot;     // 显示给玩家的转轮
    std::optional<SlotResult> reveal;   // 假结果之后揭示的真实转轮

    LotteryReport() : kind(LotteryKind::NORMAL), reached_start_hole(true) {}
};

enum class Command {
    START_GAME,
    LAUNCH_BALL,
    FINISH_GAME
};

enum class CommandStatus {
    OK,
    INSUFFICIENT_BALLS,
    INVALID_COMMAND
};

std::string ToString(Outcome outcome);
std::string ToString(LotteryKind kind);
std::string ToString(Command command);
std::string ToString(CommandStatus status);
std::string ToString(const LotteryResult& result);

template <typename Symbol>
std::string ToString(const SlotLine<Symbol>& line) {
    std::string text = "[";
    for (size_t i = 0; i < line.symbols.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += std::to_string(line.symbols[i]);
    }
    return text + "]";
}

} // namespace Pachislo
