// src/lottery/lottery.h
#pragma once

#include "../core/types.h"
#include "../utils/random_source.h"

namespace Pachislo {

// 抽选：先决定真实结果，再独立决定是否显示假结果
class Lottery {
public:
    Lottery(const ProbabilityConfig& probability, RandomSource& rng);

    // 每次调用恰好消耗两个随机数：先真实结果，再假结果
    static LotteryResult Resolve(const SlotProbability& probability, RandomSource& rng);

    LotteryResult ResolveNormal();
    LotteryResult ResolveRush();
    LotteryResult ResolveRushContinue(int rush_count);

    // 第n次RUSH继续抽选使用的概率（win已乘以衰减系数并限制在[0,1]）
    SlotProbability GetRushContinueProbability(int rush_count) const;

    const ProbabilityConfig& GetProbability() const { return probability_; }

private:
    ProbabilityConfig probability_;
    RandomSource& rng_;
};

} // namespace Pachislo
