// src/lottery/lottery.cpp
#include "lottery.h"
#include <algorithm>
#include <cmath>

namespace Pachislo {

Lottery::Lottery(const ProbabilityConfig& probability, RandomSource& rng)
    : probability_(probability), rng_(rng) {
    if (!probability_.rush_continue_fn) {
        throw ConfigError("rush_continue_fn must be set");
    }
}

LotteryResult Lottery::Resolve(const SlotProbability& probability, RandomSource& rng) {
    Outcome real = rng.NextBool(probability.win) ? Outcome::WIN : Outcome::LOSE;

    Outcome displayed = real;
    if (real == Outcome::WIN) {
        if (rng.NextBool(probability.fake_win)) {
            displayed = Outcome::LOSE;
        }
    } else {
        if (rng.NextBool(probability.fake_lose)) {
            displayed = Outcome::WIN;
        }
    }

    return LotteryResult(real, displayed);
}

LotteryResult Lottery::ResolveNormal() {
    return Resolve(probability_.normal, rng_);
}

LotteryResult Lottery::ResolveRush() {
    return Resolve(probability_.rush, rng_);
}

LotteryResult Lottery::ResolveRushContinue(int rush_count) {
    return Resolve(GetRushContinueProbability(rush_count), rng_);
}

SlotProbability Lottery::GetRushContinueProbability(int rush_count) const {
    SlotProbability probability = probability_.rush_continue;
    double win = probability.win * probability_.rush_continue_fn(rush_count);
    probability.win = std::isnan(win) ? 0.0 : std::clamp(win, 0.0, 1.0);
    return probability;
}

} // namespace Pachislo
