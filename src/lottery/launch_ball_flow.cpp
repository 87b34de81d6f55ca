// src/lottery/launch_ball_flow.cpp
#include "launch_ball_flow.h"
#include "../core/types.h"

namespace Pachislo {

LaunchBallFlowProducer::LaunchBallFlowProducer(double start_hole_probability, RandomSource& rng)
    : start_hole_probability_(start_hole_probability), rng_(rng) {
    if (!(start_hole_probability_ >= 0.0 && start_hole_probability_ <= 1.0)) {
        throw ConfigError("start_hole probability out of [0, 1]: " +
                          std::to_string(start_hole_probability_));
    }
}

bool LaunchBallFlowProducer::Launch(double start_hole_probability, RandomSource& rng) {
    return rng.NextBool(start_hole_probability);
}

bool LaunchBallFlowProducer::Launch() {
    return Launch(start_hole_probability_, rng_);
}

} // namespace Pachislo
