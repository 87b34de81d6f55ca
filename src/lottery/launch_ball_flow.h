// src/lottery/launch_ball_flow.h
#pragma once

#include "../utils/random_source.h"

namespace Pachislo {

// 判断发射的球是否进入启动口
class LaunchBallFlowProducer {
public:
    LaunchBallFlowProducer(double start_hole_probability, RandomSource& rng);

    // 单次抽取，r < start_hole_probability 时进入启动口
    static bool Launch(double start_hole_probability, RandomSource& rng);

    bool Launch();

    double GetStartHoleProbability() const { return start_hole_probability_; }

private:
    double start_hole_probability_;
    RandomSource& rng_;
};

} // namespace Pachislo
