// src/utils/timer.cpp
#include "timer.h"
#include "logger.h"

namespace Pachislo {

void Timer::Start() {
    start_time_ = std::chrono::steady_clock::now();
    elapsed_seconds_ = 0.0;
    running_ = true;
}

double Timer::Stop() {
    if (running_) {
        elapsed_seconds_ = ElapsedSeconds();
        running_ = false;
    }
    return elapsed_seconds_;
}

double Timer::ElapsedSeconds() const {
    if (!running_) {
        return elapsed_seconds_;
    }

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time_);
    return duration.count() / 1000000.0;
}

ScopedTimer::ScopedTimer(std::string name, std::string component)
    : name_(std::move(name)), component_(std::move(component)) {
    timer_.Start();
}

ScopedTimer::~ScopedTimer() {
    double elapsed = timer_.Stop();
    LOG_DEBUG(name_ + " took " + std::to_string(elapsed * 1000.0) + " ms", component_);
}

} // namespace Pachislo
