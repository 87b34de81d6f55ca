// src/utils/random_source.cpp
#include "random_source.h"
#include <chrono>
#include <stdexcept>
#include <string>

namespace Pachislo {

std::size_t RandomSource::NextIndex(std::size_t bound) {
    if (bound == 0) {
        throw std::invalid_argument("NextIndex bound must be positive");
    }
    auto index = static_cast<std::size_t>(NextDouble() * static_cast<double>(bound));
    // 浮点舍入可能得到 bound 本身
    return index < bound ? index : bound - 1;
}

bool RandomSource::NextBool(double probability) {
    return NextDouble() < probability;
}

Mt19937RandomSource::Mt19937RandomSource()
    : Mt19937RandomSource(static_cast<uint64_t>(
          std::chrono::high_resolution_clock::now().time_since_epoch().count()) ^
          static_cast<uint64_t>(std::random_device{}())) {
}

Mt19937RandomSource::Mt19937RandomSource(uint64_t seed) : rng_(seed), seed_(seed) {
}

double Mt19937RandomSource::NextDouble() {
    // 取高53位，结果严格小于1
    return static_cast<double>(rng_() >> 11) * (1.0 / 9007199254740992.0);
}

void Mt19937RandomSource::SetSeed(uint64_t seed) {
    seed_ = seed;
    rng_.seed(seed);
}

ScriptedRandomSource::ScriptedRandomSource(std::vector<double> values)
    : values_(std::move(values)) {
    if (values_.empty()) {
        throw std::invalid_argument("ScriptedRandomSource needs at least one value");
    }
    for (double value : values_) {
        if (!(value >= 0.0 && value < 1.0)) {
            throw std::invalid_argument("Scripted draw out of [0, 1): " + std::to_string(value));
        }
    }
}

double ScriptedRandomSource::NextDouble() {
    double value = values_[position_];
    position_ = (position_ + 1) % values_.size();
    ++draw_count_;
    return value;
}

void ScriptedRandomSource::Rewind() {
    position_ = 0;
    draw_count_ = 0;
}

RecordingRandomSource::RecordingRandomSource(RandomSource& inner) : inner_(inner) {
}

double RecordingRandomSource::NextDouble() {
    double value = inner_.NextDouble();
    recorded_.push_back(value);
    return value;
}

} // namespace Pachislo
