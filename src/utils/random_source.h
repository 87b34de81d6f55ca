// src/utils/random_source.h
#pragma once

#include <cstdint>
#include <cstddef>
#include <random>
#include <vector>

namespace Pachislo {

// 均匀分布随机数来源，NextDouble() 返回 [0, 1) 之间的值
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual double NextDouble() = 0;

    // 返回 [0, bound) 之间的整数，bound 必须大于 0
    std::size_t NextIndex(std::size_t bound);

    // r < probability 时返回 true（probability 为 0 永远不成立，为 1 永远成立）
    bool NextBool(double probability);
};

// 基于 mt19937_64 的随机源，固定种子时结果可复现
class Mt19937RandomSource : public RandomSource {
public:
    Mt19937RandomSource();
    explicit Mt19937RandomSource(uint64_t seed);

    double NextDouble() override;
    void SetSeed(uint64_t seed);
    uint64_t GetSeed() const { return seed_; }

private:
    std::mt19937_64 rng_;
    uint64_t seed_;
};

// 按顺序回放预先给定的数值，用完后从头循环
class ScriptedRandomSource : public RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<double> values);

    double NextDouble() override;

    std::size_t GetDrawCount() const { return draw_count_; }
    void Rewind();

private:
    std::vector<double> values_;
    std::size_t position_ = 0;
    std::size_t draw_count_ = 0;
};

// 记录另一个随机源产生的所有数值，用于之后回放
class RecordingRandomSource : public RandomSource {
public:
    explicit RecordingRandomSource(RandomSource& inner);

    double NextDouble() override;

    const std::vector<double>& GetRecorded() const { return recorded_; }

private:
    RandomSource& inner_;
    std::vector<double> recorded_;
};

} // namespace Pachislo
