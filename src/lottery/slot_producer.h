// src/lottery/slot_producer.h
#pragma once

#include "../core/types.h"
#include "../utils/random_source.h"
#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Pachislo {

// 根据显示结果生成转轮符号
// 中奖：所有转轮为同一符号；未中奖：至少包含两种不同符号
template <typename Symbol>
class SlotProducer {
public:
    using Line = SlotLine<Symbol>;

    SlotProducer(int reel_count, std::vector<Symbol> symbols, RandomSource& rng)
        : reel_count_(reel_count), symbols_(Distinct(symbols)), rng_(rng) {
        if (reel_count_ < 1) {
            throw ConfigError("Slot reel count must be positive: " + std::to_string(reel_count_));
        }
        if (symbols_.empty()) {
            throw ConfigError("Slot symbol set cannot be empty");
        }
    }

    static Line Produce(int reel_count, const std::vector<Symbol>& symbols,
                        Outcome displayed_outcome, RandomSource& rng) {
        if (displayed_outcome == Outcome::WIN) {
            return ProduceWin(reel_count, Distinct(symbols), rng);
        }
        return ProduceLose(reel_count, Distinct(symbols), rng);
    }

    Line Produce(Outcome displayed_outcome) {
        if (displayed_outcome == Outcome::WIN) {
            return ProduceWin(reel_count_, symbols_, rng_);
        }
        return ProduceLose(reel_count_, symbols_, rng_);
    }

    Line ProduceWin() { return Produce(Outcome::WIN); }
    Line ProduceLose() { return Produce(Outcome::LOSE); }

    // 先生成显示的转轮；假结果时再生成一行揭示真实结果的转轮
    std::pair<Line, std::optional<Line>> ProduceReveal(const LotteryResult& result) {
        Line shown = Produce(result.displayed_outcome);
        if (!result.is_fake) {
            return {std::move(shown), std::nullopt};
        }
        return {std::move(shown), Produce(result.real_outcome)};
    }

    int GetReelCount() const { return reel_count_; }
    const std::vector<Symbol>& GetSymbols() const { return symbols_; }

private:
    int reel_count_;
    std::vector<Symbol> symbols_;
    RandomSource& rng_;

    static Line ProduceWin(int reel_count, const std::vector<Symbol>& symbols, RandomSource& rng) {
        if (reel_count < 1 || symbols.empty()) {
            throw ConfigError("Win pattern needs at least one reel and one symbol");
        }
        const Symbol& choice = symbols[rng.NextIndex(symbols.size())];

        Line line;
        line.symbols.assign(static_cast<size_t>(reel_count), choice);
        line.matched = true;
        return line;
    }

    // symbols 必须已经去重
    static Line ProduceLose(int reel_count, std::vector<Symbol> symbols, RandomSource& rng) {
        if (symbols.size() < 2) {
            throw ConfigError("Lose pattern needs at least 2 distinct symbols, got " +
                              std::to_string(symbols.size()));
        }
        if (reel_count < 2) {
            throw ConfigError("Lose pattern needs at least 2 reels, got " +
                              std::to_string(reel_count));
        }

        // 打乱后分成两组，每组至少一个符号
        Shuffle(symbols, rng);
        size_t partition = 1 + rng.NextIndex(symbols.size() - 1);

        // 两组各自占用的转轮数量，每组至少一个
        size_t first_count = 1 + rng.NextIndex(static_cast<size_t>(reel_count) - 1);
        size_t second_count = static_cast<size_t>(reel_count) - first_count;

        Line line;
        line.symbols.reserve(static_cast<size_t>(reel_count));
        for (size_t i = 0; i < first_count; ++i) {
            line.symbols.push_back(symbols[rng.NextIndex(partition)]);
        }
        for (size_t i = 0; i < second_count; ++i) {
            line.symbols.push_back(symbols[partition + rng.NextIndex(symbols.size() - partition)]);
        }

        Shuffle(line.symbols, rng);
        line.matched = false;
        return line;
    }

    static std::vector<Symbol> Distinct(const std::vector<Symbol>& symbols) {
        std::vector<Symbol> result;
        result.reserve(symbols.size());
        for (const auto& symbol : symbols) {
            if (std::find(result.begin(), result.end(), symbol) == result.end()) {
                result.push_back(symbol);
            }
        }
        return result;
    }

    template <typename T>
    static void Shuffle(std::vector<T>& values, RandomSource& rng) {
        for (size_t i = values.size(); i > 1; --i) {
            size_t j = rng.NextIndex(i);
            std::swap(values[i - 1], values[j]);
        }
    }
};

} // namespace Pachislo
