// src/utils/timer.h
#pragma once

#include <chrono>
#include <string>

namespace Pachislo {

// 简单秒表，用于统计模拟耗时
class Timer {
public:
    Timer() = default;

    void Start();

    // 停止计时并返回经过的时间（秒）
    double Stop();

    // 获取当前经过的时间（不停止计时）
    double ElapsedSeconds() const;

    bool IsRunning() const { return running_; }

private:
    std::chrono::steady_clock::time_point start_time_;
    double elapsed_seconds_ = 0.0;
    bool running_ = false;
};

// 作用域结束时以DEBUG级别输出耗时
class ScopedTimer {
public:
    ScopedTimer(std::string name, std::string component);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    std::string component_;
    Timer timer_;
};

} // namespace Pachislo
