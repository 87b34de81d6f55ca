#pragma once

#include "utils/logger.h"
#include <string>
#include <vector>

struct CapturedLog {
    Pachislo::LogLevel level;
    std::string component;
    std::string message;
};

class CaptureLogSink : public Pachislo::LogSink {
public:
    void Write(Pachislo::LogLevel level, const std::string& component,
               const std::string& message) override {
        entries.push_back(CapturedLog{level, component, message});
    }

    bool Contains(Pachislo::LogLevel level, const std::string& component) const {
        for (const auto& entry : entries) {
            if (entry.level == level && entry.component == component) {
                return true;
            }
        }
        return false;
    }

    void Clear() { entries.clear(); }

    std::vector<CapturedLog> entries;
};

// 测试期间挂接日志目标并关闭控制台输出
class ScopedLogCapture {
public:
    ScopedLogCapture() {
        Pachislo::Logger::GetInstance().SetConsoleEnabled(false);
        Pachislo::Logger::GetInstance().SetSink(&sink);
    }

    ~ScopedLogCapture() {
        Pachislo::Logger::GetInstance().SetSink(nullptr);
    }

    CaptureLogSink sink;
};
