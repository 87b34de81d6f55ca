// src/utils/logger.h
#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <memory>
#include <sstream>

namespace Pachislo {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

// 日志输出目标（测试中用于捕获日志）
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void Write(LogLevel level, const std::string& component,
                       const std::string& message) = 0;
};

class Logger {
public:
    static Logger& GetInstance();

    // 配置日志系统
    void Initialize(const std::string& log_file_path = "",
                   LogLevel console_level = LogLevel::INFO,
                   LogLevel file_level = LogLevel::DEBUG,
                   bool enable_console = true,
                   bool enable_file = true);

    void Log(LogLevel level, const std::string& message,
             const std::string& component = "");

    void Debug(const std::string& message, const std::string& component = "");
    void Info(const std::string& message, const std::string& component = "");
    void Warning(const std::string& message, const std::string& component = "");
    void Error(const std::string& message, const std::string& component = "");

    void SetConsoleLevel(LogLevel level);
    void SetFileLevel(LogLevel level);
    void SetConsoleEnabled(bool enabled);

    // 设置额外的日志目标，传入nullptr取消
    void SetSink(LogSink* sink);

    void Shutdown();

    static std::string LogLevelToString(LogLevel level);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mutex_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::string log_file_path_;
    LogSink* sink_ = nullptr;

    LogLevel console_level_ = LogLevel::INFO;
    LogLevel file_level_ = LogLevel::DEBUG;
    bool enable_console_ = true;
    bool enable_file_ = false;

    std::string GetTimestamp() const;
    void WriteToConsole(LogLevel level, const std::string& formatted_message) const;
    void WriteToFile(const std::string& formatted_message);
};

#define LOG_DEBUG(msg, component) ::Pachislo::Logger::GetInstance().Debug(msg, component)
#define LOG_INFO(msg, component) ::Pachislo::Logger::GetInstance().Info(msg, component)
#define LOG_WARNING(msg, component) ::Pachislo::Logger::GetInstance().Warning(msg, component)
#define LOG_ERROR(msg, component) ::Pachislo::Logger::GetInstance().Error(msg, component)

} // namespace Pachislo
