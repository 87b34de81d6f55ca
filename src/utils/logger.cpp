// src/utils/logger.cpp
#include "logger.h"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>

namespace Pachislo {

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Initialize(const std::string& log_file_path,
                       LogLevel console_level,
                       LogLevel file_level,
                       bool enable_console,
                       bool enable_file) {
    bool file_opened = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        console_level_ = console_level;
        file_level_ = file_level;
        enable_console_ = enable_console;
        enable_file_ = false;

        if (enable_file && !log_file_path.empty()) {
            log_file_path_ = log_file_path;

            // 创建日志目录（如果不存在）
            std::filesystem::path file_path(log_file_path_);
            if (file_path.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(file_path.parent_path(), ec);
            }

            file_stream_ = std::make_unique<std::ofstream>(log_file_path_,
                                                          std::ios::out | std::ios::app);
            if (!file_stream_->is_open()) {
                std::cerr << "Failed to open log file: " << log_file_path_ << std::endl;
                file_stream_.reset();
            } else {
                enable_file_ = true;
                file_opened = true;
            }
        }
    }

    if (file_opened) {
        Info("Logger initialized, writing to " + log_file_path, "Logger");
    }
}

void Logger::Log(LogLevel level, const std::string& message, const std::string& component) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool to_console = enable_console_ && level >= console_level_;
    bool to_file = enable_file_ && level >= file_level_;
    if (!to_console && !to_file && sink_ == nullptr) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << GetTimestamp() << "] [" << LogLevelToString(level) << "]";
    if (!component.empty()) {
        oss << " [" << component << "]";
    }
    oss << " " << message;

    std::string formatted_message = oss.str();

    if (to_console) {
        WriteToConsole(level, formatted_message);
    }

    if (to_file) {
        WriteToFile(formatted_message);
    }

    if (sink_ != nullptr) {
        sink_->Write(level, component, message);
    }
}

void Logger::Debug(const std::string& message, const std::string& component) {
    Log(LogLevel::DEBUG, message, component);
}

void Logger::Info(const std::string& message, const std::string& component) {
    Log(LogLevel::INFO, message, component);
}

void Logger::Warning(const std::string& message, const std::string& component) {
    Log(LogLevel::WARNING, message, component);
}

void Logger::Error(const std::string& message, const std::string& component) {
    Log(LogLevel::ERROR, message, component);
}

void Logger::SetConsoleLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_level_ = level;
}

void Logger::SetFileLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_level_ = level;
}

void Logger::SetConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enable_console_ = enabled;
}

void Logger::SetSink(LogSink* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << "[" << GetTimestamp() << "] [INFO ] [Logger] Logger shutting down"
                      << std::endl;
        file_stream_->close();
    }
    file_stream_.reset();
    enable_file_ = false;
}

std::string Logger::GetTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO ";
        case LogLevel::WARNING: return "WARN ";
        case LogLevel::ERROR:   return "ERROR";
        default:               return "UNKNW";
    }
}

void Logger::WriteToConsole(LogLevel level, const std::string& formatted_message) const {
    // 警告和错误输出到stderr，避免和游戏画面混在一起
    if (level >= LogLevel::WARNING) {
        std::cerr << formatted_message << std::endl;
    } else {
        std::clog << formatted_message << std::endl;
    }
}

void Logger::WriteToFile(const std::string& formatted_message) {
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << formatted_message << std::endl;
    }
}

} // namespace Pachislo
