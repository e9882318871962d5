#include "blockcrypt/utils/logger.hpp"
#include "blockcrypt/utils/tools.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace blockcrypt {
namespace utils {

std::string GetTimeString() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm now_tm;
    localtime_r(&now_time_t, &now_tm);

    std::stringstream ss;
    ss << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return ss.str();
}

LogLevel ParseLogLevel(const std::string& level) {
    std::string lower = ToLower(TrimSpace(level));
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;

    // 默认为Info级别
    return LogLevel::Info;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string JSONFormatter::Format(const LogEntry& entry) {
    using json = nlohmann::json;

    json j = {
        {"level", LogLevelToString(entry.level)},
        {"time", entry.time},
        {"msg", entry.message}
    };

    for (const auto& field : entry.fields) {
        j[field.first] = field.second;
    }

    // 字段值可能来自外部文档，非法 UTF-8 用替换字符输出
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string TextFormatter::Format(const LogEntry& entry) {
    std::stringstream ss;
    ss << "[" << entry.time << "] "
       << "[" << LogLevelToString(entry.level) << "] "
       << entry.message;

    if (!entry.fields.empty()) {
        ss << " {";
        bool first = true;
        for (const auto& field : entry.fields) {
            if (!first) ss << ", ";
            ss << field.first << "=" << field.second;
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

void ConsoleOutput::Write(const std::string& message) {
    std::cerr << message << std::endl;
}

FileOutput::FileOutput(const std::string& filename) {
    file_.open(filename, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "无法打开日志文件: " << filename << std::endl;
    }
}

void FileOutput::Write(const std::string& message) {
    if (file_.is_open()) {
        file_ << message << std::endl;
    }
}

LogContext LogContext::With(const std::string& key, const std::string& value) const {
    LogContext newContext = *this;
    newContext.fields_[key] = value;
    return newContext;
}

Logger::Logger() {
    AddOutput(std::make_unique<ConsoleOutput>());
    SetFormatter(std::make_unique<TextFormatter>());
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize(const std::string& level, const std::string& format,
                        const std::string& output, const std::string& file) {
    SetLevel(level);

    if (format == "json") {
        SetFormatter(std::make_unique<JSONFormatter>());
    } else {
        SetFormatter(std::make_unique<TextFormatter>());
    }

    ClearOutputs();
    if (output == "file" && !file.empty()) {
        AddOutput(std::make_unique<FileOutput>(file));
    } else {
        AddOutput(std::make_unique<ConsoleOutput>());
    }
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetLevel(const std::string& level) {
    SetLevel(ParseLogLevel(level));
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::AddOutput(std::unique_ptr<LogOutput> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.push_back(std::move(output));
}

void Logger::ClearOutputs() {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.clear();
}

void Logger::SetFormatter(std::unique_ptr<LogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(mutex_);
    formatter_ = std::move(formatter);
}

void Logger::Log(LogLevel level, const std::string& message, const LogContext& ctx) {
    if (!ShouldLog(level)) return;

    LogEntry entry;
    entry.level = level;
    entry.message = message;
    entry.time = GetTimeString();
    entry.fields = ctx.Fields();

    std::lock_guard<std::mutex> lock(mutex_);
    if (formatter_) {
        std::string formatted = formatter_->Format(entry);
        for (auto& output : outputs_) {
            output->Write(formatted);
        }
    }
}

void Logger::Trace(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Trace, message, ctx);
}

void Logger::Debug(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Debug, message, ctx);
}

void Logger::Info(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Info, message, ctx);
}

void Logger::Warn(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Warn, message, ctx);
}

void Logger::Error(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Error, message, ctx);
}

void Logger::Fatal(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Fatal, message, ctx);
}

bool Logger::ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) <= static_cast<int>(level_);
}

} // namespace utils
} // namespace blockcrypt
