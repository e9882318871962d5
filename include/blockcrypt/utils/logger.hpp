#pragma once

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace blockcrypt {
namespace utils {

// 日志级别枚举
enum class LogLevel : int {
    Fatal = 0,    // 严重错误
    Error = 1,    // 错误但可恢复
    Warn  = 2,    // 警告
    Info  = 3,    // 信息性消息
    Debug = 4,    // 调试信息
    Trace = 5     // 逐块处理的跟踪信息
};

// 获取当前时间字符串的工具函数
std::string GetTimeString();

// 日志条目结构
struct LogEntry {
    LogLevel level;
    std::string message;
    std::string time;
    std::map<std::string, std::string> fields;
};

// 日志格式化器接口
class LogFormatter {
public:
    virtual ~LogFormatter() = default;
    virtual std::string Format(const LogEntry& entry) = 0;
};

// JSON格式化器
class JSONFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

// 文本格式化器
class TextFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

// 日志输出接口
class LogOutput {
public:
    virtual ~LogOutput() = default;
    virtual void Write(const std::string& message) = 0;
};

// 控制台输出（stderr，不干扰命令的标准输出）
class ConsoleOutput : public LogOutput {
public:
    void Write(const std::string& message) override;
};

// 文件输出
class FileOutput : public LogOutput {
public:
    explicit FileOutput(const std::string& filename);
    void Write(const std::string& message) override;

private:
    std::ofstream file_;
};

// 日志上下文
class LogContext {
public:
    LogContext() = default;

    const std::map<std::string, std::string>& Fields() const { return fields_; }

    // 创建带有新字段的上下文
    LogContext With(const std::string& key, const std::string& value) const;

private:
    std::map<std::string, std::string> fields_;
};

// 主日志类
class Logger {
public:
    static Logger& GetInstance();

    // 初始化日志系统
    // format: json | text；output: console | file
    void Initialize(const std::string& level, const std::string& format,
                    const std::string& output, const std::string& file = "blockcrypt.log");

    void SetLevel(LogLevel level);
    void SetLevel(const std::string& level);
    LogLevel GetLevel() const;

    void AddOutput(std::unique_ptr<LogOutput> output);
    void ClearOutputs();
    void SetFormatter(std::unique_ptr<LogFormatter> formatter);

    void Log(LogLevel level, const std::string& message, const LogContext& ctx = LogContext());

    void Trace(const std::string& message, const LogContext& ctx = LogContext());
    void Debug(const std::string& message, const LogContext& ctx = LogContext());
    void Info(const std::string& message, const LogContext& ctx = LogContext());
    void Warn(const std::string& message, const LogContext& ctx = LogContext());
    void Error(const std::string& message, const LogContext& ctx = LogContext());
    void Fatal(const std::string& message, const LogContext& ctx = LogContext());

private:
    Logger();
    ~Logger() = default;

    // 禁止拷贝和移动
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::Warn;
    std::vector<std::unique_ptr<LogOutput>> outputs_;
    std::unique_ptr<LogFormatter> formatter_;
    mutable std::mutex mutex_;

    bool ShouldLog(LogLevel level) const;
};

// 便捷获取日志实例的辅助函数
inline Logger& GetLogger() {
    return Logger::GetInstance();
}

// 从字符串解析日志级别，无法识别时返回 Info
LogLevel ParseLogLevel(const std::string& level);

std::string LogLevelToString(LogLevel level);

} // namespace utils
} // namespace blockcrypt
