#pragma once

#include <string>
#include "blockcrypt/types.hpp"

namespace blockcrypt {
namespace utils {

// 日志配置
struct LoggingConfig {
    std::string level = "warn";        // 日志级别: trace, debug, info, warn, error, fatal
    std::string format = "text";       // 日志格式: json, text
    std::string output = "console";    // 日志输出: console, file
    std::string file = "blockcrypt.log"; // 日志文件路径(当output为file时使用)
};

// 全局配置
struct Config {
    std::string defaultSigner = DSA_SIGNER;
    std::string defaultCipher = RSA_CIPHER;
    LoggingConfig logging;
};

// 解析 JSON 配置，缺少的键保留默认值
//
// {
//   "defaultSigner": "DSA-JCE",
//   "defaultCipher": "RSA-JCE",
//   "logging": {"level": "info", "format": "json", "output": "file", "file": "x.log"}
// }
Result<Config> ParseConfig(const std::string& text);

// 读取并解析配置文件
Result<Config> LoadConfig(const std::string& path);

} // namespace utils
} // namespace blockcrypt
