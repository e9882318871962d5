#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "blockcrypt/types.hpp"

namespace blockcrypt {
namespace utils {

// Base64编码（不换行）
std::string Base64Encode(const std::vector<uint8_t>& data);
// Base64解码，遇到非法字符抛出 std::invalid_argument
std::vector<uint8_t> Base64Decode(const std::string& base64);

// 生成随机UUID字符串
std::string NewUUID();

// 取出并清空OpenSSL错误队列，返回可读的错误描述
std::string OpenSSLError();

// 去除两端空白
std::string TrimSpace(const std::string& str);
std::string ToUpper(const std::string& str);
std::string ToLower(const std::string& str);

// 覆写后清空，尽量缩短敏感数据在内存中的驻留时间
void Cleanse(std::string& data);
void Cleanse(std::vector<uint8_t>& data);

// 文件读写
Result<std::string> ReadFile(const std::string& path);
Error WriteFile(const std::string& path, const std::string& content);

} // namespace utils
} // namespace blockcrypt
