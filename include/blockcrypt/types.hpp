#pragma once

#include <string>
#include <vector>
#include <utility>

namespace blockcrypt {

// 提供者名称
const std::string RSA_CIPHER = "RSA-JCE";
const std::string DSA_SIGNER = "DSA-JCE";

// 错误码
enum class ErrorCode : int {
    None = 0,
    Unknown,
    KeyNotFound,        // 可恢复，通过上下文回调报告
    NotDecrypted,       // 内嵌密文块未能解密
    SignatureInvalid,   // 内嵌签名校验失败
    CryptError,         // 提供者层面的失败
    ProviderNotFound,   // 没有按名称注册的提供者
    InvalidFormat,      // 块文本格式错误
    ConfigError
};

inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::KeyNotFound: return "key not found";
        case ErrorCode::NotDecrypted: return "not decrypted";
        case ErrorCode::SignatureInvalid: return "signature invalid";
        case ErrorCode::CryptError: return "crypt error";
        case ErrorCode::ProviderNotFound: return "provider not found";
        case ErrorCode::InvalidFormat: return "invalid format";
        case ErrorCode::ConfigError: return "config error";
        default: return "unknown";
    }
}

// 错误类型
class Error {
public:
    Error() : code_(ErrorCode::None) {}
    explicit Error(const std::string& message) : code_(ErrorCode::Unknown), message_(message) {}
    Error(ErrorCode code, const std::string& message, const std::string& block = "")
        : code_(code), message_(message), block_(block) {}

    const std::string& what() const { return message_; }
    bool ok() const { return code_ == ErrorCode::None; }
    bool hasError() const { return code_ != ErrorCode::None; }

    ErrorCode code() const { return code_; }

    // 出错块的描述（名称和标识），没有关联块时为空
    const std::string& block() const { return block_; }

private:
    ErrorCode code_;
    std::string message_;
    std::string block_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : error_(ErrorCode::Unknown, "empty result"), hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T& value() & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

} // namespace blockcrypt
