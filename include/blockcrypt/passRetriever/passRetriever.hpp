#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <iostream>
#include <tuple>
#include "blockcrypt/types.hpp"

namespace blockcrypt {
namespace passphrase {

// 常量定义
constexpr int ID_BYTES_TO_DISPLAY = 7;
constexpr int MAX_PASSPHRASE_ATTEMPTS = 3;
constexpr size_t MIN_PASSPHRASE_LENGTH = 8;
constexpr const char* NEW_PRIVATE_KEY_WARNING =
    "You are about to protect a new private key with a passphrase. Every document\n"
    "encrypted for this key, and every signature made with it, depends on this\n"
    "passphrase. There is no way to recover the key without it.";

// PassRetriever 函数类型定义
// 参数：密钥标识、别名（提供者名称）、是否为新密钥、已尝试次数
// 返回值：tuple<passphrase, giveup, error>
using PassRetriever = std::function<std::tuple<std::string, bool, Error>(
    const std::string& keyId,
    const std::string& alias,
    bool createNew,
    int numAttempts
)>;

// 带输入输出流和缓存的交互式获取器
class BoundRetriever {
private:
    std::istream* in_;
    std::ostream* out_;
    std::map<std::string, std::string> aliasMap_;
    // 按密钥标识缓存
    std::map<std::string, std::string> passphraseCache_;

public:
    BoundRetriever(std::istream* in, std::ostream* out,
                   const std::map<std::string, std::string>& aliasMap = {});
    ~BoundRetriever();

    std::tuple<std::string, bool, Error> getPassphrase(
        const std::string& keyId,
        const std::string& alias,
        bool createNew,
        int numAttempts
    );

private:
    std::tuple<std::string, bool, Error> requestPassphrase(
        const std::string& keyId,
        const std::string& alias,
        bool createNew
    );

    Error verifyAndConfirmPassword(
        const std::string& retPass,
        const std::string& displayAlias,
        const std::string& withID
    );

    void cachePassword(const std::string& keyId, const std::string& retPass);

    // 只显示密钥标识的前几位
    std::string formatKeyId(const std::string& keyId) const;
};

// 创建提示型密码获取器（标准输入不是终端时总是返回错误）
PassRetriever PromptRetriever(const std::map<std::string, std::string>& aliasMap = {});

// 创建指定输入输出的密码获取器
PassRetriever PromptRetrieverWithInOut(
    std::istream* in,
    std::ostream* out,
    const std::map<std::string, std::string>& aliasMap = {}
);

// 创建常量密码获取器
PassRetriever ConstantRetriever(const std::string& constantPassphrase);

// 读取一行口令；从终端的标准输入读取时关闭回显
std::tuple<std::string, Error> GetPassphrase(std::istream* in = nullptr);

bool IsTerminal(int fd);

} // namespace passphrase
} // namespace blockcrypt
