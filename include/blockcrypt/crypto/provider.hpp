#pragma once

#include <memory>
#include <string>
#include "blockcrypt/block/block.hpp"
#include "blockcrypt/crypto/secure_string.hpp"
#include "blockcrypt/types.hpp"

namespace blockcrypt {
namespace crypto {

// 生成密钥对的选项
struct KeyOptions {
    int length = 0;           // 0 表示使用提供者的默认长度
    std::string passphrase;   // 非空时私钥负载用口令加密
};

// createKeys 的结果，两个块通过 PrivateKey/PublicKey 属性互相引用
struct KeyPairBlocks {
    Block privateKey;
    Block publicKey;
};

// 加密提供者接口
class CipherProvider {
public:
    virtual ~CipherProvider() = default;

    // 用公钥加密文本，返回密文块
    virtual Result<Block> Encrypt(const Block& publicKey, const std::string& content) = 0;

    // 用私钥解密密文块；密文损坏、密钥不匹配或填充错误时返回 CryptError
    virtual Result<SecureString> Decrypt(const Block& privateKey,
                                         const Block& encoded,
                                         const std::string& passphrase) = 0;

    virtual Result<KeyPairBlocks> CreateKeys(const KeyOptions& options) = 0;

    // 注册表按此名称查找
    virtual std::string Name() const = 0;
};

// 签名提供者接口
class SignerProvider {
public:
    virtual ~SignerProvider() = default;

    // 对完整文本签名，返回签名块
    virtual Result<Block> Sign(const Block& privateKey,
                               const std::string& text,
                               const std::string& passphrase) = 0;

    // 签名不匹配时返回 false；只有密钥不可用时才返回错误
    virtual Result<bool> Validate(const Block& publicKey,
                                  const std::string& text,
                                  const Block& signature) = 0;

    virtual Result<KeyPairBlocks> CreateKeys(const KeyOptions& options) = 0;

    virtual std::string Name() const = 0;
};

} // namespace crypto
} // namespace blockcrypt
