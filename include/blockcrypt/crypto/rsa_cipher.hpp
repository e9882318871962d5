#pragma once

#include <cstddef>
#include <string>
#include "blockcrypt/crypto/provider.hpp"

namespace blockcrypt {
namespace crypto {

constexpr int RSA_DEFAULT_KEY_LENGTH = 1024;

// RSA 分块加密（PKCS#1 v1.5 填充）
//
// 块大小与已有密文互通，必须逐位一致：
//   加密：Length 为 512 时每块 53 字节明文，其它长度一律 117 字节
//   解密：每块 max(Length / 1024 * 128, 64) 字节密文
// 密钥长度大于 1024 位时 117 字节没有用满模长，但结果仍然正确。
class RsaCipher : public CipherProvider {
public:
    Result<Block> Encrypt(const Block& publicKey, const std::string& content) override;
    Result<SecureString> Decrypt(const Block& privateKey,
                                 const Block& encoded,
                                 const std::string& passphrase) override;
    Result<KeyPairBlocks> CreateKeys(const KeyOptions& options) override;
    std::string Name() const override { return RSA_CIPHER; }

    // 每次加密的明文字节数
    static size_t EncryptBlockSize(int length);
    // 每次解密的密文字节数
    static size_t DecryptBlockSize(int length);
};

} // namespace crypto
} // namespace blockcrypt
