#pragma once

#include <string>
#include "blockcrypt/crypto/provider.hpp"

namespace blockcrypt {
namespace crypto {

constexpr int DSA_DEFAULT_KEY_LENGTH = 1024;

// DSA 签名（SHA-256 摘要，DER 编码的签名值）
class DsaSigner : public SignerProvider {
public:
    Result<Block> Sign(const Block& privateKey,
                       const std::string& text,
                       const std::string& passphrase) override;
    Result<bool> Validate(const Block& publicKey,
                          const std::string& text,
                          const Block& signature) override;
    Result<KeyPairBlocks> CreateKeys(const KeyOptions& options) override;
    std::string Name() const override { return DSA_SIGNER; }
};

} // namespace crypto
} // namespace blockcrypt
