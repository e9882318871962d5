#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "blockcrypt/crypto/provider.hpp"

namespace blockcrypt {
namespace crypto {

using EvpKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

// 公钥编码为 X.509 SubjectPublicKeyInfo DER
std::vector<uint8_t> EncodePublicKey(EVP_PKEY* key);

// 私钥编码为 PKCS#8 DER；口令非空时使用 AES-256-CBC 加密的 PKCS#8
std::vector<uint8_t> EncodePrivateKey(EVP_PKEY* key, const std::string& passphrase);

// 解析公钥块负载
EvpKeyPtr DecodePublicKey(const Block& publicKey);

// 解析私钥块负载，块标记为 Encrypted 时需要口令
EvpKeyPtr DecodePrivateKey(const Block& privateKey, const std::string& passphrase);

// 由生成的密钥构造一对互相引用的密钥块
KeyPairBlocks NewKeyPairBlocks(EVP_PKEY* key, const std::string& method,
                               int length, const std::string& passphrase);

} // namespace crypto
} // namespace blockcrypt
