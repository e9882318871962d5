#pragma once

#include <memory>
#include <string>
#include "blockcrypt/block/block.hpp"
#include "blockcrypt/crypto/secure_string.hpp"

namespace blockcrypt {
namespace chain {

// 解释块链时由调用方提供的上下文
//
// 负责按标识查找密钥和口令，并接收解释过程中发现的各类块的通知。
// 查找不到时返回 nullptr 或空字符串，不抛出异常。
class ProcessContext {
public:
    virtual ~ProcessContext() = default;

    // 密钥查找
    virtual std::shared_ptr<Block> GetPrivateKey(const std::string& keyId) = 0;
    virtual std::shared_ptr<Block> GetPublicKey(const std::string& keyId) = 0;

    // 公私钥标识互相映射，没有对应关系时返回空字符串
    virtual std::string GetPrivateIdForPublicKeyId(const std::string& publicKeyId) = 0;
    virtual std::string GetPublicIdForPrivateKeyId(const std::string& privateKeyId) = 0;

    // 解密 block 时使用的私钥口令，未加密的私钥返回空字符串
    virtual std::string GetPassphrase(const std::string& keyId, const Block& block) = 0;

    // 解密得到的明文；调用返回后 secret 可能被清除，需要保留时自行复制
    virtual void FoundSecret(const Block& block, const crypto::SecureString& secret) = 0;
    virtual void FoundValidated(const Block& signature) = 0;
    virtual void FoundPublicKey(const Block& key) = 0;
    virtual void FoundPrivateKey(const Block& key) = 0;
    virtual void FoundHash(const Block& hash) = 0;

    // 块所需的密钥无法解析，解释过程继续
    virtual void ErrorKeyNotFound(const Block& block) = 0;

    // 加密的私钥用 GetPassphrase 给出的口令解密失败
    virtual void PassphraseRejected(const std::string& /*keyId*/, const Block& /*block*/) {}
};

} // namespace chain
} // namespace blockcrypt
