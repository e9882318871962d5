#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "blockcrypt/block/block.hpp"
#include "blockcrypt/chain/process_context.hpp"
#include "blockcrypt/passRetriever/passRetriever.hpp"
#include "blockcrypt/types.hpp"

namespace blockcrypt {
namespace context {

// 内存中的密钥环
//
// 按 Ident 保存公私钥块，解释过程中发现的密钥块也会加入，但不会覆盖同一 Ident 下已有的密钥；
// 解密得到的明文只转交给调用方的处理函数，自身不保留副本。
class KeyRingContext : public chain::ProcessContext {
public:
    using SecretHandler = std::function<void(const Block& block, const crypto::SecureString& secret)>;

    KeyRingContext() = default;
    explicit KeyRingContext(passphrase::PassRetriever retriever, SecretHandler handler = nullptr);

    // 只接受带 Ident 的公钥或私钥块，同一 Ident 的旧密钥被替换
    Error AddKey(const Block& key);

    void SetPassRetriever(passphrase::PassRetriever retriever);
    void SetSecretHandler(SecretHandler handler);

    std::shared_ptr<Block> GetPrivateKey(const std::string& keyId) override;
    std::shared_ptr<Block> GetPublicKey(const std::string& keyId) override;
    std::string GetPrivateIdForPublicKeyId(const std::string& publicKeyId) override;
    std::string GetPublicIdForPrivateKeyId(const std::string& privateKeyId) override;
    std::string GetPassphrase(const std::string& keyId, const Block& block) override;

    void FoundSecret(const Block& block, const crypto::SecureString& secret) override;
    void FoundValidated(const Block& signature) override;
    void FoundPublicKey(const Block& key) override;
    void FoundPrivateKey(const Block& key) override;
    void FoundHash(const Block& hash) override;
    void ErrorKeyNotFound(const Block& block) override;
    // 下次为该密钥取口令时按重试处理，取口令函数会丢弃缓存的口令
    void PassphraseRejected(const std::string& keyId, const Block& block) override;

    // 解释结果，元素为块的描述（名称和标识）
    std::vector<std::string> Validated() const;
    std::vector<std::string> Hashes() const;
    std::vector<std::string> MissingKeys() const;
    size_t SecretCount() const;

    size_t PrivateKeyCount() const;
    size_t PublicKeyCount() const;

private:
    Error storeKey(const Block& key, bool replace);

    passphrase::PassRetriever retriever_;
    SecretHandler secretHandler_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Block>> privateKeys_;
    std::map<std::string, std::shared_ptr<Block>> publicKeys_;

    std::vector<std::string> validated_;
    std::vector<std::string> hashes_;
    std::vector<std::string> missingKeys_;
    size_t secretCount_ = 0;

    // 每个私钥被拒绝的口令次数，解密成功后清零
    std::map<std::string, int> rejected_;
    std::string pendingKeyId_;
};

} // namespace context
} // namespace blockcrypt
