#include "blockcrypt/context/key_ring_context.hpp"
#include "blockcrypt/utils/logger.hpp"

namespace blockcrypt {
namespace context {

KeyRingContext::KeyRingContext(passphrase::PassRetriever retriever, SecretHandler handler)
    : retriever_(std::move(retriever)), secretHandler_(std::move(handler)) {}

void KeyRingContext::SetPassRetriever(passphrase::PassRetriever retriever) {
    std::lock_guard<std::mutex> lock(mutex_);
    retriever_ = std::move(retriever);
}

void KeyRingContext::SetSecretHandler(SecretHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    secretHandler_ = std::move(handler);
}

Error KeyRingContext::AddKey(const Block& key) {
    return storeKey(key, true);
}

Error KeyRingContext::storeKey(const Block& key, bool replace) {
    std::string ident = key.Ident();
    if (ident.empty()) {
        return Error(ErrorCode::InvalidFormat, "key block has no Ident", key.Describe());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::shared_ptr<Block>>* keys = nullptr;
    switch (key.Kind()) {
        case BlockKind::PrivateKey:
            keys = &privateKeys_;
            break;
        case BlockKind::PublicKey:
            keys = &publicKeys_;
            break;
        default:
            return Error(ErrorCode::InvalidFormat, "not a key block: " + key.Name(), key.Describe());
    }

    if (!replace && keys->count(ident) > 0) {
        utils::GetLogger().Warn("Document key shadows a known key, keeping the known key",
            utils::LogContext().With("block", key.Describe()));
        return Error();
    }
    (*keys)[ident] = std::make_shared<Block>(key);
    return Error();
}

std::shared_ptr<Block> KeyRingContext::GetPrivateKey(const std::string& keyId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = privateKeys_.find(keyId);
    return it == privateKeys_.end() ? nullptr : it->second;
}

std::shared_ptr<Block> KeyRingContext::GetPublicKey(const std::string& keyId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = publicKeys_.find(keyId);
    return it == publicKeys_.end() ? nullptr : it->second;
}

std::string KeyRingContext::GetPrivateIdForPublicKeyId(const std::string& publicKeyId) {
    std::lock_guard<std::mutex> lock(mutex_);
    // 先看公钥块上的交叉引用，再查找引用了该公钥的私钥块
    auto pub = publicKeys_.find(publicKeyId);
    if (pub != publicKeys_.end()) {
        std::string privId = pub->second->GetString(PROP_PRIV_ID);
        if (!privId.empty() && privateKeys_.count(privId) > 0) {
            return privId;
        }
    }
    for (const auto& entry : privateKeys_) {
        if (entry.second->GetString(PROP_PUB_ID) == publicKeyId) {
            return entry.first;
        }
    }
    return "";
}

std::string KeyRingContext::GetPublicIdForPrivateKeyId(const std::string& privateKeyId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto priv = privateKeys_.find(privateKeyId);
    if (priv != privateKeys_.end()) {
        std::string pubId = priv->second->GetString(PROP_PUB_ID);
        if (!pubId.empty() && publicKeys_.count(pubId) > 0) {
            return pubId;
        }
    }
    for (const auto& entry : publicKeys_) {
        if (entry.second->GetString(PROP_PRIV_ID) == privateKeyId) {
            return entry.first;
        }
    }
    return "";
}

std::string KeyRingContext::GetPassphrase(const std::string& keyId, const Block& block) {
    std::shared_ptr<Block> key = GetPrivateKey(keyId);
    if (!key || !key->IsProperty(PROP_ENCRYPTED)) {
        return "";
    }

    passphrase::PassRetriever retriever;
    int attempts = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retriever = retriever_;
        auto it = rejected_.find(keyId);
        if (it != rejected_.end()) {
            attempts = it->second;
        }
        pendingKeyId_ = keyId;
    }
    if (!retriever) {
        utils::GetLogger().Warn("No passphrase retriever for encrypted private key",
            utils::LogContext().With("privateKey", keyId).With("block", block.Describe()));
        return "";
    }

    auto [passphrase, giveup, err] = retriever(keyId, key->Method(), false, attempts);
    if (err.hasError() || giveup) {
        utils::GetLogger().Warn("Could not get passphrase",
            utils::LogContext().With("privateKey", keyId).With("error", err.what()));
        return "";
    }
    return passphrase;
}

void KeyRingContext::FoundSecret(const Block& block, const crypto::SecureString& secret) {
    SecretHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++secretCount_;
        handler = secretHandler_;
        if (!pendingKeyId_.empty()) {
            rejected_.erase(pendingKeyId_);
            pendingKeyId_.clear();
        }
    }
    if (handler) {
        handler(block, secret);
    }
}

void KeyRingContext::FoundValidated(const Block& signature) {
    std::lock_guard<std::mutex> lock(mutex_);
    validated_.push_back(signature.Describe());
}

void KeyRingContext::FoundPublicKey(const Block& key) {
    Error err = storeKey(key, false);
    if (err.hasError()) {
        utils::GetLogger().Warn("Ignoring public key", utils::LogContext().With("error", err.what()));
    }
}

void KeyRingContext::FoundPrivateKey(const Block& key) {
    Error err = storeKey(key, false);
    if (err.hasError()) {
        utils::GetLogger().Warn("Ignoring private key", utils::LogContext().With("error", err.what()));
    }
}

void KeyRingContext::FoundHash(const Block& hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    hashes_.push_back(hash.Describe());
}

void KeyRingContext::ErrorKeyNotFound(const Block& block) {
    utils::GetLogger().Info("Key not found", utils::LogContext().With("block", block.Describe()));
    std::lock_guard<std::mutex> lock(mutex_);
    missingKeys_.push_back(block.Describe());
}

void KeyRingContext::PassphraseRejected(const std::string& keyId, const Block& block) {
    utils::GetLogger().Info("Passphrase rejected",
        utils::LogContext().With("privateKey", keyId).With("block", block.Describe()));
    std::lock_guard<std::mutex> lock(mutex_);
    ++rejected_[keyId];
    pendingKeyId_.clear();
}

std::vector<std::string> KeyRingContext::Validated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validated_;
}

std::vector<std::string> KeyRingContext::Hashes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hashes_;
}

std::vector<std::string> KeyRingContext::MissingKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return missingKeys_;
}

size_t KeyRingContext::SecretCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return secretCount_;
}

size_t KeyRingContext::PrivateKeyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return privateKeys_.size();
}

size_t KeyRingContext::PublicKeyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publicKeys_.size();
}

} // namespace context
} // namespace blockcrypt
