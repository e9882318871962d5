#include "blockcrypt/crypt_api.hpp"
#include "blockcrypt/utils/logger.hpp"
#include "blockcrypt/utils/tools.hpp"

namespace blockcrypt {

namespace {

std::shared_ptr<crypto::ProviderRegistry> orDefault(std::shared_ptr<crypto::ProviderRegistry> registry) {
    return registry ? registry : crypto::ProviderRegistry::NewDefaultRegistry();
}

} // namespace

CryptApi::CryptApi(std::shared_ptr<crypto::ProviderRegistry> registry, const utils::Config& config)
    : registry_(orDefault(std::move(registry))),
      config_(config),
      processor_(registry_, config.defaultCipher, config.defaultSigner) {}

std::string CryptApi::methodOr(const Block& block, const std::string& def) const {
    std::string method = block.Method();
    return method.empty() ? def : method;
}

Result<std::shared_ptr<crypto::CipherProvider>> CryptApi::GetCipher(const std::string& name) const {
    return registry_->GetCipher(name);
}

Result<std::shared_ptr<crypto::SignerProvider>> CryptApi::GetSigner(const std::string& name) const {
    return registry_->GetSigner(name);
}

Result<std::shared_ptr<crypto::CipherProvider>> CryptApi::GetDefaultCipher() const {
    return registry_->GetCipher(config_.defaultCipher);
}

Result<std::shared_ptr<crypto::SignerProvider>> CryptApi::GetDefaultSigner() const {
    return registry_->GetSigner(config_.defaultSigner);
}

Result<Block> CryptApi::Sign(const Block& privateKey, const std::string& text, const std::string& passphrase) {
    auto signer = GetSigner(methodOr(privateKey, config_.defaultSigner));
    if (!signer.ok()) {
        return signer.error();
    }
    return signer.value()->Sign(privateKey, text, passphrase);
}

Result<bool> CryptApi::Validate(const Block& publicKey, const std::string& text, const Block& signature) {
    auto signer = GetSigner(methodOr(publicKey, config_.defaultSigner));
    if (!signer.ok()) {
        return signer.error();
    }
    return signer.value()->Validate(publicKey, text, signature);
}

Result<Block> CryptApi::Encrypt(const Block& publicKey, const std::string& text) {
    auto cipher = GetCipher(methodOr(publicKey, config_.defaultCipher));
    if (!cipher.ok()) {
        return cipher.error();
    }
    return cipher.value()->Encrypt(publicKey, text);
}

Result<crypto::SecureString> CryptApi::Decrypt(const Block& privateKey, const Block& encoded,
                                               const std::string& passphrase) {
    auto cipher = GetCipher(methodOr(encoded, config_.defaultCipher));
    if (!cipher.ok()) {
        return cipher.error();
    }
    return cipher.value()->Decrypt(privateKey, encoded, passphrase);
}

Result<crypto::KeyPairBlocks> CryptApi::CreateKeys(const std::string& method, const crypto::KeyOptions& options) {
    auto cipher = GetCipher(method);
    if (cipher.ok()) {
        return cipher.value()->CreateKeys(options);
    }
    auto signer = GetSigner(method);
    if (signer.ok()) {
        return signer.value()->CreateKeys(options);
    }
    return Error(ErrorCode::ProviderNotFound,
                 "no cipher or signer named " + crypto::ProviderRegistry::NormalizeName(method));
}

Result<Block> CryptApi::EncryptEmbedded(const Block& publicKey, const BlockList& blocks) {
    std::string text = blocks.ToString();
    auto encoded = Encrypt(publicKey, text);
    utils::Cleanse(text);
    if (!encoded.ok()) {
        return encoded.error();
    }
    Block block = std::move(encoded).value();
    block.Set(PROP_EMBEDDED, true);
    return block;
}

Result<Block> CryptApi::SignEmbedded(const Block& privateKey, const BlockList& blocks,
                                     const std::string& passphrase, bool nextOnly) {
    std::string text;
    if (nextOnly) {
        if (blocks.Empty()) {
            return Error(ErrorCode::CryptError, "nothing to sign", privateKey.Describe());
        }
        text = blocks.Get(0).ToString();
    } else {
        text = blocks.ToString();
    }

    auto signature = Sign(privateKey, text, passphrase);
    if (!signature.ok()) {
        return signature.error();
    }
    Block block = std::move(signature).value();
    if (nextOnly) {
        block.Set(PROP_EMBEDDED, EMBEDDED_NEXT);
    } else {
        block.Set(PROP_EMBEDDED, true);
    }
    return block;
}

Error CryptApi::ProcessBlocks(chain::ProcessContext& context, BlockList& blocks) {
    Error err = processor_.Process(context, blocks);
    if (err.hasError()) {
        utils::GetLogger().Error("Block processing failed",
            utils::LogContext().With("error", err.what())
                               .With("code", errorCodeToString(err.code()))
                               .With("block", err.block()));
    }
    return err;
}

Result<chain::BlockOutcome> CryptApi::ProcessBlock(chain::ProcessContext& context, const Block& block) {
    return processor_.ProcessBlock(context, block);
}

} // namespace blockcrypt
