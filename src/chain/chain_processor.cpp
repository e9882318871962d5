#include "blockcrypt/chain/chain_processor.hpp"
#include "blockcrypt/block/pem_format.hpp"
#include "blockcrypt/utils/logger.hpp"
#include "blockcrypt/utils/tools.hpp"

namespace blockcrypt {
namespace chain {

ChainProcessor::ChainProcessor(std::shared_ptr<crypto::ProviderRegistry> registry,
                               const std::string& defaultCipher,
                               const std::string& defaultSigner)
    : registry_(std::move(registry)),
      defaultCipher_(defaultCipher),
      defaultSigner_(defaultSigner) {
    if (!registry_) {
        registry_ = crypto::ProviderRegistry::NewDefaultRegistry();
    }
}

std::string ChainProcessor::methodOf(const Block& block, const std::string& def) const {
    std::string method = block.Method();
    return method.empty() ? def : method;
}

Error ChainProcessor::Process(ProcessContext& context, BlockList& blocks) {
    // 列表长度每一步都重新读取，插入的块会在后续步骤中处理
    for (size_t index = 0; index < blocks.Size(); ++index) {
        Block block = blocks.Get(index);
        utils::GetLogger().Trace("Processing block",
            utils::LogContext().With("block", block.Describe())
                               .With("index", std::to_string(index)));

        auto result = ProcessBlock(context, block);
        if (!result.ok()) {
            return result.error();
        }
        BlockOutcome outcome = std::move(result).value();

        BlockKind kind = block.Kind();
        if (kind == BlockKind::Cipher && block.IsEmbedded()) {
            if (outcome.type != BlockOutcome::Type::Secret) {
                return Error(ErrorCode::NotDecrypted, "embedded cipher block was not decrypted",
                             block.Describe());
            }
            Error err = insertSecret(blocks, index, block, outcome.secret);
            if (err.hasError()) {
                return err;
            }
        } else if (kind == BlockKind::Signature && (block.IsEmbedded() || block.IsEmbeddedNext())) {
            Error err = validateEmbedded(context, blocks, index, block, outcome);
            if (err.hasError()) {
                return err;
            }
        }
    }
    return Error();
}

Result<BlockOutcome> ChainProcessor::ProcessBlock(ProcessContext& context, const Block& block) {
    switch (block.Kind()) {
        case BlockKind::Cipher:
            return processCipher(context, block);
        case BlockKind::Signature:
            return processSignature(context, block);
        case BlockKind::PublicKey: {
            context.FoundPublicKey(block);
            BlockOutcome outcome;
            outcome.type = BlockOutcome::Type::Key;
            outcome.key = std::make_shared<Block>(block);
            return Result<BlockOutcome>(std::move(outcome));
        }
        case BlockKind::PrivateKey: {
            context.FoundPrivateKey(block);
            BlockOutcome outcome;
            outcome.type = BlockOutcome::Type::Key;
            outcome.key = std::make_shared<Block>(block);
            return Result<BlockOutcome>(std::move(outcome));
        }
        case BlockKind::Hash:
            context.FoundHash(block);
            break;
        case BlockKind::Content:
            break;
        default:
            utils::GetLogger().Warn("Unknown block type",
                utils::LogContext().With("block", block.Name()));
            break;
    }
    return Result<BlockOutcome>(BlockOutcome());
}

Result<BlockOutcome> ChainProcessor::processCipher(ProcessContext& context, const Block& block) {
    // 没有 Symmetric 属性时，有 KeyId 即视为对称加密
    bool symmetric = block.GetBool(PROP_SYMMETRIC, block.IsProperty(PROP_KEY_ID));

    std::string keyId;
    if (symmetric) {
        keyId = block.GetString(PROP_KEY_ID);
        if (keyId.empty()) {
            utils::GetLogger().Debug("Key id not found", utils::LogContext().With("block", block.Describe()));
            context.ErrorKeyNotFound(block);
            return Result<BlockOutcome>(BlockOutcome());
        }
    } else {
        keyId = block.GetString(PROP_PRIV_ID);
        if (keyId.empty()) {
            std::string pubId = block.GetString(PROP_PUB_ID);
            if (pubId.empty()) {
                utils::GetLogger().Debug("Public key not found", utils::LogContext().With("block", block.Describe()));
                context.ErrorKeyNotFound(block);
                return Result<BlockOutcome>(BlockOutcome());
            }
            keyId = context.GetPrivateIdForPublicKeyId(pubId);
            if (keyId.empty()) {
                utils::GetLogger().Debug("Private key not found for public key",
                    utils::LogContext().With("block", block.Describe()).With("publicKey", pubId));
                context.ErrorKeyNotFound(block);
                return Result<BlockOutcome>(BlockOutcome());
            }
        }
    }

    std::shared_ptr<Block> privateKey = context.GetPrivateKey(keyId);
    if (!privateKey) {
        utils::GetLogger().Debug("Private key not found",
            utils::LogContext().With("block", block.Describe()).With("privateKey", keyId));
        context.ErrorKeyNotFound(block);
        return Result<BlockOutcome>(BlockOutcome());
    }

    auto cipher = registry_->GetCipher(methodOf(block, defaultCipher_));
    if (!cipher.ok()) {
        return Error(cipher.error().code(), cipher.error().what(), block.Describe());
    }

    std::string passphrase = context.GetPassphrase(keyId, block);
    auto decoded = cipher.value()->Decrypt(*privateKey, block, passphrase);
    utils::Cleanse(passphrase);
    if (!decoded.ok()) {
        if (privateKey->IsProperty(PROP_ENCRYPTED)) {
            context.PassphraseRejected(keyId, block);
        }
        return decoded.error();
    }

    BlockOutcome outcome;
    outcome.type = BlockOutcome::Type::Secret;
    outcome.secret = std::move(decoded).value();
    context.FoundSecret(block, outcome.secret);
    return Result<BlockOutcome>(std::move(outcome));
}

Result<BlockOutcome> ChainProcessor::processSignature(ProcessContext& context, const Block& block) {
    // 这里只解析公钥，内容只有在内嵌时才能校验
    std::string keyId = block.GetString(PROP_PUB_ID);
    if (keyId.empty()) {
        std::string privId = block.GetString(PROP_PRIV_ID);
        if (privId.empty()) {
            utils::GetLogger().Debug("Private key not found", utils::LogContext().With("block", block.Describe()));
            context.ErrorKeyNotFound(block);
            return Result<BlockOutcome>(BlockOutcome());
        }
        keyId = context.GetPublicIdForPrivateKeyId(privId);
        if (keyId.empty()) {
            utils::GetLogger().Debug("Public key not found for private key",
                utils::LogContext().With("block", block.Describe()).With("privateKey", privId));
            context.ErrorKeyNotFound(block);
            return Result<BlockOutcome>(BlockOutcome());
        }
    }

    std::shared_ptr<Block> publicKey = context.GetPublicKey(keyId);
    if (!publicKey) {
        utils::GetLogger().Debug("Public key not found",
            utils::LogContext().With("block", block.Describe()).With("publicKey", keyId));
        context.ErrorKeyNotFound(block);
        return Result<BlockOutcome>(BlockOutcome());
    }

    BlockOutcome outcome;
    outcome.type = BlockOutcome::Type::Key;
    outcome.key = publicKey;
    return Result<BlockOutcome>(std::move(outcome));
}

Error ChainProcessor::insertSecret(BlockList& blocks, size_t index, const Block& block,
                                   crypto::SecureString& secret) {
    std::string text = secret.Copy();
    secret.Clear();
    auto parsed = format::ParseBlocks(text);
    utils::Cleanse(text);
    if (!parsed.ok()) {
        return Error(parsed.error().code(),
                     "embedded content could not be parsed: " + parsed.error().what(),
                     block.Describe());
    }

    utils::GetLogger().Trace("Inserting embedded blocks",
        utils::LogContext().With("block", block.Describe())
                           .With("count", std::to_string(parsed.value().Size())));
    blocks.Insert(index + 1, parsed.value());
    return Error();
}

Error ChainProcessor::validateEmbedded(ProcessContext& context, const BlockList& blocks, size_t index,
                                       const Block& signature, const BlockOutcome& outcome) {
    if (outcome.type != BlockOutcome::Type::Key || !outcome.key) {
        return Error(ErrorCode::CryptError, "sign key not found", signature.Describe());
    }

    std::string text;
    if (signature.IsEmbeddedNext()) {
        if (index + 1 >= blocks.Size()) {
            return Error(ErrorCode::CryptError, "no block follows the signature", signature.Describe());
        }
        text = blocks.Get(index + 1).ToString();
    } else {
        text = blocks.ToString(index + 1, blocks.Size());
    }

    auto signer = registry_->GetSigner(methodOf(signature, defaultSigner_));
    if (!signer.ok()) {
        return Error(signer.error().code(), signer.error().what(), signature.Describe());
    }

    auto valid = signer.value()->Validate(*outcome.key, text, signature);
    if (!valid.ok()) {
        return Error(valid.error().code(), valid.error().what(), signature.Describe());
    }
    if (!valid.value()) {
        return Error(ErrorCode::SignatureInvalid, "signature is not valid", signature.Describe());
    }

    context.FoundValidated(signature);
    return Error();
}

} // namespace chain
} // namespace blockcrypt
