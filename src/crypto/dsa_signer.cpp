#include "blockcrypt/crypto/dsa_signer.hpp"
#include "blockcrypt/crypto/keys.hpp"
#include "blockcrypt/utils/logger.hpp"
#include "blockcrypt/utils/tools.hpp"
#include <openssl/dsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace blockcrypt {
namespace crypto {

namespace {

using EvpKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

void requireDsa(EVP_PKEY* key) {
    if (EVP_PKEY_base_id(key) != EVP_PKEY_DSA) {
        throw std::runtime_error("value was not a DSA key");
    }
}

EvpMdCtxPtr newDigestContext() {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create digest context: " + utils::OpenSSLError());
    }
    return ctx;
}

} // namespace

Result<Block> DsaSigner::Sign(const Block& privateKey,
                              const std::string& text,
                              const std::string& passphrase) {
    try {
        EvpKeyPtr key = DecodePrivateKey(privateKey, passphrase);
        requireDsa(key.get());

        EvpMdCtxPtr ctx = newDigestContext();
        if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) <= 0) {
            throw std::runtime_error("Failed to initialize DSA signing: " + utils::OpenSSLError());
        }

        const unsigned char* data = reinterpret_cast<const unsigned char*>(text.data());
        size_t sigLen = 0;
        if (EVP_DigestSign(ctx.get(), nullptr, &sigLen, data, text.size()) <= 0) {
            throw std::runtime_error("Failed to get DSA signature length: " + utils::OpenSSLError());
        }
        std::vector<uint8_t> signature(sigLen);
        if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, data, text.size()) <= 0) {
            throw std::runtime_error("DSA signing failed: " + utils::OpenSSLError());
        }
        signature.resize(sigLen);

        Block block(BLOCK_SIGN, signature);
        block.Set(PROP_METHOD, Name())
             .Set(PROP_LENGTH, privateKey.GetInt(PROP_LENGTH, DSA_DEFAULT_KEY_LENGTH))
             .Set(PROP_IDENT, utils::NewUUID());
        if (!privateKey.Ident().empty()) {
            block.Set(PROP_PRIV_ID, privateKey.Ident());
        }
        if (privateKey.IsProperty(PROP_PUB_ID)) {
            block.Set(PROP_PUB_ID, privateKey.GetString(PROP_PUB_ID));
        }
        return block;
    } catch (const std::exception& e) {
        return Error(ErrorCode::CryptError, e.what(), privateKey.Describe());
    }
}

Result<bool> DsaSigner::Validate(const Block& publicKey,
                                 const std::string& text,
                                 const Block& signature) {
    EvpKeyPtr key(nullptr, EVP_PKEY_free);
    EvpMdCtxPtr ctx(nullptr, EVP_MD_CTX_free);
    try {
        key = DecodePublicKey(publicKey);
        requireDsa(key.get());
        ctx = newDigestContext();
        if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) <= 0) {
            throw std::runtime_error("Failed to initialize DSA verification: " + utils::OpenSSLError());
        }
    } catch (const std::exception& e) {
        return Error(ErrorCode::CryptError, e.what(), publicKey.Describe());
    }

    const std::vector<uint8_t>& sig = signature.Payload();
    int rc = EVP_DigestVerify(ctx.get(), sig.data(), sig.size(),
                              reinterpret_cast<const unsigned char*>(text.data()), text.size());
    if (rc != 1) {
        // 签名损坏或不匹配都只是“无效”，不是错误
        ERR_clear_error();
        utils::GetLogger().Debug("DSA signature did not verify",
            utils::LogContext().With("signature", signature.Describe()));
        return false;
    }
    return true;
}

Result<KeyPairBlocks> DsaSigner::CreateKeys(const KeyOptions& options) {
    int length = options.length > 0 ? options.length : DSA_DEFAULT_KEY_LENGTH;
    try {
        // 先生成域参数，再由参数生成密钥
        EvpKeyCtxPtr paramCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_DSA, nullptr), EVP_PKEY_CTX_free);
        if (!paramCtx) {
            throw std::runtime_error("Failed to create DSA parameter context: " + utils::OpenSSLError());
        }
        if (EVP_PKEY_paramgen_init(paramCtx.get()) <= 0 ||
            EVP_PKEY_CTX_set_dsa_paramgen_bits(paramCtx.get(), length) <= 0) {
            throw std::runtime_error("Failed to initialize DSA parameter generation: " + utils::OpenSSLError());
        }
        EVP_PKEY* rawParams = nullptr;
        if (EVP_PKEY_paramgen(paramCtx.get(), &rawParams) <= 0) {
            throw std::runtime_error("Failed to generate DSA parameters: " + utils::OpenSSLError());
        }
        EvpKeyPtr params(rawParams, EVP_PKEY_free);

        EvpKeyCtxPtr keyCtx(EVP_PKEY_CTX_new(params.get(), nullptr), EVP_PKEY_CTX_free);
        if (!keyCtx || EVP_PKEY_keygen_init(keyCtx.get()) <= 0) {
            throw std::runtime_error("Failed to initialize DSA key generation: " + utils::OpenSSLError());
        }
        EVP_PKEY* raw = nullptr;
        if (EVP_PKEY_keygen(keyCtx.get(), &raw) <= 0) {
            throw std::runtime_error("Failed to generate DSA key pair: " + utils::OpenSSLError());
        }
        EvpKeyPtr key(raw, EVP_PKEY_free);

        KeyPairBlocks pair = NewKeyPairBlocks(key.get(), Name(), length, options.passphrase);
        utils::GetLogger().Debug("Created DSA key pair",
            utils::LogContext().With("privateKey", pair.privateKey.Ident())
                               .With("publicKey", pair.publicKey.Ident())
                               .With("length", std::to_string(length)));
        return pair;
    } catch (const std::exception& e) {
        return Error(ErrorCode::CryptError, e.what());
    }
}

} // namespace crypto
} // namespace blockcrypt
