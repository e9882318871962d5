#include "blockcrypt/crypto/rsa_cipher.hpp"
#include "blockcrypt/crypto/keys.hpp"
#include "blockcrypt/utils/logger.hpp"
#include "blockcrypt/utils/tools.hpp"
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <algorithm>
#include <stdexcept>

namespace blockcrypt {
namespace crypto {

namespace {

const std::string DEFAULT_STRING_ENCODING = "utf-8";

using EvpKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

EvpKeyCtxPtr newKeyContext(EVP_PKEY* key) {
    EvpKeyCtxPtr ctx(EVP_PKEY_CTX_new(key, nullptr), EVP_PKEY_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create RSA context: " + utils::OpenSSLError());
    }
    return ctx;
}

void requireRsa(EVP_PKEY* key) {
    if (EVP_PKEY_base_id(key) != EVP_PKEY_RSA) {
        throw std::runtime_error("value was not an RSA key");
    }
}

// 把解密出的字节按声明的编码转换成 UTF-8 文本
void decodeText(std::vector<uint8_t>& bytes, const std::string& encoding) {
    std::string enc = utils::ToLower(utils::TrimSpace(encoding));
    if (enc == "utf-8" || enc == "utf8") {
        return;
    }
    if (enc == "us-ascii" || enc == "ascii") {
        for (uint8_t b : bytes) {
            if (b >= 0x80) {
                throw std::runtime_error("decrypted text is not valid " + encoding);
            }
        }
        return;
    }
    if (enc == "iso-8859-1" || enc == "latin1") {
        std::vector<uint8_t> utf8;
        utf8.reserve(bytes.size() * 2);
        for (uint8_t b : bytes) {
            if (b < 0x80) {
                utf8.push_back(b);
            } else {
                utf8.push_back(static_cast<uint8_t>(0xC0 | (b >> 6)));
                utf8.push_back(static_cast<uint8_t>(0x80 | (b & 0x3F)));
            }
        }
        utils::Cleanse(bytes);
        bytes.swap(utf8);
        return;
    }
    throw std::runtime_error("unsupported string encoding: " + encoding);
}

} // namespace

size_t RsaCipher::EncryptBlockSize(int length) {
    return length == 512 ? 53 : 117;
}

size_t RsaCipher::DecryptBlockSize(int length) {
    return static_cast<size_t>(std::max(length / 1024 * 128, 64));
}

Result<Block> RsaCipher::Encrypt(const Block& publicKey, const std::string& content) {
    try {
        EvpKeyPtr key = DecodePublicKey(publicKey);
        requireRsa(key.get());

        EvpKeyCtxPtr ctx = newKeyContext(key.get());
        if (EVP_PKEY_encrypt_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0) {
            throw std::runtime_error("Failed to initialize RSA encryption: " + utils::OpenSSLError());
        }

        int length = publicKey.GetInt(PROP_LENGTH, RSA_DEFAULT_KEY_LENGTH);
        size_t blockSize = EncryptBlockSize(length);

        const uint8_t* in = reinterpret_cast<const uint8_t*>(content.data());
        std::vector<uint8_t> out;
        size_t off = 0;
        while (off < content.size()) {
            size_t len = std::min(blockSize, content.size() - off);
            size_t outLen = 0;
            if (EVP_PKEY_encrypt(ctx.get(), nullptr, &outLen, in + off, len) <= 0) {
                throw std::runtime_error("Failed to get RSA ciphertext length: " + utils::OpenSSLError());
            }
            std::vector<uint8_t> chunk(outLen);
            if (EVP_PKEY_encrypt(ctx.get(), chunk.data(), &outLen, in + off, len) <= 0) {
                throw std::runtime_error("RSA encryption failed: " + utils::OpenSSLError());
            }
            out.insert(out.end(), chunk.begin(), chunk.begin() + outLen);
            off += len;
        }

        Block block(BLOCK_CIPHER, out);
        block.Set(PROP_METHOD, Name())
             .Set(PROP_LENGTH, length)
             .Set(PROP_STRING_ENCODING, DEFAULT_STRING_ENCODING)
             .Set(PROP_IDENT, utils::NewUUID());
        if (!publicKey.Ident().empty()) {
            block.Set(PROP_PUB_ID, publicKey.Ident());
        }
        if (publicKey.IsProperty(PROP_PRIV_ID)) {
            block.Set(PROP_PRIV_ID, publicKey.GetString(PROP_PRIV_ID));
        }
        return block;
    } catch (const std::exception& e) {
        return Error(ErrorCode::CryptError, e.what(), publicKey.Describe());
    }
}

Result<SecureString> RsaCipher::Decrypt(const Block& privateKey,
                                        const Block& encoded,
                                        const std::string& passphrase) {
    std::vector<uint8_t> plain;
    try {
        EvpKeyPtr key = DecodePrivateKey(privateKey, passphrase);
        requireRsa(key.get());

        EvpKeyCtxPtr ctx = newKeyContext(key.get());
        if (EVP_PKEY_decrypt_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0) {
            throw std::runtime_error("Failed to initialize RSA decryption: " + utils::OpenSSLError());
        }

        int length = privateKey.GetInt(PROP_LENGTH, RSA_DEFAULT_KEY_LENGTH);
        size_t blockSize = DecryptBlockSize(length);

        const std::vector<uint8_t>& b = encoded.Payload();
        size_t off = 0;
        while (off < b.size()) {
            size_t len = std::min(blockSize, b.size() - off);
            size_t outLen = 0;
            if (EVP_PKEY_decrypt(ctx.get(), nullptr, &outLen, b.data() + off, len) <= 0) {
                throw std::runtime_error("Failed to get RSA plaintext length: " + utils::OpenSSLError());
            }
            std::vector<uint8_t> chunk(outLen);
            if (EVP_PKEY_decrypt(ctx.get(), chunk.data(), &outLen, b.data() + off, len) <= 0) {
                utils::Cleanse(chunk);
                throw std::runtime_error("RSA decryption failed: " + utils::OpenSSLError());
            }
            plain.insert(plain.end(), chunk.begin(), chunk.begin() + outLen);
            utils::Cleanse(chunk);
            off += len;
        }

        decodeText(plain, encoded.GetString(PROP_STRING_ENCODING, DEFAULT_STRING_ENCODING));
        SecureString secret(plain.data(), plain.size());
        utils::Cleanse(plain);
        return Result<SecureString>(std::move(secret));
    } catch (const std::exception& e) {
        utils::Cleanse(plain);
        utils::GetLogger().Debug("RSA decryption failed",
            utils::LogContext().With("block", encoded.Describe()).With("error", e.what()));
        return Error(ErrorCode::CryptError, e.what(), encoded.Describe());
    }
}

Result<KeyPairBlocks> RsaCipher::CreateKeys(const KeyOptions& options) {
    int length = options.length > 0 ? options.length : RSA_DEFAULT_KEY_LENGTH;
    try {
        EvpKeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free);
        if (!ctx) {
            throw std::runtime_error("Failed to create RSA key context: " + utils::OpenSSLError());
        }
        if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), length) <= 0) {
            throw std::runtime_error("Failed to initialize RSA key generation: " + utils::OpenSSLError());
        }

        // 随机数来自 OpenSSL 的 CSPRNG
        EVP_PKEY* raw = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
            throw std::runtime_error("Failed to generate RSA key pair: " + utils::OpenSSLError());
        }
        EvpKeyPtr key(raw, EVP_PKEY_free);

        KeyPairBlocks pair = NewKeyPairBlocks(key.get(), Name(), length, options.passphrase);
        utils::GetLogger().Debug("Created RSA key pair",
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
