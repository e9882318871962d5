#include "blockcrypt/crypto/keys.hpp"
#include "blockcrypt/utils/tools.hpp"
#include <openssl/err.h>
#include <openssl/pkcs12.h>
#include <openssl/x509.h>
#include <stdexcept>

namespace blockcrypt {
namespace crypto {

std::vector<uint8_t> EncodePublicKey(EVP_PKEY* key) {
    int len = i2d_PUBKEY(key, nullptr);
    if (len <= 0) {
        throw std::runtime_error("Failed to get public key DER length: " + utils::OpenSSLError());
    }

    std::vector<uint8_t> derData(len);
    unsigned char* p = derData.data();
    if (i2d_PUBKEY(key, &p) <= 0) {
        throw std::runtime_error("Failed to encode public key to DER: " + utils::OpenSSLError());
    }
    return derData;
}

std::vector<uint8_t> EncodePrivateKey(EVP_PKEY* key, const std::string& passphrase) {
    std::unique_ptr<PKCS8_PRIV_KEY_INFO, decltype(&PKCS8_PRIV_KEY_INFO_free)> p8inf(
        EVP_PKEY2PKCS8(key), PKCS8_PRIV_KEY_INFO_free);
    if (!p8inf) {
        throw std::runtime_error("Failed to convert private key to PKCS#8: " + utils::OpenSSLError());
    }

    std::vector<uint8_t> derData;
    if (passphrase.empty()) {
        // 未加密的 PKCS#8
        int len = i2d_PKCS8_PRIV_KEY_INFO(p8inf.get(), nullptr);
        if (len <= 0) {
            throw std::runtime_error("Failed to get PKCS#8 DER length: " + utils::OpenSSLError());
        }
        derData.resize(len);
        unsigned char* p = derData.data();
        if (i2d_PKCS8_PRIV_KEY_INFO(p8inf.get(), &p) <= 0) {
            throw std::runtime_error("Failed to encode PKCS#8: " + utils::OpenSSLError());
        }
        return derData;
    }

    // 使用 AES-256-CBC 加密 PKCS#8，密钥由口令经 PBKDF2 派生
    std::unique_ptr<X509_SIG, decltype(&X509_SIG_free)> p8(
        PKCS8_encrypt(-1, EVP_aes_256_cbc(), passphrase.c_str(),
                      static_cast<int>(passphrase.size()), nullptr, 0, 0, p8inf.get()),
        X509_SIG_free);
    if (!p8) {
        throw std::runtime_error("Failed to encrypt PKCS#8: " + utils::OpenSSLError());
    }
    int len = i2d_X509_SIG(p8.get(), nullptr);
    if (len <= 0) {
        throw std::runtime_error("Failed to get encrypted PKCS#8 DER length: " + utils::OpenSSLError());
    }
    derData.resize(len);
    unsigned char* p = derData.data();
    if (i2d_X509_SIG(p8.get(), &p) <= 0) {
        throw std::runtime_error("Failed to encode encrypted PKCS#8: " + utils::OpenSSLError());
    }
    return derData;
}

EvpKeyPtr DecodePublicKey(const Block& publicKey) {
    const std::vector<uint8_t>& pubData = publicKey.Payload();
    const unsigned char* data = pubData.data();

    EVP_PKEY* key = d2i_PUBKEY(nullptr, &data, static_cast<long>(pubData.size()));
    if (!key) {
        throw std::runtime_error("Failed to parse public key " + publicKey.Describe() +
                                 ": " + utils::OpenSSLError());
    }
    return EvpKeyPtr(key, EVP_PKEY_free);
}

EvpKeyPtr DecodePrivateKey(const Block& privateKey, const std::string& passphrase) {
    const std::vector<uint8_t>& privData = privateKey.Payload();
    const unsigned char* p = privData.data();
    long dataLen = static_cast<long>(privData.size());

    PKCS8_PRIV_KEY_INFO* p8inf = nullptr;
    std::string encrypted = privateKey.GetString(PROP_ENCRYPTED);
    if (encrypted.empty()) {
        p8inf = d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, dataLen);
        if (!p8inf) {
            throw std::runtime_error("Failed to parse PKCS#8 private key " + privateKey.Describe() +
                                     ": " + utils::OpenSSLError());
        }
    } else {
        if (encrypted != ENC_AES256_CBC) {
            throw std::runtime_error("Unsupported private key encryption: " + encrypted);
        }
        if (passphrase.empty()) {
            throw std::runtime_error("Private key " + privateKey.Describe() +
                                     " is encrypted but no passphrase was given");
        }
        X509_SIG* p8 = d2i_X509_SIG(nullptr, &p, dataLen);
        if (!p8) {
            throw std::runtime_error("Failed to parse encrypted PKCS#8 private key " +
                                     privateKey.Describe() + ": " + utils::OpenSSLError());
        }
        p8inf = PKCS8_decrypt(p8, passphrase.c_str(), static_cast<int>(passphrase.size()));
        X509_SIG_free(p8);
        if (!p8inf) {
            throw std::runtime_error("Failed to decrypt PKCS#8 private key " + privateKey.Describe() +
                                     " - wrong passphrase? " + utils::OpenSSLError());
        }
    }

    EVP_PKEY* key = EVP_PKCS82PKEY(p8inf);
    PKCS8_PRIV_KEY_INFO_free(p8inf);
    if (!key) {
        throw std::runtime_error("Failed to extract private key from PKCS#8: " + utils::OpenSSLError());
    }
    return EvpKeyPtr(key, EVP_PKEY_free);
}

KeyPairBlocks NewKeyPairBlocks(EVP_PKEY* key, const std::string& method,
                               int length, const std::string& passphrase) {
    std::string privId = utils::NewUUID();
    std::string pubId = utils::NewUUID();

    KeyPairBlocks pair;
    pair.publicKey = Block(BLOCK_PUB, EncodePublicKey(key));
    pair.publicKey.Set(PROP_METHOD, method)
                  .Set(PROP_LENGTH, length)
                  .Set(PROP_FORMAT, "X.509")
                  .Set(PROP_IDENT, pubId)
                  .Set(PROP_PRIV_ID, privId);

    std::vector<uint8_t> privBytes = EncodePrivateKey(key, passphrase);
    pair.privateKey = Block(BLOCK_PRIV, privBytes);
    utils::Cleanse(privBytes);
    pair.privateKey.Set(PROP_METHOD, method)
                   .Set(PROP_LENGTH, length)
                   .Set(PROP_FORMAT, "PKCS#8")
                   .Set(PROP_IDENT, privId)
                   .Set(PROP_PUB_ID, pubId);
    if (!passphrase.empty()) {
        pair.privateKey.Set(PROP_ENCRYPTED, ENC_AES256_CBC);
    }
    return pair;
}

} // namespace crypto
} // namespace blockcrypt
