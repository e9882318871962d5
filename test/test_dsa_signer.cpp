#include <catch2/catch_test_macros.hpp>
#include "blockcrypt/crypto/dsa_signer.hpp"
#include "blockcrypt/crypto/rsa_cipher.hpp"

using namespace blockcrypt;
using namespace blockcrypt::crypto;

namespace {

const KeyPairBlocks& dsaKeys() {
    static KeyPairBlocks pair = [] {
        DsaSigner signer;
        auto created = signer.CreateKeys(KeyOptions());
        REQUIRE(created.ok());
        return created.value();
    }();
    return pair;
}

} // namespace

TEST_CASE("DsaSigner - Sign and validate", "[dsa]") {
    DsaSigner signer;
    const KeyPairBlocks& pair = dsaKeys();
    const std::string text = "the quick brown fox jumps over the lazy dog";

    REQUIRE(pair.privateKey.Method() == DSA_SIGNER);
    REQUIRE(pair.publicKey.GetInt(PROP_LENGTH, 0) == DSA_DEFAULT_KEY_LENGTH);

    auto signature = signer.Sign(pair.privateKey, text, "");
    REQUIRE(signature.ok());
    REQUIRE(signature.value().Kind() == BlockKind::Signature);
    REQUIRE(signature.value().Method() == DSA_SIGNER);
    REQUIRE(signature.value().GetString(PROP_PRIV_ID) == pair.privateKey.Ident());
    REQUIRE(signature.value().GetString(PROP_PUB_ID) == pair.publicKey.Ident());
    REQUIRE_FALSE(signature.value().Payload().empty());

    SECTION("Original text validates") {
        auto valid = signer.Validate(pair.publicKey, text, signature.value());
        REQUIRE(valid.ok());
        REQUIRE(valid.value());
    }

    SECTION("One changed byte fails") {
        std::string tampered = text;
        tampered[4] = 'Q';
        auto valid = signer.Validate(pair.publicKey, tampered, signature.value());
        REQUIRE(valid.ok());
        REQUIRE_FALSE(valid.value());
    }

    SECTION("Corrupt signature is only invalid") {
        Block broken = signature.value();
        broken.SetPayload({0x30, 0x01, 0x00});
        auto valid = signer.Validate(pair.publicKey, text, broken);
        REQUIRE(valid.ok());
        REQUIRE_FALSE(valid.value());
    }

    SECTION("Other public key fails") {
        auto other = signer.CreateKeys(KeyOptions());
        REQUIRE(other.ok());
        REQUIRE(other.value().publicKey.Ident() != pair.publicKey.Ident());
        auto valid = signer.Validate(other.value().publicKey, text, signature.value());
        REQUIRE(valid.ok());
        REQUIRE_FALSE(valid.value());
    }
}

TEST_CASE("DsaSigner - Unusable keys", "[dsa]") {
    DsaSigner signer;

    SECTION("RSA key cannot sign") {
        RsaCipher cipher;
        KeyOptions options;
        options.length = 512;
        auto rsa = cipher.CreateKeys(options);
        REQUIRE(rsa.ok());

        auto signature = signer.Sign(rsa.value().privateKey, "text", "");
        REQUIRE_FALSE(signature.ok());
        REQUIRE(signature.error().code() == ErrorCode::CryptError);
    }

    SECTION("Corrupt public key is an error") {
        Block key(BLOCK_PUB, {1, 2, 3});
        key.Set(PROP_METHOD, DSA_SIGNER);
        auto valid = signer.Validate(key, "text", Block(BLOCK_SIGN));
        REQUIRE_FALSE(valid.ok());
        REQUIRE(valid.error().code() == ErrorCode::CryptError);
    }
}

TEST_CASE("DsaSigner - Passphrase protected key", "[dsa]") {
    DsaSigner signer;
    KeyOptions options;
    options.passphrase = "signing passphrase";
    auto pair = signer.CreateKeys(options);
    REQUIRE(pair.ok());
    REQUIRE(pair.value().privateKey.GetString(PROP_ENCRYPTED) == ENC_AES256_CBC);

    auto signature = signer.Sign(pair.value().privateKey, "hello", "signing passphrase");
    REQUIRE(signature.ok());
    auto valid = signer.Validate(pair.value().publicKey, "hello", signature.value());
    REQUIRE(valid.ok());
    REQUIRE(valid.value());

    auto rejected = signer.Sign(pair.value().privateKey, "hello", "not it");
    REQUIRE_FALSE(rejected.ok());
}
