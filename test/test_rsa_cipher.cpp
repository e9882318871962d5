#include <catch2/catch_test_macros.hpp>
#include <map>
#include "blockcrypt/block/block_list.hpp"
#include "blockcrypt/crypto/rsa_cipher.hpp"

using namespace blockcrypt;
using namespace blockcrypt::crypto;

namespace {

// 生成密钥较慢，同一长度的密钥对在测试间共享
const KeyPairBlocks& sharedKeys(int length) {
    static std::map<int, KeyPairBlocks> cache;
    auto it = cache.find(length);
    if (it == cache.end()) {
        RsaCipher cipher;
        KeyOptions options;
        options.length = length;
        auto pair = cipher.CreateKeys(options);
        REQUIRE(pair.ok());
        it = cache.emplace(length, pair.value()).first;
    }
    return it->second;
}

size_t chunks(size_t len, size_t chunk) {
    return (len + chunk - 1) / chunk;
}

} // namespace

TEST_CASE("RsaCipher - Chunk sizes", "[rsa]") {
    REQUIRE(RsaCipher::EncryptBlockSize(512) == 53);
    REQUIRE(RsaCipher::EncryptBlockSize(1024) == 117);
    REQUIRE(RsaCipher::EncryptBlockSize(2048) == 117);
    REQUIRE(RsaCipher::EncryptBlockSize(4096) == 117);

    REQUIRE(RsaCipher::DecryptBlockSize(512) == 64);
    REQUIRE(RsaCipher::DecryptBlockSize(1024) == 128);
    REQUIRE(RsaCipher::DecryptBlockSize(2048) == 256);
    REQUIRE(RsaCipher::DecryptBlockSize(4096) == 512);
}

TEST_CASE("RsaCipher - CreateKeys", "[rsa]") {
    const KeyPairBlocks& pair = sharedKeys(1024);

    REQUIRE(pair.privateKey.Kind() == BlockKind::PrivateKey);
    REQUIRE(pair.publicKey.Kind() == BlockKind::PublicKey);
    REQUIRE(pair.privateKey.Method() == RSA_CIPHER);
    REQUIRE(pair.publicKey.GetInt(PROP_LENGTH, 0) == 1024);

    // 两个块互相引用
    REQUIRE_FALSE(pair.privateKey.Ident().empty());
    REQUIRE_FALSE(pair.publicKey.Ident().empty());
    REQUIRE(pair.privateKey.Ident() != pair.publicKey.Ident());
    REQUIRE(pair.privateKey.GetString(PROP_PUB_ID) == pair.publicKey.Ident());
    REQUIRE(pair.publicKey.GetString(PROP_PRIV_ID) == pair.privateKey.Ident());
    REQUIRE_FALSE(pair.privateKey.IsProperty(PROP_ENCRYPTED));

    SECTION("Each pair has fresh ids and keys") {
        RsaCipher cipher;
        KeyOptions options;
        options.length = 1024;
        auto other = cipher.CreateKeys(options);
        REQUIRE(other.ok());
        REQUIRE(other.value().privateKey.Ident() != pair.privateKey.Ident());
        REQUIRE(other.value().publicKey.Ident() != pair.publicKey.Ident());
        REQUIRE(other.value().privateKey.Payload() != pair.privateKey.Payload());
        REQUIRE(other.value().publicKey.Payload() != pair.publicKey.Payload());
    }

    SECTION("Key blocks survive the text format") {
        BlockList list;
        list.Add(pair.privateKey);
        list.Add(pair.publicKey);
        auto parsed = BlockList::Parse(list.ToString());
        REQUIRE(parsed.ok());
        REQUIRE(parsed.value() == list);
    }
}

TEST_CASE("RsaCipher - Encrypt and decrypt", "[rsa]") {
    RsaCipher cipher;
    const KeyPairBlocks& pair = sharedKeys(1024);

    SECTION("Short text") {
        auto encoded = cipher.Encrypt(pair.publicKey, "hello");
        REQUIRE(encoded.ok());
        REQUIRE(encoded.value().Kind() == BlockKind::Cipher);
        REQUIRE(encoded.value().Method() == RSA_CIPHER);
        REQUIRE(encoded.value().GetString(PROP_PUB_ID) == pair.publicKey.Ident());
        REQUIRE(encoded.value().GetString(PROP_PRIV_ID) == pair.privateKey.Ident());
        REQUIRE(encoded.value().Payload().size() == 128);

        auto decoded = cipher.Decrypt(pair.privateKey, encoded.value(), "");
        REQUIRE(decoded.ok());
        REQUIRE(decoded.value().Equals("hello"));
    }

    SECTION("Multi-chunk ciphertext length") {
        std::string text(1000, 'a');
        for (size_t i = 0; i < text.size(); ++i) {
            text[i] = static_cast<char>('a' + i % 26);
        }
        auto encoded = cipher.Encrypt(pair.publicKey, text);
        REQUIRE(encoded.ok());
        REQUIRE(encoded.value().Payload().size() == chunks(text.size(), 117) * 128);

        auto decoded = cipher.Decrypt(pair.privateKey, encoded.value(), "");
        REQUIRE(decoded.ok());
        REQUIRE(decoded.value().Equals(text));
    }

    SECTION("Exactly one chunk") {
        std::string text(117, 'z');
        auto encoded = cipher.Encrypt(pair.publicKey, text);
        REQUIRE(encoded.ok());
        REQUIRE(encoded.value().Payload().size() == 128);
    }

    SECTION("UTF-8 text") {
        std::string text = "签名与加密 ✓";
        auto encoded = cipher.Encrypt(pair.publicKey, text);
        REQUIRE(encoded.ok());
        auto decoded = cipher.Decrypt(pair.privateKey, encoded.value(), "");
        REQUIRE(decoded.ok());
        REQUIRE(decoded.value().Equals(text));
    }

    SECTION("Empty text") {
        auto encoded = cipher.Encrypt(pair.publicKey, "");
        REQUIRE(encoded.ok());
        REQUIRE(encoded.value().Payload().empty());
        auto decoded = cipher.Decrypt(pair.privateKey, encoded.value(), "");
        REQUIRE(decoded.ok());
        REQUIRE(decoded.value().Empty());
    }
}

TEST_CASE("RsaCipher - 512 bit key", "[rsa]") {
    RsaCipher cipher;
    const KeyPairBlocks& pair = sharedKeys(512);

    std::string text(200, 'q');
    auto encoded = cipher.Encrypt(pair.publicKey, text);
    REQUIRE(encoded.ok());
    REQUIRE(encoded.value().Payload().size() == chunks(text.size(), 53) * 64);

    auto decoded = cipher.Decrypt(pair.privateKey, encoded.value(), "");
    REQUIRE(decoded.ok());
    REQUIRE(decoded.value().Equals(text));
}

TEST_CASE("RsaCipher - 2048 bit key", "[rsa]") {
    RsaCipher cipher;
    const KeyPairBlocks& pair = sharedKeys(2048);

    // 每块只用 117 字节明文，但每块密文占满模长
    std::string text(300, 'r');
    auto encoded = cipher.Encrypt(pair.publicKey, text);
    REQUIRE(encoded.ok());
    REQUIRE(encoded.value().Payload().size() == chunks(text.size(), 117) * 256);

    auto decoded = cipher.Decrypt(pair.privateKey, encoded.value(), "");
    REQUIRE(decoded.ok());
    REQUIRE(decoded.value().Equals(text));
}

TEST_CASE("RsaCipher - Decrypt failures", "[rsa]") {
    RsaCipher cipher;
    const KeyPairBlocks& pair = sharedKeys(1024);
    auto encoded = cipher.Encrypt(pair.publicKey, "for someone else");
    REQUIRE(encoded.ok());

    SECTION("Wrong private key") {
        RsaCipher other;
        KeyOptions options;
        options.length = 1024;
        auto otherPair = other.CreateKeys(options);
        REQUIRE(otherPair.ok());

        // 较新的 OpenSSL 对 PKCS#1 v1.5 采用隐式拒绝，可能返回随机数据而不是错误
        auto decoded = cipher.Decrypt(otherPair.value().privateKey, encoded.value(), "");
        if (decoded.ok()) {
            REQUIRE_FALSE(decoded.value().Equals("for someone else"));
        } else {
            REQUIRE(decoded.error().code() == ErrorCode::CryptError);
            REQUIRE(decoded.error().block() == encoded.value().Describe());
        }
    }

    SECTION("Ciphertext above the modulus") {
        Block broken = encoded.value();
        broken.SetPayload(std::vector<uint8_t>(128, 0xFF));
        auto decoded = cipher.Decrypt(pair.privateKey, broken, "");
        REQUIRE_FALSE(decoded.ok());
        REQUIRE(decoded.error().code() == ErrorCode::CryptError);
    }

    SECTION("Unsupported string encoding") {
        Block odd = encoded.value();
        odd.Set(PROP_STRING_ENCODING, "ebcdic");
        auto decoded = cipher.Decrypt(pair.privateKey, odd, "");
        REQUIRE_FALSE(decoded.ok());
        REQUIRE(decoded.error().what().find("unsupported string encoding") != std::string::npos);
    }

    SECTION("Decrypt with the public key block") {
        auto decoded = cipher.Decrypt(pair.publicKey, encoded.value(), "");
        REQUIRE_FALSE(decoded.ok());
        REQUIRE(decoded.error().code() == ErrorCode::CryptError);
    }
}

TEST_CASE("RsaCipher - ISO-8859-1 plaintext becomes UTF-8", "[rsa]") {
    RsaCipher cipher;
    const KeyPairBlocks& pair = sharedKeys(1024);

    // "café" 的 Latin-1 字节
    std::string latin1 = "caf\xE9";
    auto encoded = cipher.Encrypt(pair.publicKey, latin1);
    REQUIRE(encoded.ok());
    Block block = encoded.value();
    block.Set(PROP_STRING_ENCODING, "ISO-8859-1");

    auto decoded = cipher.Decrypt(pair.privateKey, block, "");
    REQUIRE(decoded.ok());
    REQUIRE(decoded.value().Equals("caf\xC3\xA9"));
}

TEST_CASE("RsaCipher - Passphrase protected key", "[rsa]") {
    RsaCipher cipher;
    KeyOptions options;
    options.length = 1024;
    options.passphrase = "correct horse battery";
    auto pair = cipher.CreateKeys(options);
    REQUIRE(pair.ok());
    REQUIRE(pair.value().privateKey.GetString(PROP_ENCRYPTED) == ENC_AES256_CBC);
    REQUIRE_FALSE(pair.value().publicKey.IsProperty(PROP_ENCRYPTED));

    auto encoded = cipher.Encrypt(pair.value().publicKey, "protected");
    REQUIRE(encoded.ok());

    SECTION("Correct passphrase") {
        auto decoded = cipher.Decrypt(pair.value().privateKey, encoded.value(), "correct horse battery");
        REQUIRE(decoded.ok());
        REQUIRE(decoded.value().Equals("protected"));
    }

    SECTION("Wrong passphrase") {
        auto decoded = cipher.Decrypt(pair.value().privateKey, encoded.value(), "wrong");
        REQUIRE_FALSE(decoded.ok());
        REQUIRE(decoded.error().code() == ErrorCode::CryptError);
    }

    SECTION("Missing passphrase") {
        auto decoded = cipher.Decrypt(pair.value().privateKey, encoded.value(), "");
        REQUIRE_FALSE(decoded.ok());
        REQUIRE(decoded.error().code() == ErrorCode::CryptError);
    }
}
