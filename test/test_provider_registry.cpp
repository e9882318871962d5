#include <catch2/catch_test_macros.hpp>
#include "blockcrypt/crypto/provider_registry.hpp"

using namespace blockcrypt;
using namespace blockcrypt::crypto;

namespace {

// 只用于检查注册表的提供者
class NamedSigner : public SignerProvider {
public:
    explicit NamedSigner(const std::string& name) : name_(name) {}

    Result<Block> Sign(const Block&, const std::string&, const std::string&) override {
        return Block(BLOCK_SIGN);
    }
    Result<bool> Validate(const Block&, const std::string&, const Block&) override {
        return true;
    }
    Result<KeyPairBlocks> CreateKeys(const KeyOptions&) override {
        return Error(ErrorCode::CryptError, "not supported");
    }
    std::string Name() const override { return name_; }

private:
    std::string name_;
};

} // namespace

TEST_CASE("ProviderRegistry - Lookup by name", "[registry]") {
    auto registry = ProviderRegistry::NewDefaultRegistry();

    SECTION("Default providers") {
        REQUIRE(registry->CipherNames() == std::vector<std::string>{RSA_CIPHER});
        REQUIRE(registry->SignerNames() == std::vector<std::string>{DSA_SIGNER});
    }

    SECTION("Names are case-insensitive and trimmed") {
        auto cipher = registry->GetCipher("  rsa-jce \t");
        REQUIRE(cipher.ok());
        REQUIRE(cipher.value()->Name() == RSA_CIPHER);

        auto signer = registry->GetSigner("Dsa-Jce");
        REQUIRE(signer.ok());
        REQUIRE(signer.value()->Name() == DSA_SIGNER);
    }

    SECTION("Unregistered names") {
        auto cipher = registry->GetCipher("AES-JCE");
        REQUIRE_FALSE(cipher.ok());
        REQUIRE(cipher.error().code() == ErrorCode::ProviderNotFound);
        REQUIRE(cipher.error().what() == "cipher not found: AES-JCE");

        // 签名提供者和加密提供者分开查找
        auto signer = registry->GetSigner(RSA_CIPHER);
        REQUIRE_FALSE(signer.ok());
        REQUIRE(signer.error().code() == ErrorCode::ProviderNotFound);
    }

    SECTION("Register a new provider") {
        registry->RegisterSigner(std::make_shared<NamedSigner>(" ecdsa-test "));
        auto signer = registry->GetSigner("ECDSA-TEST");
        REQUIRE(signer.ok());
        REQUIRE(registry->SignerNames().size() == 2);
    }

    SECTION("Same name replaces the registration") {
        auto replacement = std::make_shared<NamedSigner>(DSA_SIGNER);
        registry->RegisterSigner(replacement);
        auto signer = registry->GetSigner(DSA_SIGNER);
        REQUIRE(signer.ok());
        REQUIRE(signer.value() == replacement);
        REQUIRE(registry->SignerNames().size() == 1);
    }
}

TEST_CASE("ProviderRegistry - NormalizeName", "[registry]") {
    REQUIRE(ProviderRegistry::NormalizeName(" rsa-jce ") == "RSA-JCE");
    REQUIRE(ProviderRegistry::NormalizeName("") == "");
}
