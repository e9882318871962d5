#include "blockcrypt/crypto/provider_registry.hpp"
#include "blockcrypt/crypto/dsa_signer.hpp"
#include "blockcrypt/crypto/rsa_cipher.hpp"
#include "blockcrypt/utils/logger.hpp"
#include "blockcrypt/utils/tools.hpp"

namespace blockcrypt {
namespace crypto {

std::shared_ptr<ProviderRegistry> ProviderRegistry::NewDefaultRegistry() {
    auto registry = std::make_shared<ProviderRegistry>();
    registry->RegisterCipher(std::make_shared<RsaCipher>());
    registry->RegisterSigner(std::make_shared<DsaSigner>());
    return registry;
}

std::string ProviderRegistry::NormalizeName(const std::string& name) {
    return utils::ToUpper(utils::TrimSpace(name));
}

void ProviderRegistry::RegisterCipher(std::shared_ptr<CipherProvider> provider) {
    if (!provider) return;
    std::string name = NormalizeName(provider->Name());
    std::lock_guard<std::mutex> lock(mutex_);
    ciphers_[name] = provider;
    utils::GetLogger().Debug("Registered cipher provider", utils::LogContext().With("cipher", name));
}

void ProviderRegistry::RegisterSigner(std::shared_ptr<SignerProvider> provider) {
    if (!provider) return;
    std::string name = NormalizeName(provider->Name());
    std::lock_guard<std::mutex> lock(mutex_);
    signers_[name] = provider;
    utils::GetLogger().Debug("Registered signer provider", utils::LogContext().With("signer", name));
}

Result<std::shared_ptr<CipherProvider>> ProviderRegistry::GetCipher(const std::string& name) const {
    std::string normalized = NormalizeName(name);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ciphers_.find(normalized);
    if (it == ciphers_.end()) {
        return Error(ErrorCode::ProviderNotFound, "cipher not found: " + normalized);
    }
    return it->second;
}

Result<std::shared_ptr<SignerProvider>> ProviderRegistry::GetSigner(const std::string& name) const {
    std::string normalized = NormalizeName(name);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = signers_.find(normalized);
    if (it == signers_.end()) {
        return Error(ErrorCode::ProviderNotFound, "signer not found: " + normalized);
    }
    return it->second;
}

std::vector<std::string> ProviderRegistry::CipherNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : ciphers_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> ProviderRegistry::SignerNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : signers_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace crypto
} // namespace blockcrypt
