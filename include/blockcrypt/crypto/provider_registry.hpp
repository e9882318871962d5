#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "blockcrypt/crypto/provider.hpp"
#include "blockcrypt/types.hpp"

namespace blockcrypt {
namespace crypto {

// 按名称查找提供者的注册表
// 名称比较前去除两端空白并转为大写
class ProviderRegistry {
public:
    ProviderRegistry() = default;

    // 注册内置的 RSA-JCE 和 DSA-JCE
    static std::shared_ptr<ProviderRegistry> NewDefaultRegistry();

    void RegisterCipher(std::shared_ptr<CipherProvider> provider);
    void RegisterSigner(std::shared_ptr<SignerProvider> provider);

    Result<std::shared_ptr<CipherProvider>> GetCipher(const std::string& name) const;
    Result<std::shared_ptr<SignerProvider>> GetSigner(const std::string& name) const;

    std::vector<std::string> CipherNames() const;
    std::vector<std::string> SignerNames() const;

    static std::string NormalizeName(const std::string& name);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CipherProvider>> ciphers_;
    std::map<std::string, std::shared_ptr<SignerProvider>> signers_;
};

} // namespace crypto
} // namespace blockcrypt
