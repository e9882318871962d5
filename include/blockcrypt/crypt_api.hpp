#pragma once

#include <memory>
#include <string>
#include "blockcrypt/block/block.hpp"
#include "blockcrypt/block/block_list.hpp"
#include "blockcrypt/chain/chain_processor.hpp"
#include "blockcrypt/chain/process_context.hpp"
#include "blockcrypt/crypto/provider.hpp"
#include "blockcrypt/crypto/provider_registry.hpp"
#include "blockcrypt/types.hpp"
#include "blockcrypt/utils/config.hpp"

namespace blockcrypt {

// 加解密、签名和块链解释的统一入口
//
// 提供者通过注入的注册表按名称查找；默认提供者名称来自构造时传入的配置。
class CryptApi {
public:
    explicit CryptApi(std::shared_ptr<crypto::ProviderRegistry> registry = nullptr,
                      const utils::Config& config = utils::Config());

    Result<std::shared_ptr<crypto::CipherProvider>> GetCipher(const std::string& name) const;
    Result<std::shared_ptr<crypto::SignerProvider>> GetSigner(const std::string& name) const;
    Result<std::shared_ptr<crypto::CipherProvider>> GetDefaultCipher() const;
    Result<std::shared_ptr<crypto::SignerProvider>> GetDefaultSigner() const;

    // 按密钥块的 Method 选择提供者，没有 Method 时使用默认提供者
    Result<Block> Sign(const Block& privateKey, const std::string& text, const std::string& passphrase);
    Result<bool> Validate(const Block& publicKey, const std::string& text, const Block& signature);
    Result<Block> Encrypt(const Block& publicKey, const std::string& text);
    // 按密文块的 Method 选择提供者
    Result<crypto::SecureString> Decrypt(const Block& privateKey, const Block& encoded,
                                         const std::string& passphrase);

    // method 可以是加密或签名提供者的名称，先查加密提供者
    Result<crypto::KeyPairBlocks> CreateKeys(const std::string& method, const crypto::KeyOptions& options);

    // 把整个列表加密为内嵌密文块，解释时解密结果会展开到文档中
    Result<Block> EncryptEmbedded(const Block& publicKey, const BlockList& blocks);

    // 对列表生成内嵌签名块，签名块应放在 blocks 之前
    // nextOnly 为 true 时只覆盖第一个块（Embedded: next）
    Result<Block> SignEmbedded(const Block& privateKey, const BlockList& blocks,
                               const std::string& passphrase, bool nextOnly = false);

    Error ProcessBlocks(chain::ProcessContext& context, BlockList& blocks);
    Result<chain::BlockOutcome> ProcessBlock(chain::ProcessContext& context, const Block& block);

    const utils::Config& GetConfig() const { return config_; }

private:
    std::string methodOr(const Block& block, const std::string& def) const;

    std::shared_ptr<crypto::ProviderRegistry> registry_;
    utils::Config config_;
    chain::ChainProcessor processor_;
};

} // namespace blockcrypt
