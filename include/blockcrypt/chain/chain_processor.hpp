#pragma once

#include <memory>
#include <string>
#include "blockcrypt/block/block.hpp"
#include "blockcrypt/block/block_list.hpp"
#include "blockcrypt/chain/process_context.hpp"
#include "blockcrypt/crypto/provider_registry.hpp"
#include "blockcrypt/crypto/secure_string.hpp"
#include "blockcrypt/types.hpp"

namespace blockcrypt {
namespace chain {

// 单个块的处理结果
struct BlockOutcome {
    enum class Type {
        None,     // 没有结果（内容块、哈希块或密钥未找到）
        Secret,   // 密文块解密得到的明文
        Key       // 密钥块本身，或签名块解析出的公钥
    };

    Type type = Type::None;
    crypto::SecureString secret;
    std::shared_ptr<Block> key;
};

// 块链解释器
//
// 按下标遍历块列表，每步处理一个块后下标加一。内嵌的密文块解密后，
// 明文被解析为块列表并插入到当前块之后，在后续步骤中继续解释。
// 内嵌签名覆盖其后的全部块（Embedded: true）或仅下一个块（Embedded: next），
// 校验失败时整个解释过程失败。
class ChainProcessor {
public:
    // 块没有 Method 属性时使用默认的提供者名称
    explicit ChainProcessor(std::shared_ptr<crypto::ProviderRegistry> registry,
                            const std::string& defaultCipher = RSA_CIPHER,
                            const std::string& defaultSigner = DSA_SIGNER);

    // 解释整个列表，遇到第一个不可恢复的错误时返回
    // 列表在过程中会被修改（插入解密得到的块）
    Error Process(ProcessContext& context, BlockList& blocks);

    // 处理单个块，不做内嵌展开和签名校验
    Result<BlockOutcome> ProcessBlock(ProcessContext& context, const Block& block);

private:
    Result<BlockOutcome> processCipher(ProcessContext& context, const Block& block);
    Result<BlockOutcome> processSignature(ProcessContext& context, const Block& block);

    // 把解密得到的子文档插入到 index 之后
    Error insertSecret(BlockList& blocks, size_t index, const Block& block,
                       crypto::SecureString& secret);

    // 校验内嵌签名
    Error validateEmbedded(ProcessContext& context, const BlockList& blocks, size_t index,
                           const Block& signature, const BlockOutcome& outcome);

    std::string methodOf(const Block& block, const std::string& def) const;

    std::shared_ptr<crypto::ProviderRegistry> registry_;
    std::string defaultCipher_;
    std::string defaultSigner_;
};

} // namespace chain
} // namespace blockcrypt
