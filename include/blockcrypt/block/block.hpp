#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace blockcrypt {

// 块名称
const std::string BLOCK_PUB     = "PUBLIC KEY";
const std::string BLOCK_PRIV    = "PRIVATE KEY";
const std::string BLOCK_CIPHER  = "CIPHER";
const std::string BLOCK_SIGN    = "SIGNATURE";
const std::string BLOCK_HASH    = "HASH";
const std::string BLOCK_CONTENT = "CONTENT";

// 属性名称
const std::string PROP_METHOD          = "Method";
const std::string PROP_LENGTH          = "Length";
const std::string PROP_EMBEDDED        = "Embedded";
const std::string PROP_SYMMETRIC       = "Symmetric";
const std::string PROP_KEY_ID          = "KeyId";
const std::string PROP_PRIV_ID         = "PrivateKey";
const std::string PROP_PUB_ID          = "PublicKey";
const std::string PROP_IDENT           = "Ident";
const std::string PROP_ENCRYPTED       = "Encrypted";
const std::string PROP_STRING_ENCODING = "StringEncoding";
const std::string PROP_FORMAT          = "Format";

// Embedded 属性的特殊取值：签名只覆盖下一个块
const std::string EMBEDDED_NEXT = "next";

// 私钥口令加密方式
const std::string ENC_AES256_CBC = "AES-256-CBC";

// 块类型，由块名称推导，不单独保存
enum class BlockKind {
    PublicKey,
    PrivateKey,
    Cipher,
    Signature,
    Hash,
    Content,
    Unknown
};

std::string blockKindToString(BlockKind kind);

// 文档中的一个块：名称、属性表和原始负载
class Block {
public:
    Block() = default;
    explicit Block(const std::string& name, const std::vector<uint8_t>& payload = {});

    const std::string& Name() const { return name_; }
    BlockKind Kind() const;

    bool IsProperty(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& def = "") const;
    // 无法解析为整数时返回默认值
    int GetInt(const std::string& key, int def) const;
    // 只接受 true/false/yes/no/1/0，其它取值返回默认值
    bool GetBool(const std::string& key, bool def) const;

    Block& Set(const std::string& key, const std::string& value);
    Block& Set(const std::string& key, const char* value);
    Block& Set(const std::string& key, int value);
    Block& Set(const std::string& key, bool value);
    void Remove(const std::string& key);

    const std::map<std::string, std::string>& Properties() const { return properties_; }

    const std::vector<uint8_t>& Payload() const { return payload_; }
    void SetPayload(const std::vector<uint8_t>& payload) { payload_ = payload; }
    std::string PayloadText() const { return std::string(payload_.begin(), payload_.end()); }

    std::string Ident() const { return GetString(PROP_IDENT); }
    std::string Method() const { return GetString(PROP_METHOD); }

    bool IsEmbedded() const { return GetBool(PROP_EMBEDDED, false); }
    bool IsEmbeddedNext() const { return GetString(PROP_EMBEDDED) == EMBEDDED_NEXT; }

    // 文本形式，签名覆盖的正是这段文本
    std::string ToString() const;

    // 用于日志和错误信息
    std::string Describe() const;

    bool operator==(const Block& other) const;
    bool operator!=(const Block& other) const { return !(*this == other); }

private:
    std::string name_;
    std::map<std::string, std::string> properties_;
    std::vector<uint8_t> payload_;
};

// 创建内容块
Block NewContentBlock(const std::string& text);

} // namespace blockcrypt
