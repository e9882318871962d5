#include "blockcrypt/block/block.hpp"
#include "blockcrypt/block/pem_format.hpp"
#include "blockcrypt/utils/tools.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace blockcrypt {

namespace {

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string blockKindToString(BlockKind kind) {
    switch (kind) {
        case BlockKind::PublicKey: return "public key";
        case BlockKind::PrivateKey: return "private key";
        case BlockKind::Cipher: return "cipher";
        case BlockKind::Signature: return "signature";
        case BlockKind::Hash: return "hash";
        case BlockKind::Content: return "content";
        default: return "unknown";
    }
}

Block::Block(const std::string& name, const std::vector<uint8_t>& payload)
    : name_(name), payload_(payload) {}

BlockKind Block::Kind() const {
    // 允许 "RSA PUBLIC KEY" 这类带算法前缀的名称
    if (name_ == BLOCK_PUB || endsWith(name_, " " + BLOCK_PUB)) return BlockKind::PublicKey;
    if (name_ == BLOCK_PRIV || endsWith(name_, " " + BLOCK_PRIV)) return BlockKind::PrivateKey;
    if (name_ == BLOCK_CIPHER) return BlockKind::Cipher;
    if (name_ == BLOCK_SIGN) return BlockKind::Signature;
    if (name_ == BLOCK_HASH) return BlockKind::Hash;
    if (name_ == BLOCK_CONTENT) return BlockKind::Content;
    return BlockKind::Unknown;
}

bool Block::IsProperty(const std::string& key) const {
    return properties_.find(key) != properties_.end();
}

std::string Block::GetString(const std::string& key, const std::string& def) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return def;
    }
    return it->second;
}

int Block::GetInt(const std::string& key, int def) const {
    auto it = properties_.find(key);
    if (it == properties_.end() || it->second.empty()) {
        return def;
    }
    const char* begin = it->second.c_str();
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(begin, &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        return def;
    }
    return static_cast<int>(value);
}

bool Block::GetBool(const std::string& key, bool def) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return def;
    }
    std::string value = utils::ToLower(utils::TrimSpace(it->second));
    if (value == "true" || value == "yes" || value == "1") return true;
    if (value == "false" || value == "no" || value == "0") return false;
    return def;
}

Block& Block::Set(const std::string& key, const std::string& value) {
    properties_[key] = value;
    return *this;
}

Block& Block::Set(const std::string& key, const char* value) {
    return Set(key, std::string(value ? value : ""));
}

Block& Block::Set(const std::string& key, int value) {
    return Set(key, std::to_string(value));
}

Block& Block::Set(const std::string& key, bool value) {
    return Set(key, std::string(value ? "true" : "false"));
}

void Block::Remove(const std::string& key) {
    properties_.erase(key);
}

std::string Block::ToString() const {
    return format::RenderBlock(*this);
}

std::string Block::Describe() const {
    std::string ident = Ident();
    if (ident.empty()) {
        return name_;
    }
    return name_ + " [" + ident + "]";
}

bool Block::operator==(const Block& other) const {
    return name_ == other.name_ &&
           properties_ == other.properties_ &&
           payload_ == other.payload_;
}

Block NewContentBlock(const std::string& text) {
    return Block(BLOCK_CONTENT, std::vector<uint8_t>(text.begin(), text.end()));
}

} // namespace blockcrypt
