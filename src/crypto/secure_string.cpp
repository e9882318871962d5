#include "blockcrypt/crypto/secure_string.hpp"
#include "blockcrypt/utils/tools.hpp"
#include <openssl/crypto.h>
#include <algorithm>

namespace blockcrypt {
namespace crypto {

SecureString::SecureString(const uint8_t* data, size_t size)
    : data_(reinterpret_cast<const char*>(data), reinterpret_cast<const char*>(data) + size) {}

SecureString SecureString::Take(std::string& source) {
    SecureString result;
    result.data_.assign(source.begin(), source.end());
    utils::Cleanse(source);
    return result;
}

SecureString::~SecureString() {
    Clear();
}

SecureString::SecureString(SecureString&& other) noexcept
    : data_(std::move(other.data_)) {
    // vector 的移动转移了缓冲区，这里只需保证源对象为空
    other.data_.clear();
}

SecureString& SecureString::operator=(SecureString&& other) noexcept {
    if (this != &other) {
        Clear();
        data_ = std::move(other.data_);
        other.data_.clear();
    }
    return *this;
}

bool SecureString::Equals(const std::string& text) const {
    return data_.size() == text.size() && std::equal(data_.begin(), data_.end(), text.begin());
}

void SecureString::Clear() {
    if (!data_.empty()) {
        OPENSSL_cleanse(data_.data(), data_.size());
    }
    data_.clear();
    data_.shrink_to_fit();
}

} // namespace crypto
} // namespace blockcrypt
