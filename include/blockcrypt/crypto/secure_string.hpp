#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace blockcrypt {
namespace crypto {

// 解密得到的明文的短生命周期容器
//
// 只能移动不能拷贝；析构、被移走和 Clear() 时用 OPENSSL_cleanse 覆写缓冲区。
// 只是尽力而为：OpenSSL 或分配器内部留下的副本不在控制范围内。
class SecureString {
public:
    SecureString() = default;
    SecureString(const uint8_t* data, size_t size);

    // 接管 source 的内容，并覆写清空 source
    static SecureString Take(std::string& source);

    ~SecureString();

    SecureString(SecureString&& other) noexcept;
    SecureString& operator=(SecureString&& other) noexcept;

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    const char* Data() const { return data_.data(); }
    size_t Size() const { return data_.size(); }
    bool Empty() const { return data_.empty(); }

    // 返回明文副本，调用方负责用 utils::Cleanse 清理
    std::string Copy() const { return std::string(data_.begin(), data_.end()); }

    bool Equals(const std::string& text) const;

    void Clear();

private:
    std::vector<char> data_;
};

} // namespace crypto
} // namespace blockcrypt
