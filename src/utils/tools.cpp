#include "blockcrypt/utils/tools.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <uuid/uuid.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace blockcrypt {
namespace utils {

std::string Base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    BIO* bio, * b64;
    BUF_MEM* bufferPtr;

    b64 = BIO_new(BIO_f_base64());
    // 不换行（默认 Base64 会每 64 字符换行）
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    result.erase(std::remove(result.begin(), result.end(), '\n'), result.end());
    return result;
}

std::vector<uint8_t> Base64Decode(const std::string& base64) {
    std::string clean;
    clean.reserve(base64.size());
    for (char c : base64) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/' && c != '=') {
            throw std::invalid_argument(std::string("Invalid base64 character: ") + c);
        }
        clean.push_back(c);
    }
    if (clean.empty()) {
        return {};
    }
    if (clean.size() % 4 != 0) {
        throw std::invalid_argument("Base64 input length is not a multiple of 4");
    }

    BIO* bio, * b64;
    std::vector<uint8_t> decoded(clean.length());

    b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_new_mem_buf(clean.data(), static_cast<int>(clean.length()));
    bio = BIO_push(b64, bio);

    int decodedLen = BIO_read(bio, decoded.data(), static_cast<int>(clean.length()));
    BIO_free_all(bio);
    if (decodedLen <= 0) {
        throw std::invalid_argument("Base64 decode failed");
    }
    decoded.resize(decodedLen);
    return decoded;
}

std::string NewUUID() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr);
}

std::string OpenSSLError() {
    std::string result;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!result.empty()) result += "; ";
        result += buf;
    }
    return result.empty() ? "unknown openssl error" : result;
}

std::string TrimSpace(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string ToUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void Cleanse(std::string& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(&data[0], data.size());
    }
    data.clear();
}

void Cleanse(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    data.clear();
}

Result<std::string> ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error("Failed to open file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error("Failed to read file: " + path);
    }
    return ss.str();
}

Error WriteFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error("Failed to open file for writing: " + path);
    }
    file << content;
    if (!file) {
        return Error("Failed to write file: " + path);
    }
    return Error();
}

} // namespace utils
} // namespace blockcrypt
