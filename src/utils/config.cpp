#include "blockcrypt/utils/config.hpp"
#include "blockcrypt/utils/tools.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace blockcrypt {
namespace utils {

namespace {

using json = nlohmann::json;

// 字符串字段存在时覆盖默认值，类型不对时报错
void readString(const json& object, const std::string& key, std::string& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    if (!it->is_string()) {
        throw std::runtime_error("\"" + key + "\" must be a string");
    }
    target = it->get<std::string>();
}

} // namespace

Result<Config> ParseConfig(const std::string& text) {
    Config config;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return Error(ErrorCode::ConfigError, "configuration must be a JSON object");
        }

        readString(j, "defaultSigner", config.defaultSigner);
        readString(j, "defaultCipher", config.defaultCipher);

        auto logging = j.find("logging");
        if (logging != j.end() && !logging->is_null()) {
            if (!logging->is_object()) {
                return Error(ErrorCode::ConfigError, "\"logging\" must be an object");
            }
            readString(*logging, "level", config.logging.level);
            readString(*logging, "format", config.logging.format);
            readString(*logging, "output", config.logging.output);
            readString(*logging, "file", config.logging.file);
        }
    } catch (const std::exception& e) {
        return Error(ErrorCode::ConfigError, std::string("invalid configuration: ") + e.what());
    }

    if (TrimSpace(config.defaultSigner).empty() || TrimSpace(config.defaultCipher).empty()) {
        return Error(ErrorCode::ConfigError, "default provider names must not be empty");
    }
    return config;
}

Result<Config> LoadConfig(const std::string& path) {
    auto content = ReadFile(path);
    if (!content.ok()) {
        return Error(ErrorCode::ConfigError, content.error().what());
    }
    return ParseConfig(content.value());
}

} // namespace utils
} // namespace blockcrypt
