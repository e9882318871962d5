#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include "blockcrypt/utils/config.hpp"
#include "blockcrypt/utils/tools.hpp"

using namespace blockcrypt;
using namespace blockcrypt::utils;

TEST_CASE("Config - Parse", "[config]") {
    SECTION("Empty object keeps defaults") {
        auto config = ParseConfig("{}");
        REQUIRE(config.ok());
        REQUIRE(config.value().defaultCipher == RSA_CIPHER);
        REQUIRE(config.value().defaultSigner == DSA_SIGNER);
        REQUIRE(config.value().logging.level == "warn");
        REQUIRE(config.value().logging.format == "text");
        REQUIRE(config.value().logging.output == "console");
    }

    SECTION("Override every field") {
        auto config = ParseConfig(R"({
            "defaultSigner": "ECDSA-JCE",
            "defaultCipher": "AES-JCE",
            "logging": {"level": "debug", "format": "json", "output": "file", "file": "/tmp/bc.log"}
        })");
        REQUIRE(config.ok());
        REQUIRE(config.value().defaultSigner == "ECDSA-JCE");
        REQUIRE(config.value().defaultCipher == "AES-JCE");
        REQUIRE(config.value().logging.level == "debug");
        REQUIRE(config.value().logging.format == "json");
        REQUIRE(config.value().logging.output == "file");
        REQUIRE(config.value().logging.file == "/tmp/bc.log");
    }

    SECTION("Partial logging section") {
        auto config = ParseConfig(R"({"logging": {"level": "trace"}})");
        REQUIRE(config.ok());
        REQUIRE(config.value().logging.level == "trace");
        REQUIRE(config.value().logging.format == "text");
        REQUIRE(config.value().logging.file == "blockcrypt.log");
    }
}

TEST_CASE("Config - Errors", "[config]") {
    SECTION("Malformed JSON") {
        auto config = ParseConfig("{\"defaultSigner\": ");
        REQUIRE_FALSE(config.ok());
        REQUIRE(config.error().code() == ErrorCode::ConfigError);
    }

    SECTION("Top level is not an object") {
        auto config = ParseConfig("[1, 2]");
        REQUIRE_FALSE(config.ok());
        REQUIRE(config.error().what() == "configuration must be a JSON object");
    }

    SECTION("Wrong field type") {
        auto config = ParseConfig(R"({"defaultCipher": 42})");
        REQUIRE_FALSE(config.ok());
        REQUIRE(config.error().code() == ErrorCode::ConfigError);
    }

    SECTION("Logging is not an object") {
        auto config = ParseConfig(R"({"logging": "debug"})");
        REQUIRE_FALSE(config.ok());
        REQUIRE(config.error().code() == ErrorCode::ConfigError);
    }

    SECTION("Empty provider name") {
        auto config = ParseConfig(R"({"defaultSigner": "  "})");
        REQUIRE_FALSE(config.ok());
        REQUIRE(config.error().what() == "default provider names must not be empty");
    }
}

TEST_CASE("Config - Load file", "[config]") {
    SECTION("Missing file") {
        auto config = LoadConfig("/nonexistent/blockcrypt/config.json");
        REQUIRE_FALSE(config.ok());
        REQUIRE(config.error().code() == ErrorCode::ConfigError);
    }

    SECTION("Reads a written file") {
        std::string path = "blockcrypt_test_config.json";
        REQUIRE_FALSE(WriteFile(path, R"({"logging": {"format": "json"}})").hasError());
        auto config = LoadConfig(path);
        std::remove(path.c_str());
        REQUIRE(config.ok());
        REQUIRE(config.value().logging.format == "json");
    }
}
