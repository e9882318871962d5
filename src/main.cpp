#include <iostream>
#include <map>
#include <string>
#include <tuple>
#include <vector>
#include <CLI/CLI.hpp>
#include "blockcrypt/block/block_list.hpp"
#include "blockcrypt/context/key_ring_context.hpp"
#include "blockcrypt/crypt_api.hpp"
#include "blockcrypt/passRetriever/passRetriever.hpp"
#include "blockcrypt/utils/config.hpp"
#include "blockcrypt/utils/logger.hpp"
#include "blockcrypt/utils/tools.hpp"

using namespace blockcrypt;

namespace {

// 提示口令时显示的密钥用途
const std::map<std::string, std::string> KEY_ALIASES = {
    {RSA_CIPHER, "encryption"},
    {DSA_SIGNER, "signing"}
};

// 读取块文件
Result<BlockList> loadBlocks(const std::string& path) {
    auto content = utils::ReadFile(path);
    if (!content.ok()) {
        return content.error();
    }
    return BlockList::Parse(content.value());
}

// 从文件中取出第一个指定类型的块
Result<Block> loadBlock(const std::string& path, BlockKind kind) {
    auto blocks = loadBlocks(path);
    if (!blocks.ok()) {
        return blocks.error();
    }
    for (const auto& block : blocks.value()) {
        if (block.Kind() == kind) {
            return block;
        }
    }
    return Error(ErrorCode::InvalidFormat, "no " + blockKindToString(kind) + " block in " + path);
}

// 加密的私钥需要口令
std::tuple<std::string, Error> keyPassphrase(const passphrase::PassRetriever& retriever, const Block& key) {
    if (!key.IsProperty(PROP_ENCRYPTED)) {
        return std::make_tuple("", Error());
    }
    auto [pass, giveup, err] = retriever(key.Ident(), key.Method(), false, 0);
    if (err.hasError()) {
        return std::make_tuple("", err);
    }
    if (giveup) {
        return std::make_tuple("", Error("No passphrase for private key " + key.Ident()));
    }
    return std::make_tuple(pass, Error());
}

void printList(const std::string& title, const std::vector<std::string>& items) {
    std::cout << title << ": " << items.size() << std::endl;
    for (const auto& item : items) {
        std::cout << "  " << item << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"blockcrypt - process documents of key, cipher, signature and content blocks"};
    app.require_subcommand(1);

    // 全局选项
    std::string configFile;
    std::string logLevel;
    std::string logFormat;
    std::string passphraseOption;
    int exitCode = 0;

    app.add_option("-c,--config", configFile, "Configuration file path (JSON)");
    app.add_option("--log-level", logLevel, "日志级别: trace, debug, info, warn, error, fatal");
    app.add_option("--log-format", logFormat, "日志格式: json, text");
    app.add_option("-p,--passphrase", passphraseOption, "Passphrase for private keys (prompted when omitted)");

    utils::Config config;
    passphrase::PassRetriever retriever;

    // 在每个子命令之前加载配置并初始化日志，命令行参数优先于配置文件
    app.parse_complete_callback([&]() {
        if (!configFile.empty()) {
            auto loaded = utils::LoadConfig(configFile);
            if (!loaded.ok()) {
                throw CLI::ValidationError("--config", loaded.error().what());
            }
            config = loaded.value();
        }
        if (!logLevel.empty()) config.logging.level = logLevel;
        if (!logFormat.empty()) config.logging.format = logFormat;

        utils::GetLogger().Initialize(config.logging.level, config.logging.format,
                                      config.logging.output, config.logging.file);

        if (!passphraseOption.empty()) {
            retriever = passphrase::ConstantRetriever(passphraseOption);
        } else {
            retriever = passphrase::PromptRetriever(KEY_ALIASES);
        }
    });

    // keys 命令
    auto keys = app.add_subcommand("keys", "Create a key pair for a cipher or signer");
    std::string keysMethod;
    std::string keysOut;
    int keysLength = 0;
    bool keysProtect = false;

    keys->add_option("method", keysMethod, "Provider name, e.g. RSA-JCE or DSA-JCE")->required();
    keys->add_option("-o,--out", keysOut, "Output prefix, writes <prefix>.priv and <prefix>.pub")->required();
    keys->add_option("-l,--length", keysLength, "Key length in bits");
    keys->add_flag("--protect", keysProtect, "Encrypt the private key with a passphrase");

    keys->callback([&]() {
        try {
            CryptApi api(nullptr, config);
            crypto::KeyOptions options;
            options.length = keysLength;

            if (keysProtect) {
                auto [pass, giveup, err] = retriever("", crypto::ProviderRegistry::NormalizeName(keysMethod), true, 0);
                if (err.hasError() || giveup) {
                    utils::GetLogger().Error("Error getting passphrase: " + err.what());
                    exitCode = 1;
                    return;
                }
                options.passphrase = pass;
                utils::Cleanse(pass);
            }

            auto pair = api.CreateKeys(keysMethod, options);
            utils::Cleanse(options.passphrase);
            if (!pair.ok()) {
                utils::GetLogger().Error("Error creating keys: " + pair.error().what());
                exitCode = 1;
                return;
            }

            Error err = utils::WriteFile(keysOut + ".priv", pair.value().privateKey.ToString());
            if (!err.hasError()) {
                err = utils::WriteFile(keysOut + ".pub", pair.value().publicKey.ToString());
            }
            if (err.hasError()) {
                utils::GetLogger().Error("Error writing keys: " + err.what());
                exitCode = 1;
                return;
            }

            std::cout << "private key " << pair.value().privateKey.Ident() << " -> " << keysOut << ".priv" << std::endl;
            std::cout << "public key  " << pair.value().publicKey.Ident() << " -> " << keysOut << ".pub" << std::endl;
        } catch (const std::exception& e) {
            utils::GetLogger().Error("Error: " + std::string(e.what()));
            exitCode = 1;
        }
    });

    // encrypt 命令
    auto encrypt = app.add_subcommand("encrypt", "Encrypt a file for a public key");
    std::string encryptKey;
    std::string encryptInput;
    bool encryptEmbedded = false;

    encrypt->add_option("-k,--key", encryptKey, "Public key file")->required();
    encrypt->add_option("input", encryptInput, "File to encrypt")->required();
    encrypt->add_flag("-e,--embedded", encryptEmbedded, "Input is a block document, embed it in the cipher block");

    encrypt->callback([&]() {
        try {
            CryptApi api(nullptr, config);
            auto key = loadBlock(encryptKey, BlockKind::PublicKey);
            if (!key.ok()) {
                utils::GetLogger().Error("Error loading key: " + key.error().what());
                exitCode = 1;
                return;
            }

            Result<Block> encoded;
            if (encryptEmbedded) {
                auto blocks = loadBlocks(encryptInput);
                if (!blocks.ok()) {
                    utils::GetLogger().Error("Error reading input: " + blocks.error().what());
                    exitCode = 1;
                    return;
                }
                encoded = api.EncryptEmbedded(key.value(), blocks.value());
            } else {
                auto content = utils::ReadFile(encryptInput);
                if (!content.ok()) {
                    utils::GetLogger().Error("Error reading input: " + content.error().what());
                    exitCode = 1;
                    return;
                }
                encoded = api.Encrypt(key.value(), content.value());
            }

            if (!encoded.ok()) {
                utils::GetLogger().Error("Error encrypting: " + encoded.error().what());
                exitCode = 1;
                return;
            }
            std::cout << encoded.value().ToString();
        } catch (const std::exception& e) {
            utils::GetLogger().Error("Error: " + std::string(e.what()));
            exitCode = 1;
        }
    });

    // decrypt 命令
    auto decrypt = app.add_subcommand("decrypt", "Decrypt the first cipher block of a file");
    std::string decryptKey;
    std::string decryptInput;

    decrypt->add_option("-k,--key", decryptKey, "Private key file")->required();
    decrypt->add_option("input", decryptInput, "File containing a cipher block")->required();

    decrypt->callback([&]() {
        try {
            CryptApi api(nullptr, config);
            auto key = loadBlock(decryptKey, BlockKind::PrivateKey);
            if (!key.ok()) {
                utils::GetLogger().Error("Error loading key: " + key.error().what());
                exitCode = 1;
                return;
            }
            auto encoded = loadBlock(decryptInput, BlockKind::Cipher);
            if (!encoded.ok()) {
                utils::GetLogger().Error("Error reading input: " + encoded.error().what());
                exitCode = 1;
                return;
            }

            auto [pass, passErr] = keyPassphrase(retriever, key.value());
            if (passErr.hasError()) {
                utils::GetLogger().Error("Error getting passphrase: " + passErr.what());
                exitCode = 1;
                return;
            }

            auto secret = api.Decrypt(key.value(), encoded.value(), pass);
            utils::Cleanse(pass);
            if (!secret.ok()) {
                utils::GetLogger().Error("Error decrypting: " + secret.error().what());
                exitCode = 1;
                return;
            }
            std::cout.write(secret.value().Data(), secret.value().Size());
            std::cout.flush();
        } catch (const std::exception& e) {
            utils::GetLogger().Error("Error: " + std::string(e.what()));
            exitCode = 1;
        }
    });

    // sign 命令
    auto sign = app.add_subcommand("sign", "Sign a file with a private key");
    std::string signKey;
    std::string signInput;
    bool signEmbedded = false;
    bool signNext = false;

    sign->add_option("-k,--key", signKey, "Private key file")->required();
    sign->add_option("input", signInput, "File to sign")->required();
    sign->add_flag("-e,--embedded", signEmbedded, "Input is a block document, prepend an embedded signature");
    sign->add_flag("-n,--next", signNext, "With --embedded, cover only the first block");

    sign->callback([&]() {
        try {
            CryptApi api(nullptr, config);
            auto key = loadBlock(signKey, BlockKind::PrivateKey);
            if (!key.ok()) {
                utils::GetLogger().Error("Error loading key: " + key.error().what());
                exitCode = 1;
                return;
            }

            auto [pass, passErr] = keyPassphrase(retriever, key.value());
            if (passErr.hasError()) {
                utils::GetLogger().Error("Error getting passphrase: " + passErr.what());
                exitCode = 1;
                return;
            }

            if (signEmbedded) {
                auto blocks = loadBlocks(signInput);
                if (!blocks.ok()) {
                    utils::GetLogger().Error("Error reading input: " + blocks.error().what());
                    exitCode = 1;
                    return;
                }
                auto signature = api.SignEmbedded(key.value(), blocks.value(), pass, signNext);
                utils::Cleanse(pass);
                if (!signature.ok()) {
                    utils::GetLogger().Error("Error signing: " + signature.error().what());
                    exitCode = 1;
                    return;
                }
                std::cout << signature.value().ToString() << blocks.value().ToString();
                return;
            }

            auto content = utils::ReadFile(signInput);
            if (!content.ok()) {
                utils::GetLogger().Error("Error reading input: " + content.error().what());
                exitCode = 1;
                return;
            }
            auto signature = api.Sign(key.value(), content.value(), pass);
            utils::Cleanse(pass);
            if (!signature.ok()) {
                utils::GetLogger().Error("Error signing: " + signature.error().what());
                exitCode = 1;
                return;
            }
            std::cout << signature.value().ToString();
        } catch (const std::exception& e) {
            utils::GetLogger().Error("Error: " + std::string(e.what()));
            exitCode = 1;
        }
    });

    // validate 命令
    auto validate = app.add_subcommand("validate", "Validate a detached signature");
    std::string validateKey;
    std::string validateSignature;
    std::string validateInput;

    validate->add_option("-k,--key", validateKey, "Public key file")->required();
    validate->add_option("-s,--signature", validateSignature, "Signature file")->required();
    validate->add_option("input", validateInput, "Signed file")->required();

    validate->callback([&]() {
        try {
            CryptApi api(nullptr, config);
            auto key = loadBlock(validateKey, BlockKind::PublicKey);
            if (!key.ok()) {
                utils::GetLogger().Error("Error loading key: " + key.error().what());
                exitCode = 1;
                return;
            }
            auto signature = loadBlock(validateSignature, BlockKind::Signature);
            if (!signature.ok()) {
                utils::GetLogger().Error("Error reading signature: " + signature.error().what());
                exitCode = 1;
                return;
            }
            auto content = utils::ReadFile(validateInput);
            if (!content.ok()) {
                utils::GetLogger().Error("Error reading input: " + content.error().what());
                exitCode = 1;
                return;
            }

            auto valid = api.Validate(key.value(), content.value(), signature.value());
            if (!valid.ok()) {
                utils::GetLogger().Error("Error validating: " + valid.error().what());
                exitCode = 1;
                return;
            }
            std::cout << (valid.value() ? "valid" : "invalid") << std::endl;
            if (!valid.value()) {
                exitCode = 2;
            }
        } catch (const std::exception& e) {
            utils::GetLogger().Error("Error: " + std::string(e.what()));
            exitCode = 1;
        }
    });

    // process 命令
    auto process = app.add_subcommand("process", "Interpret a block document");
    std::string processInput;
    std::vector<std::string> processKeys;
    bool showSecrets = false;

    process->add_option("input", processInput, "Block document")->required();
    process->add_option("-k,--keys", processKeys, "Key files to load, can be given several times");
    process->add_flag("--show-secrets", showSecrets, "Print decrypted content");

    process->callback([&]() {
        try {
            CryptApi api(nullptr, config);
            context::KeyRingContext ctx(retriever);
            if (showSecrets) {
                ctx.SetSecretHandler([](const Block& block, const crypto::SecureString& secret) {
                    std::cout << "secret from " << block.Describe() << ":" << std::endl;
                    std::cout.write(secret.Data(), secret.Size());
                    std::cout << std::endl;
                });
            }

            for (const auto& path : processKeys) {
                auto blocks = loadBlocks(path);
                if (!blocks.ok()) {
                    utils::GetLogger().Error("Error loading keys: " + blocks.error().what(),
                        utils::LogContext().With("file", path));
                    exitCode = 1;
                    return;
                }
                for (const auto& block : blocks.value()) {
                    Error err = ctx.AddKey(block);
                    if (err.hasError()) {
                        utils::GetLogger().Warn("Skipping block: " + err.what(),
                            utils::LogContext().With("file", path));
                    }
                }
            }

            auto blocks = loadBlocks(processInput);
            if (!blocks.ok()) {
                utils::GetLogger().Error("Error reading input: " + blocks.error().what());
                exitCode = 1;
                return;
            }

            BlockList document = blocks.value();
            Error err = api.ProcessBlocks(ctx, document);

            std::cout << "blocks: " << document.Size() << std::endl;
            std::cout << "secrets: " << ctx.SecretCount() << std::endl;
            printList("validated", ctx.Validated());
            printList("hashes", ctx.Hashes());
            printList("missing keys", ctx.MissingKeys());

            if (err.hasError()) {
                std::cout << "failed: " << errorCodeToString(err.code()) << ": " << err.what();
                if (!err.block().empty()) {
                    std::cout << " (" << err.block() << ")";
                }
                std::cout << std::endl;
                exitCode = 2;
            }
        } catch (const std::exception& e) {
            utils::GetLogger().Error("Error: " + std::string(e.what()));
            exitCode = 1;
        }
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    return exitCode;
}
