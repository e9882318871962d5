#include "blockcrypt/passRetriever/passRetriever.hpp"
#include "blockcrypt/utils/tools.hpp"
#include <iostream>
#include <unistd.h>
#include <termios.h>

namespace blockcrypt {
namespace passphrase {

BoundRetriever::BoundRetriever(std::istream* in, std::ostream* out,
                               const std::map<std::string, std::string>& aliasMap)
    : in_(in), out_(out), aliasMap_(aliasMap) {
    if (!in_) in_ = &std::cin;
    if (!out_) out_ = &std::cerr;
}

BoundRetriever::~BoundRetriever() {
    for (auto& entry : passphraseCache_) {
        utils::Cleanse(entry.second);
    }
}

std::tuple<std::string, bool, Error> BoundRetriever::getPassphrase(
    const std::string& keyId,
    const std::string& alias,
    bool createNew,
    int numAttempts) {

    if (numAttempts == 0) {
        if (createNew) {
            *out_ << NEW_PRIVATE_KEY_WARNING << std::endl;
        }

        // 检查缓存
        auto it = passphraseCache_.find(keyId);
        if (it != passphraseCache_.end()) {
            return std::make_tuple(it->second, false, Error());
        }
    } else if (!createNew) { // numAttempts > 0 and not creating new
        if (numAttempts > MAX_PASSPHRASE_ATTEMPTS) {
            return std::make_tuple("", true, Error("Too many attempts"));
        }
        // 上次的口令不对，不再使用缓存
        auto it = passphraseCache_.find(keyId);
        if (it != passphraseCache_.end()) {
            utils::Cleanse(it->second);
            passphraseCache_.erase(it);
        }
        *out_ << "Passphrase incorrect. Please retry." << std::endl;
    }

    return requestPassphrase(keyId, alias, createNew);
}

std::tuple<std::string, bool, Error> BoundRetriever::requestPassphrase(
    const std::string& keyId,
    const std::string& alias,
    bool createNew) {

    std::string displayAlias = alias.empty() ? "private" : alias;
    auto it = aliasMap_.find(alias);
    if (it != aliasMap_.end()) {
        displayAlias = it->second;
    }

    std::string shortId = formatKeyId(keyId);
    std::string withID = shortId.empty() ? "" : " with ID " + shortId;

    if (createNew) {
        *out_ << "Enter passphrase for new " << displayAlias << " key" << withID << ": ";
    } else {
        *out_ << "Enter passphrase for " << displayAlias << " key" << withID << ": ";
    }
    out_->flush();

    auto [passphrase, err] = GetPassphrase(in_);
    *out_ << std::endl;

    if (err.hasError()) {
        return std::make_tuple("", false, err);
    }

    std::string retPass = utils::TrimSpace(passphrase);
    utils::Cleanse(passphrase);

    if (createNew) {
        Error verifyErr = verifyAndConfirmPassword(retPass, displayAlias, withID);
        if (verifyErr.hasError()) {
            utils::Cleanse(retPass);
            return std::make_tuple("", false, verifyErr);
        }
    }

    cachePassword(keyId, retPass);

    return std::make_tuple(retPass, false, Error());
}

Error BoundRetriever::verifyAndConfirmPassword(
    const std::string& retPass,
    const std::string& displayAlias,
    const std::string& withID) {

    if (retPass.length() < MIN_PASSPHRASE_LENGTH) {
        *out_ << "Passphrase is too short. Please use a password manager to generate and store a good random passphrase." << std::endl;
        return Error("Passphrase too short");
    }

    *out_ << "Repeat passphrase for new " << displayAlias << " key" << withID << ": ";
    out_->flush();

    auto [confirmation, err] = GetPassphrase(in_);
    *out_ << std::endl;

    if (err.hasError()) {
        return err;
    }

    std::string confirmationStr = utils::TrimSpace(confirmation);
    utils::Cleanse(confirmation);
    bool match = retPass == confirmationStr;
    utils::Cleanse(confirmationStr);

    if (!match) {
        *out_ << "Passphrases do not match. Please retry." << std::endl;
        return Error("Passphrases do not match");
    }

    return Error();
}

void BoundRetriever::cachePassword(const std::string& keyId, const std::string& retPass) {
    if (keyId.empty()) return;
    passphraseCache_[keyId] = retPass;
}

std::string BoundRetriever::formatKeyId(const std::string& keyId) const {
    if (keyId.length() > static_cast<size_t>(ID_BYTES_TO_DISPLAY)) {
        return keyId.substr(0, ID_BYTES_TO_DISPLAY);
    }
    return keyId;
}

PassRetriever PromptRetriever(const std::map<std::string, std::string>& aliasMap) {
    if (!IsTerminal(STDIN_FILENO)) {
        return [](const std::string&, const std::string&, bool, int) -> std::tuple<std::string, bool, Error> {
            return std::make_tuple("", true, Error("No input available"));
        };
    }
    return PromptRetrieverWithInOut(&std::cin, &std::cerr, aliasMap);
}

PassRetriever PromptRetrieverWithInOut(
    std::istream* in,
    std::ostream* out,
    const std::map<std::string, std::string>& aliasMap) {

    auto bound = std::make_shared<BoundRetriever>(in, out, aliasMap);

    return [bound](const std::string& keyId, const std::string& alias,
                   bool createNew, int numAttempts) -> std::tuple<std::string, bool, Error> {
        return bound->getPassphrase(keyId, alias, createNew, numAttempts);
    };
}

PassRetriever ConstantRetriever(const std::string& constantPassphrase) {
    return [constantPassphrase](const std::string&, const std::string&, bool, int) -> std::tuple<std::string, bool, Error> {
        return std::make_tuple(constantPassphrase, false, Error());
    };
}

std::tuple<std::string, Error> GetPassphrase(std::istream* in) {
    if (!in) in = &std::cin;

    std::string passphrase;

    if (in == &std::cin && IsTerminal(STDIN_FILENO)) {
        // 在终端中，禁用回显
        struct termios oldTermios, newTermios;
        if (tcgetattr(STDIN_FILENO, &oldTermios) != 0) {
            return std::make_tuple("", Error("Failed to read terminal attributes"));
        }
        newTermios = oldTermios;
        newTermios.c_lflag &= ~(ECHO | ECHOE | ECHOK | ECHONL);
        tcsetattr(STDIN_FILENO, TCSANOW, &newTermios);

        std::getline(*in, passphrase);

        // 恢复终端设置
        tcsetattr(STDIN_FILENO, TCSANOW, &oldTermios);
    } else {
        std::getline(*in, passphrase);
    }

    if (in->fail() && !in->eof()) {
        return std::make_tuple("", Error("Failed to read passphrase"));
    }

    return std::make_tuple(passphrase, Error());
}

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

} // namespace passphrase
} // namespace blockcrypt
