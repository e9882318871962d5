#include "blockcrypt/block/pem_format.hpp"
#include "blockcrypt/utils/tools.hpp"
#include <sstream>
#include <stdexcept>

namespace blockcrypt {
namespace format {

namespace {

const std::string BEGIN_PREFIX = "-----BEGIN ";
const std::string END_PREFIX = "-----END ";
const std::string MARKER_SUFFIX = "-----";

// 解析 "-----BEGIN NAME-----" / "-----END NAME-----"，不匹配时返回 false
bool parseMarker(const std::string& line, const std::string& prefix, std::string& name) {
    if (line.size() < prefix.size() + MARKER_SUFFIX.size() ||
        line.compare(0, prefix.size(), prefix) != 0 ||
        line.compare(line.size() - MARKER_SUFFIX.size(), MARKER_SUFFIX.size(), MARKER_SUFFIX) != 0) {
        return false;
    }
    name = line.substr(prefix.size(), line.size() - prefix.size() - MARKER_SUFFIX.size());
    return !name.empty();
}

} // namespace

std::string RenderBlock(const Block& block) {
    std::ostringstream ss;
    ss << BEGIN_PREFIX << block.Name() << MARKER_SUFFIX << "\n";
    for (const auto& [key, value] : block.Properties()) {
        ss << key << ": " << value << "\n";
    }
    ss << "\n";

    std::string body = utils::Base64Encode(block.Payload());
    for (size_t off = 0; off < body.size(); off += PEM_LINE_WIDTH) {
        ss << body.substr(off, PEM_LINE_WIDTH) << "\n";
    }
    ss << END_PREFIX << block.Name() << MARKER_SUFFIX << "\n";
    return ss.str();
}

Result<BlockList> ParseBlocks(const std::string& text) {
    BlockList list;
    std::istringstream in(text);
    std::string line;
    size_t lineNo = 0;

    bool inBlock = false;
    bool inHeader = false;
    std::string name;
    std::string body;
    Block current;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!inBlock) {
            // 块之外的文本忽略
            std::string beginName;
            if (parseMarker(line, BEGIN_PREFIX, beginName)) {
                inBlock = true;
                inHeader = true;
                name = beginName;
                body.clear();
                current = Block(name);
            }
            continue;
        }

        std::string markerName;
        if (parseMarker(line, END_PREFIX, markerName)) {
            if (markerName != name) {
                return Error(ErrorCode::InvalidFormat,
                             "END " + markerName + " does not match BEGIN " + name +
                             " at line " + std::to_string(lineNo));
            }
            try {
                current.SetPayload(utils::Base64Decode(body));
            } catch (const std::exception& e) {
                return Error(ErrorCode::InvalidFormat,
                             "invalid payload in block " + name + ": " + e.what());
            }
            list.Add(current);
            inBlock = false;
            continue;
        }
        if (parseMarker(line, BEGIN_PREFIX, markerName)) {
            return Error(ErrorCode::InvalidFormat,
                         "nested BEGIN " + markerName + " inside block " + name +
                         " at line " + std::to_string(lineNo));
        }

        if (inHeader) {
            if (line.empty()) {
                inHeader = false;
                continue;
            }
            size_t colon = line.find(':');
            if (colon != std::string::npos) {
                std::string key = line.substr(0, colon);
                std::string value = line.substr(colon + 1);
                if (!value.empty() && value[0] == ' ') {
                    value.erase(0, 1);
                }
                current.Set(key, value);
                continue;
            }
            // 没有属性头，直接是负载
            inHeader = false;
        }
        body += line;
    }

    if (inBlock) {
        return Error(ErrorCode::InvalidFormat, "unterminated block " + name);
    }
    return list;
}

} // namespace format
} // namespace blockcrypt
