#include "blockcrypt/block/block_list.hpp"
#include "blockcrypt/block/pem_format.hpp"
#include <algorithm>

namespace blockcrypt {

Result<BlockList> BlockList::Parse(const std::string& text) {
    return format::ParseBlocks(text);
}

void BlockList::Insert(size_t position, const BlockList& other) {
    position = std::min(position, blocks_.size());
    blocks_.insert(blocks_.begin() + static_cast<std::ptrdiff_t>(position),
                   other.blocks_.begin(), other.blocks_.end());
}

std::string BlockList::ToString(size_t from, size_t to) const {
    to = std::min(to, blocks_.size());
    std::string result;
    for (size_t i = from; i < to; ++i) {
        result += blocks_[i].ToString();
    }
    return result;
}

} // namespace blockcrypt
