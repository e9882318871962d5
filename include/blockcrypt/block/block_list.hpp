#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "blockcrypt/block/block.hpp"
#include "blockcrypt/types.hpp"

namespace blockcrypt {

// 有序、可按下标访问、可修改的块序列
// 同一时间只能被一次解释过程持有，不支持并发修改
class BlockList {
public:
    BlockList() = default;
    explicit BlockList(std::vector<Block> blocks) : blocks_(std::move(blocks)) {}

    // 解析块文本
    static Result<BlockList> Parse(const std::string& text);

    size_t Size() const { return blocks_.size(); }
    bool Empty() const { return blocks_.empty(); }

    // 越界时抛出 std::out_of_range
    Block& Get(size_t index) { return blocks_.at(index); }
    const Block& Get(size_t index) const { return blocks_.at(index); }

    void Add(const Block& block) { blocks_.push_back(block); }

    // 在 position 处插入另一个列表，之后的元素顺移
    void Insert(size_t position, const BlockList& other);

    std::string ToString() const { return ToString(0, blocks_.size()); }

    // 渲染 [from, to) 范围内的块，to 超出长度时截到末尾
    std::string ToString(size_t from, size_t to) const;

    std::vector<Block>::iterator begin() { return blocks_.begin(); }
    std::vector<Block>::iterator end() { return blocks_.end(); }
    std::vector<Block>::const_iterator begin() const { return blocks_.begin(); }
    std::vector<Block>::const_iterator end() const { return blocks_.end(); }

    bool operator==(const BlockList& other) const { return blocks_ == other.blocks_; }
    bool operator!=(const BlockList& other) const { return !(*this == other); }

private:
    std::vector<Block> blocks_;
};

} // namespace blockcrypt
