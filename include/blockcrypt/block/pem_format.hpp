#pragma once

#include <string>
#include "blockcrypt/block/block.hpp"
#include "blockcrypt/block/block_list.hpp"
#include "blockcrypt/types.hpp"

namespace blockcrypt {
namespace format {

// 块文本格式：
//
//   -----BEGIN <NAME>-----
//   Key: value            (属性按键名排序)
//
//   <base64 负载，每行 64 列>
//   -----END <NAME>-----
//
// 块之外的文本被忽略。

constexpr size_t PEM_LINE_WIDTH = 64;

std::string RenderBlock(const Block& block);

Result<BlockList> ParseBlocks(const std::string& text);

} // namespace format
} // namespace blockcrypt
