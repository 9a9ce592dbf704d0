#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace dagcbor::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 编解码默认的最大嵌套深度（List/Map）。
inline constexpr std::size_t kDefaultMaxDepth = 256;

}  // 命名空间 dagcbor::core
