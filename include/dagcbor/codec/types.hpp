#pragma once

#include "dagcbor/core/common.hpp"

#include <cstddef>
#include <cstdint>

namespace dagcbor::codec {

using byte = dagcbor::core::byte;
using bytes_view = dagcbor::core::bytes_view;
using mutable_bytes_view = dagcbor::core::mutable_bytes_view;

/**
 * @brief 数据项头部的 3-bit 主类型（CBOR major type）。
 *
 * 头部首字节：
 * - 高 3 位：major_type
 * - 低 5 位：additional info（<24 为内嵌参数；24..27 表示后随 1/2/4/8 字节参数）
 */
enum class major_type : std::uint8_t {
  unsigned_integer = 0x0,
  negative_integer = 0x1,
  byte_string = 0x2,
  text_string = 0x3,
  array = 0x4,
  map = 0x5,
  tag = 0x6,
  simple_or_float = 0x7,
};

inline constexpr std::uint8_t kMaxInlineArgument = 23;
inline constexpr std::uint8_t kInfoOneByte = 24;
inline constexpr std::uint8_t kInfoTwoBytes = 25;
inline constexpr std::uint8_t kInfoFourBytes = 26;
inline constexpr std::uint8_t kInfoEightBytes = 27;

inline constexpr std::uint8_t kSimpleFalse = 20;
inline constexpr std::uint8_t kSimpleTrue = 21;
inline constexpr std::uint8_t kSimpleNull = 22;

// 唯一允许的 tag：CID 链接。
inline constexpr std::uint64_t kLinkTag = 42;

// CID 字节串的首字节：identity multibase 前缀。
inline constexpr byte kLinkMarker = 0x00;

// 'dag-cbor' 的 multicodec code。
inline constexpr std::uint64_t kDagCborMulticodec = 0x71;

[[nodiscard]] constexpr byte make_leading_byte(major_type type, std::uint8_t info) noexcept {
  return static_cast<byte>((static_cast<std::uint8_t>(type) << 5) | (info & 0x1Fu));
}

/**
 * @brief 可选的 Unicode 规范化方式（编码前/解码后对字符串应用）。
 *
 * 默认 none：规范化不属于线上格式的规范性约束，只作为调用方选项。
 */
enum class Normalization : std::uint8_t {
  none = 0,
  nfc = 1,
  nfkc = 2,
  nfd = 3,
  nfkd = 4,
};

}  // namespace dagcbor::codec
