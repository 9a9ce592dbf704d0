#pragma once

#include "dagcbor/codec/types.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

/**
 * @brief multicodec 前缀：unsigned varint（LEB128，每字节低 7 位，高位为延续标志）。
 *
 * 'dag-cbor' 的 code 为 0x71，对应单字节前缀 0x71。
 */
namespace dagcbor::codec::multicodec {

// varint 最长字节数（即 code 最多 63 位）。
inline constexpr std::size_t kMaxVarintBytes = 9;

/**
 * @brief 以最小长度编码 varint 并追加到 out。
 */
void encode_varint(std::uint64_t value, std::vector<byte>& out);

/**
 * @brief 从 in 开头解码一个 varint。
 *
 * - 输入在 varint 结束前耗尽：errc::unexpected_eof
 * - 非最小编码（末字节为 0x00 且不是首字节）或超出 kMaxVarintBytes：errc::missing_framing
 */
std::error_code decode_varint(bytes_view in, std::uint64_t& value, std::size_t& consumed) noexcept;

/**
 * @brief 追加 code 前缀与 payload 到 out。
 */
void wrap(std::uint64_t code, bytes_view payload, std::vector<byte>& out);

/**
 * @brief 拆分前缀，返回 code 与剩余 payload（视图指向 in 内部）。
 */
std::error_code unwrap(bytes_view in, std::uint64_t& code, bytes_view& payload) noexcept;

}  // namespace dagcbor::codec::multicodec
