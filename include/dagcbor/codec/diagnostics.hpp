#pragma once

#include "dagcbor/codec/error.hpp"
#include "dagcbor/codec/stream.hpp"
#include "dagcbor/codec/unicode.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

/**
 * @file diagnostics.hpp
 * @brief 解码错误的多行诊断文本（纯函数，仅在失败路径调用）。
 *
 * 文本格式示例（整数非最小编码）：
 *
 *   Integer 10 was encoded using 2 bytes, while 0 bytes would have been enough.
 *   At byte #0: 19000a
 *                 ^^^^ same as leading byte 0x0a
 *
 * - "At byte #N:" 行给出相关字节（最多 16 字节原样显示，更长时折叠为 "首字节...尾字节"
 *   并附加 "(last byte #M)"）；
 * - 第二行用 ^^ 标出具体负责的字节区间，后跟说明；
 * - 容器错误在自身的头部字节行之后，附上子错误文本（首行以 "\ " 开头，其余缩进两格）。
 *
 * 这里只依赖最近一两次读取的快照，不需要缓存完整输入。
 */
namespace dagcbor::codec::diag {

// 超过该长度的字节序列折叠显示。
inline constexpr std::size_t kTruncateBytes = 16;

/**
 * @brief 字节转小写十六进制（超过 kTruncateBytes 时折叠为 "xx...yy"）。
 */
[[nodiscard]] std::string bytes_to_hex(bytes_view bytes);

/**
 * @brief 字节标注行的选项。
 *
 * - start/end：在拼接后的快照字节中截取 [start, end)
 * - pad_start：在字节前填充的空位数（以字节为单位），用于与其它行对齐
 * - hl_start/hl_len：第二行高亮的字节区间（hl_len 缺省表示到末尾）
 * - dots：在字节后追加 "..."，表示后续还有内容
 */
struct LineOptions final {
  std::optional<std::string> details{};
  std::size_t start{0};
  std::optional<std::size_t> end{};
  std::size_t pad_start{0};
  std::size_t hl_start{0};
  std::optional<std::size_t> hl_len{};
  bool dots{false};
};

/**
 * @brief 将一个或多个（按顺序相邻的）快照渲染为一到两行字节标注。
 */
[[nodiscard]] std::vector<std::string> snapshot_lines(std::initializer_list<const StreamSnapshot*> snapshots,
                                                      const LineOptions& options = {});

/**
 * @brief 提取子错误文本并缩进（首行前缀 "\ "，其余前缀两个空格）。
 */
[[nodiscard]] std::vector<std::string> cause_lines(const DecodeError& cause);

[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines);

// 以下为各类解码错误的完整诊断文本。

// snapshots 中从 hl_start 开始的字节是本次不完整读取的结果（共 bytes_read 个）。
[[nodiscard]] std::string unexpected_eof(std::initializer_list<const StreamSnapshot*> snapshots,
                                         std::size_t hl_start,
                                         std::size_t bytes_read,
                                         std::string_view what,
                                         std::size_t expected);

[[nodiscard]] std::string invalid_additional_info(const StreamSnapshot& head,
                                                  std::uint8_t additional_info,
                                                  std::uint8_t major);

[[nodiscard]] std::string excessive_integer_size(const StreamSnapshot& head,
                                                 std::uint8_t major,
                                                 std::uint64_t argument,
                                                 std::size_t bytes_used,
                                                 std::size_t bytes_sufficient);

[[nodiscard]] std::string invalid_float(const StreamSnapshot& head, double value);

[[nodiscard]] std::string invalid_utf8(const StreamSnapshot& head,
                                       const StreamSnapshot& body,
                                       std::size_t length,
                                       const Utf8Error& error);

[[nodiscard]] std::string invalid_simple_value(const StreamSnapshot& head, std::uint8_t value);

[[nodiscard]] std::string list_item(const StreamSnapshot& list_head,
                                    std::size_t index,
                                    std::size_t length,
                                    const DecodeError& cause);

// item 取值 "key" 或 "value"。
[[nodiscard]] std::string map_item(const StreamSnapshot& map_head,
                                   std::string_view item,
                                   std::size_t index,
                                   std::size_t length,
                                   const DecodeError& cause);

[[nodiscard]] std::string key_type(const StreamSnapshot& key_head, std::uint8_t major);

[[nodiscard]] std::string duplicate_key(const StreamSnapshot& map_head,
                                        const StreamSnapshot& key_body,
                                        std::string_view key,
                                        std::size_t index,
                                        std::size_t length);

[[nodiscard]] std::string key_order(const StreamSnapshot& map_head,
                                    bytes_view key0,
                                    std::size_t index0,
                                    bytes_view key1,
                                    std::size_t index1,
                                    std::size_t length);

[[nodiscard]] std::string invalid_tag(const StreamSnapshot& head, std::uint64_t tag);

[[nodiscard]] std::string link_item(const StreamSnapshot& link_head, const DecodeError& cause);

[[nodiscard]] std::string link_payload_type(const StreamSnapshot& link_head,
                                            const StreamSnapshot& payload_head,
                                            std::uint8_t major);

[[nodiscard]] std::string link_marker(const StreamSnapshot& link_head,
                                      const StreamSnapshot& payload_head,
                                      const StreamSnapshot& payload);

[[nodiscard]] std::string trailing_data(const StreamSnapshot& next);

[[nodiscard]] std::string missing_framing(const StreamSnapshot& prefix, std::uint64_t expected_code);

[[nodiscard]] std::string nesting_too_deep(const StreamSnapshot& head, std::size_t max_depth);

[[nodiscard]] std::string normalization_failed(const StreamSnapshot& head, std::string_view form, std::size_t length);

[[nodiscard]] std::string io_error(const StreamSnapshot& curr, const std::error_code& ec);

}  // namespace dagcbor::codec::diag
