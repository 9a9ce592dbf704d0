#pragma once

#include "dagcbor/ipld/path.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <system_error>

namespace dagcbor::codec {

/**
 * @brief 编解码错误码。
 *
 * 各错误码按 error_family 归类（见 default_error_condition）：
 * - format：通用线上格式错误（截断、头部非法、UTF-8 非法，以及容器包装错误）
 * - canonical_form：规范形式约束（非最小整数、非法 tag/简单值、键类型/重复/顺序、
 *   NaN/Infinity、尾随数据、缺少 multicodec 前缀、整数越界）
 * - resource：资源耗尽或输出失败（嵌套过深、输出缓冲区不足、文本无法规范化）
 */
enum class errc : int {
  ok = 0,

  unexpected_eof = 1,
  invalid_additional_info = 2,
  invalid_utf8 = 3,
  list_item = 4,
  map_key = 5,
  map_value = 6,
  link_item = 7,

  excessive_integer_size = 20,
  invalid_simple_value = 21,
  disallowed_float = 22,
  key_type = 23,
  duplicate_key = 24,
  key_order = 25,
  invalid_tag = 26,
  link_payload_type = 27,
  link_marker = 28,
  trailing_data = 29,
  missing_framing = 30,
  integer_range = 31,

  nesting_too_deep = 40,
  buffer_overflow = 41,
  normalization_failed = 42,
};

/**
 * @brief 错误族（std::error_condition），用于按类别判断：ec == error_family::canonical_form。
 */
enum class error_family : int {
  format = 1,
  canonical_form = 2,
  resource = 3,
};

const std::error_category& error_category() noexcept;
const std::error_category& family_category() noexcept;
std::error_code make_error_code(errc e) noexcept;
std::error_condition make_error_condition(error_family f) noexcept;

/**
 * @brief 解码错误的结构化描述。
 *
 * - code：具体错误码
 * - message：多行诊断文本（首行为概述，随后是 "At byte #N: ..." 字节标注行；
 *   容器错误还会包含子错误的缩进文本）
 * - position：出错数据项在流中的起始字节位置
 * - cause：容器/链接包装错误时的内层错误（不可变，可共享）
 */
struct DecodeError final {
  std::error_code code{};
  std::string message{};
  std::size_t position{0};
  std::shared_ptr<const DecodeError> cause{};

  // 沿 cause 链找到最内层错误（无 cause 时返回自身）。
  [[nodiscard]] const DecodeError& root_cause() const noexcept;
};

/**
 * @brief 编码错误的结构化描述（path 为出错值在输入树中的位置）。
 */
struct EncodeError final {
  std::error_code code{};
  std::string message{};
  dagcbor::ipld::ObjPath path{};
};

}  // namespace dagcbor::codec

namespace std {
template <>
struct is_error_code_enum<dagcbor::codec::errc> : true_type {};
template <>
struct is_error_condition_enum<dagcbor::codec::error_family> : true_type {};
}  // namespace std
