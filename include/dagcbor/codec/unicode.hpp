#pragma once

#include "dagcbor/codec/types.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace dagcbor::codec {

/**
 * @brief UTF-8 非法字节区间 [start, end) 及原因。
 *
 * reason 取值："invalid start byte" / "invalid continuation byte" / "unexpected end of data"。
 */
struct Utf8Error final {
  std::size_t start{0};
  std::size_t end{0};
  const char* reason{""};
};

/**
 * @brief 严格 UTF-8 校验（拒绝超长编码、代理区码点与 U+10FFFF 以上码点）。
 *
 * 合法时返回 std::nullopt；否则返回第一个非法区间。
 */
[[nodiscard]] std::optional<Utf8Error> validate_utf8(bytes_view bytes) noexcept;

[[nodiscard]] inline std::optional<Utf8Error> validate_utf8(std::string_view text) noexcept {
  return validate_utf8(bytes_view{reinterpret_cast<const byte*>(text.data()), text.size()});
}

// 可规范化文本的最大字节数（ICU 以 int32_t 表示长度）。
inline constexpr std::size_t kMaxNormalizeBytes = static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());

/**
 * @brief 对合法 UTF-8 文本做 Unicode 规范化（ICU Normalizer2）。
 *
 * form 为 none 时原样拷贝；超过 kMaxNormalizeBytes 或 ICU 失败时返回 core::errc::invalid_argument。
 */
std::error_code normalize(std::string_view text, Normalization form, std::string& out);

[[nodiscard]] const char* normalization_name(Normalization form) noexcept;

}  // namespace dagcbor::codec
