#pragma once

#include <system_error>

namespace dagcbor::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有可能失败的接口返回 std::error_code，输出通过引用参数给出；
 * - io_error 用于描述底层字节源/字节汇的读写失败（具体原因见日志）。
 */
enum class errc : int {
  ok = 0,
  buffer_overflow = 1,
  invalid_argument = 2,
  io_error = 3,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace dagcbor::core

namespace std {
template <>
struct is_error_code_enum<dagcbor::core::errc> : true_type {};
}  // namespace std
