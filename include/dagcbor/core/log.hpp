#pragma once

#include <cstdint>

namespace dagcbor::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 编解码失败时以 debug 级别记录错误码与位置，trace 级别额外输出输入的 hexdump；
 * - 业务侧可通过 set_log_level 调整全局日志级别；
 * - 业务侧若要接管输出，须在首次编解码前向 spdlog 注册名为 "dagcbor" 的 logger。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace dagcbor::core
