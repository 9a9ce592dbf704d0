#pragma once

#include "dagcbor/core/common.hpp"
#include "dagcbor/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dagcbor::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 把 "a2 61 61 0c ..." 形式的文本（测试向量、日志片段）解析为 bytes；
 * - 将编码结果以 hexdump 形式输出，便于逐字节核对数据项头部。
 */

struct HexDumpOptions final {
    // 每行字节数（0 按 16 处理）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};

    // 是否输出 ANSI 颜色控制码。
    bool enable_color{false};
};

[[nodiscard]] std::string hex_dump(dagcbor::core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 连续小写 16 进制（无分隔符），如 "a2616100"。
 */
[[nodiscard]] std::string to_hex(dagcbor::core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes（覆盖 out）。
 *
 * 忽略空白与常见分隔符（逗号、冒号、连字符等），以及 0x/0X 前缀；
 * 出现其它字符或 nibble 个数为奇数时返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<dagcbor::core::byte> &out) noexcept;

} // namespace dagcbor::utils
