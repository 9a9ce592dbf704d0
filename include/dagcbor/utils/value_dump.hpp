#pragma once

#include "dagcbor/ipld/value.hpp"

#include <cstddef>
#include <string>

namespace dagcbor::utils {

/**
 * @brief IPLD Value 的可读化输出（调试/日志用途）。
 *
 * 输出示例（multiline=false）：
 *   map[2] {'a': 12, 'b': "hello!"}
 *   list[3] [null, true, bytes[2] 00ff]
 *   link(01711220...)
 *
 * 该输出不是任何标准文本格式，也不保证可逆；Map 按规范键序输出。
 */
struct ValueDumpOptions final {
    // 递归最大深度（0 表示只输出根节点，子项折叠为 "..."）。
    std::size_t max_depth{16};

    // List/Map 最大输出元素数（0 表示不限制）。
    std::size_t max_items{128};

    // Bytes/Text/Link 最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{256};

    // List/Map 是否使用多行缩进格式。
    bool multiline{true};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码。
    bool enable_color{false};
};

[[nodiscard]] std::string dump_value(const dagcbor::ipld::Value &value,
                                     ValueDumpOptions options = {});

} // namespace dagcbor::utils
