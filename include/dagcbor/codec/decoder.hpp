#pragma once

#include "dagcbor/codec/error.hpp"
#include "dagcbor/codec/stream.hpp"
#include "dagcbor/codec/types.hpp"
#include "dagcbor/core/common.hpp"
#include "dagcbor/ipld/value.hpp"

#include <cstddef>
#include <functional>
#include <system_error>

namespace dagcbor::codec {

/**
 * @brief 逐项解码回调：callback(item, num_bytes_read)。
 *
 * 以后序方式同步调用，每个数据项一次：
 * - 标量：头部 + 内容字节数
 * - List/Map：仅头部字节数（不含子项）
 * - Map 键：以 Text 报告，字节数为键的头部 + 内容
 * - Link：tag 头部 + 字节串头部 + 字节串内容（内部字节串不单独报告）
 */
using DecodeCallback = std::function<void(const ipld::Value& item, std::size_t num_bytes_read)>;

/**
 * @brief 解码选项。
 *
 * - allow_concat：只解码一个顶层数据项，不检查后续字节（可对同一字节源继续 decode）
 * - require_multicodec：输入必须以 'dag-cbor' multicodec 前缀（0x71）开头
 * - callback：逐项回调（用于字节统计等，不影响解码结果）
 * - normalize_strings：对解码出的 Text 与 Map 键做 Unicode 规范化
 * - max_depth：List/Map 的最大嵌套深度（超过返回 errc::nesting_too_deep）
 */
struct DecodeOptions final {
  bool allow_concat{false};
  bool require_multicodec{false};
  DecodeCallback callback{};
  Normalization normalize_strings{Normalization::none};
  std::size_t max_depth{core::kDefaultMaxDepth};
};

/**
 * @brief 从字节源严格解码一个顶层数据项。
 *
 * 失败时：
 * - 返回非零 error_code（codec::errc，或字节源的 I/O 错误）
 * - error 非空时填充结构化错误（多行诊断文本、出错位置与内层原因）
 * - out 保持不变
 */
std::error_code decode(ByteSource& source,
                       ipld::Value& out,
                       const DecodeOptions& options = {},
                       DecodeError* error = nullptr);

/**
 * @brief 从内存缓冲区严格解码一个顶层数据项（等价于对 MemorySource 调用 decode）。
 */
std::error_code decode(bytes_view in,
                       ipld::Value& out,
                       const DecodeOptions& options = {},
                       DecodeError* error = nullptr);

}  // namespace dagcbor::codec
