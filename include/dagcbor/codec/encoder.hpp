#pragma once

#include "dagcbor/codec/error.hpp"
#include "dagcbor/codec/sink.hpp"
#include "dagcbor/codec/types.hpp"
#include "dagcbor/core/common.hpp"
#include "dagcbor/ipld/value.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace dagcbor::codec {

/**
 * @brief 编码选项。
 *
 * - include_multicodec：输出前加 'dag-cbor' multicodec 前缀（0x71）
 * - normalize_strings：对 Text 与 Map 键先做 Unicode 规范化再编码
 * - max_depth：List/Map 的最大嵌套深度（超过返回 errc::nesting_too_deep）
 */
struct EncodeOptions final {
  bool include_multicodec{false};
  Normalization normalize_strings{Normalization::none};
  std::size_t max_depth{core::kDefaultMaxDepth};
};

/**
 * @brief 将 Value 规范编码并追加到 out。
 *
 * 失败时 out 恢复为调用前的长度；error 非空时填充结构化错误（含出错值的路径）。
 */
std::error_code encode(const ipld::Value& value,
                       std::vector<byte>& out,
                       const EncodeOptions& options = {},
                       EncodeError* error = nullptr);

/**
 * @brief 将 Value 规范编码写入 sink，成功时 written 为本次写入的字节数。
 *
 * 注意：失败时 sink 中可能已有部分输出（由调用方决定丢弃方式）。
 */
std::error_code encode_to(const ipld::Value& value,
                          ByteSink& sink,
                          std::size_t& written,
                          const EncodeOptions& options = {},
                          EncodeError* error = nullptr);

/**
 * @brief 计算规范编码的字节数（含可选的 multicodec 前缀），不产生输出。
 */
std::error_code encoded_size(const ipld::Value& value,
                             std::size_t& out_size,
                             const EncodeOptions& options = {},
                             EncodeError* error = nullptr);

}  // namespace dagcbor::codec
