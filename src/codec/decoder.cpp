#include "dagcbor/codec/decoder.hpp"

#include "dagcbor/codec/diagnostics.hpp"
#include "dagcbor/codec/multicodec.hpp"
#include "dagcbor/codec/unicode.hpp"
#include "dagcbor/utils/hex.hpp"

#include "../core/log_internal.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace dagcbor::codec {
namespace {

using ipld::Value;

// 恶意长度字段下的预分配上限。
constexpr std::size_t kMaxReserve = 1024;

struct Head final {
  major_type type{major_type::unsigned_integer};
  std::uint8_t info{0};
  std::uint64_t argument{0};
  bool is_float{false};
  double float_value{0.0};
};

constexpr std::size_t minimal_width(std::uint64_t arg) noexcept {
  if (arg <= kMaxInlineArgument) {
    return 0;
  }
  if (arg <= 0xFFu) {
    return 1;
  }
  if (arg <= 0xFFFFu) {
    return 2;
  }
  if (arg <= 0xFFFFFFFFu) {
    return 4;
  }
  return 8;
}

[[nodiscard]] std::uint8_t major_bits(major_type type) noexcept {
  return static_cast<std::uint8_t>(type);
}

/**
 * @brief 单个顶层数据项的递归下降解码器（持有 Stream，不回溯）。
 *
 * 所有失败路径都通过 fail()/wrap() 填充 DecodeError：
 * - fail：当前数据项自身的错误
 * - wrap：子项错误包装为容器错误（I/O 错误不包装，原样向上传递）
 */
class Decoder final {
 public:
  Decoder(Stream& stream, const DecodeOptions& options) noexcept : stream_(stream), options_(options) {}

  std::error_code decode_top_level(Value& out, DecodeError& err) {
    if (options_.require_multicodec) {
      auto ec = read_framing(err);
      if (ec) {
        return ec;
      }
    }
    auto ec = decode_item(0, out, err);
    if (ec) {
      return ec;
    }
    if (options_.allow_concat) {
      return {};
    }
    // 只探测 1 个字节：不会把字节源中的剩余内容全部读出。
    bytes_view next;
    ec = stream_.read_fresh(1, next);
    if (ec) {
      return io_failure(ec, err);
    }
    if (!next.empty()) {
      return fail(err, errc::trailing_data, diag::trailing_data(stream_.current()),
                  stream_.current().latest_read_start());
    }
    return {};
  }

  std::error_code decode_item(std::size_t depth, Value& out, DecodeError& err) {
    Head head;
    auto ec = read_head(head, err);
    if (ec) {
      return ec;
    }
    const std::size_t head_size = stream_.current().latest_read_size();

    switch (head.type) {
      case major_type::unsigned_integer:
        out = Value(ipld::Integer::from_uint64(head.argument));
        report(out, head_size);
        return {};
      case major_type::negative_integer:
        out = Value(ipld::Integer::negative(head.argument));
        report(out, head_size);
        return {};
      case major_type::byte_string: {
        bytes_view body;
        ec = read_body(head.argument, "bytestring", body, err);
        if (ec) {
          return ec;
        }
        out = Value::bytes(std::vector<byte>(body.begin(), body.end()));
        report(out, head_size + body.size());
        return {};
      }
      case major_type::text_string: {
        std::string text;
        ec = read_text(head.argument, text, nullptr, err);
        if (ec) {
          return ec;
        }
        out = Value::text(std::move(text));
        report(out, head_size + static_cast<std::size_t>(head.argument));
        return {};
      }
      case major_type::array:
        return decode_list(head, depth, out, err);
      case major_type::map:
        return decode_map(head, depth, out, err);
      case major_type::tag:
        return decode_link(head, out, err);
      case major_type::simple_or_float:
        return decode_simple(head, out, err);
    }
    return fail(err, errc::invalid_additional_info,
                diag::invalid_additional_info(stream_.current(), head.info, major_bits(head.type)), item_start());
  }

 private:
  [[nodiscard]] std::size_t item_start() const noexcept { return stream_.current().latest_read_start(); }

  void report(const Value& value, std::size_t num_bytes) const {
    if (options_.callback) {
      options_.callback(value, num_bytes);
    }
  }

  std::error_code fail(DecodeError& err, std::error_code code, std::string message, std::size_t position) const {
    err.code = code;
    err.message = std::move(message);
    err.position = position;
    err.cause.reset();
    return err.code;
  }

  std::error_code fail(DecodeError& err, errc e, std::string message, std::size_t position) const {
    return fail(err, make_error_code(e), std::move(message), position);
  }

  // err 中已有子项错误；message 须在调用前基于子项错误构造完成。
  std::error_code wrap(DecodeError& err, errc e, std::string message, std::size_t position) const {
    auto cause = std::make_shared<const DecodeError>(std::move(err));
    err = DecodeError{};
    err.code = make_error_code(e);
    err.message = std::move(message);
    err.position = position;
    err.cause = std::move(cause);
    return err.code;
  }

  [[nodiscard]] static bool is_wrappable(const DecodeError& err) noexcept {
    return err.code.category() == error_category();
  }

  std::error_code io_failure(std::error_code ec, DecodeError& err) const {
    return fail(err, ec, diag::io_error(stream_.current(), ec), stream_.position());
  }

  std::error_code read_framing(DecodeError& err) {
    bytes_view got;
    auto ec = stream_.read_fresh(1, got);
    while (!ec && !got.empty() && (got.back() & 0x80u) != 0 &&
           stream_.current().latest_read_size() < multicodec::kMaxVarintBytes) {
      ec = stream_.read_extend(1, got);
    }
    if (ec) {
      return io_failure(ec, err);
    }
    const auto& prefix = stream_.current();
    const auto prefix_bytes = prefix.latest_read();
    if (got.empty()) {
      return fail(err, errc::unexpected_eof,
                  diag::unexpected_eof({&prefix}, 0, prefix.latest_read_size(), "multicodec code",
                                       prefix.latest_read_size() + 1),
                  prefix.latest_read_start());
    }
    std::uint64_t code = 0;
    std::size_t consumed = 0;
    ec = multicodec::decode_varint(prefix_bytes, code, consumed);
    if (ec || code != kDagCborMulticodec) {
      return fail(err, errc::missing_framing, diag::missing_framing(prefix, kDagCborMulticodec),
                  prefix.latest_read_start());
    }
    return {};
  }

  std::error_code read_head(Head& head, DecodeError& err) {
    bytes_view got;
    auto ec = stream_.read_fresh(1, got);
    if (ec) {
      return io_failure(ec, err);
    }
    if (got.empty()) {
      return fail(err, errc::unexpected_eof,
                  diag::unexpected_eof({&stream_.current()}, 0, 0, "leading byte of data item head", 1),
                  stream_.position());
    }
    const byte leading = got[0];
    head.type = static_cast<major_type>(leading >> 5);
    head.info = static_cast<std::uint8_t>(leading & 0x1Fu);
    if (head.info <= kMaxInlineArgument) {
      head.argument = head.info;
      return {};
    }
    if (head.info > kInfoEightBytes ||
        (head.type == major_type::simple_or_float && head.info != kInfoEightBytes)) {
      return fail(err, errc::invalid_additional_info,
                  diag::invalid_additional_info(stream_.current(), head.info, major_bits(head.type)), item_start());
    }

    const std::size_t width = std::size_t{1} << (head.info - kInfoOneByte);
    ec = stream_.read_extend(width, got);
    if (ec) {
      return io_failure(ec, err);
    }
    if (got.size() < width) {
      return fail(err, errc::unexpected_eof,
                  diag::unexpected_eof({&stream_.current()}, 1, got.size(),
                                       std::to_string(width) + " byte argument of data item head", width),
                  item_start());
    }
    std::uint64_t arg = 0;
    for (byte b : got) {
      arg = (arg << 8) | b;
    }
    head.argument = arg;

    if (head.type == major_type::simple_or_float) {
      head.is_float = true;
      head.float_value = std::bit_cast<double>(arg);
      return {};
    }
    const auto sufficient = minimal_width(arg);
    if (sufficient < width) {
      return fail(err, errc::excessive_integer_size,
                  diag::excessive_integer_size(stream_.current(), major_bits(head.type), arg, width, sufficient),
                  item_start());
    }
    return {};
  }

  // 读取恰好 length 字节的字符串内容；previous 快照为其头部。
  std::error_code read_body(std::uint64_t length, const char* what, bytes_view& body, DecodeError& err) {
    const auto n = static_cast<std::size_t>(length);
    auto ec = stream_.read_fresh(n, body);
    if (ec) {
      return io_failure(ec, err);
    }
    if (body.size() < n) {
      const auto& head = stream_.previous();
      return fail(err, errc::unexpected_eof,
                  diag::unexpected_eof({&head, &stream_.current()}, head.latest_read_size(), body.size(),
                                       std::to_string(n) + " bytes of " + what, n),
                  head.latest_read_start());
    }
    return {};
  }

  // 读取并校验 UTF-8 文本；raw 非空时保存规范化前的原始字节（键序检查使用）。
  std::error_code read_text(std::uint64_t length, std::string& text, std::string* raw, DecodeError& err) {
    bytes_view body;
    auto ec = read_body(length, "string", body, err);
    if (ec) {
      return ec;
    }
    if (const auto bad = validate_utf8(body)) {
      const auto& head = stream_.previous();
      return fail(err, errc::invalid_utf8, diag::invalid_utf8(head, stream_.current(), body.size(), *bad),
                  head.latest_read_start());
    }
    text.assign(reinterpret_cast<const char*>(body.data()), body.size());
    if (raw != nullptr) {
      *raw = text;
    }
    if (options_.normalize_strings != Normalization::none) {
      std::string normalized;
      ec = normalize(text, options_.normalize_strings, normalized);
      if (ec) {
        const auto& head = stream_.previous();
        return fail(err, errc::normalization_failed,
                    diag::normalization_failed(head, normalization_name(options_.normalize_strings), body.size()),
                    head.latest_read_start());
      }
      text = std::move(normalized);
    }
    return {};
  }

  std::error_code check_depth(std::size_t depth, DecodeError& err) const {
    if (depth >= options_.max_depth) {
      return fail(err, errc::nesting_too_deep, diag::nesting_too_deep(stream_.current(), options_.max_depth),
                  item_start());
    }
    return {};
  }

  std::error_code decode_list(const Head& head, std::size_t depth, Value& out, DecodeError& err) {
    auto ec = check_depth(depth, err);
    if (ec) {
      return ec;
    }
    const StreamSnapshot list_head = stream_.current();
    const auto length = static_cast<std::size_t>(head.argument);

    ipld::List items;
    items.reserve(std::min(length, kMaxReserve));
    for (std::size_t i = 0; i < length; ++i) {
      Value child = Value::null();  // 占位，后续会被覆盖
      ec = decode_item(depth + 1, child, err);
      if (ec) {
        if (!is_wrappable(err)) {
          return ec;
        }
        return wrap(err, errc::list_item, diag::list_item(list_head, i, length, err), list_head.latest_read_start());
      }
      items.push_back(std::move(child));
    }
    out = Value(std::move(items));
    report(out, list_head.latest_read_size());
    return {};
  }

  std::error_code decode_key(std::string& key, std::string& raw, DecodeError& err) {
    Head head;
    auto ec = read_head(head, err);
    if (ec) {
      return ec;
    }
    if (head.type != major_type::text_string) {
      return fail(err, errc::key_type, diag::key_type(stream_.current(), major_bits(head.type)), item_start());
    }
    const std::size_t head_size = stream_.current().latest_read_size();
    ec = read_text(head.argument, key, &raw, err);
    if (ec) {
      return ec;
    }
    if (options_.callback) {
      report(Value::text(key), head_size + raw.size());
    }
    return {};
  }

  std::error_code decode_map(const Head& head, std::size_t depth, Value& out, DecodeError& err) {
    auto ec = check_depth(depth, err);
    if (ec) {
      return ec;
    }
    const StreamSnapshot map_head = stream_.current();
    const auto length = static_cast<std::size_t>(head.argument);

    // 先按到达顺序收集，校验键序后再一次性构建 Map。
    std::vector<ipld::MapEntry> entries;
    std::vector<std::string> raw_keys;
    std::unordered_set<std::string> seen;
    entries.reserve(std::min(length, kMaxReserve));
    raw_keys.reserve(std::min(length, kMaxReserve));
    seen.reserve(std::min(length, kMaxReserve));
    for (std::size_t i = 0; i < length; ++i) {
      std::string key;
      std::string raw;
      ec = decode_key(key, raw, err);
      if (ec) {
        if (!is_wrappable(err)) {
          return ec;
        }
        return wrap(err, errc::map_key, diag::map_item(map_head, "key", i, length, err),
                    map_head.latest_read_start());
      }
      if (!seen.insert(key).second) {
        return fail(err, errc::duplicate_key, diag::duplicate_key(map_head, stream_.current(), key, i, length),
                    map_head.latest_read_start());
      }

      Value value = Value::null();  // 占位，后续会被覆盖
      ec = decode_item(depth + 1, value, err);
      if (ec) {
        if (!is_wrappable(err)) {
          return ec;
        }
        return wrap(err, errc::map_value, diag::map_item(map_head, "value", i, length, err),
                    map_head.latest_read_start());
      }
      entries.push_back(ipld::MapEntry{std::move(key), std::move(value)});
      raw_keys.push_back(std::move(raw));
    }

    // 键序按线上原始字节检查（与规范化无关）。
    std::vector<std::string> sorted = raw_keys;
    std::sort(sorted.begin(), sorted.end(), [](const std::string& a, const std::string& b) {
      return ipld::canonical_key_less(a, b);
    });
    const auto mismatch = std::mismatch(raw_keys.begin(), raw_keys.end(), sorted.begin());
    if (mismatch.first != raw_keys.end()) {
      const auto idx0 = static_cast<std::size_t>(mismatch.first - raw_keys.begin());
      const auto idx1 = static_cast<std::size_t>(std::find(raw_keys.begin(), raw_keys.end(), *mismatch.second) -
                                                 raw_keys.begin());
      const auto as_view = [](const std::string& s) {
        return bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()};
      };
      return fail(err, errc::key_order,
                  diag::key_order(map_head, as_view(*mismatch.first), idx0, as_view(*mismatch.second), idx1,
                                  length),
                  map_head.latest_read_start());
    }

    // 原始键已有序；规范化后的键可能改变相对顺序，需重新排序。
    if (options_.normalize_strings != Normalization::none) {
      std::sort(entries.begin(), entries.end(), [](const ipld::MapEntry& a, const ipld::MapEntry& b) {
        return ipld::canonical_key_less(a.key, b.key);
      });
    }
    ipld::Map map;
    for (auto& entry : entries) {
      map.insert(std::move(entry.key), std::move(entry.value));
    }
    out = Value(std::move(map));
    report(out, map_head.latest_read_size());
    return {};
  }

  std::error_code decode_link(const Head& head, Value& out, DecodeError& err) {
    if (head.argument != kLinkTag) {
      return fail(err, errc::invalid_tag, diag::invalid_tag(stream_.current(), head.argument), item_start());
    }
    const StreamSnapshot link_head = stream_.current();

    Head payload;
    auto ec = read_head(payload, err);
    if (ec) {
      if (!is_wrappable(err)) {
        return ec;
      }
      return wrap(err, errc::link_item, diag::link_item(link_head, err), link_head.latest_read_start());
    }
    const StreamSnapshot payload_head = stream_.current();
    if (payload.type != major_type::byte_string) {
      return fail(err, errc::link_payload_type,
                  diag::link_payload_type(link_head, payload_head, major_bits(payload.type)),
                  link_head.latest_read_start());
    }

    bytes_view body;
    ec = read_body(payload.argument, "bytestring", body, err);
    if (ec) {
      if (!is_wrappable(err)) {
        return ec;
      }
      return wrap(err, errc::link_item, diag::link_item(link_head, err), link_head.latest_read_start());
    }
    if (body.empty() || body.front() != kLinkMarker) {
      return fail(err, errc::link_marker, diag::link_marker(link_head, payload_head, stream_.current()),
                  link_head.latest_read_start());
    }

    out = Value::link(std::vector<byte>(body.begin() + 1, body.end()));
    report(out, link_head.latest_read_size() + payload_head.latest_read_size() + body.size());
    return {};
  }

  std::error_code decode_simple(const Head& head, Value& out, DecodeError& err) {
    const std::size_t head_size = stream_.current().latest_read_size();
    if (head.is_float) {
      if (std::isnan(head.float_value) || std::isinf(head.float_value)) {
        return fail(err, errc::disallowed_float, diag::invalid_float(stream_.current(), head.float_value),
                    item_start());
      }
      out = Value::floating(head.float_value);
      report(out, head_size);
      return {};
    }
    switch (head.argument) {
      case kSimpleFalse:
        out = Value::boolean(false);
        break;
      case kSimpleTrue:
        out = Value::boolean(true);
        break;
      case kSimpleNull:
        out = Value::null();
        break;
      default:
        return fail(err, errc::invalid_simple_value,
                    diag::invalid_simple_value(stream_.current(), static_cast<std::uint8_t>(head.argument)),
                    item_start());
    }
    report(out, head_size);
    return {};
  }

  Stream& stream_;
  const DecodeOptions& options_;
};

}  // namespace

std::error_code decode(ByteSource& source, ipld::Value& out, const DecodeOptions& options, DecodeError* error) {
  DecodeError local{};
  DecodeError& err = error != nullptr ? *error : local;
  err = DecodeError{};

  Stream stream(source);
  Decoder decoder(stream, options);
  Value result = Value::null();
  auto ec = decoder.decode_top_level(result, err);
  if (ec) {
    core::detail::logger()->debug("dag-cbor decode failed at byte #{}: {}", err.root_cause().position,
                                  ec.message());
    return ec;
  }
  out = std::move(result);
  return {};
}

std::error_code decode(bytes_view in, ipld::Value& out, const DecodeOptions& options, DecodeError* error) {
  const auto& logger = core::detail::logger();
  if (logger->should_log(spdlog::level::trace)) {
    logger->trace("dag-cbor decode input ({} bytes):\n{}", in.size(), utils::hex_dump(in));
  }
  MemorySource source(in);
  return decode(source, out, options, error);
}

}  // namespace dagcbor::codec
