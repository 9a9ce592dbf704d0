#include "dagcbor/codec/encoder.hpp"

#include "dagcbor/codec/multicodec.hpp"
#include "dagcbor/codec/unicode.hpp"
#include "dagcbor/ipld/path.hpp"

#include "../core/log_internal.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace dagcbor::codec {
namespace {

using ipld::Value;

constexpr std::uint8_t argument_width(std::uint64_t arg) noexcept {
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

constexpr std::uint8_t info_for_width(std::uint8_t width) noexcept {
  switch (width) {
    case 1:
      return kInfoOneByte;
    case 2:
      return kInfoTwoBytes;
    case 4:
      return kInfoFourBytes;
    default:
      return kInfoEightBytes;
  }
}

[[nodiscard]] bytes_view as_bytes(std::string_view s) noexcept {
  return bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()};
}

/**
 * @brief 单次编码的遍历状态：输出 sink、当前路径（仅在出错时物化为 ObjPath）与选项。
 */
class Encoder final {
 public:
  Encoder(ByteSink& sink, const EncodeOptions& options, EncodeError* error) noexcept
      : sink_(sink), options_(options), error_(error) {}

  std::error_code write_head(major_type type, std::uint64_t arg) noexcept {
    std::array<byte, 9> head{};
    const auto width = argument_width(arg);
    if (width == 0) {
      head[0] = make_leading_byte(type, static_cast<std::uint8_t>(arg));
    } else {
      head[0] = make_leading_byte(type, info_for_width(width));
      for (std::uint8_t i = 0; i < width; ++i) {
        const auto shift = static_cast<unsigned>(8u * (width - 1u - i));
        head[1u + i] = static_cast<byte>((arg >> shift) & 0xFFu);
      }
    }
    return sink_.write(bytes_view{head.data(), 1u + width});
  }

  std::error_code encode_value(const Value& value, std::size_t depth) {
    return std::visit(
      [&](const auto& v) -> std::error_code {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ipld::Null>) {
          return write_simple(kSimpleNull);
        } else if constexpr (std::is_same_v<T, ipld::Boolean>) {
          return write_simple(v.value ? kSimpleTrue : kSimpleFalse);
        } else if constexpr (std::is_same_v<T, ipld::Integer>) {
          const auto type = v.is_negative() ? major_type::negative_integer : major_type::unsigned_integer;
          return write_head(type, v.argument());
        } else if constexpr (std::is_same_v<T, ipld::Float>) {
          return encode_float(v.value);
        } else if constexpr (std::is_same_v<T, ipld::Bytes>) {
          return write_string(major_type::byte_string, bytes_view{v.value.data(), v.value.size()});
        } else if constexpr (std::is_same_v<T, ipld::Text>) {
          return encode_text(v.value);
        } else if constexpr (std::is_same_v<T, ipld::List>) {
          return encode_list(v, depth);
        } else if constexpr (std::is_same_v<T, ipld::Map>) {
          return encode_map(v, depth);
        } else {
          return encode_link(v);
        }
      },
      value.storage());
  }

 private:
  std::error_code write_simple(std::uint8_t simple) noexcept {
    const byte b = make_leading_byte(major_type::simple_or_float, simple);
    return sink_.write(bytes_view{&b, 1});
  }

  std::error_code write_string(major_type type, bytes_view body) noexcept {
    auto ec = write_head(type, body.size());
    if (ec) {
      return ec;
    }
    return sink_.write(body);
  }

  std::error_code encode_float(double value) {
    if (std::isnan(value) || std::isinf(value)) {
      const char* name = std::isnan(value) ? "NaN" : (value > 0 ? "Infinity" : "-Infinity");
      return fail(errc::disallowed_float,
                  std::string("Error encoding float value at ") + current_path().to_string() + ": " + name +
                    " is not allowed.");
    }
    std::array<byte, 9> buf{};
    buf[0] = make_leading_byte(major_type::simple_or_float, kInfoEightBytes);
    const auto bits = std::bit_cast<std::uint64_t>(value);
    for (std::size_t i = 0; i < 8; ++i) {
      buf[1 + i] = static_cast<byte>((bits >> (8u * (7u - i))) & 0xFFu);
    }
    return sink_.write(bytes_view{buf.data(), buf.size()});
  }

  std::error_code check_utf8(std::string_view text, const char* what) {
    if (const auto bad = validate_utf8(text)) {
      return fail(errc::invalid_utf8,
                  std::string("Error encoding ") + what + " at " + current_path().to_string() +
                    ": invalid utf-8 at byte " + std::to_string(bad->start) + " (" + bad->reason + ").");
    }
    return {};
  }

  // 校验 UTF-8 并按选项规范化到 out。
  std::error_code prepare_text(std::string_view text, std::string& out, const char* what) {
    auto ec = check_utf8(text, what);
    if (ec) {
      return ec;
    }
    if (options_.normalize_strings == Normalization::none) {
      out.assign(text);
      return {};
    }
    ec = normalize(text, options_.normalize_strings, out);
    if (ec) {
      return fail(errc::normalization_failed,
                  std::string("Error encoding ") + what + " at " + current_path().to_string() + ": " +
                    normalization_name(options_.normalize_strings) + " normalization failed.");
    }
    return {};
  }

  std::error_code encode_text(const std::string& text) {
    if (options_.normalize_strings == Normalization::none) {
      auto ec = check_utf8(text, "string");
      if (ec) {
        return ec;
      }
      return write_string(major_type::text_string, as_bytes(text));
    }
    std::string normalized;
    auto ec = prepare_text(text, normalized, "string");
    if (ec) {
      return ec;
    }
    return write_string(major_type::text_string, as_bytes(normalized));
  }

  std::error_code enter_container(std::size_t depth) {
    if (depth >= options_.max_depth) {
      return fail(errc::nesting_too_deep,
                  "Error encoding value at " + current_path().to_string() + ": maximum nesting depth " +
                    std::to_string(options_.max_depth) + " exceeded.");
    }
    return {};
  }

  std::error_code encode_list(const ipld::List& list, std::size_t depth) {
    auto ec = enter_container(depth);
    if (ec) {
      return ec;
    }
    ec = write_head(major_type::array, list.size());
    if (ec) {
      return ec;
    }
    for (std::size_t i = 0; i < list.size(); ++i) {
      path_.emplace_back(i);
      ec = encode_value(list[i], depth + 1);
      if (ec) {
        return ec;
      }
      path_.pop_back();
    }
    return {};
  }

  struct KeyedEntry final {
    std::string key;
    const ipld::MapEntry* entry{nullptr};
  };

  std::error_code encode_map(const ipld::Map& map, std::size_t depth) {
    auto ec = enter_container(depth);
    if (ec) {
      return ec;
    }

    // Map 自身已按规范键序保存；规范化后的键需要重新排序并重新检查唯一性。
    std::vector<KeyedEntry> entries;
    entries.reserve(map.size());
    for (const auto& entry : map) {
      path_.emplace_back(entry.key);
      KeyedEntry keyed{{}, &entry};
      ec = prepare_text(entry.key, keyed.key, "map key");
      if (ec) {
        return ec;
      }
      path_.pop_back();
      entries.push_back(std::move(keyed));
    }
    if (options_.normalize_strings != Normalization::none) {
      std::sort(entries.begin(), entries.end(), [](const KeyedEntry& a, const KeyedEntry& b) {
        return ipld::canonical_key_less(a.key, b.key);
      });
      const auto dup = std::adjacent_find(entries.begin(), entries.end(), [](const KeyedEntry& a, const KeyedEntry& b) {
        return a.key == b.key;
      });
      if (dup != entries.end()) {
        path_.emplace_back(std::next(dup)->entry->key);
        return fail(errc::duplicate_key,
                    "Error encoding map key at " + current_path().to_string() + ": key '" + dup->key +
                      "' is duplicated after " + normalization_name(options_.normalize_strings) +
                      " normalization.");
      }
    }

    ec = write_head(major_type::map, entries.size());
    if (ec) {
      return ec;
    }
    for (const auto& keyed : entries) {
      ec = write_string(major_type::text_string, as_bytes(keyed.key));
      if (ec) {
        return ec;
      }
      path_.emplace_back(keyed.entry->key);
      ec = encode_value(keyed.entry->value, depth + 1);
      if (ec) {
        return ec;
      }
      path_.pop_back();
    }
    return {};
  }

  std::error_code encode_link(const ipld::Link& link) {
    auto ec = write_head(major_type::tag, kLinkTag);
    if (ec) {
      return ec;
    }
    ec = write_head(major_type::byte_string, link.cid.size() + 1);
    if (ec) {
      return ec;
    }
    ec = sink_.write(bytes_view{&kLinkMarker, 1});
    if (ec) {
      return ec;
    }
    return sink_.write(bytes_view{link.cid.data(), link.cid.size()});
  }

  [[nodiscard]] ipld::ObjPath current_path() const { return ipld::ObjPath(path_); }

  std::error_code fail(std::error_code ec, std::string message) {
    if (error_ != nullptr) {
      error_->code = ec;
      error_->message = std::move(message);
      error_->path = current_path();
    }
    return ec;
  }

  std::error_code fail(errc e, std::string message) { return fail(make_error_code(e), std::move(message)); }

  ByteSink& sink_;
  const EncodeOptions& options_;
  EncodeError* error_{nullptr};
  std::vector<ipld::PathSegment> path_{};
};

}  // namespace

std::error_code encode_to(const ipld::Value& value,
                          ByteSink& sink,
                          std::size_t& written,
                          const EncodeOptions& options,
                          EncodeError* error) {
  const auto start = sink.written();
  EncodeError local{};
  EncodeError* err = error != nullptr ? error : &local;
  *err = EncodeError{};

  std::error_code ec;
  if (options.include_multicodec) {
    std::vector<byte> prefix;
    multicodec::encode_varint(kDagCborMulticodec, prefix);
    ec = sink.write(bytes_view{prefix.data(), prefix.size()});
  }
  if (!ec) {
    Encoder encoder(sink, options, err);
    ec = encoder.encode_value(value, 0);
  }
  if (ec) {
    if (err->code != ec) {
      // 输出失败（sink 写入错误）时没有结构化描述，补一个通用描述。
      err->code = ec;
      err->message = "Error writing encoded output: " + ec.message() + '.';
      err->path = ipld::ObjPath{};
    }
    core::detail::logger()->debug("dag-cbor encode failed: {} at {}", ec.message(), err->path.to_string());
    return ec;
  }
  written = sink.written() - start;
  return {};
}

std::error_code encode(const ipld::Value& value,
                       std::vector<byte>& out,
                       const EncodeOptions& options,
                       EncodeError* error) {
  const auto original_size = out.size();
  VectorSink sink(out);
  std::size_t written = 0;
  auto ec = encode_to(value, sink, written, options, error);
  if (ec) {
    out.resize(original_size);
  }
  return ec;
}

std::error_code encoded_size(const ipld::Value& value,
                             std::size_t& out_size,
                             const EncodeOptions& options,
                             EncodeError* error) {
  CountingSink sink;
  return encode_to(value, sink, out_size, options, error);
}

}  // namespace dagcbor::codec
