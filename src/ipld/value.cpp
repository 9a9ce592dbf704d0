#include "dagcbor/ipld/value.hpp"

#include "dagcbor/codec/error.hpp"
#include "dagcbor/core/error.hpp"

#include <algorithm>
#include <bit>
#include <limits>
#include <utility>

namespace dagcbor::ipld {
namespace {

// 2^64 的十进制表示：负整数下界 -2^64 的绝对值，无法用 uint64 表示。
constexpr std::string_view kTwoPow64 = "18446744073709551616";

}  // namespace

const char* kind_name(Kind kind) noexcept {
  switch (kind) {
    case Kind::null:
      return "null";
    case Kind::boolean:
      return "boolean";
    case Kind::integer:
      return "integer";
    case Kind::floating:
      return "float";
    case Kind::bytes:
      return "bytes";
    case Kind::text:
      return "text";
    case Kind::list:
      return "list";
    case Kind::map:
      return "map";
    case Kind::link:
      return "link";
  }
  return "unknown";
}

std::error_code Integer::parse(std::string_view text, Integer& out) noexcept {
  bool negative = false;
  if (!text.empty() && text.front() == '-') {
    negative = true;
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return core::make_error_code(core::errc::invalid_argument);
    }
  }
  while (text.size() > 1 && text.front() == '0') {
    text.remove_prefix(1);
  }

  if (negative && text == kTwoPow64) {
    out = Integer::negative(std::numeric_limits<std::uint64_t>::max());
    return {};
  }

  std::uint64_t magnitude = 0;
  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  for (char c : text) {
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (magnitude > (kMax - digit) / 10) {
      return codec::make_error_code(codec::errc::integer_range);
    }
    magnitude = magnitude * 10 + digit;
  }

  if (!negative || magnitude == 0) {
    out = Integer::from_uint64(magnitude);
  } else {
    out = Integer::negative(magnitude - 1);
  }
  return {};
}

std::optional<std::int64_t> Integer::to_int64() const noexcept {
  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  if (argument_ > kMax) {
    return std::nullopt;
  }
  const auto v = static_cast<std::int64_t>(argument_);
  return negative_ ? -1 - v : v;
}

std::optional<std::uint64_t> Integer::to_uint64() const noexcept {
  if (negative_) {
    return std::nullopt;
  }
  return argument_;
}

std::string Integer::to_string() const {
  if (!negative_) {
    return std::to_string(argument_);
  }
  if (argument_ == std::numeric_limits<std::uint64_t>::max()) {
    return "-" + std::string(kTwoPow64);
  }
  return "-" + std::to_string(argument_ + 1);
}

bool operator==(const Float& lhs, const Float& rhs) noexcept {
  return std::bit_cast<std::uint64_t>(lhs.value) == std::bit_cast<std::uint64_t>(rhs.value);
}

bool canonical_key_less(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return lhs.size() < rhs.size();
  }
  // std::string_view 的比较按 char_traits<char>::compare，即 memcmp 语义（按无符号字节）。
  return lhs < rhs;
}

Map::Map() = default;
Map::Map(const Map& other) = default;
Map::Map(Map&& other) noexcept = default;
Map& Map::operator=(const Map& other) = default;
Map& Map::operator=(Map&& other) noexcept = default;
Map::~Map() = default;

Map::Map(std::initializer_list<MapEntry> entries) {
  entries_.reserve(entries.size());
  for (const auto& e : entries) {
    insert_or_assign(e.key, e.value);
  }
}

Map::container_type::iterator Map::lower_bound_(std::string_view key) noexcept {
  return std::lower_bound(entries_.begin(), entries_.end(), key, [](const MapEntry& e, std::string_view k) {
    return canonical_key_less(e.key, k);
  });
}

Map::const_iterator Map::lower_bound_(std::string_view key) const noexcept {
  return std::lower_bound(entries_.begin(), entries_.end(), key, [](const MapEntry& e, std::string_view k) {
    return canonical_key_less(e.key, k);
  });
}

bool Map::insert(std::string key, Value value) {
  // 快路径：按规范顺序到达的键直接追加。
  if (entries_.empty() || canonical_key_less(entries_.back().key, key)) {
    entries_.push_back(MapEntry{std::move(key), std::move(value)});
    return true;
  }
  auto it = lower_bound_(key);
  if (it != entries_.end() && it->key == key) {
    return false;
  }
  entries_.insert(it, MapEntry{std::move(key), std::move(value)});
  return true;
}

void Map::insert_or_assign(std::string key, Value value) {
  auto it = lower_bound_(key);
  if (it != entries_.end() && it->key == key) {
    it->value = std::move(value);
    return;
  }
  entries_.insert(it, MapEntry{std::move(key), std::move(value)});
}

const Value* Map::find(std::string_view key) const noexcept {
  auto it = lower_bound_(key);
  if (it == entries_.end() || it->key != key) {
    return nullptr;
  }
  return &it->value;
}

Value* Map::find(std::string_view key) noexcept {
  auto it = lower_bound_(key);
  if (it == entries_.end() || it->key != key) {
    return nullptr;
  }
  return &it->value;
}

bool Map::contains(std::string_view key) const noexcept { return find(key) != nullptr; }

std::size_t Map::size() const noexcept { return entries_.size(); }

bool Map::empty() const noexcept { return entries_.empty(); }

Map::const_iterator Map::begin() const noexcept { return entries_.begin(); }

Map::const_iterator Map::end() const noexcept { return entries_.end(); }

bool operator==(const Map& lhs, const Map& rhs) noexcept { return lhs.entries_ == rhs.entries_; }

Value::Value(Null v) : storage_(v) {}
Value::Value(Boolean v) : storage_(v) {}
Value::Value(Integer v) : storage_(v) {}
Value::Value(Float v) : storage_(v) {}
Value::Value(Bytes v) : storage_(std::move(v)) {}
Value::Value(Text v) : storage_(std::move(v)) {}
Value::Value(List v) : storage_(std::move(v)) {}
Value::Value(Map v) : storage_(std::move(v)) {}
Value::Value(Link v) : storage_(std::move(v)) {}

Value Value::null() { return Value(Null{}); }

Value Value::boolean(bool value) { return Value(Boolean{value}); }

Value Value::integer(std::int64_t value) { return Value(Integer::from_int64(value)); }

Value Value::uinteger(std::uint64_t value) { return Value(Integer::from_uint64(value)); }

Value Value::integer(Integer value) { return Value(value); }

Value Value::floating(double value) { return Value(Float{value}); }

Value Value::bytes(std::vector<byte> value) { return Value(Bytes{std::move(value)}); }

Value Value::text(std::string value) { return Value(Text{std::move(value)}); }

Value Value::list(std::vector<Value> values) { return Value(List(std::move(values))); }

Value Value::map(Map value) { return Value(std::move(value)); }

Value Value::link(std::vector<byte> cid) { return Value(Link{std::move(cid)}); }

bool operator==(const Value& lhs, const Value& rhs) noexcept { return lhs.storage_ == rhs.storage_; }

}  // namespace dagcbor::ipld
