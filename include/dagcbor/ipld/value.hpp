#pragma once

#include "dagcbor/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace dagcbor::ipld {

using byte = dagcbor::core::byte;
using bytes_view = dagcbor::core::bytes_view;

class Value;
struct MapEntry;
using List = std::vector<Value>;

/**
 * @brief IPLD 数据模型中的 Kind（封闭集合）。
 */
enum class Kind : std::uint8_t {
  null = 0,
  boolean = 1,
  integer = 2,
  floating = 3,
  bytes = 4,
  text = 5,
  list = 6,
  map = 7,
  link = 8,
};

[[nodiscard]] const char* kind_name(Kind kind) noexcept;

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

struct Boolean final {
  bool value{false};
  friend bool operator==(const Boolean&, const Boolean&) = default;
};

/**
 * @brief 取值范围恰为 [-2^64, 2^64 - 1] 的整数。
 *
 * 内部按线上格式的方式保存：符号 + 无符号参数 argument。
 * - 非负数：value = argument
 * - 负数：  value = -1 - argument
 * 因此超出范围的整数在该类型中不可表示，只能在 parse() 时被拒绝。
 */
class Integer final {
 public:
  constexpr Integer() noexcept = default;

  [[nodiscard]] static constexpr Integer from_int64(std::int64_t v) noexcept {
    if (v >= 0) {
      return Integer(false, static_cast<std::uint64_t>(v));
    }
    // -1 - v 在 v = INT64_MIN 时也不会溢出（按无符号计算）。
    return Integer(true, ~static_cast<std::uint64_t>(v));
  }

  [[nodiscard]] static constexpr Integer from_uint64(std::uint64_t v) noexcept {
    return Integer(false, v);
  }

  // 由负整数的线上参数构造：value = -1 - argument。
  [[nodiscard]] static constexpr Integer negative(std::uint64_t argument) noexcept {
    return Integer(true, argument);
  }

  /**
   * @brief 解析十进制整数文本（可带前导 '-'）。
   *
   * 超出 [-2^64, 2^64 - 1] 时返回 codec::errc::integer_range；
   * 文本不是合法十进制整数时返回 core::errc::invalid_argument。
   */
  static std::error_code parse(std::string_view text, Integer& out) noexcept;

  [[nodiscard]] constexpr bool is_negative() const noexcept { return negative_; }
  [[nodiscard]] constexpr std::uint64_t argument() const noexcept { return argument_; }

  [[nodiscard]] std::optional<std::int64_t> to_int64() const noexcept;
  [[nodiscard]] std::optional<std::uint64_t> to_uint64() const noexcept;
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Integer&, const Integer&) = default;

 private:
  constexpr Integer(bool negative, std::uint64_t argument) noexcept
      : negative_(negative), argument_(argument) {}

  bool negative_{false};
  std::uint64_t argument_{0};
};

// 浮点按位比较（-0.0 与 0.0 编码不同，视为不同的值）。
struct Float final {
  double value{0.0};
  friend bool operator==(const Float& lhs, const Float& rhs) noexcept;
};

struct Bytes final {
  std::vector<byte> value;
  friend bool operator==(const Bytes&, const Bytes&) = default;
};

// UTF-8 文本；合法性由编码器/解码器校验。
struct Text final {
  std::string value;
  friend bool operator==(const Text&, const Text&) = default;
};

/**
 * @brief 内容标识（CID）链接。
 *
 * cid 为外部 CID 编解码器给出的原始字节（version + codec + multihash），
 * 不含线上格式的 0x00 前缀字节。
 */
struct Link final {
  std::vector<byte> cid;
  friend bool operator==(const Link&, const Link&) = default;
};

/**
 * @brief 规范键序：UTF-8 字节长度短者在前；等长时按字节字典序。
 */
[[nodiscard]] bool canonical_key_less(std::string_view lhs, std::string_view rhs) noexcept;

/**
 * @brief 以 Text 为键的映射，键唯一，并始终按规范键序保存。
 *
 * 迭代顺序即编码顺序。
 */
class Map final {
 public:
  using container_type = std::vector<MapEntry>;
  using const_iterator = container_type::const_iterator;

  Map();
  Map(std::initializer_list<MapEntry> entries);
  Map(const Map& other);
  Map(Map&& other) noexcept;
  Map& operator=(const Map& other);
  Map& operator=(Map&& other) noexcept;
  ~Map();

  /**
   * @brief 插入键值对；键已存在时不修改并返回 false。
   *
   * 键按规范顺序到达时（解码场景）为追加，均摊 O(1)。
   */
  bool insert(std::string key, Value value);

  /**
   * @brief 插入或覆盖键值对。
   */
  void insert_or_assign(std::string key, Value value);

  [[nodiscard]] const Value* find(std::string_view key) const noexcept;
  [[nodiscard]] Value* find(std::string_view key) noexcept;
  [[nodiscard]] bool contains(std::string_view key) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;

  friend bool operator==(const Map& lhs, const Map& rhs) noexcept;
  friend bool operator!=(const Map& lhs, const Map& rhs) noexcept { return !(lhs == rhs); }

 private:
  [[nodiscard]] container_type::iterator lower_bound_(std::string_view key) noexcept;
  [[nodiscard]] const_iterator lower_bound_(std::string_view key) const noexcept;

  container_type entries_;
};

/**
 * @brief IPLD 值（强类型，支持 List/Map 嵌套）。
 *
 * 约定：
 * - 树形结构：List/Map 独占其子元素，不存在共享或回指；
 * - 布尔与整数是不同的 Kind（Boolean 永远编码为简单值，而不是整数）。
 */
class Value final {
 public:
  using storage_type = std::variant<Null, Boolean, Integer, Float, Bytes, Text, List, Map, Link>;

  Value() = delete;

  explicit Value(Null v);
  explicit Value(Boolean v);
  explicit Value(Integer v);
  explicit Value(Float v);
  explicit Value(Bytes v);
  explicit Value(Text v);
  explicit Value(List v);
  explicit Value(Map v);
  explicit Value(Link v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(storage_.index()); }

  static Value null();
  static Value boolean(bool value);
  static Value integer(std::int64_t value);
  static Value uinteger(std::uint64_t value);
  static Value integer(Integer value);
  static Value floating(double value);
  static Value bytes(std::vector<byte> value);
  static Value text(std::string value);
  static Value list(std::vector<Value> values);
  static Value map(Map value);
  static Value link(std::vector<byte> cid);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

struct MapEntry final {
  std::string key;
  Value value;
  friend bool operator==(const MapEntry&, const MapEntry&) = default;
};

}  // namespace dagcbor::ipld
