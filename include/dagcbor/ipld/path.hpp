#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dagcbor::ipld {

class Value;

// 路径段：List 下标或 Map 键。
using PathSegment = std::variant<std::size_t, std::string>;

/**
 * @brief IPLD 值内部的结构化路径（用于定位编码错误）。
 *
 * 字符串形式与常见调试输出一致：根为 "/"，下标为数字，键用单引号包裹，
 * 例如 /2/'red'/0。
 */
class ObjPath final {
 public:
  ObjPath() = default;
  explicit ObjPath(std::vector<PathSegment> segments) : segments_(std::move(segments)) {}

  [[nodiscard]] ObjPath operator/(std::size_t index) const;
  [[nodiscard]] ObjPath operator/(std::string key) const;
  [[nodiscard]] ObjPath operator/(const ObjPath& other) const;

  [[nodiscard]] const std::vector<PathSegment>& segments() const noexcept { return segments_; }
  [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
  [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }

  // this 是否为 other 的前缀（含相等）。
  [[nodiscard]] bool is_prefix_of(const ObjPath& other) const noexcept;

  /**
   * @brief 按路径访问子值；路径不存在或段类型与容器不匹配时返回 nullptr。
   */
  [[nodiscard]] const Value* access(const Value& root) const noexcept;

  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const ObjPath&, const ObjPath&) = default;

 private:
  std::vector<PathSegment> segments_;
};

}  // namespace dagcbor::ipld
