#include "dagcbor/ipld/path.hpp"

#include "dagcbor/ipld/value.hpp"

#include <utility>

namespace dagcbor::ipld {

ObjPath ObjPath::operator/(std::size_t index) const {
  auto segments = segments_;
  segments.emplace_back(index);
  return ObjPath(std::move(segments));
}

ObjPath ObjPath::operator/(std::string key) const {
  auto segments = segments_;
  segments.emplace_back(std::move(key));
  return ObjPath(std::move(segments));
}

ObjPath ObjPath::operator/(const ObjPath& other) const {
  auto segments = segments_;
  segments.insert(segments.end(), other.segments_.begin(), other.segments_.end());
  return ObjPath(std::move(segments));
}

bool ObjPath::is_prefix_of(const ObjPath& other) const noexcept {
  if (segments_.size() > other.segments_.size()) {
    return false;
  }
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (segments_[i] != other.segments_[i]) {
      return false;
    }
  }
  return true;
}

const Value* ObjPath::access(const Value& root) const noexcept {
  const Value* current = &root;
  for (const auto& seg : segments_) {
    if (const auto* index = std::get_if<std::size_t>(&seg)) {
      const auto* list = current->get_if<List>();
      if (list == nullptr || *index >= list->size()) {
        return nullptr;
      }
      current = &(*list)[*index];
    } else {
      const auto* map = current->get_if<Map>();
      if (map == nullptr) {
        return nullptr;
      }
      current = map->find(std::get<std::string>(seg));
      if (current == nullptr) {
        return nullptr;
      }
    }
  }
  return current;
}

std::string ObjPath::to_string() const {
  if (segments_.empty()) {
    return "/";
  }
  std::string out;
  for (const auto& seg : segments_) {
    out += '/';
    if (const auto* index = std::get_if<std::size_t>(&seg)) {
      out += std::to_string(*index);
    } else {
      out += '\'';
      out += std::get<std::string>(seg);
      out += '\'';
    }
  }
  return out;
}

}  // namespace dagcbor::ipld
