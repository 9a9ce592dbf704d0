#include "dagcbor/codec/sink.hpp"

#include "dagcbor/codec/error.hpp"
#include "dagcbor/core/error.hpp"

#include <algorithm>
#include <new>
#include <stdexcept>

namespace dagcbor::codec {

std::error_code VectorSink::write(bytes_view data) noexcept {
  if (data.empty()) {
    return {};
  }
  try {
    out_.insert(out_.end(), data.begin(), data.end());
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::buffer_overflow);
  } catch (const std::length_error&) {
    return core::make_error_code(core::errc::buffer_overflow);
  }
  written_ += data.size();
  return {};
}

std::error_code SpanSink::write(bytes_view data) noexcept {
  if (data.empty()) {
    return {};
  }
  if (out_.size() - written_ < data.size()) {
    return make_error_code(errc::buffer_overflow);
  }
  std::copy(data.begin(), data.end(), out_.begin() + static_cast<std::ptrdiff_t>(written_));
  written_ += data.size();
  return {};
}

}  // namespace dagcbor::codec
