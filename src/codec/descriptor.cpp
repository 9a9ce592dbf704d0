#include "dagcbor/codec/descriptor.hpp"

#include "dagcbor/core/error.hpp"

#include "../core/log_internal.hpp"

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

namespace dagcbor::codec {

DescriptorSource::DescriptorSource(int fd) : sd_(io_, fd) {}

std::error_code DescriptorSource::read(mutable_bytes_view out, std::size_t& n) noexcept {
  std::error_code ec;
  n = asio::read(sd_, asio::buffer(out.data(), out.size()), ec);
  pos_ += n;
  // 到达末尾（对端关闭）不是错误：由 Stream 根据读到的字节数判断是否截断。
  if (ec == asio::error::eof) {
    return {};
  }
  if (ec) {
    core::detail::logger()->debug("descriptor read failed after {} bytes: {}", pos_, ec.message());
    return core::make_error_code(core::errc::io_error);
  }
  return {};
}

DescriptorSink::DescriptorSink(int fd) : sd_(io_, fd) {}

std::error_code DescriptorSink::write(bytes_view data) noexcept {
  std::error_code ec;
  const auto n = asio::write(sd_, asio::buffer(data.data(), data.size()), ec);
  written_ += n;
  if (ec) {
    core::detail::logger()->debug("descriptor write failed after {} bytes: {}", written_, ec.message());
    return core::make_error_code(core::errc::io_error);
  }
  return {};
}

}  // namespace dagcbor::codec
