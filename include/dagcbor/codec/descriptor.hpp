#pragma once

/**
 * @file descriptor.hpp
 * @brief 基于 POSIX 文件描述符的字节源/字节汇（pipe、文件、socket 等）。
 *
 * 说明：
 * - 仅在 POSIX 平台可用（依赖 asio::posix::stream_descriptor）；
 * - 读写为同步阻塞调用，不需要运行 io_context；
 * - 构造时接管 fd 生命周期，析构时关闭。
 */

#include "dagcbor/codec/sink.hpp"
#include "dagcbor/codec/stream.hpp"

#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <cstddef>
#include <system_error>

namespace dagcbor::codec {

class DescriptorSource final : public ByteSource {
 public:
  explicit DescriptorSource(int fd);

  std::error_code read(mutable_bytes_view out, std::size_t& n) noexcept override;
  [[nodiscard]] std::size_t position() const noexcept override { return pos_; }

 private:
  asio::io_context io_;
  asio::posix::stream_descriptor sd_;
  std::size_t pos_{0};
};

class DescriptorSink final : public ByteSink {
 public:
  explicit DescriptorSink(int fd);

  std::error_code write(bytes_view data) noexcept override;
  [[nodiscard]] std::size_t written() const noexcept override { return written_; }

 private:
  asio::io_context io_;
  asio::posix::stream_descriptor sd_;
  std::size_t written_{0};
};

}  // namespace dagcbor::codec
