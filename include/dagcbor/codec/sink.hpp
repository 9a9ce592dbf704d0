#pragma once

#include "dagcbor/codec/types.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace dagcbor::codec {

/**
 * @brief 推送式字节汇（编码输出）。
 *
 * write() 要么写入全部字节，要么返回错误；written() 为累计成功写入的字节数。
 */
class ByteSink {
 public:
  virtual ~ByteSink() = default;

  virtual std::error_code write(bytes_view data) noexcept = 0;
  [[nodiscard]] virtual std::size_t written() const noexcept = 0;
};

/**
 * @brief 追加写入 std::vector<byte>。
 */
class VectorSink final : public ByteSink {
 public:
  explicit VectorSink(std::vector<byte>& out) noexcept : out_(out) {}

  std::error_code write(bytes_view data) noexcept override;
  [[nodiscard]] std::size_t written() const noexcept override { return written_; }

 private:
  std::vector<byte>& out_;
  std::size_t written_{0};
};

/**
 * @brief 写入固定缓冲区（零拷贝场景）；空间不足返回 errc::buffer_overflow。
 */
class SpanSink final : public ByteSink {
 public:
  explicit SpanSink(mutable_bytes_view out) noexcept : out_(out) {}

  std::error_code write(bytes_view data) noexcept override;
  [[nodiscard]] std::size_t written() const noexcept override { return written_; }

 private:
  mutable_bytes_view out_{};
  std::size_t written_{0};
};

/**
 * @brief 只计数不存储（用于计算编码长度）。
 */
class CountingSink final : public ByteSink {
 public:
  std::error_code write(bytes_view data) noexcept override {
    written_ += data.size();
    return {};
  }
  [[nodiscard]] std::size_t written() const noexcept override { return written_; }

 private:
  std::size_t written_{0};
};

}  // namespace dagcbor::codec
