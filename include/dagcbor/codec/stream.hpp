#pragma once

#include "dagcbor/codec/types.hpp"

#include <cstddef>
#include <system_error>
#include <utility>
#include <vector>

namespace dagcbor::codec {

/**
 * @brief 拉取式字节源（解码输入）。
 *
 * 约定：
 * - read() 阻塞直到读满 out 或到达末尾；仅在末尾时 n < out.size()（这不是错误）；
 * - 底层读失败时返回非零 error_code；
 * - position() 为已从该源读出的总字节数（多次 decode 共享同一源时位置连续）。
 */
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual std::error_code read(mutable_bytes_view out, std::size_t& n) noexcept = 0;
  [[nodiscard]] virtual std::size_t position() const noexcept = 0;
};

/**
 * @brief 内存字节源（不拷贝输入，调用方保证 data 在使用期间有效）。
 */
class MemorySource final : public ByteSource {
 public:
  explicit MemorySource(bytes_view data) noexcept : data_(data) {}

  std::error_code read(mutable_bytes_view out, std::size_t& n) noexcept override;
  [[nodiscard]] std::size_t position() const noexcept override { return pos_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

 private:
  bytes_view data_{};
  std::size_t pos_{0};
};

/**
 * @brief 流快照：最近一次读取的字节，以及读取结束后的流位置。
 *
 * 快照是不可变的值：Stream 每次读取都整体替换快照，已被错误构造持有的旧快照不受影响。
 */
class StreamSnapshot final {
 public:
  StreamSnapshot() = default;
  StreamSnapshot(std::vector<byte> latest_read, std::size_t next_read_start)
      : bytes_(std::move(latest_read)), pos_(next_read_start) {}

  [[nodiscard]] bytes_view latest_read() const noexcept { return bytes_view{bytes_.data(), bytes_.size()}; }
  [[nodiscard]] std::size_t latest_read_size() const noexcept { return bytes_.size(); }
  [[nodiscard]] std::size_t latest_read_start() const noexcept { return pos_ - bytes_.size(); }
  [[nodiscard]] std::size_t num_bytes_read() const noexcept { return pos_; }

 private:
  std::vector<byte> bytes_{};
  std::size_t pos_{0};
};

/**
 * @brief 解码期间使用的字节流：在 ByteSource 之上维护 previous/current 两个快照。
 *
 * - read_fresh(n)：current 降级为 previous，新 current 承载本次读取的字节；
 * - read_extend(n)：本次读取追加到 current（生成新快照替换），previous 保持不变。
 *
 * 两种读取在到达末尾时都可能返回少于 n 个字节，由调用方判断是否为截断错误。
 * 返回的 out 视图指向 current 快照内部，下一次读取后失效。
 */
class Stream final {
 public:
  explicit Stream(ByteSource& source) noexcept;

  Stream(const Stream&) = delete;
  Stream& operator=(const Stream&) = delete;

  std::error_code read_fresh(std::size_t n, bytes_view& out);
  std::error_code read_extend(std::size_t n, bytes_view& out);

  [[nodiscard]] const StreamSnapshot& current() const noexcept { return curr_; }
  [[nodiscard]] const StreamSnapshot& previous() const noexcept { return prev_; }

  // 当前流位置（字节源中的绝对位置）。
  [[nodiscard]] std::size_t position() const noexcept { return pos_; }

 private:
  std::error_code pull_(std::size_t n, std::vector<byte>& buf);

  ByteSource& source_;
  StreamSnapshot curr_{};
  StreamSnapshot prev_{};
  std::size_t pos_{0};
};

}  // namespace dagcbor::codec
