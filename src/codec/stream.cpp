#include "dagcbor/codec/stream.hpp"

#include <algorithm>
#include <utility>

namespace dagcbor::codec {
namespace {

// 大长度读取按块增长缓冲区：避免恶意长度字段导致一次性分配巨量内存。
constexpr std::size_t kReadChunk = 64 * 1024;

}  // namespace

std::error_code MemorySource::read(mutable_bytes_view out, std::size_t& n) noexcept {
  n = std::min(out.size(), remaining());
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
  pos_ += n;
  return {};
}

Stream::Stream(ByteSource& source) noexcept
    : source_(source), curr_({}, source.position()), prev_({}, source.position()), pos_(source.position()) {}

std::error_code Stream::pull_(std::size_t n, std::vector<byte>& buf) {
  std::size_t remaining = n;
  while (remaining > 0) {
    const auto chunk = std::min(remaining, kReadChunk);
    const auto old_size = buf.size();
    buf.resize(old_size + chunk);
    std::size_t got = 0;
    auto ec = source_.read(mutable_bytes_view{buf.data() + old_size, chunk}, got);
    buf.resize(old_size + got);
    pos_ += got;
    if (ec) {
      return ec;
    }
    if (got < chunk) {
      break;
    }
    remaining -= chunk;
  }
  return {};
}

std::error_code Stream::read_fresh(std::size_t n, bytes_view& out) {
  std::vector<byte> buf;
  auto ec = pull_(n, buf);
  prev_ = std::move(curr_);
  curr_ = StreamSnapshot(std::move(buf), pos_);
  out = curr_.latest_read();
  return ec;
}

std::error_code Stream::read_extend(std::size_t n, bytes_view& out) {
  const auto before = curr_.latest_read();
  std::vector<byte> buf(before.begin(), before.end());
  const auto old_size = buf.size();
  auto ec = pull_(n, buf);
  curr_ = StreamSnapshot(std::move(buf), pos_);
  out = curr_.latest_read().subspan(old_size);
  return ec;
}

}  // namespace dagcbor::codec
