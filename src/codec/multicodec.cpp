#include "dagcbor/codec/multicodec.hpp"

#include "dagcbor/codec/error.hpp"

namespace dagcbor::codec::multicodec {

void encode_varint(std::uint64_t value, std::vector<byte>& out) {
  while (value >= 0x80u) {
    out.push_back(static_cast<byte>((value & 0x7Fu) | 0x80u));
    value >>= 7;
  }
  out.push_back(static_cast<byte>(value));
}

std::error_code decode_varint(bytes_view in, std::uint64_t& value, std::size_t& consumed) noexcept {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (i >= kMaxVarintBytes) {
      return make_error_code(errc::missing_framing);
    }
    const byte b = in[i];
    v |= static_cast<std::uint64_t>(b & 0x7Fu) << (7 * i);
    if ((b & 0x80u) == 0) {
      if (b == 0 && i > 0) {
        return make_error_code(errc::missing_framing);
      }
      value = v;
      consumed = i + 1;
      return {};
    }
  }
  return make_error_code(errc::unexpected_eof);
}

void wrap(std::uint64_t code, bytes_view payload, std::vector<byte>& out) {
  encode_varint(code, out);
  out.insert(out.end(), payload.begin(), payload.end());
}

std::error_code unwrap(bytes_view in, std::uint64_t& code, bytes_view& payload) noexcept {
  std::size_t consumed = 0;
  auto ec = decode_varint(in, code, consumed);
  if (ec) {
    return ec;
  }
  payload = in.subspan(consumed);
  return {};
}

}  // namespace dagcbor::codec::multicodec
