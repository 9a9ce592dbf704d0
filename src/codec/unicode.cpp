#include "dagcbor/codec/unicode.hpp"

#include "dagcbor/core/error.hpp"

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include <algorithm>
#include <cstdint>

namespace dagcbor::codec {
namespace {

struct LeadInfo final {
  std::size_t continuation{0};
  byte second_lo{0x80};
  byte second_hi{0xBF};
};

// 首字节 -> 后续字节数与第二字节的合法区间（排除超长编码、代理区与超出 U+10FFFF）。
[[nodiscard]] std::optional<LeadInfo> lead_info(byte b) noexcept {
  if (b >= 0xC2 && b <= 0xDF) {
    return LeadInfo{1, 0x80, 0xBF};
  }
  if (b == 0xE0) {
    return LeadInfo{2, 0xA0, 0xBF};
  }
  if (b == 0xED) {
    return LeadInfo{2, 0x80, 0x9F};
  }
  if (b >= 0xE1 && b <= 0xEF) {
    return LeadInfo{2, 0x80, 0xBF};
  }
  if (b == 0xF0) {
    return LeadInfo{3, 0x90, 0xBF};
  }
  if (b >= 0xF1 && b <= 0xF3) {
    return LeadInfo{3, 0x80, 0xBF};
  }
  if (b == 0xF4) {
    return LeadInfo{3, 0x80, 0x8F};
  }
  return std::nullopt;
}

[[nodiscard]] const icu::Normalizer2* normalizer_for(Normalization form, UErrorCode& status) noexcept {
  switch (form) {
    case Normalization::nfc:
      return icu::Normalizer2::getNFCInstance(status);
    case Normalization::nfkc:
      return icu::Normalizer2::getNFKCInstance(status);
    case Normalization::nfd:
      return icu::Normalizer2::getNFDInstance(status);
    case Normalization::nfkd:
      return icu::Normalizer2::getNFKDInstance(status);
    case Normalization::none:
      break;
  }
  return nullptr;
}

}  // namespace

std::optional<Utf8Error> validate_utf8(bytes_view bytes) noexcept {
  const std::size_t n = bytes.size();
  std::size_t i = 0;
  while (i < n) {
    const byte b = bytes[i];
    if (b < 0x80) {
      ++i;
      continue;
    }
    const auto info = lead_info(b);
    if (!info) {
      return Utf8Error{i, i + 1, "invalid start byte"};
    }
    for (std::size_t k = 1; k <= info->continuation; ++k) {
      if (i + k >= n) {
        return Utf8Error{i, n, "unexpected end of data"};
      }
      const byte c = bytes[i + k];
      const byte lo = (k == 1) ? info->second_lo : byte{0x80};
      const byte hi = (k == 1) ? info->second_hi : byte{0xBF};
      if (c < lo || c > hi) {
        return Utf8Error{i, i + k, "invalid continuation byte"};
      }
    }
    i += info->continuation + 1;
  }
  return std::nullopt;
}

std::error_code normalize(std::string_view text, Normalization form, std::string& out) {
  if (form == Normalization::none) {
    out.assign(text.begin(), text.end());
    return {};
  }
  // ICU 的长度参数为 int32_t。
  if (text.size() > kMaxNormalizeBytes) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  // 纯 ASCII 文本在四种规范化形式下都保持不变。
  const bool ascii = std::all_of(text.begin(), text.end(), [](char c) {
    return static_cast<unsigned char>(c) < 0x80;
  });
  if (ascii) {
    out.assign(text.begin(), text.end());
    return {};
  }

  UErrorCode status = U_ZERO_ERROR;
  const auto* normalizer = normalizer_for(form, status);
  if (normalizer == nullptr || U_FAILURE(status)) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  const auto src = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<std::int32_t>(text.size())));
  const auto dst = normalizer->normalize(src, status);
  if (U_FAILURE(status)) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  out.clear();
  dst.toUTF8String(out);
  return {};
}

const char* normalization_name(Normalization form) noexcept {
  switch (form) {
    case Normalization::none:
      return "none";
    case Normalization::nfc:
      return "NFC";
    case Normalization::nfkc:
      return "NFKC";
    case Normalization::nfd:
      return "NFD";
    case Normalization::nfkd:
      return "NFKD";
  }
  return "unknown";
}

}  // namespace dagcbor::codec
