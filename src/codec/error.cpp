#include "dagcbor/codec/error.hpp"

#include <string>

namespace dagcbor::codec {
namespace {

class codec_family_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "dagcbor.codec.family"; }

  std::string message(int ev) const override {
    switch (static_cast<error_family>(ev)) {
      case error_family::format:
        return "cbor format error";
      case error_family::canonical_form:
        return "dag-cbor canonical form error";
      case error_family::resource:
        return "codec resource error";
      default:
        return "unknown dagcbor.codec.family condition";
    }
  }
};

class codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "dagcbor.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unexpected_eof:
        return "unexpected end of input";
      case errc::invalid_additional_info:
        return "invalid additional info in data item head";
      case errc::invalid_utf8:
        return "invalid utf-8 string";
      case errc::list_item:
        return "error while decoding list item";
      case errc::map_key:
        return "error while decoding map key";
      case errc::map_value:
        return "error while decoding map value";
      case errc::link_item:
        return "error while decoding link";
      case errc::excessive_integer_size:
        return "integer not minimally encoded";
      case errc::invalid_simple_value:
        return "simple value not allowed";
      case errc::disallowed_float:
        return "NaN and Infinity are not allowed";
      case errc::key_type:
        return "map key is not a string";
      case errc::duplicate_key:
        return "duplicate map key";
      case errc::key_order:
        return "map keys not in canonical order";
      case errc::invalid_tag:
        return "tag not allowed";
      case errc::link_payload_type:
        return "link payload is not a byte string";
      case errc::link_marker:
        return "link payload missing 0x00 prefix";
      case errc::trailing_data:
        return "trailing data after top-level item";
      case errc::missing_framing:
        return "missing dag-cbor multicodec prefix";
      case errc::integer_range:
        return "integer out of range";
      case errc::nesting_too_deep:
        return "maximum nesting depth exceeded";
      case errc::buffer_overflow:
        return "output buffer overflow";
      case errc::normalization_failed:
        return "unicode normalization failed";
      default:
        return "unknown dagcbor.codec error";
    }
  }

  std::error_condition default_error_condition(int ev) const noexcept override {
    // 按错误码区段归族：1..19 format，20..39 canonical_form，40.. resource。
    if (ev > 0 && ev < 20) {
      return make_error_condition(error_family::format);
    }
    if (ev >= 20 && ev < 40) {
      return make_error_condition(error_family::canonical_form);
    }
    if (ev >= 40 && ev <= static_cast<int>(errc::normalization_failed)) {
      return make_error_condition(error_family::resource);
    }
    return {ev, *this};
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static codec_error_category category;
  return category;
}

const std::error_category& family_category() noexcept {
  static codec_family_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::error_condition make_error_condition(error_family f) noexcept {
  return {static_cast<int>(f), family_category()};
}

const DecodeError& DecodeError::root_cause() const noexcept {
  const DecodeError* current = this;
  while (current->cause) {
    current = current->cause.get();
  }
  return *current;
}

}  // namespace dagcbor::codec
