#include "dagcbor/codec/encoder.hpp"
#include "dagcbor/utils/hex.hpp"

#include "test_main.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {

using dagcbor::codec::byte;
using dagcbor::codec::encode;
using dagcbor::codec::encode_to;
using dagcbor::codec::encoded_size;
using dagcbor::codec::EncodeError;
using dagcbor::codec::EncodeOptions;
using dagcbor::codec::errc;
using dagcbor::codec::Normalization;
using dagcbor::ipld::Integer;
using dagcbor::ipld::Map;
using dagcbor::ipld::ObjPath;
using dagcbor::ipld::Value;

std::string encode_hex(const Value& value, const EncodeOptions& options = {}) {
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(value, out, options));
  return dagcbor::utils::to_hex(dagcbor::core::bytes_view{out.data(), out.size()});
}

Value sample_map() { return Value::map(Map{{"a", Value::integer(12)}, {"b", Value::text("hello!")}}); }

void test_reference_map() { TEST_EXPECT_EQ(encode_hex(sample_map()), "a261610c61626668656c6c6f21"); }

void test_minimal_integer_heads() {
  TEST_EXPECT_EQ(encode_hex(Value::integer(0)), "00");
  TEST_EXPECT_EQ(encode_hex(Value::integer(23)), "17");
  TEST_EXPECT_EQ(encode_hex(Value::integer(24)), "1818");
  TEST_EXPECT_EQ(encode_hex(Value::integer(255)), "18ff");
  TEST_EXPECT_EQ(encode_hex(Value::integer(256)), "190100");
  TEST_EXPECT_EQ(encode_hex(Value::integer(65535)), "19ffff");
  TEST_EXPECT_EQ(encode_hex(Value::integer(65536)), "1a00010000");
  TEST_EXPECT_EQ(encode_hex(Value::integer(4294967295)), "1affffffff");
  TEST_EXPECT_EQ(encode_hex(Value::integer(4294967296)), "1b0000000100000000");
  TEST_EXPECT_EQ(encode_hex(Value::uinteger(std::numeric_limits<std::uint64_t>::max())), "1bffffffffffffffff");

  TEST_EXPECT_EQ(encode_hex(Value::integer(-1)), "20");
  TEST_EXPECT_EQ(encode_hex(Value::integer(-24)), "37");
  TEST_EXPECT_EQ(encode_hex(Value::integer(-25)), "3818");
  TEST_EXPECT_EQ(encode_hex(Value::integer(-256)), "38ff");
  TEST_EXPECT_EQ(encode_hex(Value::integer(-257)), "390100");
  TEST_EXPECT_EQ(encode_hex(Value::integer(Integer::negative(std::numeric_limits<std::uint64_t>::max()))),
                 "3bffffffffffffffff");

  std::vector<byte> out;
  TEST_EXPECT_OK(encode(Value::integer(255), out));
  TEST_EXPECT_EQ(out.size(), 2u);
  out.clear();
  TEST_EXPECT_OK(encode(Value::integer(256), out));
  TEST_EXPECT_EQ(out.size(), 3u);
}

void test_scalars() {
  TEST_EXPECT_EQ(encode_hex(Value::boolean(false)), "f4");
  TEST_EXPECT_EQ(encode_hex(Value::boolean(true)), "f5");
  TEST_EXPECT_EQ(encode_hex(Value::null()), "f6");
  // 浮点总是 8 字节，不做最小化。
  TEST_EXPECT_EQ(encode_hex(Value::floating(1.5)), "fb3ff8000000000000");
  TEST_EXPECT_EQ(encode_hex(Value::floating(0.0)), "fb0000000000000000");
  TEST_EXPECT_EQ(encode_hex(Value::floating(-0.0)), "fb8000000000000000");
  TEST_EXPECT_EQ(encode_hex(Value::bytes({})), "40");
  TEST_EXPECT_EQ(encode_hex(Value::bytes({0x01, 0x02, 0x03})), "43010203");
  TEST_EXPECT_EQ(encode_hex(Value::text("")), "60");
  TEST_EXPECT_EQ(encode_hex(Value::text("IETF")), "6449455446");
  TEST_EXPECT_EQ(encode_hex(Value::text("\xc3\xbc")), "62c3bc");
}

void test_containers_and_links() {
  TEST_EXPECT_EQ(encode_hex(Value::list({})), "80");
  TEST_EXPECT_EQ(encode_hex(Value::list({Value::integer(1), Value::list({Value::integer(2), Value::integer(3)})})),
                 "8201820203");
  TEST_EXPECT_EQ(encode_hex(Value::map(Map{})), "a0");
  TEST_EXPECT_EQ(encode_hex(Value::link({0x01, 0x02})), "d82a43000102");

  std::vector<Value> many;
  for (int i = 0; i < 24; ++i) {
    many.push_back(Value::null());
  }
  const auto hex = encode_hex(Value::list(std::move(many)));
  TEST_EXPECT_EQ(hex.substr(0, 4), "9818");
  TEST_EXPECT_EQ(hex.size(), 2u * (2u + 24u));
}

void test_map_key_order_is_length_first() {
  TEST_EXPECT_EQ(encode_hex(Value::map(Map{{"aa", Value::integer(1)}, {"b", Value::integer(2)}})),
                 "a261620262616101");

  Map forward;
  forward.insert("a", Value::integer(1));
  forward.insert("b", Value::integer(2));
  forward.insert("aa", Value::integer(3));
  Map backward;
  backward.insert("aa", Value::integer(3));
  backward.insert("b", Value::integer(2));
  backward.insert("a", Value::integer(1));
  TEST_EXPECT_EQ(encode_hex(Value::map(forward)), encode_hex(Value::map(backward)));
}

void test_disallowed_floats() {
  const std::array<double, 3> bad{std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity(),
                                  -std::numeric_limits<double>::infinity()};
  for (double f : bad) {
    std::vector<byte> out;
    EncodeError err;
    TEST_EXPECT_EC(encode(Value::floating(f), out, {}, &err), errc::disallowed_float);
    TEST_EXPECT(out.empty());
    TEST_EXPECT(err.path.empty());
  }

  EncodeError err;
  std::vector<byte> out{0xaa};
  const auto nested = Value::map(Map{{"x", Value::list({Value::integer(1), Value::floating(
                                                            std::numeric_limits<double>::quiet_NaN())})}});
  TEST_EXPECT_EC(encode(nested, out, {}, &err), errc::disallowed_float);
  TEST_EXPECT_EQ(out, (std::vector<byte>{0xaa}));
  TEST_EXPECT(err.path == ObjPath{} / std::string("x") / 1);
  TEST_EXPECT_EQ(err.message, "Error encoding float value at /'x'/1: NaN is not allowed.");

  std::vector<byte> out2;
  EncodeError err2;
  TEST_EXPECT_EC(encode(Value::list({Value::floating(-std::numeric_limits<double>::infinity())}), out2, {}, &err2),
                 errc::disallowed_float);
  TEST_EXPECT_EQ(err2.message, "Error encoding float value at /0: -Infinity is not allowed.");
}

void test_invalid_utf8_rejected() {
  std::vector<byte> out;
  EncodeError err;
  TEST_EXPECT_EC(encode(Value::text("\xff"), out, {}, &err), errc::invalid_utf8);
  TEST_EXPECT_EQ(err.message, "Error encoding string at /: invalid utf-8 at byte 0 (invalid start byte).");

  EncodeError key_err;
  TEST_EXPECT_EC(encode(Value::map(Map{{"ok\xe2\x82", Value::null()}}), out, {}, &key_err), errc::invalid_utf8);
  TEST_EXPECT(key_err.path == ObjPath{} / std::string("ok\xe2\x82"));
  TEST_EXPECT(out.empty());
}

void test_normalization() {
  EncodeOptions nfc;
  nfc.normalize_strings = Normalization::nfc;
  TEST_EXPECT_EQ(encode_hex(Value::text("e\xcc\x81"), nfc), "62c3a9");
  TEST_EXPECT_EQ(encode_hex(Value::text("e\xcc\x81")), "6365cc81");

  EncodeOptions nfd;
  nfd.normalize_strings = Normalization::nfd;
  TEST_EXPECT_EQ(encode_hex(Value::text("\xc3\xa9"), nfd), "6365cc81");

  // 规范化后键重新排序：3 字节的 "e\u0301" 变为 2 字节的 "\u00e9"，排到 "abc" 之前。
  TEST_EXPECT_EQ(encode_hex(Value::map(Map{{"abc", Value::integer(1)}, {"e\xcc\x81", Value::integer(2)}}), nfc),
                 "a262c3a9026361626301");
}

void test_normalization_collision() {
  EncodeOptions nfc;
  nfc.normalize_strings = Normalization::nfc;
  std::vector<byte> out;
  EncodeError err;
  const auto v = Value::map(Map{{"\xc3\xa9", Value::integer(1)}, {"e\xcc\x81", Value::integer(2)}});
  TEST_EXPECT_EC(encode(v, out, nfc, &err), errc::duplicate_key);
  TEST_EXPECT_EQ(err.path.size(), 1u);
  TEST_EXPECT_OK(encode(v, out));
}

void test_nesting_limit() {
  EncodeOptions shallow;
  shallow.max_depth = 2;
  const auto ok = Value::list({Value::list({Value::integer(1)})});
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(ok, out, shallow));

  const auto deep = Value::list({Value::list({Value::list({})})});
  EncodeError err;
  out.clear();
  TEST_EXPECT_EC(encode(deep, out, shallow, &err), errc::nesting_too_deep);
  TEST_EXPECT(err.path == ObjPath{} / 0 / 0);
  TEST_EXPECT(out.empty());
}

void test_multicodec_prefix_and_sizes() {
  EncodeOptions framed;
  framed.include_multicodec = true;
  TEST_EXPECT_EQ(encode_hex(Value::integer(1), framed), "7101");

  std::size_t size = 0;
  TEST_EXPECT_OK(encoded_size(sample_map(), size));
  TEST_EXPECT_EQ(size, 13u);
  TEST_EXPECT_OK(encoded_size(sample_map(), size, framed));
  TEST_EXPECT_EQ(size, 14u);
}

void test_encode_to_sinks() {
  std::vector<byte> buf{0x00, 0x00};
  dagcbor::codec::VectorSink vs(buf);
  std::size_t written = 0;
  TEST_EXPECT_OK(encode_to(Value::text("hello"), vs, written));
  TEST_EXPECT_EQ(written, 6u);
  TEST_EXPECT_EQ(buf.size(), 8u);

  std::array<byte, 3> small{};
  dagcbor::codec::SpanSink ss(dagcbor::codec::mutable_bytes_view{small.data(), small.size()});
  EncodeError err;
  TEST_EXPECT_EC(encode_to(Value::text("hello"), ss, written, {}, &err), errc::buffer_overflow);
  TEST_EXPECT_EQ(err.message, "Error writing encoded output: output buffer overflow.");
}

}  // namespace

int main() {
  test_reference_map();
  test_minimal_integer_heads();
  test_scalars();
  test_containers_and_links();
  test_map_key_order_is_length_first();
  test_disallowed_floats();
  test_invalid_utf8_rejected();
  test_normalization();
  test_normalization_collision();
  test_nesting_limit();
  test_multicodec_prefix_and_sizes();
  test_encode_to_sinks();
  return ::dagcbor::tests::run_and_report();
}
