#include "dagcbor/codec/decoder.hpp"
#include "dagcbor/codec/encoder.hpp"
#include "dagcbor/codec/stream.hpp"

#include "test_main.hpp"

#include <array>
#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace {

using dagcbor::codec::byte;
using dagcbor::codec::bytes_view;
using dagcbor::codec::decode;
using dagcbor::codec::DecodeOptions;
using dagcbor::codec::encode;
using dagcbor::codec::encoded_size;
using dagcbor::codec::EncodeOptions;
using dagcbor::codec::MemorySource;
using dagcbor::ipld::Integer;
using dagcbor::ipld::Map;
using dagcbor::ipld::Value;

// 头部宽度切换点附近的参数值。
constexpr std::array<std::uint64_t, 10> kBoundaries{
    0, 23, 24, 255, 256, 65535, 65536, 0xFFFFFFFFull, 0x100000000ull, std::numeric_limits<std::uint64_t>::max(),
};

// 文本片段：ASCII 与 2/3/4 字节 UTF-8 序列。
constexpr std::array<const char*, 9> kTextPieces{
    "a", "Z", "0", " ", "\xc3\xa9", "\xc3\x9f", "\xe2\x82\xac", "\xe6\x97\xa5", "\xf0\x9f\x98\x80",
};

// 固定种子的随机 Value 生成器：覆盖全部 Kind，嵌套深度有限。
class ValueGenerator final {
 public:
  explicit ValueGenerator(std::uint64_t seed) : rng_(seed) {}

  Value next(std::size_t depth = 0) {
    const std::size_t kinds = depth >= kMaxDepth ? 6 : 9;
    switch (pick(kinds)) {
      case 0:
        return Value::null();
      case 1:
        return Value::boolean(pick(2) == 1);
      case 2:
        return Value::integer(next_integer());
      case 3:
        return Value::floating(next_float());
      case 4:
        return Value::bytes(next_bytes(pick(8) == 0 ? 300 : pick(20)));
      case 5:
        return Value::text(next_text());
      case 6: {
        std::vector<Value> items;
        const std::size_t n = pick(10) == 0 ? 30 : pick(5);
        for (std::size_t i = 0; i < n; ++i) {
          items.push_back(next(depth + 1));
        }
        return Value::list(std::move(items));
      }
      case 7: {
        Map map;
        const std::size_t n = pick(6);
        for (std::size_t i = 0; i < n; ++i) {
          map.insert(next_text(), next(depth + 1));
        }
        return Value::map(std::move(map));
      }
      default: {
        std::vector<byte> cid{0x01, 0x71, 0x12, 0x20};
        const auto digest = next_bytes(32);
        cid.insert(cid.end(), digest.begin(), digest.end());
        return Value::link(std::move(cid));
      }
    }
  }

 private:
  static constexpr std::size_t kMaxDepth = 4;

  std::size_t pick(std::size_t n) { return static_cast<std::size_t>(rng_() % n); }

  Integer next_integer() {
    switch (pick(4)) {
      case 0:
        return Integer::from_uint64(kBoundaries[pick(kBoundaries.size())]);
      case 1:
        return Integer::negative(kBoundaries[pick(kBoundaries.size())]);
      case 2:
        return Integer::from_int64(static_cast<std::int64_t>(rng_()));
      default:
        return Integer::from_uint64(rng_());
    }
  }

  double next_float() {
    switch (pick(4)) {
      case 0:
        return -0.0;
      case 1:
        return std::numeric_limits<double>::denorm_min();
      case 2:
        return std::numeric_limits<double>::max();
      default:
        break;
    }
    const auto d = std::bit_cast<double>(rng_());
    return std::isfinite(d) ? d : 1.5;
  }

  std::vector<byte> next_bytes(std::size_t n) {
    std::vector<byte> out(n);
    for (auto& b : out) {
      b = static_cast<byte>(rng_() & 0xFFu);
    }
    return out;
  }

  std::string next_text() {
    std::string out;
    const std::size_t n = pick(8) == 0 ? 30 : pick(6);
    for (std::size_t i = 0; i < n; ++i) {
      out += kTextPieces[pick(kTextPieces.size())];
    }
    return out;
  }

  std::mt19937_64 rng_;
};

std::vector<byte> encode_ok(const Value& v) {
  std::vector<byte> out;
  TEST_EXPECT_OK(encode(v, out));
  return out;
}

void test_generated_roundtrip() {
  ValueGenerator gen(20240601);
  for (int i = 0; i < 1000; ++i) {
    const auto v = gen.next();
    const auto encoded = encode_ok(v);

    std::size_t size = 0;
    TEST_EXPECT_OK(encoded_size(v, size));
    TEST_EXPECT_EQ(size, encoded.size());

    EncodeOptions framed;
    framed.include_multicodec = true;
    TEST_EXPECT_OK(encoded_size(v, size, framed));
    TEST_EXPECT_EQ(size, encoded.size() + 1);

    Value out = Value::null();
    TEST_EXPECT_OK(decode(bytes_view{encoded.data(), encoded.size()}, out));
    TEST_EXPECT(out == v);
    // 规范编码唯一：再次编码得到相同字节。
    TEST_EXPECT(encode_ok(out) == encoded);
  }
}

// 同一字节源上连续解码三个拼接的数据项：逐项回调的字节数之和等于各自的编码长度。
void test_generated_concat() {
  ValueGenerator gen(7);
  for (int round = 0; round < 200; ++round) {
    const std::array<Value, 3> values{gen.next(), gen.next(), gen.next()};
    std::vector<byte> joined;
    std::array<std::size_t, 3> sizes{};
    for (std::size_t k = 0; k < values.size(); ++k) {
      const auto encoded = encode_ok(values[k]);
      sizes[k] = encoded.size();
      joined.insert(joined.end(), encoded.begin(), encoded.end());
    }

    MemorySource source(bytes_view{joined.data(), joined.size()});
    std::size_t counted = 0;
    DecodeOptions options;
    options.allow_concat = true;
    options.callback = [&](const Value&, std::size_t n) { counted += n; };

    std::size_t left = joined.size();
    for (std::size_t k = 0; k < values.size(); ++k) {
      counted = 0;
      Value out = Value::null();
      TEST_EXPECT_OK(decode(source, out, options));
      TEST_EXPECT(out == values[k]);
      TEST_EXPECT_EQ(counted, sizes[k]);
      left -= sizes[k];
      TEST_EXPECT_EQ(source.remaining(), left);
    }
  }
}

}  // namespace

int main() {
  test_generated_roundtrip();
  test_generated_concat();
  return ::dagcbor::tests::run_and_report();
}
