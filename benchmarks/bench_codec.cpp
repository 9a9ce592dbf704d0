#include "bench_main.hpp"
#include "dagcbor/codec/decoder.hpp"
#include "dagcbor/codec/encoder.hpp"
#include "dagcbor/ipld/value.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using namespace dagcbor;
using namespace dagcbor::codec;
using ipld::Map;
using ipld::Value;

static Value create_deep_nested_list(int depth) {
  if (depth <= 0) {
    return Value::integer(42);
  }
  return Value::list({create_deep_nested_list(depth - 1)});
}

static void bench_roundtrip(benchmarks::Suite& suite, const std::string& label, const Value& value, int runs) {
  std::vector<byte> encoded;
  suite.measure(label + " encode", runs, [&] {
    encoded.clear();
    auto ec = encode(value, encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
    return encoded.size();
  });

  suite.measure(label + " decode", runs, [&] {
    Value decoded = Value::null();
    DecodeError err;
    auto ec = decode(bytes_view{encoded.data(), encoded.size()}, decoded, {}, &err);
    if (ec) {
      std::cerr << "Decode failed: " << err.message << "\n";
    }
    return encoded.size();
  });
}

static void bench_codec_deep_nested(benchmarks::Suite& suite) {
  // 深度嵌套 List（200 层，低于默认嵌套上限）
  bench_roundtrip(suite, "Deep nested list (200 levels)", create_deep_nested_list(200), 10);
}

static void bench_codec_large_list(benchmarks::Suite& suite) {
  constexpr std::size_t item_count = 100000;
  std::vector<Value> items;
  items.reserve(item_count);
  for (std::size_t i = 0; i < item_count; ++i) {
    items.push_back(Value::uinteger(static_cast<std::uint64_t>(i) * 7919u));
  }
  bench_roundtrip(suite, "Large list (100000 integers)", Value::list(std::move(items)), 5);
}

static void bench_codec_large_map(benchmarks::Suite& suite) {
  // 键以乱序插入，Map 内部保持规范顺序
  constexpr std::size_t entry_count = 10000;
  Map map;
  for (std::size_t i = entry_count; i > 0; --i) {
    map.insert("key-" + std::to_string(i), Value::text("value-" + std::to_string(i)));
  }
  bench_roundtrip(suite, "Large map (10000 entries)", Value::map(std::move(map)), 5);
}

static void bench_codec_large_bytes(benchmarks::Suite& suite) {
  constexpr std::size_t size = 4 * 1024 * 1024;
  std::vector<byte> payload(size);
  for (std::size_t i = 0; i < size; ++i) {
    payload[i] = static_cast<byte>(i & 0xFF);
  }
  bench_roundtrip(suite, "Large bytes (4 MB)", Value::bytes(std::move(payload)), 5);
}

static void bench_codec_links(benchmarks::Suite& suite) {
  constexpr std::size_t link_count = 10000;
  std::vector<Value> links;
  links.reserve(link_count);
  for (std::size_t i = 0; i < link_count; ++i) {
    std::vector<byte> cid{0x01, 0x71, 0x12, 0x20};
    cid.resize(36, static_cast<byte>(i & 0xFF));
    links.push_back(Value::link(std::move(cid)));
  }
  bench_roundtrip(suite, "Link list (10000 CIDs)", Value::list(std::move(links)), 5);
}

static void bench_codec_normalized_text(benchmarks::Suite& suite) {
  std::vector<Value> texts;
  for (int i = 0; i < 10000; ++i) {
    texts.push_back(Value::text("e\xcc\x81t\xc3\xa9 " + std::to_string(i)));
  }
  const Value value = Value::list(std::move(texts));

  EncodeOptions options;
  options.normalize_strings = Normalization::nfc;
  std::vector<byte> encoded;
  suite.measure("NFC text list encode (10000 strings)", 5, [&] {
    encoded.clear();
    auto ec = encode(value, encoded, options);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
    return encoded.size();
  });
}

int main() {
  benchmarks::Suite suite;
  bench_codec_deep_nested(suite);
  bench_codec_large_list(suite);
  bench_codec_large_map(suite);
  bench_codec_large_bytes(suite);
  bench_codec_links(suite);
  bench_codec_normalized_text(suite);

  suite.report();
  return 0;
}
