#include "dagcbor/codec/diagnostics.hpp"

#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

namespace diag = dagcbor::codec::diag;
using dagcbor::codec::byte;
using dagcbor::codec::bytes_view;
using dagcbor::codec::DecodeError;
using dagcbor::codec::StreamSnapshot;
using Lines = std::vector<std::string>;

std::vector<byte> iota_bytes(std::size_t n) {
  std::vector<byte> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = static_cast<byte>(i);
  }
  return out;
}

void test_bytes_to_hex() {
  const auto short_bytes = iota_bytes(16);
  TEST_EXPECT_EQ(diag::bytes_to_hex(bytes_view{short_bytes.data(), short_bytes.size()}),
                 "000102030405060708090a0b0c0d0e0f");
  const auto long_bytes = iota_bytes(17);
  TEST_EXPECT_EQ(diag::bytes_to_hex(bytes_view{long_bytes.data(), long_bytes.size()}), "00...10");
  TEST_EXPECT_EQ(diag::bytes_to_hex(bytes_view{}), "");
}

void test_snapshot_layout() {
  // 读取了 3 个字节，读取结束后位置为 5：起始位置为 2。
  const StreamSnapshot head({0x19, 0x00, 0x0a}, 5);

  TEST_EXPECT_EQ(diag::snapshot_lines({&head}), (Lines{"At byte #2: 19000a"}));
  TEST_EXPECT_EQ(diag::snapshot_lines({&head}, diag::LineOptions{.details = "x", .hl_start = 1}),
                 (Lines{"At byte #2: 19000a", "              ^^^^ x"}));
  TEST_EXPECT_EQ(diag::snapshot_lines({&head}, diag::LineOptions{.details = "y", .hl_len = 1, .dots = true}),
                 (Lines{"At byte #2: 19000a...", "            ^^ y"}));
  TEST_EXPECT_EQ(diag::snapshot_lines({&head}, diag::LineOptions{.details = "z", .start = 1, .end = 2, .pad_start = 1}),
                 (Lines{"At byte #3:   00", "              ^^ z"}));

  // 多个快照拼接：位置取第一个快照的起始位置。
  const StreamSnapshot body({0x61}, 6);
  TEST_EXPECT_EQ(diag::snapshot_lines({&head, &body}), (Lines{"At byte #2: 19000a61"}));

  // 位置位数变化时第二行随之对齐。
  const StreamSnapshot far({0xf0}, 1235);
  TEST_EXPECT_EQ(diag::snapshot_lines({&far}, diag::LineOptions{.details = "d"}),
                 (Lines{"At byte #1234: f0", "               ^^ d"}));
}

void test_snapshot_eof() {
  const StreamSnapshot empty({}, 7);
  TEST_EXPECT_EQ(diag::snapshot_lines({&empty}, diag::LineOptions{.details = "gone"}),
                 (Lines{"At byte #7: <EOF>", "            ^^^^^ gone"}));
}

void test_snapshot_truncated() {
  const StreamSnapshot big(iota_bytes(20), 20);
  TEST_EXPECT_EQ(diag::snapshot_lines({&big}, diag::LineOptions{.details = "first", .hl_len = 1}),
                 (Lines{"At byte #0: 00...13 (last byte #19)", "            ^^ first"}));
  TEST_EXPECT_EQ(diag::snapshot_lines({&big}, diag::LineOptions{.details = "last", .hl_start = 19}),
                 (Lines{"At byte #0: 00...13 (last byte #19)", "                 ^^ last"}));
  TEST_EXPECT_EQ(diag::snapshot_lines({&big}, diag::LineOptions{.details = "all", .hl_start = 3, .hl_len = 2}),
                 (Lines{"At byte #0: 00...13 (last byte #19)", "            ^^^^^^^ all"}));
}

void test_cause_lines() {
  DecodeError inner;
  inner.message = "Inner failure.\nAt byte #3: 01\n            ^^ here";
  TEST_EXPECT_EQ(diag::cause_lines(inner),
                 (Lines{"\\ Inner failure.", "  At byte #3: 01", "              ^^ here"}));
  TEST_EXPECT_EQ(diag::join_lines({"a", "b"}), "a\nb");
  TEST_EXPECT_EQ(diag::join_lines({}), "");
}

void test_messages() {
  const StreamSnapshot tag({0xd8, 0x2b}, 2);
  TEST_EXPECT_EQ(diag::invalid_tag(tag, 43),
                 "Error while decoding item of major type 0x6: only tag 42 is allowed.\n"
                 "At byte #0: d82b\n"
                 "              ^^ tag 43");

  const StreamSnapshot head({0x81}, 10);
  TEST_EXPECT_EQ(diag::nesting_too_deep(head, 4),
                 "Maximum nesting depth 4 exceeded.\n"
                 "At byte #9: 81\n"
                 "            ^^ container nested too deeply");

  // 规范化失败只标注字符串头部（正文可能很长）。
  const StreamSnapshot text_head({0x7a, 0x80, 0x00, 0x00, 0x00}, 8);
  TEST_EXPECT_EQ(diag::normalization_failed(text_head, "NFC", 0x80000000u),
                 "Unicode NFC normalization failed.\n"
                 "At byte #3: 7a80000000...\n"
                 "            ^^ string of length 2147483648");

  const StreamSnapshot prefix({0x72}, 1);
  TEST_EXPECT_EQ(diag::missing_framing(prefix, 0x71),
                 "Required 'dag-cbor' multicodec code.\n"
                 "At byte #0: 72\n"
                 "            ^^ byte should be 0x71.");

  const StreamSnapshot map_head({0xa2}, 1);
  const StreamSnapshot key({0x61, 0x27}, 3);
  TEST_EXPECT_EQ(diag::duplicate_key(map_head, key, "'", 1, 2),
                 "Error while decoding map.\n"
                 "At byte #0: a2...\n"
                 "            ^^ map of length 2\n"
                 "Duplicate key is found at position 1.\n"
                 "At byte #1: 6127\n"
                 "            ^^^^ decodes to key '\\''");
}

}  // namespace

int main() {
  test_bytes_to_hex();
  test_snapshot_layout();
  test_snapshot_eof();
  test_snapshot_truncated();
  test_cause_lines();
  test_messages();
  return ::dagcbor::tests::run_and_report();
}
