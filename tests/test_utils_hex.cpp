#include "test_main.hpp"

#include <dagcbor/core/error.hpp>
#include <dagcbor/utils/hex.hpp>

#include <cstddef>
#include <string>
#include <vector>

using namespace dagcbor;

int main() {
    // 1) hex 解析：空白、分隔符与 0x 前缀
    {
        std::vector<core::byte> bytes;
        TEST_EXPECT_OK(utils::parse_hex("a2 61 0x61,0C", bytes));
        TEST_EXPECT_EQ(bytes, (std::vector<core::byte>{0xa2, 0x61, 0x61, 0x0c}));

        TEST_EXPECT_OK(utils::parse_hex("", bytes));
        TEST_EXPECT(bytes.empty());
    }

    // 2) hex 解析失败
    {
        std::vector<core::byte> bytes;
        TEST_EXPECT_EC(utils::parse_hex("abc", bytes), core::errc::invalid_argument);
        TEST_EXPECT_EC(utils::parse_hex("zz", bytes), core::errc::invalid_argument);
    }

    // 3) 紧凑格式
    {
        const std::vector<core::byte> bytes{0x00, 0x7f, 0xff};
        TEST_EXPECT_EQ(utils::to_hex(core::bytes_view{bytes.data(), bytes.size()}), "007fff");
    }

    // 4) hexdump：分行与偏移
    {
        std::vector<core::byte> bytes(18);
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<core::byte>(i);
        }
        const auto s = utils::hex_dump(core::bytes_view{bytes.data(), bytes.size()});
        TEST_EXPECT_EQ(s,
                       "0000: 00 01 02 03 04 05 06 07 08 09 0a 0b 0c 0d 0e 0f\n"
                       "0010: 10 11\n");
    }

    // 5) hexdump：截断与 ASCII 侧栏
    {
        const std::vector<core::byte> bytes{0x41, 0x42, 0x00, 0x43};
        utils::HexDumpOptions opt;
        opt.max_bytes = 2;
        TEST_EXPECT_EQ(utils::hex_dump(core::bytes_view{bytes.data(), bytes.size()}, opt),
                       "0000: 41 42\n... (truncated, total=4 bytes)\n");

        opt = {};
        opt.bytes_per_line = 4;
        opt.show_offset = false;
        opt.show_ascii = true;
        TEST_EXPECT_EQ(utils::hex_dump(core::bytes_view{bytes.data(), 3}, opt), "41 42 00      AB.\n");
    }

    // 6) 颜色输出
    {
        const std::vector<core::byte> bytes{0x01};
        utils::HexDumpOptions opt;
        opt.enable_color = true;
        const auto s = utils::hex_dump(core::bytes_view{bytes.data(), bytes.size()}, opt);
        TEST_EXPECT(s.find("\033[") != std::string::npos);
        TEST_EXPECT(s.find("01") != std::string::npos);
    }

    return ::dagcbor::tests::run_and_report();
}
