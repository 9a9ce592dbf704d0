#include "dagcbor/utils/hex.hpp"

#include <algorithm>
#include <cctype>
#include <new>
#include <string_view>
#include <utility>

namespace dagcbor::utils {
namespace {

constexpr std::string_view kDigits = "0123456789abcdef";
constexpr std::string_view kSeparators = ",;:-_|/\\[](){}<>'\"";

constexpr const char *kReset = "\033[0m";
constexpr const char *kDim = "\033[2m";
constexpr const char *kBytes = "\033[1;33m";
constexpr const char *kAscii = "\033[1;32m";
constexpr const char *kError = "\033[1;31m";

void append_byte_(std::string &out, dagcbor::core::byte b) {
    out += kDigits[b >> 4];
    out += kDigits[b & 0x0F];
}

[[nodiscard]] int nibble_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    c = static_cast<unsigned char>(std::tolower(c));
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

[[nodiscard]] bool skippable_(unsigned char c) noexcept {
    return std::isspace(c) != 0 || kSeparators.find(static_cast<char>(c)) != std::string_view::npos;
}

/**
 * @brief 按选项逐段拼接输出（颜色码在关闭时为空串）。
 */
class DumpWriter final {
public:
    explicit DumpWriter(bool color) : color_(color) {}

    void styled(const char *style, std::string_view text) {
        if (color_) {
            out_ += style;
        }
        out_ += text;
        if (color_) {
            out_ += kReset;
        }
    }

    void plain(std::string_view text) { out_ += text; }

    [[nodiscard]] std::string take() { return std::move(out_); }

private:
    bool color_{false};
    std::string out_;
};

} // namespace

std::string to_hex(dagcbor::core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        append_byte_(out, b);
    }
    return out;
}

std::string hex_dump(dagcbor::core::bytes_view bytes, HexDumpOptions options) {
    const std::size_t total = bytes.size();
    const std::size_t shown = options.max_bytes == 0 ? total : std::min(total, options.max_bytes);
    const std::size_t per_line = options.bytes_per_line == 0 ? 16 : options.bytes_per_line;

    DumpWriter w(options.enable_color);
    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        const std::size_t n = std::min(per_line, shown - offset);

        if (options.show_offset) {
            std::string off;
            for (int shift = 12; shift >= 0; shift -= 4) {
                off += kDigits[(offset >> shift) & 0x0F];
            }
            off += ": ";
            w.styled(kDim, off);
        }

        std::string hex;
        for (std::size_t i = 0; i < n; ++i) {
            if (i != 0) {
                hex += ' ';
            }
            append_byte_(hex, bytes[offset + i]);
        }
        w.styled(kBytes, hex);

        if (options.show_ascii) {
            // 末行不足 per_line 时补齐，保证 ASCII 列对齐。
            std::string pad((per_line - n) * 3 + 3, ' ');
            w.plain(pad);
            std::string ascii;
            for (std::size_t i = 0; i < n; ++i) {
                const auto c = bytes[offset + i];
                ascii += (c >= 0x20 && c <= 0x7E) ? static_cast<char>(c) : '.';
            }
            w.styled(kAscii, ascii);
        }
        w.plain("\n");
    }

    if (shown < total) {
        w.styled(kError, "... (truncated, total=" + std::to_string(total) + " bytes)");
        w.plain("\n");
    }
    return w.take();
}

std::error_code parse_hex(std::string_view text,
                          std::vector<dagcbor::core::byte> &out) noexcept {
    out.clear();
    int high = -1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (skippable_(c)) {
            continue;
        }
        // 0x/0X 前缀只在字节边界上识别。
        if (high < 0 && c == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }
        const int v = nibble_(c);
        if (v < 0) {
            return dagcbor::core::make_error_code(dagcbor::core::errc::invalid_argument);
        }
        if (high < 0) {
            high = v;
            continue;
        }
        try {
            out.push_back(static_cast<dagcbor::core::byte>((high << 4) | v));
        } catch (const std::bad_alloc &) {
            return dagcbor::core::make_error_code(dagcbor::core::errc::buffer_overflow);
        }
        high = -1;
    }
    if (high >= 0) {
        return dagcbor::core::make_error_code(dagcbor::core::errc::invalid_argument);
    }
    return {};
}

} // namespace dagcbor::utils
