#include "dagcbor/utils/value_dump.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace dagcbor::utils {
namespace {

using dagcbor::ipld::Value;

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *kind = "\033[1;35m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *dim = "\033[2m";
};

class Dumper final {
public:
    explicit Dumper(const ValueDumpOptions &options) : opt_(options) {}

    void value(const Value &v, std::size_t depth) {
        std::visit(
            [&](const auto &x) {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, ipld::Null>) {
                    colored(Ansi::value) << "null";
                    end_color();
                } else if constexpr (std::is_same_v<T, ipld::Boolean>) {
                    colored(Ansi::value) << (x.value ? "true" : "false");
                    end_color();
                } else if constexpr (std::is_same_v<T, ipld::Integer>) {
                    colored(Ansi::value) << x.to_string();
                    end_color();
                } else if constexpr (std::is_same_v<T, ipld::Float>) {
                    colored(Ansi::value) << std::setprecision(17) << x.value;
                    end_color();
                } else if constexpr (std::is_same_v<T, ipld::Bytes>) {
                    colored(Ansi::kind) << "bytes[" << x.value.size() << ']';
                    end_color();
                    if (!x.value.empty()) {
                        oss_ << ' ';
                        hex(x.value);
                    }
                } else if constexpr (std::is_same_v<T, ipld::Text>) {
                    quoted(x.value, '"');
                } else if constexpr (std::is_same_v<T, ipld::List>) {
                    list(x, depth);
                } else if constexpr (std::is_same_v<T, ipld::Map>) {
                    map(x, depth);
                } else {
                    colored(Ansi::kind) << "link";
                    end_color();
                    oss_ << '(';
                    hex(x.cid);
                    oss_ << ')';
                }
            },
            v.storage());
    }

    [[nodiscard]] std::string str() const { return oss_.str(); }

private:
    std::ostringstream &colored(const char *code) {
        if (opt_.enable_color) {
            oss_ << code;
        }
        return oss_;
    }

    void end_color() {
        if (opt_.enable_color) {
            oss_ << Ansi::reset;
        }
    }

    [[nodiscard]] std::size_t limit(std::size_t total, std::size_t max) const noexcept {
        return max == 0 ? total : std::min(total, max);
    }

    void hex(const std::vector<ipld::byte> &bytes) {
        const auto n = limit(bytes.size(), opt_.max_payload_bytes);
        colored(Ansi::value);
        for (std::size_t i = 0; i < n; ++i) {
            oss_ << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]) << std::dec;
        }
        end_color();
        if (n < bytes.size()) {
            colored(Ansi::dim) << "...";
            end_color();
        }
    }

    void quoted(const std::string &s, char quote) {
        const auto n = limit(s.size(), opt_.max_payload_bytes);
        colored(Ansi::string) << quote;
        for (std::size_t i = 0; i < n; ++i) {
            const auto c = static_cast<unsigned char>(s[i]);
            if (c == '\\' || c == static_cast<unsigned char>(quote)) {
                oss_ << '\\' << static_cast<char>(c);
            } else if (c < 0x20 || c == 0x7F) {
                // 控制字符用 \xHH；非 ASCII 的 UTF-8 字节原样输出。
                oss_ << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c) << std::dec;
            } else {
                oss_ << static_cast<char>(c);
            }
        }
        if (n < s.size()) {
            oss_ << "...";
        }
        oss_ << quote;
        end_color();
    }

    void newline_indent(std::size_t depth) {
        oss_ << '\n' << std::string(depth * opt_.indent_spaces, ' ');
    }

    // 容器的公共骨架：头部 "kind[N] <open>"，逐项输出，超限时以 "..." 收尾。
    template <class Range, class Emit>
    void container(const char *kind, const Range &items, std::size_t total, char open, char close,
                   std::size_t depth, Emit emit) {
        colored(Ansi::kind) << kind << '[' << total << ']';
        end_color();
        oss_ << ' ' << open;
        if (total == 0) {
            oss_ << close;
            return;
        }
        if (depth >= opt_.max_depth) {
            colored(Ansi::dim) << "...";
            end_color();
            oss_ << close;
            return;
        }
        const auto n = limit(total, opt_.max_items);
        std::size_t i = 0;
        for (const auto &item : items) {
            if (i == n) {
                break;
            }
            if (opt_.multiline) {
                newline_indent(depth + 1);
            } else if (i != 0) {
                oss_ << ", ";
            }
            emit(item);
            ++i;
        }
        if (n < total) {
            if (opt_.multiline) {
                newline_indent(depth + 1);
            } else {
                oss_ << ", ";
            }
            colored(Ansi::dim) << "...";
            end_color();
        }
        if (opt_.multiline) {
            newline_indent(depth);
        }
        oss_ << close;
    }

    void list(const ipld::List &items, std::size_t depth) {
        container("list", items, items.size(), '[', ']', depth,
                  [&](const Value &child) { value(child, depth + 1); });
    }

    void map(const ipld::Map &entries, std::size_t depth) {
        container("map", entries, entries.size(), '{', '}', depth, [&](const ipld::MapEntry &entry) {
            quoted(entry.key, '\'');
            oss_ << ": ";
            value(entry.value, depth + 1);
        });
    }

    const ValueDumpOptions &opt_;
    std::ostringstream oss_;
};

} // namespace

std::string dump_value(const dagcbor::ipld::Value &value, ValueDumpOptions options) {
    Dumper dumper(options);
    dumper.value(value, 0);
    return dumper.str();
}

} // namespace dagcbor::utils
