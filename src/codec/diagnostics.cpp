#include "dagcbor/codec/diagnostics.hpp"

#include "dagcbor/codec/multicodec.hpp"
#include "dagcbor/codec/types.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace dagcbor::codec::diag {
namespace {

constexpr const char* kBytePrefix = "At byte #";

[[nodiscard]] std::string hex_u64(std::uint64_t v, int width) {
  std::ostringstream oss;
  oss << std::hex << std::setw(width) << std::setfill('0') << v;
  return oss.str();
}

[[nodiscard]] std::string plural(std::size_t n, std::string_view word) {
  std::string out(word);
  if (n != 1) {
    out += 's';
  }
  return out;
}

// 单引号包裹的键文本，不可打印字符用 \xHH。
[[nodiscard]] std::string quote_key(std::string_view key) {
  std::ostringstream oss;
  oss << '\'';
  for (char ch : key) {
    const auto c = static_cast<unsigned char>(ch);
    if (c == '\\' || c == '\'') {
      oss << '\\' << ch;
    } else if (c < 0x20 || c == 0x7F) {
      oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c) << std::dec;
    } else {
      oss << ch;
    }
  }
  oss << '\'';
  return oss.str();
}

[[nodiscard]] std::string with_lines(std::string headline, const std::vector<std::string>& lines) {
  std::vector<std::string> all;
  all.reserve(lines.size() + 1);
  all.push_back(std::move(headline));
  all.insert(all.end(), lines.begin(), lines.end());
  return join_lines(all);
}

void append(std::vector<std::string>& out, const std::vector<std::string>& more) {
  out.insert(out.end(), more.begin(), more.end());
}

[[nodiscard]] std::string link_template(const StreamSnapshot& link_head, const std::vector<std::string>& explanation) {
  std::vector<std::string> lines{"Error while decoding CID."};
  append(lines, snapshot_lines({&link_head}, LineOptions{.details = "CID tag", .dots = true}));
  append(lines, explanation);
  return join_lines(lines);
}

}  // namespace

std::string bytes_to_hex(bytes_view bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  if (bytes.size() <= kTruncateBytes) {
    for (byte b : bytes) {
      oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
  }
  oss << std::setw(2) << static_cast<int>(bytes.front()) << "..." << std::setw(2) << static_cast<int>(bytes.back());
  return oss.str();
}

std::vector<std::string> snapshot_lines(std::initializer_list<const StreamSnapshot*> snapshots,
                                        const LineOptions& options) {
  std::vector<byte> joined;
  std::size_t first_start = 0;
  bool first = true;
  for (const auto* snapshot : snapshots) {
    if (first) {
      first_start = snapshot->latest_read_start();
      first = false;
    }
    const auto bs = snapshot->latest_read();
    joined.insert(joined.end(), bs.begin(), bs.end());
  }

  const std::size_t start = std::min(options.start, joined.size());
  const std::size_t end = std::clamp(options.end.value_or(joined.size()), start, joined.size());
  const bytes_view bs{joined.data() + start, end - start};
  const std::size_t pos = first_start + start;

  std::string bs_str = bytes_to_hex(bs);
  const bool truncated = bs_str.size() != 2 * bs.size();
  std::string bs_tab;
  if (bs_str.empty()) {
    bs_str = "<EOF>";
    bs_tab = std::string(bs_str.size(), '^');
  } else {
    const std::size_t hl_start = std::min(options.hl_start, bs.size());
    const std::size_t hl_len = std::min(options.hl_len.value_or(bs.size() - hl_start), bs.size() - hl_start);
    if (truncated) {
      // 折叠显示时只能精确标出首字节或尾字节，其它情况标出整段。
      if (hl_len == 1 && hl_start == 0) {
        bs_tab = "^^";
      } else if (hl_len == 1 && hl_start == bs.size() - 1) {
        bs_tab = std::string(bs_str.size() - 2, ' ') + "^^";
      } else {
        bs_tab = std::string(bs_str.size(), '^');
      }
    } else {
      bs_tab = std::string(2 * hl_start, ' ') + std::string(2 * hl_len, '^');
    }
  }
  const std::string pad(2 * options.pad_start, ' ');

  std::ostringstream line;
  line << kBytePrefix << pos << ": " << pad << bs_str;
  if (truncated) {
    line << " (last byte #" << (pos + bs.size() - 1) << ')';
  }
  if (options.dots) {
    line << "...";
  }

  std::vector<std::string> lines{line.str()};
  if (options.details) {
    const auto indent = std::string_view(kBytePrefix).size() + std::to_string(pos).size() + 2;
    lines.push_back(std::string(indent, ' ') + pad + bs_tab + ' ' + *options.details);
  }
  return lines;
}

std::vector<std::string> cause_lines(const DecodeError& cause) {
  std::vector<std::string> lines;
  std::string_view text = cause.message;
  bool first = true;
  while (true) {
    const auto nl = text.find('\n');
    const auto line = text.substr(0, nl);
    lines.push_back(std::string(first ? "\\ " : "  ") + std::string(line));
    first = false;
    if (nl == std::string_view::npos) {
      break;
    }
    text.remove_prefix(nl + 1);
  }
  return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i != 0) {
      out += '\n';
    }
    out += lines[i];
  }
  return out;
}

std::string unexpected_eof(std::initializer_list<const StreamSnapshot*> snapshots,
                           std::size_t hl_start,
                           std::size_t bytes_read,
                           std::string_view what,
                           std::size_t expected) {
  std::ostringstream msg;
  msg << "Unexpected EOF while attempting to read " << what << '.';
  std::ostringstream details;
  details << bytes_read << ' ' << plural(bytes_read, "byte") << " read, out of " << expected << " expected.";
  return with_lines(msg.str(), snapshot_lines(snapshots, LineOptions{.details = details.str(), .hl_start = hl_start}));
}

std::string invalid_additional_info(const StreamSnapshot& head, std::uint8_t additional_info, std::uint8_t major) {
  const auto bits = [](unsigned v) {
    std::string s(5, '0');
    for (int i = 4; i >= 0; --i) {
      s[static_cast<std::size_t>(i)] = static_cast<char>('0' + (v & 1u));
      v >>= 1;
    }
    return s;
  };
  std::ostringstream msg;
  msg << "Invalid additional info " << static_cast<int>(additional_info)
      << " in data item head for major type 0x" << std::hex << static_cast<int>(major) << '.';
  std::string details = "lower 5 bits are " + bits(additional_info) + ", expected from " + bits(0) + " to ";
  if (major == static_cast<std::uint8_t>(major_type::simple_or_float)) {
    details += bits(kMaxInlineArgument) + ", or " + bits(kInfoEightBytes) + '.';
  } else {
    details += bits(kInfoEightBytes) + '.';
  }
  return with_lines(msg.str(), snapshot_lines({&head}, LineOptions{.details = details}));
}

std::string excessive_integer_size(const StreamSnapshot& head,
                                   std::uint8_t major,
                                   std::uint64_t argument,
                                   std::size_t bytes_used,
                                   std::size_t bytes_sufficient) {
  std::ostringstream msg;
  msg << "Integer " << argument << " was encoded using " << bytes_used << ' ' << plural(bytes_used, "byte")
      << ", while " << bytes_sufficient << ' ' << plural(bytes_sufficient, "byte") << " would have been enough.";
  std::string details;
  if (bytes_sufficient == 0) {
    const auto leading = make_leading_byte(static_cast<major_type>(major), static_cast<std::uint8_t>(argument));
    details = "same as leading byte 0x" + hex_u64(leading, 2);
  } else {
    details = "same as " + plural(bytes_sufficient, "byte") + " 0x" +
              hex_u64(argument, static_cast<int>(2 * bytes_sufficient));
  }
  return with_lines(msg.str(), snapshot_lines({&head}, LineOptions{.details = details, .hl_start = 1}));
}

std::string invalid_float(const StreamSnapshot& head, double value) {
  std::string name;
  if (std::isnan(value)) {
    name = "NaN";
  } else {
    name = value > 0 ? "Infinity" : "-Infinity";
  }
  return with_lines(name + " is not an allowed float value.",
                    snapshot_lines({&head}, LineOptions{.details = "double-precision " + name, .hl_start = 1}));
}

std::string invalid_utf8(const StreamSnapshot& head,
                         const StreamSnapshot& body,
                         std::size_t length,
                         const Utf8Error& error) {
  std::vector<std::string> lines{"String bytes are not valid utf-8 bytes."};
  append(lines,
         snapshot_lines({&head, &body},
                        LineOptions{.details = "string of length " + std::to_string(length), .hl_len = 1}));
  append(lines,
         snapshot_lines({&body},
                        LineOptions{.details = std::string(error.reason),
                                    .start = error.start,
                                    .end = error.end,
                                    .pad_start = error.start + head.latest_read_size()}));
  return join_lines(lines);
}

std::string invalid_simple_value(const StreamSnapshot& head, std::uint8_t value) {
  return with_lines(
    "Error while decoding major type 0x7: allowed simple values are 0x14, 0x15 and 0x16.",
    snapshot_lines({&head}, LineOptions{.details = "simple value is " + std::to_string(value)}));
}

std::string list_item(const StreamSnapshot& list_head,
                      std::size_t index,
                      std::size_t length,
                      const DecodeError& cause) {
  std::vector<std::string> lines{"Error while decoding list."};
  append(lines,
         snapshot_lines({&list_head},
                        LineOptions{.details = "list of length " + std::to_string(length), .dots = true}));
  lines.push_back("Error occurred while decoding item at position " + std::to_string(index) +
                  ": further details below.");
  append(lines, cause_lines(cause));
  return join_lines(lines);
}

std::string map_item(const StreamSnapshot& map_head,
                     std::string_view item,
                     std::size_t index,
                     std::size_t length,
                     const DecodeError& cause) {
  std::vector<std::string> lines{"Error while decoding map."};
  append(lines,
         snapshot_lines({&map_head},
                        LineOptions{.details = "map of length " + std::to_string(length), .dots = true}));
  lines.push_back("Error occurred while decoding " + std::string(item) + " at position " + std::to_string(index) +
                  ": further details below.");
  append(lines, cause_lines(cause));
  return join_lines(lines);
}

std::string key_type(const StreamSnapshot& key_head, std::uint8_t major) {
  std::ostringstream details;
  details << "major type is 0x" << std::hex << static_cast<int>(major) << ", should be 0x3 (string) instead.";
  return with_lines("Map key is not of string type.",
                    snapshot_lines({&key_head}, LineOptions{.details = details.str(), .hl_len = 1, .dots = true}));
}

std::string duplicate_key(const StreamSnapshot& map_head,
                          const StreamSnapshot& key_body,
                          std::string_view key,
                          std::size_t index,
                          std::size_t length) {
  std::vector<std::string> lines{"Error while decoding map."};
  append(lines,
         snapshot_lines({&map_head},
                        LineOptions{.details = "map of length " + std::to_string(length), .dots = true}));
  lines.push_back("Duplicate key is found at position " + std::to_string(index) + '.');
  append(lines, snapshot_lines({&key_body}, LineOptions{.details = "decodes to key " + quote_key(key)}));
  return join_lines(lines);
}

std::string key_order(const StreamSnapshot& map_head,
                      bytes_view key0,
                      std::size_t index0,
                      bytes_view key1,
                      std::size_t index1,
                      std::size_t length) {
  const auto idx0 = std::to_string(index0);
  const auto idx1 = std::to_string(index1);
  const auto width = std::max(idx0.size(), idx1.size());
  const auto pad = [width](const std::string& s) { return std::string(width - s.size(), ' ') + s; };

  std::vector<std::string> lines{"Error while decoding map."};
  append(lines,
         snapshot_lines({&map_head},
                        LineOptions{.details = "map of length " + std::to_string(length), .dots = true}));
  lines.push_back("Map keys not in canonical order.");
  lines.push_back("  Key at pos #" + pad(idx0) + ": " + bytes_to_hex(key0));
  lines.push_back("  Key at pos #" + pad(idx1) + ": " + bytes_to_hex(key1));
  return join_lines(lines);
}

std::string invalid_tag(const StreamSnapshot& head, std::uint64_t tag) {
  const std::size_t hl_start = head.latest_read_size() > 1 ? 1 : 0;
  return with_lines(
    "Error while decoding item of major type 0x6: only tag 42 is allowed.",
    snapshot_lines({&head}, LineOptions{.details = "tag " + std::to_string(tag), .hl_start = hl_start}));
}

std::string link_item(const StreamSnapshot& link_head, const DecodeError& cause) {
  return link_template(link_head, cause_lines(cause));
}

std::string link_payload_type(const StreamSnapshot& link_head,
                              const StreamSnapshot& payload_head,
                              std::uint8_t major) {
  std::ostringstream details;
  details << "major type is 0x" << std::hex << static_cast<int>(major) << ", should be 0x2 (bytes) instead.";
  std::vector<std::string> explanation{"CID bytes did not decode to an item of type 'bytes'."};
  append(explanation,
         snapshot_lines({&payload_head}, LineOptions{.details = details.str(), .hl_len = 1, .dots = true}));
  return link_template(link_head, explanation);
}

std::string link_marker(const StreamSnapshot& link_head,
                        const StreamSnapshot& payload_head,
                        const StreamSnapshot& payload) {
  std::vector<std::string> explanation{"CID does not start with the identity Multibase prefix."};
  const std::string details = payload.latest_read_size() == 0 ? "empty byte string, first byte should be 0x00"
                                                              : "byte should be 0x00";
  append(explanation,
         snapshot_lines({&payload_head, &payload},
                        LineOptions{.details = details, .hl_start = payload_head.latest_read_size(), .hl_len = 1}));
  return link_template(link_head, explanation);
}

std::string trailing_data(const StreamSnapshot& next) {
  return with_lines(
    "Encode and decode must operate on a single top-level CBOR object.",
    snapshot_lines({&next}, LineOptions{.details = "unexpected start byte of a second top-level CBOR object"}));
}

std::string missing_framing(const StreamSnapshot& prefix, std::uint64_t expected_code) {
  std::vector<byte> expected;
  multicodec::encode_varint(expected_code, expected);
  const auto details = plural(prefix.latest_read_size(), "byte") + " should be 0x" +
                       bytes_to_hex(bytes_view{expected.data(), expected.size()}) + '.';
  return with_lines("Required 'dag-cbor' multicodec code.",
                    snapshot_lines({&prefix}, LineOptions{.details = details}));
}

std::string nesting_too_deep(const StreamSnapshot& head, std::size_t max_depth) {
  return with_lines("Maximum nesting depth " + std::to_string(max_depth) + " exceeded.",
                    snapshot_lines({&head}, LineOptions{.details = "container nested too deeply"}));
}

std::string normalization_failed(const StreamSnapshot& head, std::string_view form, std::size_t length) {
  return with_lines("Unicode " + std::string(form) + " normalization failed.",
                    snapshot_lines({&head}, LineOptions{.details = "string of length " + std::to_string(length),
                                                        .hl_len = 1,
                                                        .dots = true}));
}

std::string io_error(const StreamSnapshot& curr, const std::error_code& ec) {
  return with_lines("I/O error while reading input: " + ec.message() + '.', snapshot_lines({&curr}));
}

}  // namespace dagcbor::codec::diag
