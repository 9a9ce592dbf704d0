#pragma once

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace dagcbor::tests {

inline int& failure_count() {
  static int count = 0;
  return count;
}

inline void record_failure(const char* file, int line, std::string_view message) {
  ++failure_count();
  std::cerr << file << ":" << line << ": " << message << "\n";
}

inline void expect_true(bool value, const char* expr, const char* file, int line) {
  if (!value) {
    record_failure(file, line, std::string("EXPECT failed: ") + expr);
  }
}

template <class L, class R>
inline void expect_eq(const L& lhs, const R& rhs, const char* lhs_expr, const char* rhs_expr, const char* file,
                      int line) {
  if (lhs == rhs) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_EQ failed: (" << lhs_expr << ") != (" << rhs_expr << ")";
  record_failure(file, line, oss.str());
}

inline void describe(std::ostringstream& oss, const std::error_code& ec) {
  if (!ec) {
    oss << "ok";
    return;
  }
  oss << "[" << ec.category().name() << ":" << ec.value() << "] " << ec.message();
}

inline void expect_ok(const std::error_code& ec, const char* expr, const char* file, int line) {
  if (!ec) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_OK failed: " << expr << " -> ";
  describe(oss, ec);
  record_failure(file, line, oss.str());
}

// 错误码比较：失败时输出双方的 category/value，便于定位。
inline void expect_ec(const std::error_code& actual,
                      const std::error_code& expected,
                      const char* expr,
                      const char* file,
                      int line) {
  if (actual == expected) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_EC failed: " << expr << " -> ";
  describe(oss, actual);
  oss << ", expected ";
  describe(oss, expected);
  record_failure(file, line, oss.str());
}

inline int run_and_report() {
  if (failure_count() == 0) {
    return 0;
  }
  std::cerr << "FAILED: " << failure_count() << " assertions\n";
  return 1;
}

}  // namespace dagcbor::tests

#define TEST_EXPECT(expr) ::dagcbor::tests::expect_true((expr), #expr, __FILE__, __LINE__)
#define TEST_EXPECT_EQ(a, b) ::dagcbor::tests::expect_eq((a), (b), #a, #b, __FILE__, __LINE__)
#define TEST_EXPECT_OK(ec) ::dagcbor::tests::expect_ok((ec), #ec, __FILE__, __LINE__)
#define TEST_EXPECT_EC(ec, expected) \
  ::dagcbor::tests::expect_ec((ec), ::std::error_code(expected), #ec, __FILE__, __LINE__)
#define TEST_FAIL(msg) ::dagcbor::tests::record_failure(__FILE__, __LINE__, (msg))
