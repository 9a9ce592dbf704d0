#include "dagcbor/core/error.hpp"

#include "test_main.hpp"

#include <string_view>

namespace {

using dagcbor::core::errc;
using dagcbor::core::make_error_code;

void test_error_category_name() {
  auto ec = make_error_code(errc::io_error);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "dagcbor.core");
  TEST_EXPECT(ec.category() == dagcbor::core::error_category());
  TEST_EXPECT(static_cast<bool>(ec));
}

void test_error_messages() {
  TEST_EXPECT_EQ(make_error_code(errc::ok).message(), "ok");
  TEST_EXPECT_EQ(make_error_code(errc::buffer_overflow).message(), "buffer overflow");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_argument).message(), "invalid argument");
  TEST_EXPECT_EQ(make_error_code(errc::io_error).message(), "i/o error");
}

void test_implicit_conversion_from_enum() {
  std::error_code ec = errc::invalid_argument;
  TEST_EXPECT(ec == errc::invalid_argument);
  TEST_EXPECT(ec != errc::buffer_overflow);
}

void test_unknown_error_code() {
  std::error_code ec(4242, dagcbor::core::error_category());
  TEST_EXPECT_EQ(ec.message(), "unknown dagcbor.core error");
}

}  // namespace

int main() {
  test_error_category_name();
  test_error_messages();
  test_implicit_conversion_from_enum();
  test_unknown_error_code();
  return ::dagcbor::tests::run_and_report();
}
