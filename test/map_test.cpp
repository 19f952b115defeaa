#include <gtest/gtest.h>

#include <railway/map.hpp>
#include <railway/outcome.hpp>

#include <exception>
#include <stdexcept>
#include <string>

namespace {

using railway::outcome;

TEST(map_test, success_applies_transform) {
  auto r = outcome<int, std::string>::success(5) | railway::map([](int x) { return x * 2; });

  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value(), 10);
}

TEST(map_test, transform_may_change_value_type) {
  auto r = outcome<int, std::string>::success(42) |
           railway::map([](int x) { return std::to_string(x); });

  static_assert(std::is_same_v<decltype(r), outcome<std::string, std::string>>);
  EXPECT_EQ(r.value(), "42");
}

TEST(map_test, failure_skips_transform) {
  int calls = 0;
  auto r = outcome<int, std::string>::failure("boom") | railway::map([&](int x) {
             ++calls;
             return x * 2;
           });

  ASSERT_TRUE(r.is_failure());
  EXPECT_EQ(r.error(), "boom");
  EXPECT_EQ(calls, 0);
}

TEST(map_test, failure_keeps_the_same_exception_object) {
  auto ep = std::make_exception_ptr(std::runtime_error("original"));
  auto r = outcome<int, std::exception_ptr>::failure(ep) |
           railway::map([](int x) { return x + 1; });

  ASSERT_TRUE(r.is_failure());
  EXPECT_EQ(r.error(), ep);
}

TEST(map_test, transforms_compose_left_to_right) {
  auto r = outcome<int, std::string>::success(3) | railway::map([](int x) { return x + 1; }) |
           railway::map([](int x) { return x * 10; });

  EXPECT_EQ(r.value(), 40);
}

TEST(map_test, exception_in_transform_propagates) {
  auto in = outcome<int, std::string>::success(1);
  EXPECT_THROW(
    (void)(in | railway::map([](int) -> int { throw std::runtime_error("unexpected"); })),
    std::runtime_error);
}

TEST(map_test, lvalue_input_is_left_untouched) {
  auto in = outcome<std::string, int>::success("abc");
  auto out = in | railway::map([](std::string s) { return s + "d"; });

  EXPECT_EQ(in.value(), "abc");
  EXPECT_EQ(out.value(), "abcd");
}

TEST(map_error_test, failure_applies_transform) {
  auto r = outcome<int, std::string>::failure("bad") |
           railway::map_error([](std::string const& e) { return static_cast<int>(e.size()); });

  static_assert(std::is_same_v<decltype(r), outcome<int, int>>);
  ASSERT_TRUE(r.is_failure());
  EXPECT_EQ(r.error(), 3);
}

TEST(map_error_test, success_skips_transform) {
  int calls = 0;
  auto r = outcome<int, std::string>::success(9) | railway::map_error([&](std::string e) {
             ++calls;
             return e + "!";
           });

  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value(), 9);
  EXPECT_EQ(calls, 0);
}

TEST(map_error_test, narrows_exception_to_domain_error) {
  auto r = outcome<int, std::exception_ptr>::failure(
             std::make_exception_ptr(std::invalid_argument("not a number"))) |
           railway::map_error([](std::exception_ptr ep) {
             try {
               std::rethrow_exception(ep);
             } catch (std::invalid_argument const& e) {
               return std::string("validation: ") + e.what();
             } catch (std::exception const& e) {
               return std::string("internal: ") + e.what();
             }
           });

  EXPECT_EQ(r.error(), "validation: not a number");
}

}  // namespace
