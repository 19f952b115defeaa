#include <gtest/gtest.h>

#include <railway/format.hpp>
#include <railway/outcome.hpp>

#include <fmt/format.h>

#include <string>

namespace {

using railway::outcome;

TEST(format_test, success_renders_value) {
  EXPECT_EQ(fmt::format("{}", outcome<int, std::string>::success(42)), "success(42)");
}

TEST(format_test, failure_renders_error) {
  EXPECT_EQ(fmt::format("{}", outcome<int, std::string>::failure("not found")),
            "failure(not found)");
}

TEST(format_test, unit_renders_empty_parens) {
  outcome<railway::unit, int> done = railway::success();
  EXPECT_EQ(fmt::format("{}", done), "success(())");
}

TEST(format_test, nested_outcome) {
  using inner = outcome<int, std::string>;
  auto o = outcome<inner, std::string>::success(inner::failure("deep"));

  EXPECT_EQ(fmt::format("{}", o), "success(failure(deep))");
}

TEST(format_test, embeds_in_surrounding_text) {
  auto o = outcome<double, int>::failure(404);
  EXPECT_EQ(fmt::format("step returned {} after {} tries", o, 3),
            "step returned failure(404) after 3 tries");
}

}  // namespace
