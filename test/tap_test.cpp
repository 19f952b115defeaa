#include <gtest/gtest.h>

#include <railway/map.hpp>
#include <railway/outcome.hpp>
#include <railway/tap.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using railway::outcome;
using result = outcome<int, std::string>;

TEST(tap_test, success_runs_action_and_returns_outcome_unchanged) {
  std::vector<int> seen;
  auto r = result::success(42) | railway::tap([&](int const& v) { seen.push_back(v); });

  EXPECT_EQ(r, result::success(42));
  EXPECT_EQ(seen, std::vector<int>{42});
}

TEST(tap_test, failure_skips_action) {
  int calls = 0;
  auto r = result::failure("Error") | railway::tap([&](int) { ++calls; });

  EXPECT_EQ(r, result::failure("Error"));
  EXPECT_EQ(calls, 0);
}

TEST(tap_test, action_result_is_ignored) {
  auto r = result::success(1) | railway::tap([](int v) { return v * 100; });
  EXPECT_EQ(r.value(), 1);
}

TEST(tap_test, passes_the_same_payload_through) {
  auto p = std::make_unique<int>(3);
  auto* raw = p.get();
  int const* observed = nullptr;

  auto r = outcome<std::unique_ptr<int>, std::string>::success(std::move(p)) |
           railway::tap([&](std::unique_ptr<int> const& v) { observed = v.get(); });

  EXPECT_EQ(observed, raw);
  EXPECT_EQ(r.value().get(), raw);
}

TEST(tap_test, runs_in_chain_order) {
  std::vector<std::string> log;
  auto r = result::success(1) |
           railway::tap([&](int v) { log.push_back("first " + std::to_string(v)); }) |
           railway::map([](int v) { return v + 1; }) |
           railway::tap([&](int v) { log.push_back("second " + std::to_string(v)); });

  EXPECT_EQ(r.value(), 2);
  EXPECT_EQ(log, (std::vector<std::string>{"first 1", "second 2"}));
}

TEST(tap_error_test, failure_runs_action_and_returns_outcome_unchanged) {
  std::string logged;
  auto r = result::failure("Database error") |
           railway::tap_error([&](std::string const& e) { logged = "Logged: " + e; });

  EXPECT_EQ(r, result::failure("Database error"));
  EXPECT_EQ(logged, "Logged: Database error");
}

TEST(tap_error_test, success_skips_action) {
  int calls = 0;
  auto r = result::success(5) | railway::tap_error([&](std::string const&) { ++calls; });

  EXPECT_EQ(r, result::success(5));
  EXPECT_EQ(calls, 0);
}

TEST(tap_error_test, exception_in_action_propagates) {
  auto in = result::failure("x");
  EXPECT_THROW((void)(in | railway::tap_error([](std::string const&) {
                        throw std::runtime_error("observer failed");
                      })),
               std::runtime_error);
}

}  // namespace
