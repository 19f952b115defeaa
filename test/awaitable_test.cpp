#include <gtest/gtest.h>

#include <railway/awaitable.hpp>
#include <railway/co_spawn.hpp>
#include <railway/error.hpp>
#include <railway/outcome.hpp>
#include <railway/run_loop.hpp>
#include <railway/sync_wait.hpp>
#include <railway/this_coro.hpp>

#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>

namespace {

TEST(awaitable_test, is_lazy_until_started) {
  railway::run_loop loop;
  bool ran = false;

  auto child = [&]() -> railway::awaitable<int> {
    ran = true;
    co_return 1;
  };

  auto a = child();
  EXPECT_TRUE(a.valid());
  EXPECT_FALSE(ran);

  EXPECT_EQ(railway::sync_wait(loop, std::move(a)), 1);
  EXPECT_TRUE(ran);
}

TEST(awaitable_test, nested_awaits_return_values) {
  railway::run_loop loop;

  auto leaf = [](int x) -> railway::awaitable<int> { co_return x + 1; };
  auto parent = [&]() -> railway::awaitable<int> {
    auto a = co_await leaf(1);
    auto b = co_await leaf(a);
    co_return a + b;
  };

  EXPECT_EQ(railway::sync_wait(loop, parent()), 5);
}

TEST(awaitable_test, move_only_result) {
  railway::run_loop loop;

  auto make = []() -> railway::awaitable<std::unique_ptr<int>> {
    co_return std::make_unique<int>(11);
  };

  auto p = railway::sync_wait(loop, make());
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(*p, 11);
}

TEST(awaitable_test, exception_rethrown_to_awaiter) {
  railway::run_loop loop;
  bool caught = false;

  auto child = []() -> railway::awaitable<int> {
    co_await railway::this_coro::yield;
    throw std::runtime_error("boom");
  };
  auto parent = [&]() -> railway::awaitable<void> {
    try {
      (void)co_await child();
    } catch (std::runtime_error const& e) {
      EXPECT_STREQ(e.what(), "boom");
      caught = true;
    }
  };

  railway::sync_wait(loop, parent());
  EXPECT_TRUE(caught);
}

TEST(awaitable_test, moved_from_awaitable_is_empty) {
  auto child = []() -> railway::awaitable<void> { co_return; };

  auto a = child();
  auto b = std::move(a);

  EXPECT_FALSE(a.valid());
  EXPECT_TRUE(b.valid());
}

TEST(awaitable_test, executor_is_inherited_by_awaited_children) {
  railway::run_loop loop;
  auto ex = loop.get_executor();

  auto child = []() -> railway::awaitable<railway::executor> {
    co_return co_await railway::this_coro::executor;
  };
  auto parent = [&]() -> railway::awaitable<bool> {
    auto mine = co_await railway::this_coro::executor;
    auto theirs = co_await child();
    co_return mine == ex && theirs == ex;
  };

  EXPECT_TRUE(railway::sync_wait(loop, parent()));
}

TEST(awaitable_test, yield_interleaves_spawned_coroutines) {
  railway::run_loop loop;
  auto ex = loop.get_executor();
  std::vector<std::string> log;

  auto worker = [&log](std::string name) -> railway::awaitable<void> {
    log.push_back(name + "1");
    co_await railway::this_coro::yield;
    log.push_back(name + "2");
  };

  railway::co_spawn(ex, worker("a"), railway::detached);
  railway::co_spawn(ex, worker("b"), railway::detached);
  (void)loop.run();

  EXPECT_EQ(log, (std::vector<std::string>{"a1", "b1", "a2", "b2"}));
}

TEST(awaitable_test, stop_token_is_not_stoppable_by_default) {
  railway::run_loop loop;

  auto probe = []() -> railway::awaitable<bool> {
    auto token = co_await railway::this_coro::stop_token;
    co_return token.stop_possible();
  };

  EXPECT_FALSE(railway::sync_wait(loop, probe()));
}

TEST(awaitable_test, bound_stop_token_is_inherited) {
  railway::run_loop loop;
  std::stop_source stop;

  auto child = []() -> railway::awaitable<bool> {
    auto token = co_await railway::this_coro::stop_token;
    co_return token.stop_possible();
  };
  auto parent = [&]() -> railway::awaitable<bool> { co_return co_await child(); };

  EXPECT_TRUE(railway::sync_wait(loop, railway::bind_stop_token(stop.get_token(), parent())));
}

TEST(awaitable_test, stop_requested_while_queued_aborts_at_yield) {
  railway::run_loop loop;
  std::stop_source stop;
  int steps = 0;

  auto work = [&]() -> railway::awaitable<void> {
    ++steps;
    stop.request_stop();
    co_await railway::this_coro::yield;
    ++steps;
  };

  try {
    railway::sync_wait(loop, railway::bind_stop_token(stop.get_token(), work()));
    ADD_FAILURE() << "expected operation_aborted";
  } catch (std::system_error const& e) {
    EXPECT_EQ(e.code(), railway::error::operation_aborted);
  }
  EXPECT_EQ(steps, 1);
}

TEST(co_spawn_test, completion_receives_value) {
  railway::run_loop loop;
  std::optional<railway::outcome<int, std::exception_ptr>> got;

  auto child = []() -> railway::awaitable<int> { co_return 7; };
  railway::co_spawn(
    loop.get_executor(), child(),
    [&](railway::outcome<int, std::exception_ptr> r) { got.emplace(std::move(r)); });

  EXPECT_FALSE(got.has_value());
  (void)loop.run();

  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->value(), 7);
}

TEST(co_spawn_test, completion_receives_exception) {
  railway::run_loop loop;
  bool got_runtime_error = false;

  auto child = []() -> railway::awaitable<int> {
    (void)co_await railway::this_coro::executor;
    throw std::runtime_error("fail");
  };
  railway::co_spawn(loop.get_executor(), child(),
                    [&](railway::outcome<int, std::exception_ptr> r) {
                      ASSERT_TRUE(r.is_failure());
                      try {
                        std::rethrow_exception(r.error());
                      } catch (std::runtime_error const& e) {
                        EXPECT_STREQ(e.what(), "fail");
                        got_runtime_error = true;
                      }
                    });

  (void)loop.run();
  EXPECT_TRUE(got_runtime_error);
}

TEST(co_spawn_test, void_awaitable_completes_with_unit) {
  railway::run_loop loop;
  bool completed = false;

  auto child = []() -> railway::awaitable<void> { co_await railway::this_coro::yield; };
  railway::co_spawn(loop.get_executor(), child(),
                    [&](railway::outcome<railway::unit, std::exception_ptr> r) {
                      completed = r.is_success();
                    });

  (void)loop.run();
  EXPECT_TRUE(completed);
}

TEST(co_spawn_test, detached_exception_does_not_escape_run) {
  railway::run_loop loop;

  auto child = []() -> railway::awaitable<void> {
    co_await railway::this_coro::yield;
    throw std::runtime_error("nobody listens");
  };
  railway::co_spawn(loop.get_executor(), child(), railway::detached);

  EXPECT_NO_THROW((void)loop.run());
}

TEST(sync_wait_test, returns_value_and_drains_follow_up_work) {
  railway::run_loop loop;
  bool follow_up = false;

  auto child = [&]() -> railway::awaitable<int> {
    auto ex = co_await railway::this_coro::executor;
    ex.post([&] { follow_up = true; });
    co_return 3;
  };

  EXPECT_EQ(railway::sync_wait(loop, child()), 3);
  EXPECT_TRUE(follow_up);
}

TEST(sync_wait_test, rethrows_exception) {
  railway::run_loop loop;

  auto child = []() -> railway::awaitable<int> {
    throw std::invalid_argument("bad");
    co_return 0;
  };

  EXPECT_THROW((void)railway::sync_wait(loop, child()), std::invalid_argument);
}

struct on_destroy {
  bool* flag;
  ~on_destroy() { *flag = true; }
};

TEST(sync_wait_test, exhausted_loop_is_reported) {
  railway::run_loop loop;
  bool destroyed = false;

  // Suspends without scheduling a resumption.
  auto stuck = [&]() -> railway::awaitable<int> {
    on_destroy guard{&destroyed};
    co_await std::suspend_always{};
    co_return 0;
  };

  try {
    (void)railway::sync_wait(loop, stuck());
    ADD_FAILURE() << "expected loop_exhausted";
  } catch (std::system_error const& e) {
    EXPECT_EQ(e.code(), railway::error::loop_exhausted);
  }
  EXPECT_TRUE(destroyed);
}

TEST(sync_wait_test, stopped_loop_is_reported) {
  railway::run_loop loop;

  auto halts = [&]() -> railway::awaitable<int> {
    loop.stop();
    co_await railway::this_coro::yield;
    co_return 0;
  };

  try {
    (void)railway::sync_wait(loop, halts());
    ADD_FAILURE() << "expected loop_stopped";
  } catch (std::system_error const& e) {
    EXPECT_EQ(e.code(), railway::error::loop_stopped);
  }
}

TEST(sync_wait_test, stopped_wait_finishes_when_loop_runs_again) {
  railway::run_loop loop;
  bool finished = false;

  auto halts = [&]() -> railway::awaitable<int> {
    loop.stop();
    co_await railway::this_coro::yield;
    finished = true;
    co_return 5;
  };

  EXPECT_THROW((void)railway::sync_wait(loop, halts()), std::system_error);
  EXPECT_FALSE(finished);
  EXPECT_TRUE(loop.has_pending_tasks());

  loop.restart();
  (void)loop.run();

  EXPECT_TRUE(finished);
  EXPECT_FALSE(loop.has_pending_tasks());
}

TEST(sync_wait_test, stopped_wait_with_nothing_queued_destroys_chain) {
  railway::run_loop loop;
  bool destroyed = false;

  auto halts = [&]() -> railway::awaitable<int> {
    on_destroy guard{&destroyed};
    loop.stop();
    co_await std::suspend_always{};
    co_return 0;
  };

  try {
    (void)railway::sync_wait(loop, halts());
    ADD_FAILURE() << "expected loop_stopped";
  } catch (std::system_error const& e) {
    EXPECT_EQ(e.code(), railway::error::loop_stopped);
  }
  EXPECT_TRUE(destroyed);
}

TEST(sync_wait_test, loop_is_reusable_across_waits) {
  railway::run_loop loop;

  auto value = [](int v) -> railway::awaitable<int> {
    co_await railway::this_coro::yield;
    co_return v;
  };

  EXPECT_EQ(railway::sync_wait(loop, value(1)), 1);
  EXPECT_EQ(railway::sync_wait(loop, value(2)), 2);
}

}  // namespace
