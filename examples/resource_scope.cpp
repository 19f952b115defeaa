// resource_scope.cpp
//
// Purpose:
//   Scoped use of resources carried by outcomes: a connection released with dispose() and a
//   transaction released with async_dispose(), nested so the inner one is released first.
//
// Notes:
//   - A failed acquisition never reaches the body and releases nothing.
//   - A body that throws still releases its resource before the exception propagates.

#include <railway/format.hpp>
#include <railway/railway.hpp>

#include <fmt/format.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace {

struct connection {
  std::string dsn;

  void dispose() { fmt::print("  close connection {}\n", dsn); }
};

struct transaction {
  int id = 0;

  auto async_dispose() -> railway::awaitable<void> {
    co_await railway::this_coro::yield;
    fmt::print("  end transaction {}\n", id);
  }
};

using query_result = railway::outcome<int, std::string>;

auto open_connection(std::string dsn)
  -> railway::outcome<std::shared_ptr<connection>, std::string> {
  if (dsn.empty()) {
    return railway::failure(std::string("empty dsn"));
  }
  fmt::print("  open connection {}\n", dsn);
  return railway::success(std::make_shared<connection>(connection{std::move(dsn)}));
}

auto begin_transaction(connection& c)
  -> railway::outcome<std::unique_ptr<transaction>, std::string> {
  fmt::print("  begin transaction on {}\n", c.dsn);
  return railway::success(std::make_unique<transaction>(transaction{1}));
}

auto count_rows(std::unique_ptr<transaction>& tx) -> railway::awaitable<query_result> {
  co_await railway::this_coro::yield;
  fmt::print("  query in transaction {}\n", tx->id);
  co_return query_result::success(3);
}

auto run(railway::run_loop& loop, std::string dsn) -> query_result {
  return railway::sync_wait(
    loop, open_connection(std::move(dsn)) |
            railway::with_resource([](std::shared_ptr<connection>& c) {
              return begin_transaction(*c) | railway::with_resource(count_rows);
            }));
}

}  // namespace

int main() {
  railway::run_loop loop;

  fmt::print("resource_scope: nested scopes\n");
  fmt::print("resource_scope: {}\n", run(loop, "db://main"));

  fmt::print("resource_scope: failed acquisition\n");
  fmt::print("resource_scope: {}\n", run(loop, ""));

  fmt::print("resource_scope: throwing body\n");
  try {
    auto reset = [](std::shared_ptr<connection>&) -> query_result {
      throw std::runtime_error("connection reset");
    };
    (void)(open_connection("db://flaky") | railway::with_resource(reset));
  } catch (std::runtime_error const& e) {
    fmt::print("resource_scope: rethrown after release: {}\n", e.what());
  }
  return 0;
}
