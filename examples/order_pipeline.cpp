// order_pipeline.cpp
//
// Purpose:
//   Validate and price an order as a chain of outcome combinators, first synchronously, then
//   with an asynchronous stock lookup driven by run_loop + sync_wait.
//
// Notes:
//   - Failures are plain strings here; any copyable error type works.
//   - bind_if skips its continuation when the predicate holds.

#include <railway/format.hpp>
#include <railway/railway.hpp>

#include <fmt/format.h>

#include <exception>
#include <string>
#include <utility>

namespace {

struct order {
  std::string sku;
  int quantity = 0;
  int unit_price = 0;
};

using checked = railway::outcome<order, std::string>;

auto parse_quantity(std::string const& text) -> railway::outcome<int, std::string> {
  return railway::try_invoke([&] { return std::stoi(text); },
                             [&](std::exception_ptr) { return "not a number: " + text; });
}

auto stock_for(std::string sku) -> railway::awaitable<int> {
  co_await railway::this_coro::yield;
  co_return sku == "widget" ? 25 : 0;
}

auto apply_bulk_discount(order o) -> checked {
  o.unit_price = o.unit_price * 9 / 10;
  return checked::success(o);
}

auto price(std::string sku, std::string quantity) -> railway::outcome<std::string, std::string> {
  return parse_quantity(quantity) |
         railway::ensure([](int q) { return q > 0; }, std::string("quantity must be positive")) |
         railway::map([&](int q) { return order{sku, q, 400}; }) |
         railway::bind_if([](order const& o) { return o.quantity < 10; }, apply_bulk_discount) |
         railway::tap([](order const& o) { fmt::print("  priced {} x {}\n", o.quantity, o.sku); }) |
         railway::map([](order const& o) {
           return fmt::format("{} cents", o.quantity * o.unit_price);
         });
}

auto reserve(order o) -> railway::awaitable<checked> {
  auto available = co_await stock_for(o.sku);
  if (available < o.quantity) {
    co_return checked::failure(fmt::format("only {} {} in stock", available, o.sku));
  }
  co_return checked::success(o);
}

}  // namespace

int main() {
  fmt::print("order_pipeline: synchronous pricing\n");
  for (auto [sku, qty] : {std::pair{"widget", "3"}, std::pair{"widget", "12"},
                          std::pair{"widget", "-1"}, std::pair{"widget", "many"}}) {
    fmt::print("{} {} -> {}\n", qty, sku, price(sku, qty));
  }

  fmt::print("order_pipeline: asynchronous reservation\n");
  railway::run_loop loop;
  for (auto [sku, qty] : {std::pair{"widget", 5}, std::pair{"gadget", 1}}) {
    auto reserved = railway::sync_wait(
      loop, checked::success(order{sku, qty, 400}) | railway::bind(reserve) |
              railway::match(
                [](order const& o) { return fmt::format("reserved {} {}", o.quantity, o.sku); },
                [](std::string const& e) { return "rejected: " + e; }));
    fmt::print("{}\n", reserved);
  }
  return 0;
}
