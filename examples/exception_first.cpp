// exception_first.cpp
//
// Purpose:
//   Capture exceptions from throwing code as outcome failures, observe the concrete exception,
//   then narrow it to a domain error.
//
// Notes:
//   - try_invoke(op) keeps the std::exception_ptr of the exception op threw, so tap_error sees
//     the original object before map_error discards it.
//   - The cleanup clause runs exactly once, on both paths.

#include <railway/format.hpp>
#include <railway/railway.hpp>

#include <fmt/format.h>

#include <exception>
#include <map>
#include <stdexcept>
#include <string>

namespace {

enum class lookup_error { missing_key, bad_value, internal };

auto to_string(lookup_error e) -> char const* {
  switch (e) {
    case lookup_error::missing_key:
      return "missing_key";
    case lookup_error::bad_value:
      return "bad_value";
    case lookup_error::internal:
      return "internal";
  }
  return "unknown";
}

auto classify(std::exception_ptr ep) -> lookup_error {
  if (railway::holds_exception<std::out_of_range>(ep)) {
    return lookup_error::missing_key;
  }
  if (railway::holds_exception<std::invalid_argument>(ep)) {
    return lookup_error::bad_value;
  }
  return lookup_error::internal;
}

auto read_port(std::map<std::string, std::string> const& config)
  -> railway::outcome<int, lookup_error> {
  return railway::try_invoke([&] { return std::stoi(config.at("port")); },
                             railway::finally([] { fmt::print("  lookup finished\n"); })) |
         railway::tap_error([](std::exception_ptr const& ep) {
           fmt::print(stderr, "  caught {}\n", railway::describe(ep));
         }) |
         railway::map_error(classify);
}

}  // namespace

int main() {
  std::map<std::string, std::string> const configs[] = {
    {{"port", "8080"}},
    {{"host", "localhost"}},
    {{"port", "eighty"}},
  };

  for (auto const& config : configs) {
    auto port = read_port(config);
    if (port) {
      fmt::print("exception_first: port = {}\n", port.value());
    } else {
      fmt::print("exception_first: error = {}\n", to_string(port.error()));
    }
  }

  auto described = railway::try_invoke([]() -> int { throw std::runtime_error("disk full"); },
                                       railway::describe);
  fmt::print("exception_first: {}\n", described);
  return 0;
}
