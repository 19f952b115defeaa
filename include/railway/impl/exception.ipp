#include <railway/detail/diagnostics.hpp>
#include <railway/exception.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace railway {

namespace {

auto demangle(char const* name) -> std::string {
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> out{abi::__cxa_demangle(name, nullptr, nullptr, &status),
                                             std::free};
  if (status == 0 && out) {
    return out.get();
  }
#endif
  return name;
}

}  // namespace

auto describe(std::exception_ptr const& ep) -> std::string {
  if (!ep) {
    return "no exception";
  }
  try {
    std::rethrow_exception(ep);
  } catch (std::exception const& e) {
    return fmt::format("{}: {}", demangle(typeid(e).name()), e.what());
  } catch (...) {
    return "unknown exception";
  }
}

auto exception_message(std::exception_ptr const& ep) -> std::string {
  if (!ep) {
    return "no exception";
  }
  try {
    std::rethrow_exception(ep);
  } catch (std::exception const& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

namespace detail {

void report_detached_exception(std::exception_ptr const& ep) noexcept {
  try {
    fmt::print(stderr, "[railway] detached coroutine exited with exception: {}\n", describe(ep));
  } catch (std::exception const&) {
    // Formatting itself failed (out of memory); fall back to a fixed message.
    std::fputs("[railway] detached coroutine exited with exception\n", stderr);
  }
  std::fflush(stderr);
}

}  // namespace detail

}  // namespace railway
