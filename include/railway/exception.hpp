#pragma once

#include <exception>
#include <string>

namespace railway {

/// Human-readable `"<type>: <what>"` description of a captured exception.
///
/// The type is demangled where the toolchain allows it. Exceptions not derived from
/// `std::exception` are described as `"unknown exception"`, a null pointer as `"no exception"`.
auto describe(std::exception_ptr const& ep) -> std::string;

/// The `what()` text of a captured `std::exception`, or `"unknown exception"`.
auto exception_message(std::exception_ptr const& ep) -> std::string;

/// True if `ep` holds an exception of type `Ex` (or derived from it).
///
/// Intended for classifying errors in exception-first pipelines, e.g. inside `tap_error` or a
/// `map_error` that narrows `std::exception_ptr` to a domain error.
template <class Ex>
auto holds_exception(std::exception_ptr const& ep) -> bool {
  if (!ep) {
    return false;
  }
  try {
    std::rethrow_exception(ep);
  } catch (Ex const&) {
    return true;
  } catch (...) {
    return false;
  }
}

}  // namespace railway
