#pragma once

#include <exception>

namespace railway::detail {

/// Write a one-line report for an exception that escaped a detached coroutine to stderr.
void report_detached_exception(std::exception_ptr const& ep) noexcept;

}  // namespace railway::detail
