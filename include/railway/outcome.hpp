#pragma once

#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace railway {

/// Thrown by `outcome::value()` on a failure and by `outcome::error()` on a success.
///
/// This signals a programmer error (reading the channel the outcome does not hold). It is not a
/// domain failure and no combinator converts it into one.
class bad_outcome_access : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

/// Payload for outcomes that carry no value.
struct unit {
  friend constexpr auto operator==(unit, unit) noexcept -> bool { return true; }
};

/// Tagged success payload, produced by `railway::success(v)`.
template <class T>
class success_value {
 public:
  constexpr explicit success_value(T const& v) : value_(v) {}
  constexpr explicit success_value(T&& v) : value_(std::move(v)) {}

  constexpr auto value() const& noexcept -> T const& { return value_; }
  constexpr auto value() && noexcept -> T&& { return std::move(value_); }

 private:
  T value_;
};

/// Tagged failure payload, produced by `railway::failure(e)`.
template <class E>
class failure_value {
 public:
  constexpr explicit failure_value(E const& e) : error_(e) {}
  constexpr explicit failure_value(E&& e) : error_(std::move(e)) {}

  constexpr auto error() const& noexcept -> E const& { return error_; }
  constexpr auto error() && noexcept -> E&& { return std::move(error_); }

 private:
  E error_;
};

template <class T>
success_value(T) -> success_value<T>;

template <class E>
failure_value(E) -> failure_value<E>;

template <class T>
constexpr auto success(T&& v) -> success_value<std::decay_t<T>> {
  return success_value<std::decay_t<T>>(std::forward<T>(v));
}

constexpr auto success() -> success_value<unit> { return success_value<unit>(unit{}); }

template <class E>
constexpr auto failure(E&& e) -> failure_value<std::decay_t<E>> {
  return failure_value<std::decay_t<E>>(std::forward<E>(e));
}

/// Two-state result: holds either a success value `T` or a failure error `E`, never both and
/// never neither.
///
/// The channels are positional, so `outcome<int, int>` is well formed and a `T` never converts
/// into the error channel (or vice versa). Build one with the `success` / `failure` factories or
/// from the `railway::success(v)` / `railway::failure(e)` tags. There are no mutators: the
/// combinators (see `railway/railway.hpp`) always produce a new outcome.
template <class T, class E>
class outcome {
  static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>,
                "outcome: reference payloads are not supported");
  static_assert(!std::is_void_v<T>, "outcome: use railway::unit for outcomes without a value");
  static_assert(!std::is_void_v<E>, "outcome: the error type must not be void");

 public:
  using value_type = T;
  using error_type = E;

  outcome() = delete;

  template <class U>
    requires std::convertible_to<U const&, T>
  constexpr outcome(success_value<U> const& s) : storage_(std::in_place_index<0>, s.value()) {}

  template <class U>
    requires std::convertible_to<U, T>
  constexpr outcome(success_value<U>&& s)
      : storage_(std::in_place_index<0>, std::move(s).value()) {}

  template <class G>
    requires std::convertible_to<G const&, E>
  constexpr outcome(failure_value<G> const& f) : storage_(std::in_place_index<1>, f.error()) {}

  template <class G>
    requires std::convertible_to<G, E>
  constexpr outcome(failure_value<G>&& f)
      : storage_(std::in_place_index<1>, std::move(f).error()) {}

  [[nodiscard]] static constexpr auto success(T v) -> outcome {
    return outcome{std::in_place_index<0>, std::move(v)};
  }

  [[nodiscard]] static constexpr auto failure(E e) -> outcome {
    return outcome{std::in_place_index<1>, std::move(e)};
  }

  constexpr auto is_success() const noexcept -> bool { return storage_.index() == 0; }
  constexpr auto is_failure() const noexcept -> bool { return storage_.index() == 1; }
  constexpr explicit operator bool() const noexcept { return is_success(); }

  constexpr auto value() const& -> T const& {
    if (!is_success()) {
      throw_bad_access("outcome is not successful");
    }
    return std::get<0>(storage_);
  }

  constexpr auto value() && -> T&& {
    if (!is_success()) {
      throw_bad_access("outcome is not successful");
    }
    return std::get<0>(std::move(storage_));
  }

  constexpr auto error() const& -> E const& {
    if (!is_failure()) {
      throw_bad_access("outcome is successful");
    }
    return std::get<1>(storage_);
  }

  constexpr auto error() && -> E&& {
    if (!is_failure()) {
      throw_bad_access("outcome is successful");
    }
    return std::get<1>(std::move(storage_));
  }

  template <class U>
  constexpr auto value_or(U&& fallback) const& -> T {
    return is_success() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
  }

  template <class U>
  constexpr auto value_or(U&& fallback) && -> T {
    return is_success() ? std::get<0>(std::move(storage_))
                        : static_cast<T>(std::forward<U>(fallback));
  }

  friend constexpr auto operator==(outcome const& a, outcome const& b) -> bool
    requires std::equality_comparable<T> && std::equality_comparable<E>
  {
    return a.storage_ == b.storage_;
  }

  template <class U>
  friend constexpr auto operator==(outcome const& o, success_value<U> const& s) -> bool {
    return o.is_success() && std::get<0>(o.storage_) == s.value();
  }

  template <class G>
  friend constexpr auto operator==(outcome const& o, failure_value<G> const& f) -> bool {
    return o.is_failure() && std::get<1>(o.storage_) == f.error();
  }

 private:
  template <std::size_t I, class... Args>
  constexpr explicit outcome(std::in_place_index_t<I> tag, Args&&... args)
      : storage_(tag, std::forward<Args>(args)...) {}

  [[noreturn]] static void throw_bad_access(char const* what) { throw bad_outcome_access(what); }

  std::variant<T, E> storage_;
};

}  // namespace railway
