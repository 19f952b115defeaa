#pragma once

#include <railway/assert.hpp>
#include <railway/awaitable.hpp>

#include <concepts>
#include <memory>

namespace railway {

/// A resource released synchronously through `dispose()`.
template <class R>
concept disposable = requires(R& r) { r.dispose(); };

/// A resource released asynchronously through `async_dispose()`.
template <class R>
concept async_disposable = requires(R& r) {
  { r.async_dispose() } -> std::same_as<awaitable<void>>;
};

/// How `with_resource` releases a resource of type `R`.
///
/// Supported: types with `dispose()` or `async_dispose()` (a synchronous `dispose()` wins when
/// both exist), and raw / unique / shared pointers to such types. A pointer must be non-null.
template <class R>
struct resource_traits {
  static_assert(disposable<R> || async_disposable<R>,
                "with_resource: the resource must provide dispose() or async_dispose()");

  static constexpr bool is_async = !disposable<R>;

  static void check(R const&) noexcept {}
  static void release(R& r) { r.dispose(); }
  static auto release_async(R& r) -> awaitable<void> { return r.async_dispose(); }
};

template <class P>
struct resource_traits<P*> {
  using pointee = resource_traits<P>;
  static constexpr bool is_async = pointee::is_async;

  // Checked before the body runs and again at release: the body may have reset the pointer.
  static void check(P const* r) { RAILWAY_ENSURE(r != nullptr, "with_resource: null resource"); }

  static void release(P* r) {
    RAILWAY_ENSURE(r != nullptr, "with_resource: null resource");
    pointee::release(*r);
  }

  static auto release_async(P* r) -> awaitable<void> {
    RAILWAY_ENSURE(r != nullptr, "with_resource: null resource");
    return pointee::release_async(*r);
  }
};

template <class P, class D>
struct resource_traits<std::unique_ptr<P, D>> : resource_traits<P*> {
  static void check(std::unique_ptr<P, D> const& r) { resource_traits<P*>::check(r.get()); }
  static void release(std::unique_ptr<P, D>& r) { resource_traits<P*>::release(r.get()); }
  static auto release_async(std::unique_ptr<P, D>& r) -> awaitable<void> {
    return resource_traits<P*>::release_async(r.get());
  }
};

template <class P>
struct resource_traits<std::shared_ptr<P>> : resource_traits<P*> {
  static void check(std::shared_ptr<P> const& r) { resource_traits<P*>::check(r.get()); }
  static void release(std::shared_ptr<P>& r) { resource_traits<P*>::release(r.get()); }
  static auto release_async(std::shared_ptr<P>& r) -> awaitable<void> {
    return resource_traits<P*>::release_async(r.get());
  }
};

}  // namespace railway
