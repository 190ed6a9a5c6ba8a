#pragma once

#include <postcoro/detail/awaitable_promise.hpp>

#include <coroutine>
#include <utility>

namespace postcoro {

/// Lazily started coroutine producing a `T`.
///
/// Owns its frame until it is awaited to completion or handed to co_spawn. Awaiting starts the
/// coroutine; its result or exception is delivered to the awaiter.
template <typename T>
class awaitable {
 public:
  using promise_type = detail::awaitable_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  explicit awaitable(handle_type h) noexcept : coro_(h) {}

  awaitable(awaitable&& other) noexcept : coro_(std::exchange(other.coro_, {})) {}
  awaitable(awaitable const&) = delete;
  auto operator=(awaitable const&) -> awaitable& = delete;
  auto operator=(awaitable&&) -> awaitable& = delete;

  ~awaitable() {
    if (coro_) {
      coro_.destroy();
    }
  }

  [[nodiscard]] auto release() noexcept -> handle_type { return std::exchange(coro_, {}); }

  bool await_ready() const noexcept { return false; }

  auto await_suspend(std::coroutine_handle<> awaiter) noexcept -> std::coroutine_handle<> {
    coro_.promise().continuation = awaiter;
    return coro_;
  }

  auto await_resume() -> T { return coro_.promise().result(); }

 private:
  handle_type coro_;
};

template <typename T>
auto detail::awaitable_promise<T>::get_return_object() -> awaitable<T> {
  return awaitable<T>{std::coroutine_handle<awaitable_promise>::from_promise(*this)};
}

inline auto detail::awaitable_promise<void>::get_return_object() -> awaitable<void> {
  return awaitable<void>{std::coroutine_handle<awaitable_promise>::from_promise(*this)};
}

}  // namespace postcoro
