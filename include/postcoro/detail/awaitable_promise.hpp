#pragma once

#include <postcoro/assert.hpp>

#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace postcoro {
template <typename T>
class awaitable;
}  // namespace postcoro

namespace postcoro::detail {

/// Resumes whoever awaited the finished coroutine, or frees a detached frame.
struct final_awaiter {
  bool await_ready() const noexcept { return false; }

  template <class Promise>
  auto await_suspend(std::coroutine_handle<Promise> h) noexcept -> std::coroutine_handle<> {
    auto& p = h.promise();
    if (p.detached) {
      POSTCORO_ENSURE(!p.failure, "co_spawn(detached): coroutine finished with an exception");
      h.destroy();
      return std::noop_coroutine();
    }
    if (p.continuation) {
      return p.continuation;
    }
    return std::noop_coroutine();
  }

  void await_resume() const noexcept {}
};

struct promise_base {
  // Everything runs on the io_context thread, so the awaiter is resumed by symmetric transfer.
  std::coroutine_handle<> continuation{};
  std::exception_ptr failure{};
  bool detached = false;

  auto initial_suspend() const noexcept -> std::suspend_always { return {}; }
  auto final_suspend() const noexcept -> final_awaiter { return {}; }
  void unhandled_exception() noexcept { failure = std::current_exception(); }

  void rethrow_if_failed() const {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }
};

template <typename T>
struct awaitable_promise final : promise_base {
  std::optional<T> value{};

  auto get_return_object() -> awaitable<T>;

  template <typename U>
  void return_value(U&& v) {
    value.emplace(std::forward<U>(v));
  }

  auto result() -> T {
    rethrow_if_failed();
    POSTCORO_ASSERT(value.has_value(), "awaitable: completed without a value");
    return std::move(*value);
  }
};

template <>
struct awaitable_promise<void> final : promise_base {
  auto get_return_object() -> awaitable<void>;
  void return_void() const noexcept {}
  void result() const { rethrow_if_failed(); }
};

}  // namespace postcoro::detail
