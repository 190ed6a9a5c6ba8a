#pragma once

#include <postcoro/awaitable.hpp>
#include <postcoro/co_spawn.hpp>
#include <postcoro/io_context.hpp>

#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace postcoro {

namespace detail {

template <typename T>
struct sync_wait_outcome {
  bool done = false;
  std::exception_ptr failure{};
  std::optional<T> value{};
};

template <>
struct sync_wait_outcome<void> {
  bool done = false;
  std::exception_ptr failure{};
};

template <typename T>
auto record_outcome(sync_wait_outcome<T>& out, awaitable<T> a) -> awaitable<void> {
  try {
    if constexpr (std::is_void_v<T>) {
      co_await std::move(a);
    } else {
      out.value.emplace(co_await std::move(a));
    }
  } catch (...) {
    out.failure = std::current_exception();
  }
  out.done = true;
}

}  // namespace detail

/// Test helper: run `ctx` one handler at a time until `a` completes, then return its value or
/// rethrow its exception.
template <typename T>
auto sync_wait(io_context& ctx, awaitable<T> a) -> T {
  detail::sync_wait_outcome<T> out{};
  ctx.restart();
  co_spawn(ctx.get_executor(), detail::record_outcome(out, std::move(a)), detached);

  while (!out.done) {
    if (ctx.run_one() == 0) {
      throw std::logic_error("sync_wait: io_context ran out of work");
    }
  }
  if (out.failure) {
    std::rethrow_exception(out.failure);
  }
  if constexpr (!std::is_void_v<T>) {
    return std::move(*out.value);
  }
}

}  // namespace postcoro
