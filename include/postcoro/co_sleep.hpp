#pragma once

#include <postcoro/assert.hpp>
#include <postcoro/awaitable.hpp>
#include <postcoro/completion_token.hpp>
#include <postcoro/error.hpp>
#include <postcoro/io_context.hpp>
#include <postcoro/steady_timer.hpp>

#include <chrono>
#include <system_error>

namespace postcoro {

/// Suspend the current coroutine for at least `d`.
///
/// Semantics:
/// - The timer is scheduled on `ex` and the coroutine is resumed through its executor.
/// - Throws std::system_error(error::operation_aborted) if `ex` is stopped before the sleep
///   completes.
inline auto co_sleep(io_context::executor_type ex, std::chrono::steady_clock::duration d)
  -> awaitable<void> {
  POSTCORO_ENSURE(ex, "co_sleep: requires a non-empty executor");

  steady_timer t{ex, d};
  if (auto const ec = co_await t.async_wait(use_awaitable)) {
    throw std::system_error(ec, "co_sleep");
  }
}

}  // namespace postcoro
