#pragma once

#include <postcoro/awaitable.hpp>
#include <postcoro/completion_token.hpp>
#include <postcoro/detail/timer_entry.hpp>
#include <postcoro/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <system_error>

namespace postcoro {

/// A reusable one-shot timer bound to an io_context executor.
///
/// Model:
/// - Set an expiry (expires_at / expires_after), then wait (async_wait).
/// - A wait never completes before the expiry.
/// - cancel() completes pending waits with `error::operation_aborted`.
///
/// Notes:
/// - Normal case: the waiting coroutine is resumed through the bound executor (never inline).
/// - Exception: if the executor is stopped, async_wait completes immediately with
///   `error::operation_aborted`.
class steady_timer {
 public:
  using clock = std::chrono::steady_clock;
  using time_point = clock::time_point;
  using duration = clock::duration;

  explicit steady_timer(io_context::executor_type ex) noexcept;
  steady_timer(io_context::executor_type ex, time_point at) noexcept;
  steady_timer(io_context::executor_type ex, duration after) noexcept;

  steady_timer(steady_timer const&) = delete;
  auto operator=(steady_timer const&) -> steady_timer& = delete;
  steady_timer(steady_timer&&) = delete;
  auto operator=(steady_timer&&) -> steady_timer& = delete;

  ~steady_timer();

  auto get_executor() const noexcept -> io_context::executor_type { return ex_; }

  auto expiry() const noexcept -> time_point { return expiry_; }

  /// Set the expiry time. Returns the number of pending waits that were cancelled.
  auto expires_at(time_point at) noexcept -> std::size_t;

  /// Set the expiry time relative to now. Returns the number of pending waits that were
  /// cancelled.
  auto expires_after(duration d) noexcept -> std::size_t;

  /// Wait until expiry (or cancellation).
  ///
  /// Returns `error::operation_aborted` iff the wait was cancelled or the executor is stopped.
  auto async_wait(use_awaitable_t) -> awaitable<std::error_code>;

  /// Cancel pending waits. Returns the number of waits that were cancelled.
  auto cancel() noexcept -> std::size_t;

 private:
  void arm();

  io_context::executor_type ex_{};
  time_point expiry_{clock::now()};
  std::shared_ptr<detail::timer_entry> entry_{};
};

}  // namespace postcoro
