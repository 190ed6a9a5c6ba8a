#pragma once

#include <postcoro/awaitable.hpp>
#include <postcoro/completion_token.hpp>
#include <postcoro/delay_handle.hpp>
#include <postcoro/detail/delay_state.hpp>
#include <postcoro/io_context.hpp>
#include <postcoro/steady_timer.hpp>

#include <chrono>
#include <memory>

namespace postcoro {

/// A delay that resolves no earlier than a target instant which handles may push later.
///
/// Model:
/// - Construct with an initial target; get_handle() hands out postponers.
/// - One coroutine awaits async_wait(). Each time the internal timer fires, the delay compares
///   the shared target with now: if the target moved into the future it re-arms for it,
///   otherwise it resolves. Resolution happens exactly once.
/// - The delay cannot be made to resolve sooner, and cannot be cancelled. Destroying it before
///   it resolves abandons it.
///
/// Threading:
/// - async_wait() belongs to the awaiting coroutine; only one await at a time, and the delay is
///   consumed once the await completes.
/// - get_handle(), target() and resolved() are safe from any thread.
class postponable_delay {
 public:
  using clock = std::chrono::steady_clock;
  using time_point = clock::time_point;

  postponable_delay(io_context::executor_type ex, time_point target);

  postponable_delay(postponable_delay const&) = delete;
  auto operator=(postponable_delay const&) -> postponable_delay& = delete;
  postponable_delay(postponable_delay&&) = delete;
  auto operator=(postponable_delay&&) -> postponable_delay& = delete;

  ~postponable_delay() = default;

  /// A new handle sharing this delay's target.
  auto get_handle() const -> delay_handle { return delay_handle{state_}; }

  auto target() const -> time_point { return state_->target(); }
  auto resolved() const -> bool { return state_->resolved(); }

  /// Complete once now >= target, re-arming as often as the target was postponed.
  ///
  /// If the target is already reached, completes without suspending.
  /// Throws std::system_error(error::operation_aborted) if the executor is already stopped when
  /// the delay has to wait on its timer; the delay then stays unresolved and may be awaited
  /// again. The delay must outlive the await.
  auto async_wait(use_awaitable_t) -> awaitable<void>;

 private:
  std::shared_ptr<detail::delay_state> state_;
  steady_timer timer_;
  bool waiting_ = false;
  bool consumed_ = false;
};

}  // namespace postcoro
