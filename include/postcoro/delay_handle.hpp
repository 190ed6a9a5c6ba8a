#pragma once

#include <postcoro/detail/delay_state.hpp>
#include <postcoro/postpone_response.hpp>

#include <chrono>
#include <memory>
#include <utility>

namespace postcoro {

class postponable_delay;

/// Copyable capability to push back a postponable_delay's resolution.
///
/// Any number of handles may exist and be used concurrently from any thread. A handle stays
/// valid after its delay is gone; if the delay was destroyed before resolving, postpone() keeps
/// answering `ok` / `cant_resolve_earlier` but nothing will ever resolve.
class delay_handle {
 public:
  using clock = std::chrono::steady_clock;
  using time_point = clock::time_point;

  delay_handle(delay_handle const&) = default;
  auto operator=(delay_handle const&) -> delay_handle& = default;
  delay_handle(delay_handle&&) noexcept = default;
  auto operator=(delay_handle&&) noexcept -> delay_handle& = default;
  ~delay_handle() = default;

  /// Ask the delay to resolve no earlier than `target`.
  ///
  /// - `already_resolved`: the delay has completed; this never changes again.
  /// - `cant_resolve_earlier`: `target` is before the current target; nothing changed.
  /// - `ok`: the current target is now `target`. The delay notices at its next wake-up, which
  ///   is no later than the previous target.
  [[nodiscard]] auto postpone(time_point target) const -> postpone_response {
    return state_->postpone(target);
  }

  /// Current target instant.
  auto target() const -> time_point { return state_->target(); }

  /// True once the delay has completed.
  auto resolved() const -> bool { return state_->resolved(); }

 private:
  friend class postponable_delay;

  explicit delay_handle(std::shared_ptr<detail::delay_state> st) noexcept
      : state_(std::move(st)) {}

  std::shared_ptr<detail::delay_state> state_;
};

}  // namespace postcoro
