#pragma once

#include <postcoro/assert.hpp>
#include <postcoro/postpone_response.hpp>

#include <chrono>
#include <mutex>
#include <optional>

namespace postcoro::detail {

/// Target instant + resolved flag shared by one postponable_delay and its handles.
///
/// Invariants (all access under `m_`):
/// - `target_` never decreases, and only changes while `resolved_` is false.
/// - `resolved_` goes false -> true once, set by the delay when it observes `now >= target_`.
class delay_state {
 public:
  using clock = std::chrono::steady_clock;
  using time_point = clock::time_point;

  explicit delay_state(time_point target) noexcept : target_(target) {}

  delay_state(delay_state const&) = delete;
  auto operator=(delay_state const&) -> delay_state& = delete;
  delay_state(delay_state&&) = delete;
  auto operator=(delay_state&&) -> delay_state& = delete;

  auto postpone(time_point new_target) -> postpone_response {
    std::scoped_lock lk{m_};
    if (resolved_) {
      return postpone_response::already_resolved;
    }
    if (new_target < target_) {
      return postpone_response::cant_resolve_earlier;
    }
    target_ = new_target;
    return postpone_response::ok;
  }

  /// Resolve if the target has been reached at `now`.
  ///
  /// Returns std::nullopt once resolved, otherwise the (later) target to wait for.
  auto try_resolve(time_point now) -> std::optional<time_point> {
    std::scoped_lock lk{m_};
    POSTCORO_ASSERT(!resolved_, "delay_state: resolved twice");
    if (target_ <= now) {
      resolved_ = true;
      return std::nullopt;
    }
    return target_;
  }

  auto target() const -> time_point {
    std::scoped_lock lk{m_};
    return target_;
  }

  auto resolved() const -> bool {
    std::scoped_lock lk{m_};
    return resolved_;
  }

 private:
  mutable std::mutex m_;
  time_point target_;
  bool resolved_ = false;
};

}  // namespace postcoro::detail
