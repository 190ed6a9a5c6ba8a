#include <postcoro/assert.hpp>
#include <postcoro/detail/scope_guard.hpp>
#include <postcoro/error.hpp>
#include <postcoro/postponable_delay.hpp>

#include <memory>
#include <system_error>

namespace postcoro {

inline postponable_delay::postponable_delay(io_context::executor_type ex, time_point target)
    : state_(std::make_shared<detail::delay_state>(target)), timer_(ex, target) {
  POSTCORO_ENSURE(timer_.get_executor(), "postponable_delay: requires a non-empty executor");
}

inline auto postponable_delay::async_wait(use_awaitable_t) -> awaitable<void> {
  POSTCORO_ENSURE(!consumed_, "postponable_delay::async_wait: delay already completed");
  POSTCORO_ENSURE(!waiting_, "postponable_delay::async_wait: only one awaiter is supported");

  waiting_ = true;
  detail::scope_exit clear_waiting{[this]() noexcept { waiting_ = false; }};

  // One iteration per wake-up; postponements between two wake-ups fold into a single re-arm.
  for (;;) {
    auto const next = state_->try_resolve(clock::now());
    if (!next) {
      break;
    }

    if (*next != timer_.expiry()) {
      (void)timer_.expires_at(*next);
      if (*next <= clock::now()) {
        continue;
      }
    }

    if (auto const ec = co_await timer_.async_wait(use_awaitable)) {
      throw std::system_error(ec, "postponable_delay::async_wait");
    }
  }

  consumed_ = true;
}

}  // namespace postcoro
