#include <postcoro/assert.hpp>
#include <postcoro/error.hpp>
#include <postcoro/steady_timer.hpp>

#include <coroutine>
#include <memory>
#include <system_error>
#include <utility>

namespace postcoro {

inline steady_timer::steady_timer(io_context::executor_type ex) noexcept
    : ex_(std::move(ex)), expiry_(clock::now()) {}

inline steady_timer::steady_timer(io_context::executor_type ex, time_point at) noexcept
    : ex_(std::move(ex)), expiry_(at) {}

inline steady_timer::steady_timer(io_context::executor_type ex, duration after) noexcept
    : ex_(std::move(ex)), expiry_(clock::now() + after) {}

inline steady_timer::~steady_timer() { (void)cancel(); }

inline auto steady_timer::expires_at(time_point at) noexcept -> std::size_t {
  expiry_ = at;
  return cancel();
}

inline auto steady_timer::expires_after(duration d) noexcept -> std::size_t {
  expiry_ = clock::now() + d;
  return cancel();
}

inline void steady_timer::arm() {
  entry_ = ex_.impl().schedule_timer(expiry_);
}

inline auto steady_timer::async_wait(use_awaitable_t) -> awaitable<std::error_code> {
  POSTCORO_ENSURE(ex_, "steady_timer::async_wait: requires a bound executor");

  if (ex_.stopped()) {
    co_return error::operation_aborted;
  }

  // Re-arm unless a wait for the current expiry is already scheduled.
  if (!entry_ || !entry_->is_pending()) {
    arm();
  }

  struct parked final {
    std::coroutine_handle<> h{};
  };

  // Resumed through the executor by whichever side settles the entry: the loop on fire, the
  // caller of cancel() otherwise.
  struct awaiter final {
    std::shared_ptr<detail::timer_entry> entry;
    io_context::executor_type ex;
    std::shared_ptr<parked> waiting{};

    bool await_ready() const noexcept { return !entry->is_pending(); }

    void await_suspend(std::coroutine_handle<> h) {
      waiting = std::make_shared<parked>(parked{h});
      entry->add_waiter([w = std::weak_ptr<parked>{waiting}, ex = ex]() {
        ex.post([w]() {
          if (auto p = w.lock()) {
            p->h.resume();
          }
        });
      });
    }

    auto await_resume() const noexcept -> std::error_code {
      if (entry->is_cancelled()) {
        return error::operation_aborted;
      }
      return {};
    }
  };

  co_return co_await awaiter{entry_, ex_};
}

inline auto steady_timer::cancel() noexcept -> std::size_t {
  if (!entry_ || !entry_->mark_cancelled()) {
    return 0;
  }
  return entry_->notify_completion();
}

}  // namespace postcoro
