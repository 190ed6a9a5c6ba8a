#pragma once

#include <postcoro/assert.hpp>
#include <postcoro/detail/io_context_impl.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

namespace postcoro {

class steady_timer;

/// Event loop running posted handlers and firing timers.
///
/// Semantics:
/// - `run()` / `run_one()` execute handlers on the calling thread, one at a time. Only one thread
///   may drive a given io_context at once.
/// - Between handlers the loop sleeps in the OS backend until the earliest timer is due or
///   another thread posts work or calls `stop()`.
/// - `stop()` leaves queued work in place; it runs after `restart()`.
class io_context {
 public:
  /// Cheap copyable reference to an io_context, used to post work and bind timers.
  class executor_type {
   public:
    executor_type() noexcept = default;

    /// Queue `f` to run on the loop thread. Never runs inline. Safe from any thread.
    void post(std::function<void()> f) const noexcept { impl().post(std::move(f)); }

    /// True if the context has been stopped, or if this executor is empty.
    auto stopped() const noexcept -> bool { return impl_ == nullptr || impl_->stopped(); }

    explicit operator bool() const noexcept { return impl_ != nullptr; }

    friend auto operator==(executor_type const&, executor_type const&) noexcept -> bool = default;

   private:
    friend class io_context;
    friend class steady_timer;

    explicit executor_type(std::shared_ptr<detail::io_context_impl> impl) noexcept
        : impl_(std::move(impl)) {}

    auto impl() const -> detail::io_context_impl& {
      POSTCORO_ENSURE(impl_, "io_context::executor_type: empty executor");
      return *impl_;
    }

    // Shared: timers and handles may outlive the io_context object.
    std::shared_ptr<detail::io_context_impl> impl_{};
  };

  io_context() : impl_(std::make_shared<detail::io_context_impl>()) {}

  io_context(io_context const&) = delete;
  auto operator=(io_context const&) -> io_context& = delete;

  /// Run until stopped or out of work. Returns the number of handlers executed.
  auto run() -> std::size_t { return impl_->run(); }

  /// Run at most one handler, waiting for it if needed. Returns 0 when stopped or out of work.
  auto run_one() -> std::size_t { return impl_->run_one(); }

  /// Make run() / run_one() return as soon as the current handler finishes. Safe from any thread.
  void stop() { impl_->stop(); }

  void restart() { impl_->restart(); }

  auto stopped() const noexcept -> bool { return impl_->stopped(); }

  auto get_executor() const noexcept -> executor_type { return executor_type{impl_}; }

 private:
  std::shared_ptr<detail::io_context_impl> impl_;
};

}  // namespace postcoro
