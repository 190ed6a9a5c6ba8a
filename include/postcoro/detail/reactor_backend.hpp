#pragma once

#include <chrono>
#include <memory>
#include <optional>

namespace postcoro::detail {

/// OS wait primitive behind io_context.
///
/// The context only ever sleeps until its next timer expires or until another thread calls
/// wakeup(); there are no descriptors to watch.
class reactor_backend {
 public:
  virtual ~reactor_backend() = default;

  reactor_backend() = default;
  reactor_backend(reactor_backend const&) = delete;
  auto operator=(reactor_backend const&) -> reactor_backend& = delete;
  reactor_backend(reactor_backend&&) = delete;
  auto operator=(reactor_backend&&) -> reactor_backend& = delete;

  /// Block until woken up or until `timeout` elapses (forever if empty).
  /// Spurious returns are allowed. Throws std::system_error on backend failure.
  virtual void wait(std::optional<std::chrono::milliseconds> timeout) = 0;

  /// Interrupt a concurrent or the next wait(). Safe from any thread.
  virtual void wakeup() noexcept = 0;
};

// Backend selection:
// - Default is epoll (no additional dependencies).
// - Define `POSTCORO_USE_URING` to use io_uring. This requires liburing headers and linking
//   against liburing.
auto make_backend() -> std::unique_ptr<reactor_backend>;

}  // namespace postcoro::detail
