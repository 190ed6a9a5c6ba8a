#pragma once

#include <postcoro/detail/reactor_backend.hpp>
#include <postcoro/detail/timer_entry.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace postcoro::detail {

// Min-heap order: earliest expiry first, then scheduling order.
struct later_timer {
  auto operator()(std::shared_ptr<timer_entry> const& a,
                  std::shared_ptr<timer_entry> const& b) const noexcept -> bool {
    return a->expiry != b->expiry ? a->expiry > b->expiry : a->id > b->id;
  }
};

class io_context_impl {
 public:
  using clock = std::chrono::steady_clock;

  io_context_impl();

  io_context_impl(io_context_impl const&) = delete;
  auto operator=(io_context_impl const&) -> io_context_impl& = delete;

  auto run() -> std::size_t;
  auto run_one() -> std::size_t;

  void stop();
  void restart() { stopped_.store(false, std::memory_order_release); }
  auto stopped() const noexcept -> bool { return stopped_.load(std::memory_order_acquire); }

  void post(std::function<void()> f);

  /// Queue a timer entry that fires no earlier than `expiry`.
  auto schedule_timer(clock::time_point expiry) -> std::shared_ptr<timer_entry>;

 private:
  // Runs one posted handler or one expired timer, sleeping in the backend until either is
  // ready. False once stopped or out of work.
  auto run_next() -> bool;

  auto take_posted() -> std::function<void()>;
  auto take_expired(clock::time_point now) -> std::shared_ptr<timer_entry>;

  // Time until the earliest live timer, or nullopt without one.
  auto next_timeout(clock::time_point now) -> std::optional<std::chrono::milliseconds>;

  std::unique_ptr<reactor_backend> backend_;
  std::atomic<bool> stopped_{false};

  std::mutex posted_mutex_;
  std::deque<std::function<void()>> posted_;

  std::mutex timer_mutex_;
  std::priority_queue<std::shared_ptr<timer_entry>, std::vector<std::shared_ptr<timer_entry>>,
                      later_timer>
    timers_;
  std::uint64_t next_timer_id_ = 0;
};

}  // namespace postcoro::detail
