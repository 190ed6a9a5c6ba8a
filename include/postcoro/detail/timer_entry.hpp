#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace postcoro::detail {

enum class timer_state : std::uint8_t {
  pending,
  fired,
  cancelled,
};

/// One scheduled expiry, shared between the io_context heap and the steady_timer that armed it.
///
/// id and expiry are written once by io_context_impl::schedule_timer() before the entry is
/// published; afterwards only `state` and the waiter list change.
struct timer_entry {
  std::uint64_t id{};
  std::chrono::steady_clock::time_point expiry{};

  std::atomic<timer_state> state{timer_state::pending};

  // Completion hooks. They run on whichever thread settles the entry (the context thread on
  // fire, the cancelling thread on cancel) and must post any resumption themselves.
  std::mutex waiters_mutex{};
  bool completion_notified = false;
  std::vector<std::function<void()>> waiters{};

  timer_entry() = default;

  timer_entry(timer_entry const&) = delete;
  auto operator=(timer_entry const&) -> timer_entry& = delete;
  timer_entry(timer_entry&&) = delete;
  auto operator=(timer_entry&&) -> timer_entry& = delete;

  auto is_pending() const noexcept -> bool {
    return state.load(std::memory_order_acquire) == timer_state::pending;
  }

  auto is_cancelled() const noexcept -> bool {
    return state.load(std::memory_order_acquire) == timer_state::cancelled;
  }

  /// pending -> fired. False if the entry was already settled.
  auto mark_fired() noexcept -> bool {
    auto expected = timer_state::pending;
    return state.compare_exchange_strong(expected, timer_state::fired, std::memory_order_acq_rel,
                                         std::memory_order_acquire);
  }

  /// pending -> cancelled. False if the entry was already settled.
  auto mark_cancelled() noexcept -> bool {
    auto expected = timer_state::pending;
    return state.compare_exchange_strong(expected, timer_state::cancelled,
                                         std::memory_order_acq_rel, std::memory_order_acquire);
  }

  /// Register a completion hook; runs it right away if the entry is already settled.
  void add_waiter(std::function<void()> w) {
    if (!w) {
      return;
    }
    {
      std::scoped_lock lk{waiters_mutex};
      if (!completion_notified) {
        waiters.push_back(std::move(w));
        return;
      }
    }
    w();
  }

  /// Run every registered hook once. Returns how many ran.
  auto notify_completion() -> std::size_t {
    std::vector<std::function<void()>> local;
    {
      std::scoped_lock lk{waiters_mutex};
      if (completion_notified) {
        return 0;
      }
      completion_notified = true;
      local.swap(waiters);
    }
    for (auto& w : local) {
      w();
    }
    return local.size();
  }
};

}  // namespace postcoro::detail
