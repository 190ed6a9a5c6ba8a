#include <postcoro/detail/io_context_impl.hpp>

#ifdef POSTCORO_USE_URING
#include <postcoro/impl/backends/uring.ipp>
#else
#include <postcoro/impl/backends/epoll.ipp>
#endif

#include <chrono>
#include <utility>

namespace postcoro::detail {

inline io_context_impl::io_context_impl() : backend_(make_backend()) {}

inline auto io_context_impl::run() -> std::size_t {
  std::size_t n = 0;
  while (run_next()) {
    ++n;
  }
  return n;
}

inline auto io_context_impl::run_one() -> std::size_t { return run_next() ? 1 : 0; }

inline void io_context_impl::stop() {
  stopped_.store(true, std::memory_order_release);
  backend_->wakeup();
}

inline void io_context_impl::post(std::function<void()> f) {
  {
    std::scoped_lock lk{posted_mutex_};
    posted_.push_back(std::move(f));
  }
  backend_->wakeup();
}

inline auto io_context_impl::schedule_timer(clock::time_point expiry)
  -> std::shared_ptr<timer_entry> {
  auto entry = std::make_shared<timer_entry>();
  entry->expiry = expiry;
  {
    std::scoped_lock lk{timer_mutex_};
    entry->id = next_timer_id_++;
    timers_.push(entry);
  }
  // The loop may be asleep on a later deadline.
  backend_->wakeup();
  return entry;
}

inline auto io_context_impl::run_next() -> bool {
  while (!stopped()) {
    if (auto f = take_posted()) {
      f();
      return true;
    }

    auto const now = clock::now();
    if (auto entry = take_expired(now)) {
      (void)entry->notify_completion();
      return true;
    }

    auto const timeout = next_timeout(now);
    if (!timeout) {
      std::scoped_lock lk{posted_mutex_};
      if (posted_.empty()) {
        return false;
      }
      continue;
    }
    backend_->wait(timeout);
  }
  return false;
}

inline auto io_context_impl::take_posted() -> std::function<void()> {
  std::scoped_lock lk{posted_mutex_};
  if (posted_.empty()) {
    return {};
  }
  auto f = std::move(posted_.front());
  posted_.pop_front();
  return f;
}

inline auto io_context_impl::take_expired(clock::time_point now) -> std::shared_ptr<timer_entry> {
  std::scoped_lock lk{timer_mutex_};
  while (!timers_.empty()) {
    auto entry = timers_.top();
    if (!entry->is_cancelled() && entry->expiry > now) {
      return nullptr;
    }
    timers_.pop();
    // Loses against a cancel() that settled the entry first.
    if (entry->mark_fired()) {
      return entry;
    }
  }
  return nullptr;
}

inline auto io_context_impl::next_timeout(clock::time_point now)
  -> std::optional<std::chrono::milliseconds> {
  std::scoped_lock lk{timer_mutex_};
  while (!timers_.empty() && timers_.top()->is_cancelled()) {
    timers_.pop();
  }
  if (timers_.empty()) {
    return std::nullopt;
  }
  auto const expiry = timers_.top()->expiry;
  if (expiry <= now) {
    return std::chrono::milliseconds{0};
  }
  // Rounded up: waking before the expiry would only spin.
  return std::chrono::ceil<std::chrono::milliseconds>(expiry - now);
}

}  // namespace postcoro::detail
