#pragma once

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <system_error>

#include <sys/eventfd.h>
#include <unistd.h>

namespace postcoro::detail {

/// Owning eventfd used to interrupt a blocked backend wait from any thread.
///
/// signal() is deduplicated: only the first call after a drain() writes to the descriptor.
class wakeup_fd {
 public:
  wakeup_fd() {
    fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd_ < 0) {
      throw std::system_error(errno, std::generic_category(), "eventfd failed");
    }
  }

  ~wakeup_fd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  wakeup_fd(wakeup_fd const&) = delete;
  auto operator=(wakeup_fd const&) -> wakeup_fd& = delete;
  wakeup_fd(wakeup_fd&&) = delete;
  auto operator=(wakeup_fd&&) -> wakeup_fd& = delete;

  auto native_handle() const noexcept -> int { return fd_; }

  void signal() noexcept {
    if (pending_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    std::uint64_t value = 1;
    for (;;) {
      auto const n = ::write(fd_, &value, sizeof(value));
      if (n >= 0) {
        return;
      }
      if (errno == EINTR) {
        continue;
      }
      // Let a later signal() retry.
      pending_.store(false, std::memory_order_release);
      return;
    }
  }

  void drain() noexcept {
    // Clear first: a signal() racing with the read below must not be lost.
    pending_.store(false, std::memory_order_release);
    std::uint64_t value = 0;
    for (;;) {
      auto const n = ::read(fd_, &value, sizeof(value));
      if (n > 0) {
        continue;
      }
      if (n < 0 && errno == EINTR) {
        continue;
      }
      break;
    }
  }

 private:
  int fd_ = -1;
  std::atomic<bool> pending_{false};
};

}  // namespace postcoro::detail
