#include <postcoro/detail/reactor_backend.hpp>
#include <postcoro/detail/wakeup_fd.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <limits>
#include <memory>
#include <optional>
#include <system_error>

#include <sys/epoll.h>
#include <unistd.h>

namespace postcoro::detail {

class backend_epoll final : public reactor_backend {
 public:
  backend_epoll() {
    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
      throw std::system_error(errno, std::generic_category(), "epoll_create1 failed");
    }

    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLET;
    ev.data.fd = wakeup_.native_handle();
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wakeup_.native_handle(), &ev) < 0) {
      auto const err = errno;
      ::close(epoll_fd_);
      throw std::system_error(err, std::generic_category(), "epoll_ctl(add eventfd) failed");
    }
  }

  ~backend_epoll() override { ::close(epoll_fd_); }

  void wait(std::optional<std::chrono::milliseconds> timeout) override {
    int timeout_ms = -1;
    if (timeout.has_value()) {
      auto const clamped = std::min<long long>(timeout->count(), std::numeric_limits<int>::max());
      timeout_ms = static_cast<int>(std::max<long long>(clamped, 0));
    }

    epoll_event ev{};
    int const nfds = ::epoll_wait(epoll_fd_, &ev, 1, timeout_ms);
    if (nfds < 0) {
      if (errno == EINTR) {
        return;
      }
      throw std::system_error(errno, std::generic_category(), "epoll_wait failed");
    }

    if (nfds > 0 && ev.data.fd == wakeup_.native_handle()) {
      wakeup_.drain();
    }
  }

  void wakeup() noexcept override { wakeup_.signal(); }

 private:
  wakeup_fd wakeup_{};
  int epoll_fd_ = -1;
};

inline auto make_backend() -> std::unique_ptr<reactor_backend> {
  return std::make_unique<backend_epoll>();
}

}  // namespace postcoro::detail
