#include <postcoro/detail/reactor_backend.hpp>
#include <postcoro/detail/wakeup_fd.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>

#include <liburing.h>
#include <poll.h>

namespace postcoro::detail {

namespace {

constexpr std::uint64_t tag_wakeup = 1;

auto to_timespec(std::chrono::milliseconds ms) noexcept -> __kernel_timespec {
  auto const clamped = std::clamp<long long>(ms.count(), 0, std::numeric_limits<int>::max());
  __kernel_timespec ts{};
  ts.tv_sec = static_cast<__kernel_time64_t>(clamped / 1000);
  ts.tv_nsec = static_cast<long long>(clamped % 1000) * 1000LL * 1000LL;
  return ts;
}

}  // namespace

class backend_uring final : public reactor_backend {
 public:
  backend_uring() {
    int const ret = ::io_uring_queue_init(8, &ring_, 0);
    if (ret < 0) {
      throw std::system_error(-ret, std::generic_category(), "io_uring_queue_init failed");
    }
    try {
      arm_wakeup();
    } catch (...) {
      ::io_uring_queue_exit(&ring_);
      throw;
    }
  }

  ~backend_uring() override { ::io_uring_queue_exit(&ring_); }

  void wait(std::optional<std::chrono::milliseconds> timeout) override {
    io_uring_cqe* cqe = nullptr;
    int ret = 0;

    if (timeout.has_value()) {
      auto ts = to_timespec(*timeout);
      ret = ::io_uring_wait_cqe_timeout(&ring_, &cqe, &ts);
    } else {
      ret = ::io_uring_wait_cqe(&ring_, &cqe);
    }

    if (ret < 0) {
      if (ret == -EINTR || ret == -EAGAIN || ret == -ETIME) {
        return;
      }
      throw std::system_error(-ret, std::generic_category(), "io_uring_wait_cqe failed");
    }

    // The only submission ever in flight is the one-shot poll on the wakeup descriptor.
    bool rearm = false;
    unsigned head = 0;
    unsigned seen = 0;
    io_uring_for_each_cqe(&ring_, head, cqe) {
      if (::io_uring_cqe_get_data64(cqe) == tag_wakeup) {
        rearm = true;
      }
      ++seen;
    }
    ::io_uring_cq_advance(&ring_, seen);

    if (rearm) {
      wakeup_.drain();
      arm_wakeup();
    }
  }

  void wakeup() noexcept override { wakeup_.signal(); }

 private:
  void arm_wakeup() {
    std::scoped_lock lk{ring_mtx_};
    auto* sqe = ::io_uring_get_sqe(&ring_);
    if (sqe == nullptr) {
      throw std::system_error(std::make_error_code(std::errc::no_buffer_space),
                              "io_uring_get_sqe failed");
    }
    ::io_uring_prep_poll_add(sqe, wakeup_.native_handle(), POLLIN);
    ::io_uring_sqe_set_data64(sqe, tag_wakeup);
    int const submit = ::io_uring_submit(&ring_);
    if (submit < 0) {
      throw std::system_error(-submit, std::generic_category(), "io_uring_submit failed");
    }
  }

  io_uring ring_{};
  wakeup_fd wakeup_{};
  std::mutex ring_mtx_{};
};

inline auto make_backend() -> std::unique_ptr<reactor_backend> {
  return std::make_unique<backend_uring>();
}

}  // namespace postcoro::detail
