// debounce.cpp
//
// Purpose:
//   Debounce a burst of events with a postponable_delay: every event pushes the deadline back by
//   a quiet period, and the flush runs once the events have stopped for that long.
//
// Notes:
//   - Events arrive on a producer thread; only the handle crosses threads.

#include <postcoro/postcoro.hpp>
#include <postcoro/src.hpp>

#include <chrono>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;

namespace {

constexpr auto quiet_period = 100ms;

auto flush_after_quiet(postcoro::postponable_delay& delay) -> postcoro::awaitable<void> {
  auto const start = std::chrono::steady_clock::now();
  co_await delay.async_wait(postcoro::use_awaitable);
  auto const elapsed =
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  std::cout << "debounce: flushed after " << elapsed.count() << "ms of activity + quiet\n";
}

}  // namespace

int main() {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();

  postcoro::postponable_delay delay{ex, std::chrono::steady_clock::now() + quiet_period};
  auto handle = delay.get_handle();

  std::thread events([handle] {
    for (int i = 0; i < 10; ++i) {
      std::this_thread::sleep_for(30ms);
      auto const r = handle.postpone(std::chrono::steady_clock::now() + quiet_period);
      std::cout << "debounce: event " << i << " -> " << r << "\n";
    }
  });

  postcoro::co_spawn(ex, flush_after_quiet(delay), postcoro::detached);
  ctx.run();

  events.join();

  // Late events are refused once the flush has happened.
  std::cout << "debounce: late event -> "
            << handle.postpone(std::chrono::steady_clock::now() + quiet_period) << "\n";
  return 0;
}
