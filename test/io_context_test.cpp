#include <gtest/gtest.h>

#include <postcoro/co_sleep.hpp>
#include <postcoro/co_spawn.hpp>
#include <postcoro/error.hpp>
#include <postcoro/io_context.hpp>
#include <postcoro/src.hpp>
#include <postcoro/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <system_error>
#include <thread>

namespace {

using namespace std::chrono_literals;

TEST(io_context_test, post_and_run_executes_all_posted_operations) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  int n = 0;

  ex.post([&] { ++n; });
  ex.post([&] { ++n; });

  EXPECT_EQ(ctx.run(), 2U);
  EXPECT_EQ(n, 2);
}

TEST(io_context_test, handlers_run_in_post_order) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  std::string order;

  ex.post([&] { order += "a"; });
  ex.post([&] {
    order += "b";
    ex.post([&] { order += "d"; });
  });
  ex.post([&] { order += "c"; });

  (void)ctx.run();
  EXPECT_EQ(order, "abcd");
}

TEST(io_context_test, run_one_runs_a_single_handler) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  int n = 0;

  ex.post([&] {
    ++n;
    ex.post([&] { ++n; });
  });

  EXPECT_EQ(ctx.run_one(), 1U);
  EXPECT_EQ(n, 1);

  EXPECT_EQ(ctx.run_one(), 1U);
  EXPECT_EQ(n, 2);

  EXPECT_EQ(ctx.run_one(), 0U);
}

TEST(io_context_test, run_without_work_returns_immediately) {
  postcoro::io_context ctx;
  EXPECT_EQ(ctx.run(), 0U);
  EXPECT_EQ(ctx.run_one(), 0U);
}

TEST(io_context_test, stop_prevents_run_and_restart_allows_processing) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  int n = 0;

  ctx.stop();
  ex.post([&] { ++n; });

  EXPECT_TRUE(ex.stopped());
  EXPECT_EQ(ctx.run(), 0U);
  EXPECT_EQ(n, 0);

  ctx.restart();
  EXPECT_FALSE(ex.stopped());
  EXPECT_EQ(ctx.run(), 1U);
  EXPECT_EQ(n, 1);
}

TEST(io_context_test, stop_from_handler_keeps_remaining_work_for_restart) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  int n = 0;

  ex.post([&] { ctx.stop(); });
  ex.post([&] { ++n; });

  EXPECT_EQ(ctx.run(), 1U);
  EXPECT_EQ(n, 0);

  ctx.restart();
  EXPECT_EQ(ctx.run(), 1U);
  EXPECT_EQ(n, 1);
}

TEST(io_context_test, post_from_another_thread_wakes_a_sleeping_loop) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  std::atomic<bool> ran{false};
  std::error_code ec{};

  // Keep the loop asleep on a far timer so only the cross-thread post can wake it.
  postcoro::steady_timer t{ex, 2s};
  auto waiter = [&]() -> postcoro::awaitable<void> {
    ec = co_await t.async_wait(postcoro::use_awaitable);
  };
  postcoro::co_spawn(ex, waiter(), postcoro::detached);

  std::thread producer([&] {
    std::this_thread::sleep_for(20ms);
    ex.post([&] {
      ran.store(true, std::memory_order_relaxed);
      (void)t.cancel();
    });
  });

  auto const start = std::chrono::steady_clock::now();
  (void)ctx.run();
  producer.join();

  EXPECT_TRUE(ran.load(std::memory_order_relaxed));
  EXPECT_EQ(ec, postcoro::error::operation_aborted);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(io_context_test, stop_from_another_thread_interrupts_a_sleeping_loop) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  postcoro::steady_timer t{ex, 2s};
  bool resumed = false;

  auto waiter = [&]() -> postcoro::awaitable<void> {
    (void)co_await t.async_wait(postcoro::use_awaitable);
    resumed = true;
  };
  postcoro::co_spawn(ex, waiter(), postcoro::detached);

  std::thread stopper([&] {
    std::this_thread::sleep_for(20ms);
    ctx.stop();
  });

  auto const start = std::chrono::steady_clock::now();
  (void)ctx.run();
  stopper.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
  EXPECT_FALSE(resumed);

  // Release the parked coroutine before the context goes away.
  ctx.restart();
  (void)t.cancel();
  (void)ctx.run();
  EXPECT_TRUE(resumed);
}

TEST(io_context_test, co_sleep_resumes_after_the_duration) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  auto const start = std::chrono::steady_clock::now();
  std::chrono::steady_clock::time_point end{};

  auto sleeper = [&]() -> postcoro::awaitable<void> {
    co_await postcoro::co_sleep(ex, 10ms);
    end = std::chrono::steady_clock::now();
  };
  postcoro::co_spawn(ex, sleeper(), postcoro::detached);

  (void)ctx.run();
  EXPECT_GE(end - start, 10ms);
}

TEST(io_context_test, executors_compare_by_context) {
  postcoro::io_context a;
  postcoro::io_context b;

  EXPECT_TRUE(a.get_executor() == a.get_executor());
  EXPECT_FALSE(a.get_executor() == b.get_executor());
  EXPECT_FALSE(a.get_executor().stopped());
  EXPECT_TRUE(postcoro::io_context::executor_type{}.stopped());
  EXPECT_FALSE(static_cast<bool>(postcoro::io_context::executor_type{}));
}

}  // namespace
