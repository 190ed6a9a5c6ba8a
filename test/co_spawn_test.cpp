#include <gtest/gtest.h>

#include <postcoro/co_sleep.hpp>
#include <postcoro/co_spawn.hpp>
#include <postcoro/io_context.hpp>
#include <postcoro/src.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "test_util.hpp"

namespace {

using namespace std::chrono_literals;

TEST(co_spawn_test, detached_starts_only_when_the_context_runs) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  std::atomic<bool> ran{false};

  auto child = [&]() -> postcoro::awaitable<void> {
    ran.store(true, std::memory_order_relaxed);
    co_return;
  };

  postcoro::co_spawn(ex, child(), postcoro::detached);
  EXPECT_FALSE(ran.load(std::memory_order_relaxed));

  EXPECT_EQ(ctx.run(), 1U);
  EXPECT_TRUE(ran.load(std::memory_order_relaxed));
}

TEST(co_spawn_test, detached_coroutine_resumes_after_co_sleep) {
  postcoro::io_context ctx;
  auto ex = ctx.get_executor();
  std::string seen;

  auto child = [&]() -> postcoro::awaitable<void> {
    seen += "a";
    co_await postcoro::co_sleep(ex, 1ms);
    seen += "b";
  };

  postcoro::co_spawn(ex, child(), postcoro::detached);
  (void)ctx.run();

  EXPECT_EQ(seen, "ab");
}

TEST(co_spawn_test, nested_awaitables_deliver_values) {
  postcoro::io_context ctx;

  auto child = []() -> postcoro::awaitable<int> { co_return 7; };
  auto parent = [&]() -> postcoro::awaitable<int> { co_return co_await child() * 6; };

  EXPECT_EQ(postcoro::sync_wait(ctx, parent()), 42);
}

TEST(co_spawn_test, nested_awaitable_rethrows_exception_in_awaiter) {
  postcoro::io_context ctx;
  bool caught = false;

  auto child = []() -> postcoro::awaitable<int> {
    throw std::runtime_error("boom");
    co_return 0;
  };

  auto parent = [&]() -> postcoro::awaitable<void> {
    try {
      (void)co_await child();
    } catch (std::runtime_error const& e) {
      EXPECT_STREQ(e.what(), "boom");
      caught = true;
    }
  };

  postcoro::sync_wait(ctx, parent());
  EXPECT_TRUE(caught);
}

TEST(co_spawn_test, sync_wait_propagates_value_and_exception) {
  postcoro::io_context ctx;

  auto value = []() -> postcoro::awaitable<std::string> { co_return std::string{"ok"}; };
  EXPECT_EQ(postcoro::sync_wait(ctx, value()), "ok");

  auto failing = []() -> postcoro::awaitable<void> {
    throw std::logic_error("bad");
    co_return;
  };
  EXPECT_THROW(postcoro::sync_wait(ctx, failing()), std::logic_error);
}

TEST(co_spawn_test, unstarted_awaitable_frees_its_frame) {
  auto token = std::make_shared<int>(1);
  std::weak_ptr<int> weak = token;

  {
    auto holder = [](std::shared_ptr<int> p) -> postcoro::awaitable<int> { co_return *p; };
    auto a = holder(std::move(token));
    EXPECT_FALSE(weak.expired());
  }
  EXPECT_TRUE(weak.expired());
}

TEST(co_spawn_death_test, detached_coroutine_finishing_with_exception_aborts) {
  EXPECT_DEATH(
    {
      postcoro::io_context ctx;
      auto escaping = []() -> postcoro::awaitable<void> {
        throw std::runtime_error("escaped");
        co_return;
      };
      postcoro::co_spawn(ctx.get_executor(), escaping(), postcoro::detached);
      (void)ctx.run();
    },
    "finished with an exception");
}

}  // namespace
