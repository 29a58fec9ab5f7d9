#include "client_rate_limiter.hpp"

#include <gtest/gtest.h>

#include <future>
#include <vector>

using namespace std::chrono_literals;

TEST(ClientRateLimiter, NotOverloadedWhenBudgetAvailable) {
  net::io_context ctx;
  auto limiter = std::make_shared<ClientRateLimiter>(ctx, 3, 900s);

  auto fut =
      net::co_spawn(ctx, limiter->is_overloaded("10.0.0.1"), net::use_future);
  ctx.run();
  EXPECT_FALSE(fut.get());
}

TEST(ClientRateLimiter, BecomesOverloadedAfterBudgetExhausted) {
  net::io_context ctx;
  auto limiter = std::make_shared<ClientRateLimiter>(ctx, 3, 900s);

  std::vector<std::future<bool>> results;
  for (int i = 0; i < 4; ++i) {
    results.push_back(net::co_spawn(ctx, limiter->is_overloaded("10.0.0.1"),
                                    net::use_future));
  }
  auto other =
      net::co_spawn(ctx, limiter->is_overloaded("10.0.0.2"), net::use_future);
  ctx.run();

  for (int i = 0; i < 3; ++i) {
    EXPECT_FALSE(results[i].get());
  }
  EXPECT_TRUE(results.back().get());
  EXPECT_FALSE(other.get());
}

TEST(ClientRateLimiter, ResetRestoresBudget) {
  net::io_context ctx;
  auto limiter = std::make_shared<ClientRateLimiter>(ctx, 1, 900s);

  auto first =
      net::co_spawn(ctx, limiter->is_overloaded("10.0.0.1"), net::use_future);
  auto second =
      net::co_spawn(ctx, limiter->is_overloaded("10.0.0.1"), net::use_future);
  ctx.run();
  EXPECT_FALSE(first.get());
  EXPECT_TRUE(second.get());

  limiter->reset();
  ctx.restart();
  auto third =
      net::co_spawn(ctx, limiter->is_overloaded("10.0.0.1"), net::use_future);
  ctx.run();
  EXPECT_FALSE(third.get());
}

TEST(ClientRateLimiter, ReplenisherClearsCountersEachWindow) {
  net::io_context ctx;
  auto limiter = std::make_shared<ClientRateLimiter>(ctx, 1, 1s);

  auto first =
      net::co_spawn(ctx, limiter->is_overloaded("10.0.0.1"), net::use_future);
  ctx.run();
  ctx.restart();
  EXPECT_FALSE(first.get());

  limiter->start_replenisher();
  ctx.run_for(1500ms);
  ctx.restart();

  auto second =
      net::co_spawn(ctx, limiter->is_overloaded("10.0.0.1"), net::use_future);
  ctx.run_for(100ms);
  EXPECT_FALSE(second.get());
}
