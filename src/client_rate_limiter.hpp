#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace net = boost::asio;

// Fixed-window request budget per client host. The replenisher coroutine
// clears every client's count once per window.
class ClientRateLimiter
    : public std::enable_shared_from_this<ClientRateLimiter> {
public:
  ClientRateLimiter(net::io_context& ctx, int max_requests,
                    std::chrono::seconds window)
      : ctx_(ctx), max_requests_(max_requests), window_(window) {}

  void start_replenisher() {
    net::co_spawn(
        ctx_,
        [weak_self = weak_from_this()]() -> net::awaitable<void> {
          net::steady_timer timer(co_await net::this_coro::executor);

          while (true) {
            auto self = weak_self.lock();
            if (!self) {
              co_return;
            }
            timer.expires_after(self->window_);
            self.reset();
            co_await timer.async_wait(net::use_awaitable);

            self = weak_self.lock();
            if (!self) {
              co_return;
            }
            self->reset();
          }
        },
        net::detached);
  }

  net::awaitable<bool> is_overloaded(std::string client) {
    bool overloaded = false;
    {
      std::scoped_lock lock(mutex_);
      auto& used = used_[client];
      if (used >= max_requests_) {
        overloaded = true;
      } else {
        ++used;
      }
    }
    co_return overloaded;
  }

  void reset() {
    std::scoped_lock lock(mutex_);
    if (!used_.empty()) {
      std::cout << "Resetting request counters for " << used_.size()
                << " clients" << std::endl;
    }
    used_.clear();
  }

private:
  net::io_context& ctx_;
  const int max_requests_;
  const std::chrono::seconds window_;
  std::unordered_map<std::string, int> used_;
  std::mutex mutex_;
};
