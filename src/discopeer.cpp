#include "client_rate_limiter.hpp"
#include "config.hpp"
#include "group_store.hpp"
#include "registry.hpp"
#include "server.hpp"
#include "snapshot_file.hpp"
#include "subscription_hub.hpp"

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace net = boost::asio;

namespace {
void save_snapshot(PeerRegistry& registry, const SnapshotFile& file) {
  try {
    auto snapshot = registry.snapshot();
    file.save(snapshot);
    std::cout << "Saved " << snapshot.size() << " peer groups to "
              << file.path().string() << std::endl;
  } catch (std::exception& e) {
    std::cerr << "Error saving peer cache: " << e.what() << std::endl;
  }
}

net::awaitable<void> save_periodically(PeerRegistry& registry,
                                       const SnapshotFile& file,
                                       std::chrono::seconds interval) {
  net::steady_timer timer(co_await net::this_coro::executor);

  while (true) {
    timer.expires_after(interval);
    co_await timer.async_wait(net::use_awaitable);
    save_snapshot(registry, file);
  }
}
} // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (!args.empty() && (args[0] == "--help" || args[0] == "-h")) {
    std::cout << usage();
    return 0;
  }

  Config config;
  try {
    config = load_config(args);
  } catch (std::exception& e) {
    std::cerr << e.what() << "\n" << usage();
    return 1;
  }

  net::io_context ioc{config.threads};
  GroupStore store{config.capacity, config.max_age};
  std::cout << "Group store holds up to " << store.capacity()
            << " groups for at most " << config.max_age.count() << "s"
            << std::endl;
  SubscriptionHub hub;
  PeerRegistry registry{store, hub};

  std::optional<SnapshotFile> snapshot;
  if (!config.snapshot_path.empty()) {
    snapshot.emplace(config.snapshot_path);
    try {
      auto loaded = registry.restore(snapshot->load());
      std::cout << "Loaded " << loaded << " peer groups from "
                << snapshot->path().string() << std::endl;
    } catch (std::exception& e) {
      std::cerr << "Error loading peer cache: " << e.what() << std::endl;
    }
  }

  std::shared_ptr<ClientRateLimiter> limiter;
  if (config.rate_limit > 0) {
    limiter = std::make_shared<ClientRateLimiter>(ioc, config.rate_limit,
                                                  config.rate_window);
    limiter->start_replenisher();
  }

  Server server{ioc, config, registry, hub, limiter};
  try {
    server.start();
  } catch (std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  if (snapshot && config.snapshot_interval.count() > 0) {
    net::co_spawn(
        ioc, save_periodically(registry, *snapshot, config.snapshot_interval),
        net::detached);
  }

  net::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int signal) {
    if (ec)
      return;
    std::cout << "Received signal " << signal << ", shutting down"
              << std::endl;
    server.stop();
    ioc.stop();
  });

  std::vector<std::thread> workers;
  for (int i = 1; i < config.threads; ++i) {
    workers.emplace_back([&ioc] {
      try {
        ioc.run();
      } catch (std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        ioc.stop();
      }
    });
  }
  try {
    ioc.run();
  } catch (std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    ioc.stop();
  }
  for (auto& worker : workers) {
    worker.join();
  }

  if (snapshot) {
    save_snapshot(registry, *snapshot);
  }
  return 0;
}
