// config.hpp

#pragma once
#include "client_address.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

struct Config {
  std::string address = "0.0.0.0";
  unsigned short port = 3000;
  int threads = 1;
  std::size_t capacity = 10000;
  std::chrono::seconds max_age{24 * 60 * 60};
  std::string snapshot_path; // empty disables persistence
  std::chrono::seconds snapshot_interval{0};
  int rate_limit = 100; // requests per window per client, 0 disables
  std::chrono::seconds rate_window{15 * 60};
  ForwardedPolicy forwarded = ForwardedPolicy::Last;
};

using EnvLookup = std::function<const char*(const char*)>;

// Environment first, then command line flags. Throws std::invalid_argument
// on unknown flags or malformed values.
Config load_config(const std::vector<std::string>& args, const EnvLookup& env);
Config load_config(const std::vector<std::string>& args);

std::string usage();
