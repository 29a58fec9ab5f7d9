#include "config.hpp"

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace {
std::uint64_t parse_number(const std::string& raw, const std::string& field,
                           std::uint64_t max) {
  std::size_t consumed = 0;
  std::uint64_t value = 0;
  try {
    if (raw.empty() || raw.front() == '-')
      throw std::invalid_argument(raw);
    value = std::stoull(raw, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument("invalid value for " + field + ": " + raw);
  }
  if (consumed != raw.size() || value > max) {
    throw std::invalid_argument("invalid value for " + field + ": " + raw);
  }
  return value;
}

void apply(Config& config, const std::string& key, const std::string& value) {
  if (key == "port") {
    config.port = static_cast<unsigned short>(
        parse_number(value, key, std::numeric_limits<unsigned short>::max()));
  } else if (key == "address") {
    config.address = value;
  } else if (key == "threads") {
    config.threads = static_cast<int>(parse_number(value, key, 256));
    if (config.threads == 0)
      throw std::invalid_argument("threads must be positive");
  } else if (key == "capacity") {
    config.capacity = parse_number(
        value, key, std::numeric_limits<std::uint32_t>::max());
    if (config.capacity == 0)
      throw std::invalid_argument("capacity must be positive");
  } else if (key == "max-age") {
    config.max_age = std::chrono::seconds{parse_number(
        value, key, std::numeric_limits<std::uint32_t>::max())};
    if (config.max_age.count() == 0)
      throw std::invalid_argument("max-age must be positive");
  } else if (key == "snapshot") {
    config.snapshot_path = value;
  } else if (key == "snapshot-interval") {
    config.snapshot_interval = std::chrono::seconds{parse_number(
        value, key, std::numeric_limits<std::uint32_t>::max())};
  } else if (key == "rate-limit") {
    config.rate_limit = static_cast<int>(
        parse_number(value, key, std::numeric_limits<int>::max()));
  } else if (key == "rate-window") {
    config.rate_window = std::chrono::seconds{parse_number(
        value, key, std::numeric_limits<std::uint32_t>::max())};
    if (config.rate_window.count() == 0)
      throw std::invalid_argument("rate-window must be positive");
  } else if (key == "forwarded") {
    config.forwarded = parse_forwarded_policy(value);
  } else {
    throw std::invalid_argument("unknown option --" + key);
  }
}

struct EnvBinding {
  const char* variable;
  const char* key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"PORT", "port"},
    {"DISCOPEER_ADDRESS", "address"},
    {"DISCOPEER_THREADS", "threads"},
    {"DISCOPEER_CAPACITY", "capacity"},
    {"DISCOPEER_MAX_AGE", "max-age"},
    {"DISCOPEER_SNAPSHOT", "snapshot"},
    {"DISCOPEER_SNAPSHOT_INTERVAL", "snapshot-interval"},
    {"DISCOPEER_RATE_LIMIT", "rate-limit"},
    {"DISCOPEER_RATE_WINDOW", "rate-window"},
    {"DISCOPEER_FORWARDED", "forwarded"},
};
} // namespace

Config load_config(const std::vector<std::string>& args,
                   const EnvLookup& env) {
  Config config;
  for (const auto& binding : kEnvBindings) {
    const char* value = env(binding.variable);
    if (value && *value)
      apply(config, binding.key, value);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
      throw std::invalid_argument("unexpected argument " + arg);
    }
    if (i + 1 >= args.size()) {
      throw std::invalid_argument("missing value for " + arg);
    }
    apply(config, arg.substr(2), args[++i]);
  }
  return config;
}

Config load_config(const std::vector<std::string>& args) {
  return load_config(args, [](const char* name) -> const char* {
    return std::getenv(name);
  });
}

std::string usage() {
  return "Usage:\n"
         "  discopeer [--port <port>] [--address <ip>] [--threads <n>]\n"
         "            [--capacity <groups>] [--max-age <seconds>]\n"
         "            [--snapshot <file>] [--snapshot-interval <seconds>]\n"
         "            [--rate-limit <requests>] [--rate-window <seconds>]\n"
         "            [--forwarded last|first|none]\n";
}
