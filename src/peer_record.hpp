// peer_record.hpp

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Registration instants are kept at millisecond resolution since they are
// persisted as milliseconds since the Unix epoch.
using Millis = std::chrono::time_point<std::chrono::system_clock,
                                       std::chrono::milliseconds>;
using Clock = std::function<Millis()>;

Millis system_now();

struct PeerRecord {
  std::string name;
  std::string endpoint;
  std::uint32_t ttl_seconds = 300;
  json metadata = json::object();
  std::string peer_id;
  std::string source_address;
  Millis registered_at{};
};

// What discovery and subscribers see of a record.
struct PeerView {
  std::string name;
  std::string endpoint;
  std::string source_address;
  std::string peer_id;
  json metadata = json::object();
  std::int64_t age_seconds = 0;
};

using GroupSnapshot = std::map<std::string, std::vector<PeerRecord>>;

void to_json(json& j, const PeerRecord& record);
void from_json(const json& j, PeerRecord& record);
void to_json(json& j, const PeerView& view);
