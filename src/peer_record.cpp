#include "peer_record.hpp"

Millis system_now() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

void to_json(json& j, const PeerRecord& record) {
  j = json{{"name", record.name},
           {"endpoint", record.endpoint},
           {"ttl", record.ttl_seconds},
           {"metadata", record.metadata},
           {"peerId", record.peer_id},
           {"sourceAddress", record.source_address},
           {"registeredAt", record.registered_at.time_since_epoch().count()}};
}

void from_json(const json& j, PeerRecord& record) {
  record.name = j.at("name").get<std::string>();
  record.endpoint = j.at("endpoint").get<std::string>();
  record.ttl_seconds = j.at("ttl").get<std::uint32_t>();
  record.metadata = j.value("metadata", json::object());
  record.peer_id = j.at("peerId").get<std::string>();
  record.source_address = j.value("sourceAddress", std::string{});
  record.registered_at = Millis{
      std::chrono::milliseconds{j.at("registeredAt").get<std::int64_t>()}};
}

void to_json(json& j, const PeerView& view) {
  j = json{{"name", view.name},
           {"endpoint", view.endpoint},
           {"sourceAddress", view.source_address},
           {"peerId", view.peer_id},
           {"metadata", view.metadata},
           {"age", view.age_seconds}};
}
