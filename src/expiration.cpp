#include "expiration.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

bool is_active(Millis now, const PeerRecord& record) {
  return now - record.registered_at < std::chrono::seconds{record.ttl_seconds};
}

std::vector<PeerRecord> active_members(Millis now,
                                       const std::vector<PeerRecord>& members) {
  std::vector<PeerRecord> active;
  std::copy_if(members.begin(), members.end(), std::back_inserter(active),
               [now](const PeerRecord& r) { return is_active(now, r); });
  return active;
}

std::vector<PeerView> public_view(Millis now,
                                  const std::vector<PeerRecord>& members) {
  std::vector<PeerView> views;
  for (const auto& r : members) {
    if (!is_active(now, r))
      continue;
    auto elapsed = (now - r.registered_at).count();
    auto age = static_cast<std::int64_t>(
        std::floor(static_cast<double>(elapsed) / 1000.0 + 0.5));
    views.push_back(PeerView{r.name, r.endpoint, r.source_address, r.peer_id,
                             r.metadata, age});
  }
  return views;
}

std::chrono::seconds group_ttl(const std::vector<PeerRecord>& members) {
  std::uint32_t ttl = 0;
  for (const auto& r : members) {
    ttl = std::max(ttl, r.ttl_seconds);
  }
  return std::chrono::seconds{ttl};
}
