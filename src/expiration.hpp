// expiration.hpp

#pragma once
#include "peer_record.hpp"

#include <chrono>
#include <vector>

// A member is active while now - registered_at < ttl_seconds * 1000 ms.
bool is_active(Millis now, const PeerRecord& record);

std::vector<PeerRecord> active_members(Millis now,
                                       const std::vector<PeerRecord>& members);

// Active members projected to their public view, age rounded to the
// nearest whole second.
std::vector<PeerView> public_view(Millis now,
                                  const std::vector<PeerRecord>& members);

// Largest member TTL, zero for an empty list.
std::chrono::seconds group_ttl(const std::vector<PeerRecord>& members);
