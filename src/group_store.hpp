// group_store.hpp

#pragma once
#include "peer_record.hpp"

#include <chrono>
#include <cstddef>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Capacity-bounded map from group key to member list. Each entry expires as
// a whole after its group TTL, capped by a global maximum age. When full,
// the least recently touched group is evicted without notice.
class GroupStore {
public:
  static constexpr std::size_t kDefaultCapacity = 10000;
  static constexpr std::chrono::seconds kDefaultMaxAge{24 * 60 * 60};

  GroupStore(std::size_t capacity, std::chrono::seconds max_age,
             Clock clock = system_now);

  std::optional<std::vector<PeerRecord>> get(const std::string& key);

  // Replaces the member list and resets the expiry to min(ttl, max age).
  // An empty member list erases the key instead.
  void put(const std::string& key, std::vector<PeerRecord> members,
           std::chrono::seconds ttl);

  void erase(const std::string& key);

  // Group TTL recorded by the last put, before the max age cap.
  std::optional<std::chrono::seconds> ttl(const std::string& key);

  std::size_t size();
  std::size_t capacity() const { return capacity_; }

  // All live groups with their stored members, unfiltered.
  GroupSnapshot entries();

private:
  // Expiry deadline to key, soonest first.
  using ExpiryIndex = std::multimap<Millis, std::string>;

  struct Entry {
    std::string key;
    std::vector<PeerRecord> members;
    std::chrono::seconds ttl;
    ExpiryIndex::iterator expiry;
  };
  using LruList = std::list<Entry>;

  LruList::iterator find_live(const std::string& key, Millis now);
  void remove(LruList::iterator entry);
  void purge_expired(Millis now);

  std::size_t capacity_;
  std::chrono::seconds max_age_;
  Clock clock_;
  LruList lru_; // front is most recently touched
  std::unordered_map<std::string, LruList::iterator> index_;
  ExpiryIndex expiry_;
  std::mutex mutex_;
};
