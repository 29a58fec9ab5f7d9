#include "group_store.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

GroupStore::GroupStore(std::size_t capacity, std::chrono::seconds max_age,
                       Clock clock)
    : capacity_(capacity), max_age_(max_age), clock_(std::move(clock)) {
  if (capacity_ == 0) {
    throw std::invalid_argument("group store capacity must be positive");
  }
  if (max_age_.count() <= 0) {
    throw std::invalid_argument("group store max age must be positive");
  }
}

GroupStore::LruList::iterator GroupStore::find_live(const std::string& key,
                                                    Millis now) {
  auto it = index_.find(key);
  if (it == index_.end())
    return lru_.end();
  if (it->second->expiry->first <= now) {
    remove(it->second);
    return lru_.end();
  }
  return it->second;
}

void GroupStore::remove(LruList::iterator entry) {
  expiry_.erase(entry->expiry);
  index_.erase(entry->key);
  lru_.erase(entry);
}

void GroupStore::purge_expired(Millis now) {
  // Only the already-expired prefix of the deadline index is visited.
  while (!expiry_.empty() && expiry_.begin()->first <= now) {
    remove(index_.at(expiry_.begin()->second));
  }
}

std::optional<std::vector<PeerRecord>>
GroupStore::get(const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto it = find_live(key, clock_());
  if (it == lru_.end())
    return std::nullopt;
  lru_.splice(lru_.begin(), lru_, it);
  return it->members;
}

void GroupStore::put(const std::string& key, std::vector<PeerRecord> members,
                     std::chrono::seconds ttl) {
  if (members.empty()) {
    erase(key);
    return;
  }

  auto now = clock_();
  auto expires_at = now + std::min(ttl, max_age_);

  std::scoped_lock lock(mutex_);
  auto it = index_.find(key);
  if (it != index_.end()) {
    auto& entry = *it->second;
    entry.members = std::move(members);
    entry.ttl = ttl;
    expiry_.erase(entry.expiry);
    entry.expiry = expiry_.emplace(expires_at, key);
    lru_.splice(lru_.begin(), lru_, it->second);
    return;
  }

  // Stale entries go first so a live group is only evicted when needed.
  purge_expired(now);
  if (lru_.size() >= capacity_) {
    remove(std::prev(lru_.end()));
  }

  lru_.push_front(Entry{key, std::move(members), ttl,
                        expiry_.emplace(expires_at, key)});
  index_.emplace(key, lru_.begin());
}

void GroupStore::erase(const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto it = index_.find(key);
  if (it == index_.end())
    return;
  remove(it->second);
}

std::optional<std::chrono::seconds>
GroupStore::ttl(const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto it = find_live(key, clock_());
  if (it == lru_.end())
    return std::nullopt;
  return it->ttl;
}

std::size_t GroupStore::size() {
  std::scoped_lock lock(mutex_);
  purge_expired(clock_());
  return lru_.size();
}

GroupSnapshot GroupStore::entries() {
  std::scoped_lock lock(mutex_);
  purge_expired(clock_());
  GroupSnapshot snapshot;
  for (const auto& entry : lru_) {
    snapshot.emplace(entry.key, entry.members);
  }
  return snapshot;
}
