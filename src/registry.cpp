#include "registry.hpp"
#include "errors.hpp"
#include "expiration.hpp"
#include "identity.hpp"

#include <algorithm>
#include <functional>

PeerRegistry::PeerRegistry(GroupStore& store, SubscriptionHub& hub,
                           Clock clock)
    : store_(store), hub_(hub), clock_(std::move(clock)) {}

std::mutex& PeerRegistry::lock_for(const std::string& group_key) {
  return locks_[std::hash<std::string>{}(group_key) % kLockStripes];
}

void PeerRegistry::write_back(const std::string& group_key,
                              std::vector<PeerRecord> members) {
  if (members.empty()) {
    store_.erase(group_key);
    return;
  }
  auto ttl = group_ttl(members);
  store_.put(group_key, std::move(members), ttl);
}

Registration PeerRegistry::register_peer(const std::string& group_key,
                                         const RegisterRequest& request,
                                         const std::string& source_address) {
  auto peer_id = resolve_peer_id(request.peer_id, request.name,
                                 request.endpoint, source_address);

  std::scoped_lock lock(lock_for(group_key));
  auto now = clock_();
  auto members = store_.get(group_key).value_or(std::vector<PeerRecord>{});
  members.erase(std::remove_if(members.begin(), members.end(),
                               [&](const PeerRecord& r) {
                                 return r.peer_id == peer_id;
                               }),
                members.end());
  members.push_back(PeerRecord{request.name, request.endpoint,
                               request.ttl_seconds, request.metadata, peer_id,
                               source_address, now});

  auto view = public_view(now, members);
  write_back(group_key, std::move(members));
  hub_.publish(group_key, view);

  return Registration{peer_id, request.ttl_seconds, source_address};
}

void PeerRegistry::heartbeat(const std::string& group_key,
                             const std::string& peer_id) {
  std::scoped_lock lock(lock_for(group_key));
  auto members = store_.get(group_key).value_or(std::vector<PeerRecord>{});
  auto it = std::find_if(members.begin(), members.end(),
                         [&](const PeerRecord& r) {
                           return r.peer_id == peer_id;
                         });
  if (it == members.end()) {
    throw NotFoundError("Peer not found");
  }
  it->registered_at = clock_();
  write_back(group_key, std::move(members));
}

void PeerRegistry::unsubscribe(const std::string& group_key,
                               const std::string& peer_id) {
  std::scoped_lock lock(lock_for(group_key));
  auto members = store_.get(group_key).value_or(std::vector<PeerRecord>{});
  members.erase(std::remove_if(members.begin(), members.end(),
                               [&](const PeerRecord& r) {
                                 return r.peer_id == peer_id;
                               }),
                members.end());

  auto view = public_view(clock_(), members);
  write_back(group_key, std::move(members));
  hub_.publish(group_key, view);
}

std::vector<PeerView> PeerRegistry::discover(const std::string& group_key) {
  std::scoped_lock lock(lock_for(group_key));
  auto now = clock_();
  auto members = store_.get(group_key);
  if (!members)
    return {};

  auto active = active_members(now, *members);
  auto view = public_view(now, active);
  if (active.size() < members->size()) {
    write_back(group_key, std::move(active));
    hub_.publish(group_key, view);
  }
  return view;
}

void PeerRegistry::attach(const std::shared_ptr<PeerObserver>& observer,
                          const std::string& group_key) {
  std::scoped_lock lock(lock_for(group_key));
  auto members = store_.get(group_key).value_or(std::vector<PeerRecord>{});
  hub_.subscribe(observer, group_key);
  auto view = public_view(clock_(), members);
  observer->deliver(SubscriptionHub::peers_message(view));
}

std::size_t PeerRegistry::restore(const GroupSnapshot& snapshot) {
  auto now = clock_();
  std::size_t kept = 0;
  for (const auto& [group_key, members] : snapshot) {
    auto active = active_members(now, members);
    if (active.empty())
      continue;
    std::scoped_lock lock(lock_for(group_key));
    write_back(group_key, std::move(active));
    ++kept;
  }
  return kept;
}

GroupSnapshot PeerRegistry::snapshot() { return store_.entries(); }

std::size_t PeerRegistry::group_count() { return store_.size(); }
