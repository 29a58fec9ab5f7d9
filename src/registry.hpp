// registry.hpp

#pragma once
#include "group_store.hpp"
#include "peer_record.hpp"
#include "register_request.hpp"
#include "subscription_hub.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct Registration {
  std::string peer_id;
  std::uint32_t ttl_seconds;
  std::string source_address;
};

// The register / heartbeat / unsubscribe / discovery protocol on top of a
// GroupStore. Each operation runs its read-modify-write-notify sequence
// under a per-key lock, so operations on one group are linearizable while
// unrelated groups proceed in parallel.
class PeerRegistry {
public:
  PeerRegistry(GroupStore& store, SubscriptionHub& hub,
               Clock clock = system_now);

  Registration register_peer(const std::string& group_key,
                             const RegisterRequest& request,
                             const std::string& source_address);

  // Throws NotFoundError when peer_id is not in the group. Does not notify
  // subscribers.
  void heartbeat(const std::string& group_key, const std::string& peer_id);

  // Removing an absent peer is a no-op. Subscribers are always notified.
  void unsubscribe(const std::string& group_key, const std::string& peer_id);

  // Returns the active members. Expired members found along the way are
  // written out of the store and subscribers are told.
  std::vector<PeerView> discover(const std::string& group_key);

  // Subscribes the observer to group_key and sends it the current view.
  void attach(const std::shared_ptr<PeerObserver>& observer,
              const std::string& group_key);

  // Loads groups, dropping expired members and groups left empty. Returns
  // the number of groups kept.
  std::size_t restore(const GroupSnapshot& snapshot);

  GroupSnapshot snapshot();

  std::size_t group_count();

private:
  static constexpr std::size_t kLockStripes = 64;

  std::mutex& lock_for(const std::string& group_key);
  void write_back(const std::string& group_key,
                  std::vector<PeerRecord> members);

  GroupStore& store_;
  SubscriptionHub& hub_;
  Clock clock_;
  std::array<std::mutex, kLockStripes> locks_;
};
