// subscription_hub.hpp

#pragma once
#include "peer_record.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// A persistent-channel client. deliver() must not block: implementations
// queue the message and write it on their own executor.
class PeerObserver {
public:
  virtual ~PeerObserver() = default;
  virtual void deliver(std::shared_ptr<const std::string> message) = 0;
};

// Tracks which group each connected observer listens to and pushes
// {"type":"peers"} messages to them.
class SubscriptionHub {
public:
  void connect(const std::shared_ptr<PeerObserver>& observer);

  // Moves the observer to group_key, leaving any previous group.
  void subscribe(const std::shared_ptr<PeerObserver>& observer,
                 const std::string& group_key);

  void disconnect(const PeerObserver& observer);

  void publish(const std::string& group_key,
               const std::vector<PeerView>& peers);

  std::size_t observer_count() const;
  std::size_t subscription_count() const;
  std::size_t subscriber_count(const std::string& group_key) const;

  static std::shared_ptr<const std::string>
  peers_message(const std::vector<PeerView>& peers);

private:
  struct ObserverRecord {
    std::weak_ptr<PeerObserver> handle;
    std::string subscribed_key; // empty until the first subscribe
  };

  void leave_locked(const PeerObserver* observer, const std::string& key);

  mutable std::mutex mutex_;
  std::unordered_map<const PeerObserver*, ObserverRecord> observers_;
  std::unordered_map<std::string, std::unordered_set<const PeerObserver*>>
      subscriptions_;
};
