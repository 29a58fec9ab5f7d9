#include "subscription_hub.hpp"

void SubscriptionHub::connect(const std::shared_ptr<PeerObserver>& observer) {
  std::scoped_lock lock(mutex_);
  auto [it, inserted] =
      observers_.try_emplace(observer.get(), ObserverRecord{observer, {}});
  if (!inserted && it->second.handle.expired()) {
    // Address reused by a new observer after the old one vanished.
    it->second.handle = observer;
  }
}

void SubscriptionHub::subscribe(const std::shared_ptr<PeerObserver>& observer,
                                const std::string& group_key) {
  std::scoped_lock lock(mutex_);
  auto [it, inserted] =
      observers_.try_emplace(observer.get(), ObserverRecord{observer, {}});
  auto& record = it->second;
  if (!inserted && record.handle.expired()) {
    record.handle = observer;
  }
  if (!inserted && !record.subscribed_key.empty()) {
    leave_locked(observer.get(), record.subscribed_key);
  }
  record.subscribed_key = group_key;
  subscriptions_[group_key].insert(observer.get());
}

void SubscriptionHub::disconnect(const PeerObserver& observer) {
  std::scoped_lock lock(mutex_);
  auto it = observers_.find(&observer);
  if (it == observers_.end())
    return;
  if (!it->second.subscribed_key.empty()) {
    leave_locked(&observer, it->second.subscribed_key);
  }
  observers_.erase(it);
}

void SubscriptionHub::leave_locked(const PeerObserver* observer,
                                   const std::string& key) {
  auto subs = subscriptions_.find(key);
  if (subs == subscriptions_.end())
    return;
  subs->second.erase(observer);
  if (subs->second.empty())
    subscriptions_.erase(subs);
}

void SubscriptionHub::publish(const std::string& group_key,
                              const std::vector<PeerView>& peers) {
  std::vector<std::shared_ptr<PeerObserver>> targets;
  {
    std::scoped_lock lock(mutex_);
    auto subs = subscriptions_.find(group_key);
    if (subs == subscriptions_.end())
      return;
    for (const auto* raw : subs->second) {
      if (auto observer = observers_.at(raw).handle.lock()) {
        targets.push_back(std::move(observer));
      }
    }
  }
  if (targets.empty())
    return;

  auto message = peers_message(peers);
  for (const auto& observer : targets) {
    observer->deliver(message);
  }
}

std::size_t SubscriptionHub::observer_count() const {
  std::scoped_lock lock(mutex_);
  return observers_.size();
}

std::size_t SubscriptionHub::subscription_count() const {
  std::scoped_lock lock(mutex_);
  return subscriptions_.size();
}

std::size_t
SubscriptionHub::subscriber_count(const std::string& group_key) const {
  std::scoped_lock lock(mutex_);
  auto subs = subscriptions_.find(group_key);
  return subs == subscriptions_.end() ? 0 : subs->second.size();
}

std::shared_ptr<const std::string>
SubscriptionHub::peers_message(const std::vector<PeerView>& peers) {
  json message{{"type", "peers"}, {"peers", peers}};
  return std::make_shared<const std::string>(message.dump());
}
