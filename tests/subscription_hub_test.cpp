#include "subscription_hub.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

TEST(SubscriptionHub, ConnectedObserverHasNoSubscription) {
  SubscriptionHub hub;
  auto observer = std::make_shared<RecordingObserver>();
  hub.connect(observer);

  EXPECT_EQ(hub.observer_count(), 1u);
  EXPECT_EQ(hub.subscription_count(), 0u);
}

TEST(SubscriptionHub, ResubscribingLeavesPreviousGroup) {
  SubscriptionHub hub;
  auto observer = std::make_shared<RecordingObserver>();
  hub.connect(observer);
  hub.subscribe(observer, "a");
  hub.subscribe(observer, "b");

  EXPECT_EQ(hub.observer_count(), 1u);
  EXPECT_EQ(hub.subscription_count(), 1u);
  EXPECT_EQ(hub.subscriber_count("a"), 0u);
  EXPECT_EQ(hub.subscriber_count("b"), 1u);
}

TEST(SubscriptionHub, DisconnectRemovesObserver) {
  SubscriptionHub hub;
  auto first = std::make_shared<RecordingObserver>();
  auto second = std::make_shared<RecordingObserver>();
  hub.subscribe(first, "a");
  hub.subscribe(second, "a");

  hub.disconnect(*first);
  EXPECT_EQ(hub.subscriber_count("a"), 1u);
  hub.disconnect(*second);
  hub.disconnect(*second);

  EXPECT_EQ(hub.observer_count(), 0u);
  EXPECT_EQ(hub.subscription_count(), 0u);
}

TEST(SubscriptionHub, PublishReachesOnlyThatGroup) {
  SubscriptionHub hub;
  auto in_a = std::make_shared<RecordingObserver>();
  auto in_b = std::make_shared<RecordingObserver>();
  hub.subscribe(in_a, "a");
  hub.subscribe(in_b, "b");

  PeerView view;
  view.name = "svc1";
  view.endpoint = "tcp://a";
  view.source_address = "1.2.3.4:5";
  view.peer_id = "p";
  view.age_seconds = 3;
  hub.publish("a", {view});

  ASSERT_EQ(in_a->messages.size(), 1u);
  EXPECT_TRUE(in_b->messages.empty());
  const auto& message = in_a->messages[0];
  EXPECT_EQ(message.at("type"), "peers");
  ASSERT_EQ(message.at("peers").size(), 1u);
  EXPECT_EQ(message.at("peers")[0].at("peerId"), "p");
  EXPECT_EQ(message.at("peers")[0].at("age"), 3);
}

TEST(SubscriptionHub, DestroyedObserverIsSkipped) {
  SubscriptionHub hub;
  auto kept = std::make_shared<RecordingObserver>();
  hub.subscribe(kept, "a");
  {
    auto gone = std::make_shared<RecordingObserver>();
    hub.subscribe(gone, "a");
  }

  hub.publish("a", {});
  ASSERT_EQ(kept->messages.size(), 1u);
  EXPECT_TRUE(kept->messages[0].at("peers").empty());
}
