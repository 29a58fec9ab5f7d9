#include "expiration.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

TEST(Expiration, ActiveUntilTtlElapses) {
  ManualClock clock;
  auto almost = make_record("a", clock.now - 2000ms + 1ms, 2);
  auto exact = make_record("b", clock.now - 2000ms, 2);

  EXPECT_TRUE(is_active(clock.now, almost));
  EXPECT_FALSE(is_active(clock.now, exact));
}

TEST(Expiration, ZeroTtlIsNeverActive) {
  ManualClock clock;
  EXPECT_FALSE(is_active(clock.now, make_record("a", clock.now, 0)));
}

TEST(Expiration, ActiveMembersKeepsOrder) {
  ManualClock clock;
  std::vector<PeerRecord> members{make_record("a", clock.now - 10s, 60),
                                  make_record("b", clock.now - 10s, 5),
                                  make_record("c", clock.now, 60)};

  auto active = active_members(clock.now, members);
  ASSERT_EQ(active.size(), 2u);
  EXPECT_EQ(active[0].peer_id, "a");
  EXPECT_EQ(active[1].peer_id, "c");
}

TEST(Expiration, PublicViewRoundsAgeToNearestSecond) {
  ManualClock clock;
  std::vector<PeerRecord> members{make_record("a", clock.now),
                                  make_record("b", clock.now - 1499ms),
                                  make_record("c", clock.now - 1500ms)};

  auto views = public_view(clock.now, members);
  ASSERT_EQ(views.size(), 3u);
  EXPECT_EQ(views[0].age_seconds, 0);
  EXPECT_EQ(views[1].age_seconds, 1);
  EXPECT_EQ(views[2].age_seconds, 2);
}

TEST(Expiration, PublicViewCarriesIdentityAndMetadata) {
  ManualClock clock;
  auto record = make_record("a", clock.now);
  record.metadata = json{{"region", "eu"}};

  auto views = public_view(clock.now, {record});
  ASSERT_EQ(views.size(), 1u);
  json j = views[0];
  EXPECT_EQ(j.at("name"), "svc-a");
  EXPECT_EQ(j.at("endpoint"), "http://10.0.0.1:8080");
  EXPECT_EQ(j.at("sourceAddress"), "10.0.0.1:40000");
  EXPECT_EQ(j.at("peerId"), "a");
  EXPECT_EQ(j.at("metadata").at("region"), "eu");
  EXPECT_EQ(j.at("age"), 0);
  EXPECT_FALSE(j.contains("registeredAt"));
}

TEST(Expiration, GroupTtlIsLargestMemberTtl) {
  ManualClock clock;
  EXPECT_EQ(group_ttl({}), 0s);
  EXPECT_EQ(group_ttl({make_record("a", clock.now, 10),
                       make_record("b", clock.now, 60),
                       make_record("c", clock.now, 30)}),
            60s);
}
