#include "identity.hpp"

#include <gtest/gtest.h>

TEST(Identity, DerivesTruncatedSha256) {
  EXPECT_EQ(derive_peer_id("svc1", "http://10.0.0.1:8080", "10.0.0.1:40000"),
            "3799440e6a06a30bd70395aed5d48ee8");
}

TEST(Identity, DerivedIdIsDeterministic) {
  auto first = derive_peer_id("svc1", "http://10.0.0.1:8080", "1.2.3.4:5");
  auto second = derive_peer_id("svc1", "http://10.0.0.1:8080", "1.2.3.4:5");
  EXPECT_EQ(first, second);
  EXPECT_EQ(first.size(), 32u);
  EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(Identity, DerivedIdDependsOnSourceAddress) {
  EXPECT_NE(derive_peer_id("svc1", "http://10.0.0.1:8080", "1.2.3.4:5"),
            derive_peer_id("svc1", "http://10.0.0.1:8080", "1.2.3.4:6"));
}

TEST(Identity, RequestedIdIsUsedVerbatim) {
  EXPECT_EQ(resolve_peer_id(std::string("my-peer"), "svc1", "e", "a:1"),
            "my-peer");
}

TEST(Identity, EmptyRequestedIdFallsBackToDerived) {
  EXPECT_EQ(resolve_peer_id(std::string(), "svc1", "e", "a:1"),
            derive_peer_id("svc1", "e", "a:1"));
  EXPECT_EQ(resolve_peer_id(std::nullopt, "svc1", "e", "a:1"),
            derive_peer_id("svc1", "e", "a:1"));
}
