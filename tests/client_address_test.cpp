#include "client_address.hpp"

#include <gtest/gtest.h>

TEST(ClientAddress, UsesSocketAddressWithoutForwardedHeader) {
  EXPECT_EQ(source_address("", "10.0.0.5", 40000, ForwardedPolicy::Last),
            "10.0.0.5:40000");
}

TEST(ClientAddress, StripsIpv4MappedPrefix) {
  EXPECT_EQ(source_address("", "::ffff:10.0.0.5", 40000, ForwardedPolicy::Last),
            "10.0.0.5:40000");
  EXPECT_EQ(client_host("::ffff:192.168.1.2", "10.0.0.5",
                        ForwardedPolicy::Last),
            "192.168.1.2");
}

TEST(ClientAddress, LastHopPolicy) {
  EXPECT_EQ(client_host("1.1.1.1, 2.2.2.2 ,3.3.3.3 ", "10.0.0.5",
                        ForwardedPolicy::Last),
            "3.3.3.3");
}

TEST(ClientAddress, FirstHopPolicy) {
  EXPECT_EQ(client_host(" 1.1.1.1, 2.2.2.2", "10.0.0.5",
                        ForwardedPolicy::First),
            "1.1.1.1");
}

TEST(ClientAddress, NonePolicyIgnoresHeader) {
  EXPECT_EQ(client_host("1.1.1.1", "10.0.0.5", ForwardedPolicy::None),
            "10.0.0.5");
}

TEST(ClientAddress, KeepsSocketPortBehindProxy) {
  EXPECT_EQ(source_address("1.1.1.1", "10.0.0.5", 5555, ForwardedPolicy::Last),
            "1.1.1.1:5555");
}

TEST(ClientAddress, ParsesPolicyNames) {
  EXPECT_EQ(parse_forwarded_policy("last"), ForwardedPolicy::Last);
  EXPECT_EQ(parse_forwarded_policy("first"), ForwardedPolicy::First);
  EXPECT_EQ(parse_forwarded_policy("none"), ForwardedPolicy::None);
  EXPECT_THROW(parse_forwarded_policy("middle"), std::invalid_argument);
}
