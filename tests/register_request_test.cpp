#include "errors.hpp"
#include "register_request.hpp"

#include <gtest/gtest.h>

namespace {
std::string rejection(const json& body) {
  try {
    RegisterRequest::from_json(body);
  } catch (const ValidationError& e) {
    return e.what();
  }
  return {};
}
} // namespace

TEST(RegisterRequest, AppliesDefaults) {
  auto req = RegisterRequest::from_json(
      {{"name", "svc1"}, {"endpoint", "http://10.0.0.1:8080"}});
  EXPECT_EQ(req.name, "svc1");
  EXPECT_EQ(req.endpoint, "http://10.0.0.1:8080");
  EXPECT_EQ(req.ttl_seconds, 300u);
  EXPECT_TRUE(req.metadata.is_object());
  EXPECT_TRUE(req.metadata.empty());
  EXPECT_FALSE(req.peer_id.has_value());
}

TEST(RegisterRequest, ReadsOptionalFields) {
  auto req = RegisterRequest::from_json({{"name", "svc1"},
                                         {"endpoint", "tcp://a"},
                                         {"ttl", 0},
                                         {"metadata", {{"zone", "b"}}},
                                         {"peerId", "p-1"}});
  EXPECT_EQ(req.ttl_seconds, 0u);
  EXPECT_EQ(req.metadata.at("zone"), "b");
  EXPECT_EQ(req.peer_id, std::optional<std::string>{"p-1"});
}

TEST(RegisterRequest, NullOptionalFieldsCountAsAbsent) {
  auto req = RegisterRequest::from_json({{"name", "svc1"},
                                         {"endpoint", "tcp://a"},
                                         {"ttl", nullptr},
                                         {"metadata", nullptr},
                                         {"peerId", nullptr}});
  EXPECT_EQ(req.ttl_seconds, 300u);
  EXPECT_TRUE(req.metadata.is_object());
  EXPECT_FALSE(req.peer_id.has_value());
}

TEST(RegisterRequest, RejectsMissingOrWrongTypedName) {
  EXPECT_EQ(rejection({{"endpoint", "tcp://a"}}), "Invalid name parameter");
  EXPECT_EQ(rejection({{"name", ""}, {"endpoint", "tcp://a"}}),
            "Invalid name parameter");
  EXPECT_EQ(rejection({{"name", 7}, {"endpoint", "tcp://a"}}),
            "Invalid name parameter");
  EXPECT_EQ(rejection(json::array()), "Invalid name parameter");
}

TEST(RegisterRequest, RejectsMissingOrWrongTypedEndpoint) {
  EXPECT_EQ(rejection({{"name", "svc1"}}), "Invalid endpoint parameter");
  EXPECT_EQ(rejection({{"name", "svc1"}, {"endpoint", json::array()}}),
            "Invalid endpoint parameter");
}

TEST(RegisterRequest, AcceptsWholeFloatTtl) {
  auto req = RegisterRequest::parse(
      R"({"name":"svc1","endpoint":"tcp://a","ttl":60.0})");
  EXPECT_EQ(req.ttl_seconds, 60u);
}

TEST(RegisterRequest, RejectsBadTtl) {
  json base{{"name", "svc1"}, {"endpoint", "tcp://a"}};
  for (const json& ttl : {json(-1), json(1.5), json(-2.0), json("30"),
                          json(true), json(5000000000LL), json(5e9)}) {
    auto body = base;
    body["ttl"] = ttl;
    EXPECT_EQ(rejection(body), "Invalid TTL parameter") << ttl.dump();
  }
}

TEST(RegisterRequest, RejectsNonObjectMetadata) {
  EXPECT_EQ(rejection({{"name", "svc1"},
                       {"endpoint", "tcp://a"},
                       {"metadata", "zone=b"}}),
            "Invalid metadata format");
  EXPECT_EQ(rejection({{"name", "svc1"},
                       {"endpoint", "tcp://a"},
                       {"metadata", json::array({1, 2})}}),
            "Invalid metadata format");
}

TEST(RegisterRequest, RejectsNonStringPeerId) {
  EXPECT_EQ(
      rejection({{"name", "svc1"}, {"endpoint", "tcp://a"}, {"peerId", 42}}),
      "Invalid peerId format");
}

TEST(RegisterRequest, ParsesRawBodies) {
  auto req = RegisterRequest::parse(R"({"name":"svc1","endpoint":"tcp://a"})");
  EXPECT_EQ(req.name, "svc1");

  EXPECT_THROW(RegisterRequest::parse("{bad json}"), ValidationError);
  try {
    RegisterRequest::parse("");
    FAIL() << "empty body accepted";
  } catch (const ValidationError& e) {
    EXPECT_STREQ(e.what(), "Invalid name parameter");
  }
}
