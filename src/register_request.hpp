// register_request.hpp

#pragma once
#include "peer_record.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct RegisterRequest {
  std::string name;
  std::string endpoint;
  std::uint32_t ttl_seconds = 300;
  json metadata = json::object();
  std::optional<std::string> peer_id;

  // Throws ValidationError naming the first offending field. Null optional
  // fields count as absent.
  static RegisterRequest from_json(const json& body);

  // An empty body is treated as {}.
  static RegisterRequest parse(std::string_view body);
};
