#include "register_request.hpp"
#include "errors.hpp"

#include <cmath>
#include <limits>

namespace {
bool present(const json& body, const char* field) {
  auto it = body.find(field);
  return it != body.end() && !it->is_null();
}

// Integer seconds in [0, UINT32_MAX]. Whole floats such as 60.0 count.
std::optional<std::uint32_t> ttl_seconds(const json& ttl) {
  constexpr auto kMax = std::numeric_limits<std::uint32_t>::max();
  if (ttl.is_number_unsigned()) {
    auto value = ttl.get<std::uint64_t>();
    if (value > kMax)
      return std::nullopt;
    return static_cast<std::uint32_t>(value);
  }
  if (ttl.is_number_integer()) {
    auto value = ttl.get<std::int64_t>();
    if (value < 0 || value > static_cast<std::int64_t>(kMax))
      return std::nullopt;
    return static_cast<std::uint32_t>(value);
  }
  if (ttl.is_number_float()) {
    auto value = ttl.get<double>();
    if (!std::isfinite(value) || std::trunc(value) != value || value < 0 ||
        value > static_cast<double>(kMax))
      return std::nullopt;
    return static_cast<std::uint32_t>(value);
  }
  return std::nullopt;
}
} // namespace

RegisterRequest RegisterRequest::from_json(const json& body) {
  if (!body.is_object()) {
    throw ValidationError("Invalid name parameter");
  }

  RegisterRequest req;

  auto name = body.find("name");
  if (name == body.end() || !name->is_string() ||
      name->get_ref<const std::string&>().empty()) {
    throw ValidationError("Invalid name parameter");
  }
  req.name = name->get<std::string>();

  auto endpoint = body.find("endpoint");
  if (endpoint == body.end() || !endpoint->is_string() ||
      endpoint->get_ref<const std::string&>().empty()) {
    throw ValidationError("Invalid endpoint parameter");
  }
  req.endpoint = endpoint->get<std::string>();

  if (present(body, "ttl")) {
    auto ttl = ::ttl_seconds(body.at("ttl"));
    if (!ttl) {
      throw ValidationError("Invalid TTL parameter");
    }
    req.ttl_seconds = *ttl;
  }

  if (present(body, "metadata")) {
    if (!body.at("metadata").is_object()) {
      throw ValidationError("Invalid metadata format");
    }
    req.metadata = body.at("metadata");
  }

  if (present(body, "peerId")) {
    if (!body.at("peerId").is_string()) {
      throw ValidationError("Invalid peerId format");
    }
    req.peer_id = body.at("peerId").get<std::string>();
  }

  return req;
}

RegisterRequest RegisterRequest::parse(std::string_view body) {
  if (body.find_first_not_of(" \t\r\n") == std::string_view::npos) {
    return from_json(json::object());
  }
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    throw ValidationError("Invalid JSON body");
  }
  return from_json(parsed);
}
