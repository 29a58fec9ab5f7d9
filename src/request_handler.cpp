#include "request_handler.hpp"
#include "errors.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace {
constexpr const char* kProjectUrl = "https://github.com/lmangani/discopeer";
constexpr const char* kAllowedMethods = "GET,HEAD,PUT,PATCH,POST,DELETE";

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::optional<std::vector<std::string>> split_path(std::string_view path) {
  std::vector<std::string> segments;
  if (!path.empty() && path.front() == '/')
    path.remove_prefix(1);
  if (!path.empty() && path.back() == '/')
    path.remove_suffix(1);
  if (path.empty())
    return segments;

  while (true) {
    auto slash = path.find('/');
    auto decoded = percent_decode(path.substr(0, slash));
    if (!decoded || decoded->empty())
      return std::nullopt;
    segments.push_back(std::move(*decoded));
    if (slash == std::string_view::npos)
      break;
    path.remove_prefix(slash + 1);
  }
  return segments;
}

Response preflight_response(const Request& req) {
  Response res{http::status::no_content, req.version()};
  set_common_headers(res);
  res.set(http::field::access_control_allow_methods, kAllowedMethods);
  auto requested = req.find(http::field::access_control_request_headers);
  if (requested != req.end()) {
    res.set(http::field::access_control_allow_headers, requested->value());
  }
  res.keep_alive(req.keep_alive());
  res.prepare_payload();
  return res;
}

Response redirect_response(const Request& req) {
  Response res{http::status::moved_permanently, req.version()};
  set_common_headers(res);
  res.set(http::field::location, kProjectUrl);
  res.set(http::field::content_type, "text/plain");
  res.body() = std::string("Moved Permanently. Redirecting to ") + kProjectUrl;
  res.keep_alive(req.keep_alive());
  res.prepare_payload();
  return res;
}
} // namespace

std::optional<std::string> percent_decode(std::string_view encoded) {
  std::string decoded;
  decoded.reserve(encoded.size());
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    if (encoded[i] != '%') {
      decoded.push_back(encoded[i]);
      continue;
    }
    if (i + 2 >= encoded.size())
      return std::nullopt;
    int hi = hex_value(encoded[i + 1]);
    int lo = hex_value(encoded[i + 2]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    decoded.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }
  return decoded;
}

std::optional<Route> match_route(http::verb method,
                                 boost::beast::string_view target) {
  std::string_view path(target.data(), target.size());
  path = path.substr(0, path.find('?'));
  if (method == http::verb::options)
    return Route{RouteKind::Preflight, {}, {}};

  auto segments = split_path(path);
  if (!segments)
    return std::nullopt;
  const auto& s = *segments;

  switch (method) {
  case http::verb::get:
    if (s.empty())
      return Route{RouteKind::Root, {}, {}};
    if (s.size() == 1 && s[0] == "health")
      return Route{RouteKind::Health, {}, {}};
    if (s.size() == 2 && s[0] == "discovery")
      return Route{RouteKind::Discovery, s[1], {}};
    if (s.size() == 3 && s[0] == "discovery" && s[2] == "ndjson")
      return Route{RouteKind::DiscoveryStream, s[1], {}};
    break;
  case http::verb::post:
    if (s.size() == 2 && s[0] == "subscribe")
      return Route{RouteKind::Register, s[1], {}};
    if (s.size() == 3 && s[0] == "heartbeat")
      return Route{RouteKind::Heartbeat, s[1], s[2]};
    break;
  case http::verb::delete_:
    if (s.size() == 3 && s[0] == "unsubscribe")
      return Route{RouteKind::Unsubscribe, s[1], s[2]};
    break;
  default:
    break;
  }
  return std::nullopt;
}

bool is_rate_limited(RouteKind kind) {
  return kind != RouteKind::Root && kind != RouteKind::Preflight;
}

Response handle_request(const Route& route, const Request& req,
                        const std::string& source_address,
                        PeerRegistry& registry, SubscriptionHub& hub) {
  try {
    switch (route.kind) {
    case RouteKind::Root:
      return redirect_response(req);
    case RouteKind::Preflight:
      return preflight_response(req);
    case RouteKind::Register:
      return handle_register(req, route.group_key, source_address, registry);
    case RouteKind::Discovery:
      return handle_discovery(req, route.group_key, registry);
    case RouteKind::DiscoveryStream:
      return handle_discovery_ndjson(req, route.group_key, registry);
    case RouteKind::Heartbeat:
      return handle_heartbeat(req, route.group_key, route.peer_id, registry);
    case RouteKind::Unsubscribe:
      return handle_unsubscribe(req, route.group_key, route.peer_id,
                                registry);
    case RouteKind::Health:
      return handle_health(req, registry, hub);
    }
    return not_found_response(req);
  } catch (const ValidationError& e) {
    return error_response(req, http::status::bad_request, e.what());
  } catch (const NotFoundError& e) {
    return error_response(req, http::status::not_found, e.what());
  } catch (const std::exception& e) {
    std::cerr << "Error handling " << req.method_string() << " "
              << req.target() << ": " << e.what() << std::endl;
    return error_response(req, http::status::internal_server_error,
                          "Internal server error");
  }
}

Response handle_register(const Request& req, const std::string& group_key,
                         const std::string& source_address,
                         PeerRegistry& registry) {
  auto request = RegisterRequest::parse(req.body());
  auto registration =
      registry.register_peer(group_key, request, source_address);

  return json_response(req, http::status::ok,
                       {{"message", "Successfully registered"},
                        {"peerId", registration.peer_id},
                        {"ttl", registration.ttl_seconds},
                        {"sourceAddress", registration.source_address}});
}

Response handle_discovery(const Request& req, const std::string& group_key,
                          PeerRegistry& registry) {
  auto peers = registry.discover(group_key);
  return json_response(req, http::status::ok, {{"peers", peers}});
}

Response handle_discovery_ndjson(const Request& req,
                                 const std::string& group_key,
                                 PeerRegistry& registry) {
  Response res{http::status::ok, req.version()};
  set_common_headers(res);
  res.set(http::field::content_type, "application/x-ndjson");
  res.keep_alive(req.keep_alive());
  for (const auto& peer : registry.discover(group_key)) {
    res.body() += json(peer).dump();
    res.body() += '\n';
  }
  res.prepare_payload();
  return res;
}

Response handle_heartbeat(const Request& req, const std::string& group_key,
                          const std::string& peer_id, PeerRegistry& registry) {
  registry.heartbeat(group_key, peer_id);
  return json_response(req, http::status::ok,
                       {{"message", "Heartbeat received"}});
}

Response handle_unsubscribe(const Request& req, const std::string& group_key,
                            const std::string& peer_id,
                            PeerRegistry& registry) {
  registry.unsubscribe(group_key, peer_id);
  return json_response(req, http::status::ok,
                       {{"message", "Successfully unsubscribed"}});
}

Response handle_health(const Request& req, PeerRegistry& registry,
                       const SubscriptionHub& hub) {
  return json_response(req, http::status::ok,
                       {{"status", "healthy"},
                        {"cacheSize", registry.group_count()},
                        {"activeWebSocketConnections", hub.observer_count()},
                        {"activeHashGroups", hub.subscription_count()},
                        {"timestamp", iso_timestamp(system_now())}});
}

Response json_response(const Request& req, http::status status,
                       const json& body) {
  Response res{status, req.version()};
  set_common_headers(res);
  res.set(http::field::content_type, "application/json");
  res.keep_alive(req.keep_alive());
  res.body() = body.dump();
  res.prepare_payload();
  return res;
}

Response error_response(const Request& req, http::status status,
                        const std::string& message) {
  return json_response(req, status, {{"error", message}});
}

Response not_found_response(const Request& req) {
  return error_response(req, http::status::not_found, "Not found");
}

Response too_many_requests_response(const Request& req) {
  Response res{http::status::too_many_requests, req.version()};
  set_common_headers(res);
  res.set(http::field::content_type, "text/plain");
  res.keep_alive(req.keep_alive());
  res.body() = "Too many requests, please try again later.";
  res.prepare_payload();
  return res;
}

std::string iso_timestamp(Millis instant) {
  auto since_epoch = instant.time_since_epoch().count();
  std::time_t seconds = static_cast<std::time_t>(since_epoch / 1000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << since_epoch % 1000 << 'Z';
  return out.str();
}
