// request_handler.hpp

#pragma once
#include "registry.hpp"
#include "subscription_hub.hpp"

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace http = boost::beast::http;
using json = nlohmann::json;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

enum class RouteKind {
  Root,
  Register,
  Discovery,
  DiscoveryStream,
  Heartbeat,
  Unsubscribe,
  Health,
  Preflight,
};

struct Route {
  RouteKind kind;
  std::string group_key;
  std::string peer_id;
};

// Maps method and target to a route with percent-decoded path parameters.
// The query string is ignored.
std::optional<Route> match_route(http::verb method,
                                 boost::beast::string_view target);

std::optional<std::string> percent_decode(std::string_view encoded);

// Rate limiting applies to every route except these.
bool is_rate_limited(RouteKind kind);

// Runs the route against the registry. Validation and not-found errors
// become 400 and 404 responses, anything else a generic 500. The transport
// streams NDJSON discovery itself when the client accepts chunked bodies.
Response handle_request(const Route& route, const Request& req,
                        const std::string& source_address,
                        PeerRegistry& registry, SubscriptionHub& hub);

Response handle_register(const Request& req, const std::string& group_key,
                         const std::string& source_address,
                         PeerRegistry& registry);
Response handle_discovery(const Request& req, const std::string& group_key,
                          PeerRegistry& registry);
// One JSON view per line, buffered into a single body.
Response handle_discovery_ndjson(const Request& req,
                                 const std::string& group_key,
                                 PeerRegistry& registry);
Response handle_heartbeat(const Request& req, const std::string& group_key,
                          const std::string& peer_id, PeerRegistry& registry);
Response handle_unsubscribe(const Request& req, const std::string& group_key,
                            const std::string& peer_id,
                            PeerRegistry& registry);
Response handle_health(const Request& req, PeerRegistry& registry,
                       const SubscriptionHub& hub);

Response json_response(const Request& req, http::status status,
                       const json& body);
Response error_response(const Request& req, http::status status,
                        const std::string& message);
Response not_found_response(const Request& req);
Response too_many_requests_response(const Request& req);

// Sets the headers shared by every response, streamed or not.
template <class Body, class Fields>
void set_common_headers(http::response<Body, Fields>& res) {
  res.set(http::field::server, "discopeer");
  res.set(http::field::access_control_allow_origin, "*");
}

std::string iso_timestamp(Millis instant);
