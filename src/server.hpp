// server.hpp

#pragma once
#include "client_rate_limiter.hpp"
#include "config.hpp"
#include "registry.hpp"
#include "request_handler.hpp"
#include "subscription_hub.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One persistent channel. Reads subscribe messages, and writes pushed peer
// lists from a queue on the connection's strand.
class WebSocketSession : public PeerObserver,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
  WebSocketSession(tcp::socket socket, PeerRegistry& registry,
                   SubscriptionHub& hub);

  void start(Request upgrade);
  void deliver(std::shared_ptr<const std::string> message) override;

private:
  static constexpr std::size_t kMaxQueuedMessages = 64;

  net::awaitable<void> run(Request upgrade);
  void handle_message(const std::string& text);
  void write_next();
  void drop(const std::string& reason);

  websocket::stream<beast::tcp_stream> ws_;
  PeerRegistry& registry_;
  SubscriptionHub& hub_;
  std::deque<std::shared_ptr<const std::string>> queue_;
  bool closing_ = false;
};

// HTTP listener. Plain requests go to the request handlers, upgrade
// requests become WebSocketSessions.
class Server {
public:
  Server(net::io_context& ioc, const Config& config, PeerRegistry& registry,
         SubscriptionHub& hub, std::shared_ptr<ClientRateLimiter> limiter);

  // Binds and starts accepting. Throws if the address cannot be bound.
  void start();
  void stop();

  // Port the acceptor is bound to. Differs from the configured port when
  // that was 0.
  unsigned short port() const { return port_; }

private:
  net::awaitable<void> listen();
  net::awaitable<void> handle_connection(beast::tcp_stream stream);
  net::awaitable<bool> respond(beast::tcp_stream& stream, const Request& req);
  net::awaitable<void> stream_discovery(beast::tcp_stream& stream,
                                        const Request& req,
                                        const std::string& group_key);

  net::io_context& ioc_;
  const Config& config_;
  PeerRegistry& registry_;
  SubscriptionHub& hub_;
  std::shared_ptr<ClientRateLimiter> limiter_;
  tcp::acceptor acceptor_;
  unsigned short port_ = 0;
};
