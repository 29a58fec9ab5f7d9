#include "server.hpp"
#include "client_address.hpp"

#include <chrono>
#include <iostream>

namespace {
constexpr std::chrono::seconds kIdleTimeout{30};
} // namespace

WebSocketSession::WebSocketSession(tcp::socket socket, PeerRegistry& registry,
                                   SubscriptionHub& hub)
    : ws_(std::move(socket)), registry_(registry), hub_(hub) {}

void WebSocketSession::start(Request upgrade) {
  net::co_spawn(
      ws_.get_executor(),
      [self = shared_from_this(),
       upgrade = std::move(upgrade)]() mutable -> net::awaitable<void> {
        co_await self->run(std::move(upgrade));
      },
      net::detached);
}

net::awaitable<void> WebSocketSession::run(Request upgrade) {
  try {
    auto timeouts =
        websocket::stream_base::timeout::suggested(beast::role_type::server);
    // Subscribers may stay silent indefinitely; pings keep them alive.
    timeouts.keep_alive_pings = true;
    ws_.set_option(timeouts);
    co_await ws_.async_accept(upgrade, net::use_awaitable);
  } catch (std::exception& e) {
    std::cerr << "Error accepting websocket: " << e.what() << std::endl;
    co_return;
  }

  ws_.text(true);
  hub_.connect(shared_from_this());

  beast::flat_buffer buffer;
  try {
    while (true) {
      co_await ws_.async_read(buffer, net::use_awaitable);
      handle_message(beast::buffers_to_string(buffer.data()));
      buffer.consume(buffer.size());
    }
  } catch (const boost::system::system_error& e) {
    if (e.code() != websocket::error::closed && !closing_) {
      std::cerr << "Error reading websocket: " << e.what() << std::endl;
    }
  }

  closing_ = true;
  hub_.disconnect(*this);
}

void WebSocketSession::handle_message(const std::string& text) {
  json data = json::parse(text, nullptr, false);
  if (data.is_discarded()) {
    std::cerr << "WebSocket message error: malformed JSON" << std::endl;
    return;
  }
  if (!data.is_object() || data.value("type", json()) != "subscribe")
    return;
  auto hash = data.find("hash");
  if (hash == data.end() || !hash->is_string() ||
      hash->get_ref<const std::string&>().empty())
    return;

  try {
    registry_.attach(shared_from_this(), hash->get<std::string>());
  } catch (const std::exception& e) {
    std::cerr << "WebSocket message error: " << e.what() << std::endl;
  }
}

void WebSocketSession::deliver(std::shared_ptr<const std::string> message) {
  net::post(ws_.get_executor(),
            [self = shared_from_this(), message = std::move(message)] {
              if (self->closing_)
                return;
              if (self->queue_.size() >= kMaxQueuedMessages) {
                self->drop("send queue full");
                return;
              }
              self->queue_.push_back(message);
              if (self->queue_.size() == 1)
                self->write_next();
            });
}

void WebSocketSession::write_next() {
  ws_.async_write(
      net::buffer(*queue_.front()),
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec) {
          self->drop(ec.message());
          return;
        }
        if (self->closing_)
          return;
        self->queue_.pop_front();
        if (!self->queue_.empty())
          self->write_next();
      });
}

void WebSocketSession::drop(const std::string& reason) {
  if (closing_)
    return;
  std::cerr << "Dropping websocket observer: " << reason << std::endl;
  closing_ = true;
  hub_.disconnect(*this);
  // Closing the socket fails the pending read, which ends run().
  beast::get_lowest_layer(ws_).close();
}

Server::Server(net::io_context& ioc, const Config& config,
               PeerRegistry& registry, SubscriptionHub& hub,
               std::shared_ptr<ClientRateLimiter> limiter)
    : ioc_(ioc), config_(config), registry_(registry), hub_(hub),
      limiter_(std::move(limiter)), acceptor_(net::make_strand(ioc)) {}

void Server::start() {
  tcp::endpoint endpoint{net::ip::make_address(config_.address), config_.port};
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
  port_ = acceptor_.local_endpoint().port();

  std::cout << "Peer discovery service listening on " << config_.address
            << ":" << port_ << std::endl;
  net::co_spawn(acceptor_.get_executor(), listen(), net::detached);
}

void Server::stop() {
  net::post(acceptor_.get_executor(), [this] {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
      std::cerr << "Error closing acceptor: " << ec.message() << std::endl;
    }
  });
}

net::awaitable<void> Server::listen() {
  while (acceptor_.is_open()) {
    try {
      tcp::socket socket =
          co_await acceptor_.async_accept(net::make_strand(ioc_),
                                          net::use_awaitable);
      auto executor = socket.get_executor();
      net::co_spawn(executor,
                    handle_connection(beast::tcp_stream(std::move(socket))),
                    net::detached);
    } catch (const boost::system::system_error& e) {
      if (e.code() == net::error::operation_aborted)
        co_return;
      std::cerr << "Error accepting connection: " << e.what() << std::endl;
    }
  }
}

net::awaitable<void>
Server::handle_connection(beast::tcp_stream stream) {
  beast::flat_buffer buffer;

  try {
    while (true) {
      Request req;
      stream.expires_after(kIdleTimeout);
      co_await http::async_read(stream, buffer, req, net::use_awaitable);

      if (websocket::is_upgrade(req)) {
        stream.expires_never();
        std::make_shared<WebSocketSession>(stream.release_socket(), registry_,
                                           hub_)
            ->start(std::move(req));
        co_return;
      }

      if (!co_await respond(stream, req))
        break;
    }
  } catch (const boost::system::system_error& e) {
    if (e.code() != http::error::end_of_stream &&
        e.code() != beast::error::timeout &&
        e.code() != net::error::operation_aborted) {
      std::cerr << "Error serving connection: " << e.what() << std::endl;
    }
  }

  boost::system::error_code ignored_ec;
  stream.socket().shutdown(tcp::socket::shutdown_send, ignored_ec);
}

net::awaitable<bool> Server::respond(beast::tcp_stream& stream,
                                     const Request& req) {
  auto route = match_route(req.method(), req.target());
  if (!route) {
    auto res = not_found_response(req);
    co_await http::async_write(stream, res, net::use_awaitable);
    co_return res.keep_alive();
  }

  auto remote = stream.socket().remote_endpoint();
  auto remote_address = remote.address().to_string();
  std::string forwarded_for;
  if (auto it = req.find("X-Forwarded-For"); it != req.end()) {
    forwarded_for.assign(it->value().data(), it->value().size());
  }

  if (limiter_ && is_rate_limited(route->kind)) {
    auto client = client_host(forwarded_for, remote_address, config_.forwarded);
    if (co_await limiter_->is_overloaded(std::move(client))) {
      auto res = too_many_requests_response(req);
      co_await http::async_write(stream, res, net::use_awaitable);
      co_return res.keep_alive();
    }
  }

  if (route->kind == RouteKind::DiscoveryStream && req.version() >= 11) {
    co_await stream_discovery(stream, req, route->group_key);
    co_return req.keep_alive();
  }

  auto source = source_address(forwarded_for, remote_address, remote.port(),
                               config_.forwarded);
  auto res = handle_request(*route, req, source, registry_, hub_);
  co_await http::async_write(stream, res, net::use_awaitable);
  co_return res.keep_alive();
}

net::awaitable<void> Server::stream_discovery(beast::tcp_stream& stream,
                                              const Request& req,
                                              const std::string& group_key) {
  std::vector<PeerView> peers;
  bool failed = false;
  try {
    peers = registry_.discover(group_key);
  } catch (const std::exception& e) {
    std::cerr << "Error handling " << req.method_string() << " "
              << req.target() << ": " << e.what() << std::endl;
    failed = true;
  }
  if (failed) {
    auto res = error_response(req, http::status::internal_server_error,
                              "Internal server error");
    co_await http::async_write(stream, res, net::use_awaitable);
    co_return;
  }

  http::response<http::empty_body> res{http::status::ok, req.version()};
  set_common_headers(res);
  res.set(http::field::content_type, "application/x-ndjson");
  res.keep_alive(req.keep_alive());
  res.chunked(true);

  http::response_serializer<http::empty_body> sr{res};
  co_await http::async_write_header(stream, sr, net::use_awaitable);

  for (const auto& peer : peers) {
    auto line = json(peer).dump() + "\n";
    co_await net::async_write(stream, http::make_chunk(net::buffer(line)),
                              net::use_awaitable);
  }
  co_await net::async_write(stream, http::make_chunk_last(),
                            net::use_awaitable);
}
