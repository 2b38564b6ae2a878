// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include "network/edge_router.hpp"
#include "network/websocket_connection.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace signalhub {
namespace network {

class SignalingRelay;

// HttpServer - Beast HTTP/1.1 listener in front of EdgeRouter.
// Uses an external io_context; the caller runs it. Each accepted socket gets
// its own strand. Plain requests are answered per EdgeRouter's decision on a
// keep-alive session; upgrades are handed to a new WebSocketConnection.
class HttpServer {
public:
  static constexpr size_t MAX_BODY_BYTES = 10 * 1024;
  static constexpr std::chrono::seconds REQUEST_TIMEOUT{30};

  HttpServer(boost::asio::io_context& io_context, EdgeRouter& router, SignalingRelay& relay,
             const WebSocketConnection::Options& ws_options);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind and start accepting. Port 0 binds an ephemeral port. Returns false
  // if the address is invalid or the bind fails.
  bool listen(const std::string& address, uint16_t port);

  void stop_listening();

  // Bound port (0 if not listening).
  uint16_t listening_port() const { return listen_port_.load(std::memory_order_acquire); }

  EdgeRouter& router() { return router_; }
  SignalingRelay& relay() { return relay_; }
  const WebSocketConnection::Options& ws_options() const { return ws_options_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket);

  boost::asio::io_context& io_context_;
  EdgeRouter& router_;
  SignalingRelay& relay_;
  const WebSocketConnection::Options ws_options_;

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::atomic<uint16_t> listen_port_{0};
};

}  // namespace network
}  // namespace signalhub
