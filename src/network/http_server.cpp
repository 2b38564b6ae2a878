// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "network/http_server.hpp"

#include "network/signaling_relay.hpp"
#include "util/logging.hpp"

#include <optional>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace signalhub {
namespace network {

namespace {

// One plain HTTP/1.1 connection. Reads requests until the peer closes, the
// request asks for close, or the router decides to upgrade.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, HttpServer& server, std::string remote_address)
      : stream_(std::move(socket)), server_(server), remote_addr_(std::move(remote_address)) {}

  void run() {
    asio::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
  }

private:
  void do_read() {
    parser_.emplace();
    parser_->body_limit(HttpServer::MAX_BODY_BYTES);
    stream_.expires_after(HttpServer::REQUEST_TIMEOUT);
    http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, size_t /*bytes*/) {
    if (ec == http::error::end_of_stream) {
      do_shutdown();
      return;
    }
    if (ec) {
      if (ec == http::error::body_limit) {
        LOG_HTTP_WARN_RL("request body from {} exceeds {} bytes", remote_addr_, HttpServer::MAX_BODY_BYTES);
      } else if (ec != beast::error::timeout && ec != asio::error::operation_aborted) {
        LOG_HTTP_TRACE("read error from {}: {}", remote_addr_, ec.message());
      }
      do_shutdown();
      return;
    }

    HttpRequest req = parser_->release();
    RouteDecision decision = server_.router().Route(req, remote_addr_);

    if (decision.upgrade) {
      std::string client = server_.router().ClientAddress(req, remote_addr_);
      auto connection = WebSocketConnection::create(std::move(stream_), std::move(client), server_.ws_options());
      connection->accept(std::move(req), server_.relay(), std::move(*decision.upgrade));
      return;
    }

    auto res = std::make_shared<HttpResponse>(std::move(*decision.response));
    http::async_write(stream_, *res, [self = shared_from_this(), res](beast::error_code write_ec, size_t /*bytes*/) {
      self->on_write(res->need_eof(), write_ec);
    });
  }

  void on_write(bool close, beast::error_code ec) {
    if (ec) {
      LOG_HTTP_TRACE("write error to {}: {}", remote_addr_, ec.message());
      do_shutdown();
      return;
    }
    if (close) {
      do_shutdown();
      return;
    }
    do_read();
  }

  void do_shutdown() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  HttpServer& server_;
  const std::string remote_addr_;
};

}  // namespace

HttpServer::HttpServer(asio::io_context& io_context, EdgeRouter& router, SignalingRelay& relay,
                       const WebSocketConnection::Options& ws_options)
    : io_context_(io_context), router_(router), relay_(relay), ws_options_(ws_options) {}

HttpServer::~HttpServer() {
  stop_listening();
}

bool HttpServer::listen(const std::string& address, uint16_t port) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  boost::system::error_code ec;
  auto bind_address = asio::ip::make_address(address, ec);
  if (ec) {
    LOG_NET_ERROR("invalid bind address '{}': {}", address, ec.message());
    return false;
  }

  tcp::endpoint endpoint(bind_address, port);
  auto acceptor = std::make_unique<tcp::acceptor>(io_context_);

  acceptor->open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor->set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor->bind(endpoint, ec);
  }
  if (!ec) {
    acceptor->listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    LOG_NET_ERROR("failed to listen on {}:{}: {}", address, port, ec.message());
    return false;
  }

  auto local = acceptor->local_endpoint(ec);
  listen_port_.store(ec ? port : local.port(), std::memory_order_release);
  acceptor_ = std::move(acceptor);

  LOG_NET_INFO("listening on {}:{}", address, listening_port());
  start_accept();
  return true;
}

void HttpServer::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  listen_port_.store(0, std::memory_order_release);
}

void HttpServer::start_accept() {
  if (!acceptor_) {
    return;
  }
  // Each connection gets its own strand.
  acceptor_->async_accept(asio::make_strand(io_context_),
                          [this](const boost::system::error_code& ec, tcp::socket socket) {
                            handle_accept(ec, std::move(socket));
                          });
}

void HttpServer::handle_accept(const boost::system::error_code& ec, tcp::socket socket) {
  if (ec) {
    if (ec != asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(tcp::no_delay(true), opt_ec);

  std::string remote_addr = "unknown";
  auto remote_ep = socket.remote_endpoint(opt_ec);
  if (!opt_ec) {
    remote_addr = remote_ep.address().to_string();
  }

  LOG_NET_TRACE("connection from {} accepted", remote_addr);
  std::make_shared<HttpSession>(std::move(socket), *this, std::move(remote_addr))->run();

  start_accept();
}

}  // namespace network
}  // namespace signalhub
