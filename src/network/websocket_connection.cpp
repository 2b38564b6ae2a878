// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "network/websocket_connection.hpp"

#include "network/relay_session.hpp"
#include "network/signaling_relay.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/error.hpp>

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

namespace signalhub {
namespace network {

std::atomic<uint64_t> WebSocketConnection::next_id_{1};

std::shared_ptr<WebSocketConnection> WebSocketConnection::create(beast::tcp_stream&& stream, std::string remote_address,
                                                                 const Options& options) {
  return std::shared_ptr<WebSocketConnection>(
      new WebSocketConnection(std::move(stream), std::move(remote_address), options));
}

WebSocketConnection::WebSocketConnection(beast::tcp_stream&& stream, std::string remote_address,
                                         const Options& options)
    : ws_(std::move(stream)), options_(options), remote_addr_(std::move(remote_address)), id_(next_id_++) {}

WebSocketConnection::~WebSocketConnection() = default;

void WebSocketConnection::accept(HttpRequest req, SignalingRelay& relay, UpgradeTarget target) {
  // Handshake, idle and keep-alive ping timeouts are owned by the websocket
  // stream from here on.
  beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.set_option(websocket::stream_base::decorator(
      [](websocket::response_type& res) { res.set(beast::http::field::server, "signalhub/" + GetVersionString()); }));
  ws_.read_message_max(options_.max_frame_bytes);

  target_ = std::move(target);
  session_ = relay.CreateSession(shared_from_this(), target_.dialect);

  // The request is handed over by value; the handler keeps it alive.
  auto request = std::make_shared<HttpRequest>(std::move(req));
  ws_.async_accept(*request, [self = shared_from_this(), request](const beast::error_code& ec) { self->on_accept(ec); });
}

void WebSocketConnection::on_accept(const beast::error_code& ec) {
  if (ec) {
    LOG_NET_TRACE("websocket handshake with {} failed: {}", remote_addr_, ec.message());
    teardown();
    return;
  }

  open_.store(true, std::memory_order_release);
  LOG_NET_DEBUG("websocket conn {} from {} accepted", id_, remote_addr_);

  if (target_.rejection) {
    session_->Fail(target_.rejection->error, target_.rejection->message);
  } else {
    session_->Open(target_.proposed_id);
  }

  if (open_.load(std::memory_order_acquire)) {
    start_read_impl();
  }
}

void WebSocketConnection::start_read_impl() {
  ws_.async_read(read_buffer_, [self = shared_from_this()](const beast::error_code& ec, size_t /*bytes*/) {
    if (ec) {
      if (ec == websocket::error::message_too_big) {
        LOG_NET_WARN_RL("conn {} from {} sent an oversized message, closing", self->id_, self->remote_addr_);
      } else if (ec != websocket::error::closed && ec != boost::asio::error::operation_aborted) {
        LOG_NET_TRACE("read error on conn {}: {}", self->id_, ec.message());
      }
      self->teardown();
      return;
    }

    std::string text = beast::buffers_to_string(self->read_buffer_.data());
    self->read_buffer_.consume(self->read_buffer_.size());

    // Local reference: the handler may tear us down and release session_.
    if (auto session = self->session_) {
      session->HandleFrame(text);
    }

    // The frame handler may have closed us (leave, eviction).
    if (self->open_.load(std::memory_order_acquire) && !self->closing_) {
      self->start_read_impl();
    }
  });
}

// Returns false if the connection is closed or its send queue has no room
// for frame; a full queue also disconnects the slow reader. A write that
// fails after the frame was queued ends in teardown() only.
bool WebSocketConnection::send(const std::string& frame) {
  if (!open_.load(std::memory_order_acquire)) {
    return false;
  }

  const size_t queued = queued_bytes_.fetch_add(frame.size(), std::memory_order_acq_rel) + frame.size();
  if (queued > options_.max_send_queue_bytes) {
    queued_bytes_.fetch_sub(frame.size(), std::memory_order_acq_rel);
    LOG_NET_WARN_RL("send queue overflow on conn {} ({} bytes queued, limit {}), disconnecting slow reader {}", id_,
                    queued - frame.size(), options_.max_send_queue_bytes, remote_addr_);
    // Posted, not dispatched: the caller may be this connection's own session.
    boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() { self->teardown(); });
    return false;
  }

  auto payload = std::make_shared<const std::string>(frame);
  boost::asio::dispatch(ws_.get_executor(), [self = shared_from_this(), payload]() {
    if (!self->open_.load(std::memory_order_acquire) || self->close_requested_) {
      self->queued_bytes_.fetch_sub(payload->size(), std::memory_order_acq_rel);
      return;
    }

    self->outbox_.push_back(payload);
    if (!self->writing_) {
      self->do_write_impl();
    }
  });
  return true;
}

void WebSocketConnection::do_write_impl() {
  if (outbox_.empty()) {
    writing_ = false;
    if (close_requested_) {
      do_close_impl();
    }
    return;
  }

  writing_ = true;
  auto payload = outbox_.front();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(*payload),
                  [self = shared_from_this(), payload](const beast::error_code& ec, size_t /*bytes*/) {
                    if (self->torn_down_) {
                      return;
                    }
                    if (ec) {
                      LOG_NET_TRACE("write error on conn {}: {}", self->id_, ec.message());
                      self->teardown();
                      return;
                    }
                    self->queued_bytes_.fetch_sub(payload->size(), std::memory_order_acq_rel);
                    self->outbox_.pop_front();
                    self->do_write_impl();
                  });
}

void WebSocketConnection::close() {
  boost::asio::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
    if (self->torn_down_ || self->close_requested_) {
      return;
    }
    if (!self->open_.load(std::memory_order_acquire)) {
      // Handshake still pending.
      self->teardown();
      return;
    }
    // Flush queued frames (error notices) before the close handshake.
    self->close_requested_ = true;
    if (!self->writing_) {
      self->do_close_impl();
    }
  });
}

void WebSocketConnection::do_close_impl() {
  if (closing_ || torn_down_) {
    return;
  }
  closing_ = true;
  ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](const beast::error_code& ec) {
    if (ec) {
      LOG_NET_TRACE("close handshake on conn {}: {}", self->id_, ec.message());
    }
    self->teardown();
  });
}

void WebSocketConnection::teardown() {
  if (torn_down_) {
    return;
  }
  torn_down_ = true;
  open_.store(false, std::memory_order_release);

  outbox_.clear();
  writing_ = false;

  beast::error_code ec;
  beast::get_lowest_layer(ws_).socket().close(ec);

  // Unregisters the peer. Its close() call back into us is a no-op now.
  if (auto session = std::move(session_)) {
    session->Close();
  }

  LOG_NET_DEBUG("websocket conn {} from {} closed", id_, remote_addr_);
}

}  // namespace network
}  // namespace signalhub
