// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include "network/edge_router.hpp"
#include "network/peer_connection.hpp"

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

namespace signalhub {
namespace network {

class RelaySession;
class SignalingRelay;

// WebSocketConnection - Beast WebSocket implementation of PeerConnection.
//
// Created by HttpServer once EdgeRouter decides to upgrade. The underlying
// tcp_stream was accepted on its own strand, so every completion handler and
// every dispatched send()/close() body runs serialized on that strand.
//
// Owns the RelaySession for its socket: feeds it inbound text frames and
// closes it exactly once on teardown (read error, write error, peer close,
// local close, send queue overflow).
class WebSocketConnection : public PeerConnection, public std::enable_shared_from_this<WebSocketConnection> {
public:
  struct Options {
    size_t max_frame_bytes{64 * 1024};
    size_t max_send_queue_bytes{1024 * 1024};
  };

  static std::shared_ptr<WebSocketConnection> create(boost::beast::tcp_stream&& stream, std::string remote_address,
                                                     const Options& options);

  ~WebSocketConnection() override;

  WebSocketConnection(const WebSocketConnection&) = delete;
  WebSocketConnection& operator=(const WebSocketConnection&) = delete;

  // Complete the WebSocket handshake for req, then open a relay session as
  // described by target and start reading.
  void accept(HttpRequest req, SignalingRelay& relay, UpgradeTarget target);

  // PeerConnection interface
  bool send(const std::string& frame) override;
  void close() override;
  bool is_open() const override { return open_.load(std::memory_order_acquire); }
  std::string remote_address() const override { return remote_addr_; }
  uint64_t id() const override { return id_; }

private:
  WebSocketConnection(boost::beast::tcp_stream&& stream, std::string remote_address, const Options& options);

  // Strand-serialized internals
  void on_accept(const boost::beast::error_code& ec);
  void start_read_impl();
  void do_write_impl();
  void do_close_impl();
  void teardown();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer read_buffer_;
  const Options options_;
  const std::string remote_addr_;
  const uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  // Accessed only on the strand
  std::shared_ptr<RelaySession> session_;
  UpgradeTarget target_;
  std::deque<std::shared_ptr<const std::string>> outbox_;
  bool writing_{false};
  bool close_requested_{false};
  bool closing_{false};
  bool torn_down_{false};

  std::atomic<bool> open_{false};
  // Bytes accepted by send() and not yet written; reserved on the caller's thread
  std::atomic<size_t> queued_bytes_{0};
};

}  // namespace network
}  // namespace signalhub
