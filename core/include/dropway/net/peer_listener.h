#pragma once
#include <boost/asio.hpp>
#include <memory>
#include "dropway/net/connection_manager.h"

namespace dropway::net {

// Accepts inbound peers, runs the server side of the handshake and hands
// the connection to the pool.
class PeerListener {
public:
  PeerListener(boost::asio::io_context& io, uint16_t port, ConnectionManager& pool);
  void start();
  void stop();

  uint16_t port() const { return port_; }

  // Also used for sockets paired through a relay.
  void accept_connection(const std::shared_ptr<Connection>& conn, TransportKind kind);

private:
  void do_accept();

  boost::asio::io_context& io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  ConnectionManager& pool_;
  uint16_t port_ = 0;
};

} // namespace dropway::net
