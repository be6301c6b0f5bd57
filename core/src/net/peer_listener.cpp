#include "dropway/net/peer_listener.h"
#include "dropway/log/logger.h"

namespace dropway::net {

PeerListener::PeerListener(boost::asio::io_context& io, uint16_t port, ConnectionManager& pool)
  : io_(io),
    acceptor_(io, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), port)),
    pool_(pool) {
  port_ = acceptor_.local_endpoint().port();
}

void PeerListener::start() {
  Logger::instance().info("[listen] accepting peers on 0.0.0.0:" + std::to_string(port_));
  do_accept();
}

void PeerListener::stop() {
  boost::system::error_code ec;
  acceptor_.close(ec);
}

void PeerListener::do_accept() {
  acceptor_.async_accept([this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
    if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) return;
    if (!ec) {
      auto conn = std::make_shared<Connection>(std::move(socket), pool_.settings().idle_timeout);
      accept_connection(conn, TransportKind::Direct);
    } else {
      Logger::instance().warn("[listen] accept error: " + ec.message());
    }
    do_accept();
  });
}

void PeerListener::accept_connection(const std::shared_ptr<Connection>& conn, TransportKind kind) {
  conn->server_handshake(pool_.settings().local_peer_id, pool_.settings().handshake_timeout,
    [this, conn, kind](bool ok, const std::string& detail) {
      if (!ok) {
        Logger::instance().warn("[listen] handshake with " + conn->remote_address() + " failed: " + detail);
        return;
      }
      Logger::instance().info("[listen] " + std::string(to_string(kind)) + " peer " + conn->peer_id() +
                              " from " + conn->remote_address());
      pool_.adopt(conn, kind);
    });
}

} // namespace dropway::net
