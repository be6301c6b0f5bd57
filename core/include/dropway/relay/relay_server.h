#pragma once
#include <boost/asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "dropway/protocol/message.h"

namespace dropway::relay {

// Rendezvous for peers that cannot reach each other directly.
//
// A listener parks standby sockets with RELAY_REGISTER{own id}. A dialer sends
// RELAY_CONNECT{target id}; the relay answers RELAY_PAIRED on both sockets and
// from then on copies bytes verbatim between them, so the peers run their own
// handshake end to end. No standby for the target: RELAY_FAIL.
class RelayServer {
public:
  RelayServer(boost::asio::io_context& io, uint16_t port);
  void start();
  void stop();

  uint16_t port() const { return port_; }
  size_t standby_count(const std::string& peer_id) const;

private:
  struct Standby {
    std::shared_ptr<boost::asio::ip::tcp::socket> socket;
    std::string peer_id;
    bool paired = false;
  };
  using SocketPtr = std::shared_ptr<boost::asio::ip::tcp::socket>;

  void do_accept();
  void read_request(const SocketPtr& sock);
  void on_request(const SocketPtr& sock, protocol::MsgType type, const std::vector<uint8_t>& payload);
  void park(const SocketPtr& sock, const std::string& peer_id);
  void watch(const std::shared_ptr<Standby>& sb);
  void unpark(const std::shared_ptr<Standby>& sb);
  void pair(const std::shared_ptr<Standby>& sb, const SocketPtr& dialer);
  void refuse(const SocketPtr& sock, const std::string& reason);

  boost::asio::io_context& io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  uint16_t port_ = 0;
  std::unordered_map<std::string, std::deque<std::shared_ptr<Standby>>> standbys_;
};

} // namespace dropway::relay
