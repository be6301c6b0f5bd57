#pragma once
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include "dropway/net/connection.h"
#include "dropway/net/peer_listener.h"
#include "dropway/ticket/ticket.h"

namespace dropway::relay {

// Keeps one standby socket registered at the relay so dialers that cannot
// reach us directly get paired; each paired socket is handed to the listener.
class RelayAgent : public std::enable_shared_from_this<RelayAgent> {
public:
  RelayAgent(boost::asio::io_context& io, Endpoint relay, std::string local_peer_id,
             net::PeerListener& listener, std::chrono::milliseconds idle_timeout);

  void start();
  void stop();

  uint64_t paired_count() const { return paired_; }

private:
  void connect();
  void wait_for_pair(const std::shared_ptr<net::Connection>& standby);
  void retry(const std::string& why);

  boost::asio::io_context& io_;
  Endpoint relay_;
  std::string local_peer_id_;
  net::PeerListener& listener_;
  std::chrono::milliseconds idle_timeout_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::asio::steady_timer retry_timer_;
  std::shared_ptr<net::Connection> standby_;
  std::chrono::milliseconds backoff_{500};
  uint64_t paired_ = 0;
  bool stopped_ = false;
};

} // namespace dropway::relay
