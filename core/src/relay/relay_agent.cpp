#include "dropway/relay/relay_agent.h"
#include "dropway/log/logger.h"
#include "dropway/protocol/peer_messages.h"
#include <algorithm>

namespace dropway::relay {

using boost::asio::ip::tcp;

static constexpr std::chrono::milliseconds kMaxBackoff{10000};

RelayAgent::RelayAgent(boost::asio::io_context& io, Endpoint relay, std::string local_peer_id,
                       net::PeerListener& listener, std::chrono::milliseconds idle_timeout)
  : io_(io),
    relay_(std::move(relay)),
    local_peer_id_(std::move(local_peer_id)),
    listener_(listener),
    idle_timeout_(idle_timeout),
    resolver_(io),
    retry_timer_(io) {}

void RelayAgent::start() {
  auto self = shared_from_this();
  boost::asio::post(io_, [this, self]() { connect(); });
}

void RelayAgent::stop() {
  auto self = shared_from_this();
  boost::asio::post(io_, [this, self]() {
    stopped_ = true;
    retry_timer_.cancel();
    resolver_.cancel();
    if (standby_) standby_->close("relay agent stopped");
    standby_.reset();
  });
}

void RelayAgent::connect() {
  if (stopped_) return;
  auto self = shared_from_this();
  resolver_.async_resolve(relay_.host, std::to_string(relay_.port),
    [this, self](boost::system::error_code ec, tcp::resolver::results_type results) {
      if (stopped_) return;
      if (ec) {
        retry("resolve: " + ec.message());
        return;
      }
      auto sock = std::make_shared<tcp::socket>(io_);
      boost::asio::async_connect(*sock, results,
        [this, self, sock](boost::system::error_code ec2, const tcp::endpoint&) {
          if (stopped_) return;
          if (ec2) {
            retry("connect: " + ec2.message());
            return;
          }
          auto standby = std::make_shared<net::Connection>(std::move(*sock), idle_timeout_);
          protocol::RelayPeer reg{local_peer_id_};
          standby->send(protocol::MsgType::RELAY_REGISTER, reg.serialize());
          standby_ = standby;
          wait_for_pair(standby);
        });
    });
}

void RelayAgent::wait_for_pair(const std::shared_ptr<net::Connection>& standby) {
  auto self = shared_from_this();
  standby->read_frame([this, self, standby](const boost::system::error_code& ec, protocol::MsgType type,
                                            std::vector<uint8_t> payload) {
    if (stopped_) return;
    if (ec) {
      standby->close("relay standby: " + ec.message());
      retry("standby: " + ec.message());
      return;
    }
    if (type == protocol::MsgType::RELAY_FAIL) {
      std::string why = "registration refused";
      try {
        why = protocol::RelayFail::deserialize(payload).reason;
      } catch (const std::exception& e) {
        Logger::instance().debug(std::string("[relay] unreadable RELAY_FAIL: ") + e.what());
      }
      standby->close("relay refused");
      retry(why);
      return;
    }
    if (type != protocol::MsgType::RELAY_PAIRED) {
      standby->close("relay protocol");
      retry(std::string("unexpected ") + protocol::msg_type_name(type));
      return;
    }

    paired_++;
    backoff_ = std::chrono::milliseconds(500);
    Logger::instance().info("[relay] standby paired, handing over to the listener");
    listener_.accept_connection(standby, net::TransportKind::Relayed);
    standby_.reset();
    connect();
  });
}

void RelayAgent::retry(const std::string& why) {
  if (stopped_) return;
  standby_.reset();
  Logger::instance().warn("[relay] " + relay_.to_string() + ": " + why + ", retrying in " +
                          std::to_string(backoff_.count()) + "ms");
  auto self = shared_from_this();
  retry_timer_.expires_after(backoff_);
  backoff_ = std::min(backoff_ * 2, kMaxBackoff);
  retry_timer_.async_wait([this, self](boost::system::error_code ec) {
    if (ec || stopped_) return;
    connect();
  });
}

} // namespace dropway::relay
