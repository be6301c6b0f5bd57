#include "dropway/relay/relay_server.h"
#include "dropway/log/logger.h"
#include "dropway/protocol/peer_messages.h"
#include <array>

namespace dropway::relay {

using boost::asio::ip::tcp;

namespace {

// Relay control frames only carry a peer id.
constexpr uint32_t kMaxRequest = 4096;

void log_info(const std::string& s) { Logger::instance().info("[relay] " + s); }

void write_frame(const std::shared_ptr<tcp::socket>& sock, protocol::MsgType type,
                 const std::vector<uint8_t>& payload, std::function<void(boost::system::error_code)> cb) {
  auto frame = std::make_shared<std::vector<uint8_t>>(protocol::make_frame(type, payload));
  boost::asio::async_write(*sock, boost::asio::buffer(*frame),
    [sock, frame, cb](boost::system::error_code ec, std::size_t) { cb(ec); });
}

void close_socket(const std::shared_ptr<tcp::socket>& sock) {
  boost::system::error_code ec;
  sock->shutdown(tcp::socket::shutdown_both, ec);
  sock->close(ec);
}

// Copies bytes both ways until either side closes.
class Splice : public std::enable_shared_from_this<Splice> {
public:
  Splice(std::shared_ptr<tcp::socket> a, std::shared_ptr<tcp::socket> b) : a_(std::move(a)), b_(std::move(b)) {}

  void start() {
    pump(a_, b_, buf_ab_);
    pump(b_, a_, buf_ba_);
  }

private:
  using Buffer = std::array<uint8_t, 64 * 1024>;

  void pump(const std::shared_ptr<tcp::socket>& from, const std::shared_ptr<tcp::socket>& to, Buffer& buf) {
    auto self = shared_from_this();
    from->async_read_some(boost::asio::buffer(buf),
      [this, self, from, to, &buf](boost::system::error_code ec, std::size_t n) {
        if (ec) {
          stop();
          return;
        }
        boost::asio::async_write(*to, boost::asio::buffer(buf.data(), n),
          [this, self, from, to, &buf](boost::system::error_code ec2, std::size_t) {
            if (ec2) {
              stop();
              return;
            }
            pump(from, to, buf);
          });
      });
  }

  void stop() {
    close_socket(a_);
    close_socket(b_);
  }

  std::shared_ptr<tcp::socket> a_;
  std::shared_ptr<tcp::socket> b_;
  Buffer buf_ab_{};
  Buffer buf_ba_{};
};

} // namespace

RelayServer::RelayServer(boost::asio::io_context& io, uint16_t port)
  : io_(io), acceptor_(io, tcp::endpoint(tcp::v4(), port)) {
  port_ = acceptor_.local_endpoint().port();
}

void RelayServer::start() {
  log_info("listening on 0.0.0.0:" + std::to_string(port_));
  do_accept();
}

void RelayServer::stop() {
  boost::system::error_code ec;
  acceptor_.close(ec);
  for (auto& kv : standbys_) {
    for (auto& sb : kv.second) close_socket(sb->socket);
  }
  standbys_.clear();
}

size_t RelayServer::standby_count(const std::string& peer_id) const {
  auto it = standbys_.find(peer_id);
  return it == standbys_.end() ? 0 : it->second.size();
}

void RelayServer::do_accept() {
  acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
    if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) return;
    if (!ec) {
      read_request(std::make_shared<tcp::socket>(std::move(socket)));
    } else {
      Logger::instance().warn("[relay] accept error: " + ec.message());
    }
    do_accept();
  });
}

void RelayServer::read_request(const SocketPtr& sock) {
  auto header = std::make_shared<protocol::MessageHeaderWire>();
  boost::asio::async_read(*sock, boost::asio::buffer(header.get(), sizeof(*header)),
    [this, sock, header](boost::system::error_code ec, std::size_t) {
      if (ec) return;
      try {
        protocol::validate_header(*header);
      } catch (const std::exception& e) {
        Logger::instance().warn(std::string("[relay] bad request header: ") + e.what());
        close_socket(sock);
        return;
      }
      uint32_t len = protocol::payload_len(*header);
      if (len > kMaxRequest) {
        close_socket(sock);
        return;
      }
      auto type = static_cast<protocol::MsgType>(header->type);
      auto body = std::make_shared<std::vector<uint8_t>>(len);
      boost::asio::async_read(*sock, boost::asio::buffer(*body),
        [this, sock, type, body](boost::system::error_code ec2, std::size_t) {
          if (ec2) return;
          on_request(sock, type, *body);
        });
    });
}

void RelayServer::on_request(const SocketPtr& sock, protocol::MsgType type, const std::vector<uint8_t>& payload) {
  protocol::RelayPeer req;
  try {
    req = protocol::RelayPeer::deserialize(payload);
  } catch (const std::exception& e) {
    refuse(sock, e.what());
    return;
  }

  if (type == protocol::MsgType::RELAY_REGISTER) {
    park(sock, req.peer_id);
    return;
  }
  if (type != protocol::MsgType::RELAY_CONNECT) {
    refuse(sock, std::string("unexpected ") + protocol::msg_type_name(type));
    return;
  }

  auto it = standbys_.find(req.peer_id);
  if (it == standbys_.end() || it->second.empty()) {
    refuse(sock, "peer " + req.peer_id + " is not registered");
    return;
  }
  auto sb = it->second.front();
  it->second.pop_front();
  if (it->second.empty()) standbys_.erase(it);
  pair(sb, sock);
}

void RelayServer::park(const SocketPtr& sock, const std::string& peer_id) {
  auto sb = std::make_shared<Standby>();
  sb->socket = sock;
  sb->peer_id = peer_id;
  standbys_[peer_id].push_back(sb);
  log_info("standby registered for " + peer_id);
  watch(sb);
}

// A parked socket must stay silent until paired; readable means EOF or a protocol violation.
void RelayServer::watch(const std::shared_ptr<Standby>& sb) {
  sb->socket->async_wait(tcp::socket::wait_read, [this, sb](boost::system::error_code ec) {
    if (sb->paired) return;
    if (ec == boost::asio::error::operation_aborted) return;
    unpark(sb);
    close_socket(sb->socket);
  });
}

void RelayServer::unpark(const std::shared_ptr<Standby>& sb) {
  auto it = standbys_.find(sb->peer_id);
  if (it == standbys_.end()) return;
  auto& q = it->second;
  for (auto qi = q.begin(); qi != q.end(); ++qi) {
    if (*qi == sb) {
      q.erase(qi);
      log_info("standby for " + sb->peer_id + " went away");
      break;
    }
  }
  if (q.empty()) standbys_.erase(it);
}

void RelayServer::pair(const std::shared_ptr<Standby>& sb, const SocketPtr& dialer) {
  sb->paired = true;
  boost::system::error_code ec;
  sb->socket->cancel(ec);

  auto listener = sb->socket;
  std::string peer = sb->peer_id;
  write_frame(listener, protocol::MsgType::RELAY_PAIRED, {}, [listener, dialer, peer](boost::system::error_code ec1) {
    if (ec1) {
      close_socket(listener);
      protocol::RelayFail fail{"standby lost"};
      write_frame(dialer, protocol::MsgType::RELAY_FAIL, fail.serialize(),
                  [dialer](boost::system::error_code) { close_socket(dialer); });
      return;
    }
    write_frame(dialer, protocol::MsgType::RELAY_PAIRED, {}, [listener, dialer, peer](boost::system::error_code ec2) {
      if (ec2) {
        close_socket(listener);
        close_socket(dialer);
        return;
      }
      log_info("paired a dialer with " + peer);
      std::make_shared<Splice>(listener, dialer)->start();
    });
  });
}

void RelayServer::refuse(const SocketPtr& sock, const std::string& reason) {
  log_info("refused: " + reason);
  protocol::RelayFail fail{reason};
  write_frame(sock, protocol::MsgType::RELAY_FAIL, fail.serialize(),
              [sock](boost::system::error_code) { close_socket(sock); });
}

} // namespace dropway::relay
