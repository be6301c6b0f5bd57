#include "dropway/net/connection.h"
#include "dropway/log/logger.h"
#include "dropway/protocol/peer_messages.h"
#include <algorithm>

namespace dropway::net {

namespace {

std::atomic<uint64_t> g_next_conn_id{1};

boost::system::error_code protocol_error() {
  return boost::system::errc::make_error_code(boost::system::errc::protocol_error);
}

} // namespace

const char* to_string(ConnState s) {
  switch (s) {
    case ConnState::Connecting: return "connecting";
    case ConnState::Direct: return "direct";
    case ConnState::Relayed: return "relayed";
    case ConnState::Closed: return "closed";
  }
  return "?";
}

const char* to_string(TransportKind k) {
  return k == TransportKind::Direct ? "direct" : "relayed";
}

Connection::Connection(boost::asio::ip::tcp::socket socket, std::chrono::milliseconds idle_timeout)
  : socket_(std::move(socket)),
    idle_timer_(socket_.get_executor()),
    handshake_timer_(socket_.get_executor()),
    idle_timeout_(idle_timeout),
    id_(g_next_conn_id.fetch_add(1)) {
  boost::system::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  remote_ = ec ? std::string("?") : ep.address().to_string() + ":" + std::to_string(ep.port());
  last_rx_ = last_tx_ = std::chrono::steady_clock::now();
}

Connection::~Connection() {
  boost::system::error_code ec;
  socket_.close(ec);
}

void Connection::log(const std::string& s) {
  Logger::instance().debug("[conn " + std::to_string(id_) + "] " + s);
}

void Connection::read_frame(ReadHandler cb) {
  auto self = shared_from_this();
  auto header = std::make_shared<protocol::MessageHeaderWire>();
  boost::asio::async_read(socket_,
    boost::asio::buffer(header.get(), sizeof(*header)),
    [this, self, header, cb](boost::system::error_code ec, std::size_t) {
      if (ec) {
        cb(ec, protocol::MsgType::PING, {});
        return;
      }
      try {
        protocol::validate_header(*header);
      } catch (const std::exception& e) {
        log(std::string("bad header: ") + e.what());
        cb(protocol_error(), protocol::MsgType::PING, {});
        return;
      }

      auto type = static_cast<protocol::MsgType>(header->type);
      auto body = std::make_shared<std::vector<uint8_t>>(protocol::payload_len(*header));
      if (body->empty()) {
        cb({}, type, {});
        return;
      }
      boost::asio::async_read(socket_,
        boost::asio::buffer(body->data(), body->size()),
        [self, type, body, cb](boost::system::error_code ec2, std::size_t) {
          if (ec2) {
            cb(ec2, type, {});
            return;
          }
          cb({}, type, std::move(*body));
        });
    });
}

void Connection::client_handshake(const std::string& local_id, const std::string& expected_peer,
                                  std::chrono::milliseconds timeout, HandshakeHandler cb) {
  auto self = shared_from_this();
  auto done = std::make_shared<bool>(false);
  outbound_ = true;

  handshake_timer_.expires_after(timeout);
  handshake_timer_.async_wait([this, self, done, cb](boost::system::error_code ec) {
    if (ec || *done) return;
    *done = true;
    close("handshake timeout");
    cb(false, "handshake timeout");
  });

  protocol::Hello hello{local_id, expected_peer};
  send(protocol::MsgType::HELLO, hello.serialize());

  read_frame([this, self, done, cb, expected_peer](const boost::system::error_code& ec,
                                                   protocol::MsgType type, std::vector<uint8_t> payload) {
    if (*done) return;
    *done = true;
    handshake_timer_.cancel();
    if (ec) {
      close("handshake: " + ec.message());
      cb(false, "handshake: " + ec.message());
      return;
    }
    if (type != protocol::MsgType::HELLO_ACK) {
      close("handshake: unexpected frame");
      cb(false, std::string("handshake: unexpected ") + protocol::msg_type_name(type));
      return;
    }
    try {
      auto ack = protocol::HelloAck::deserialize(payload);
      if (!expected_peer.empty() && ack.peer_id != expected_peer) {
        close("handshake: wrong peer");
        cb(false, "reached " + ack.peer_id + " instead of " + expected_peer);
        return;
      }
      peer_id_ = ack.peer_id;
    } catch (const std::exception& e) {
      close(std::string("handshake: ") + e.what());
      cb(false, e.what());
      return;
    }
    cb(true, peer_id_);
  });
}

void Connection::server_handshake(const std::string& local_id, std::chrono::milliseconds timeout,
                                  HandshakeHandler cb) {
  auto self = shared_from_this();
  auto done = std::make_shared<bool>(false);

  handshake_timer_.expires_after(timeout);
  handshake_timer_.async_wait([this, self, done, cb](boost::system::error_code ec) {
    if (ec || *done) return;
    *done = true;
    close("handshake timeout");
    cb(false, "handshake timeout");
  });

  read_frame([this, self, done, cb, local_id](const boost::system::error_code& ec,
                                              protocol::MsgType type, std::vector<uint8_t> payload) {
    if (*done) return;
    *done = true;
    handshake_timer_.cancel();
    if (ec || type != protocol::MsgType::HELLO) {
      std::string why = ec ? ec.message() : std::string("unexpected ") + protocol::msg_type_name(type);
      close("handshake: " + why);
      cb(false, why);
      return;
    }
    try {
      auto hello = protocol::Hello::deserialize(payload);
      if (!hello.expected_peer_id.empty() && hello.expected_peer_id != local_id) {
        close("handshake: dialer expected " + hello.expected_peer_id);
        cb(false, "dialer expected another peer");
        return;
      }
      if (hello.peer_id == local_id) {
        close("handshake: connected to self");
        cb(false, "connected to self");
        return;
      }
      peer_id_ = hello.peer_id;
    } catch (const std::exception& e) {
      close(std::string("handshake: ") + e.what());
      cb(false, e.what());
      return;
    }
    protocol::HelloAck ack{local_id};
    send(protocol::MsgType::HELLO_ACK, ack.serialize());
    cb(true, peer_id_);
  });
}

void Connection::start(TransportKind kind) {
  if (state_.load() == ConnState::Closed) return;
  kind_ = kind;
  state_ = (kind == TransportKind::Direct) ? ConnState::Direct : ConnState::Relayed;
  last_rx_ = last_tx_ = std::chrono::steady_clock::now();
  log(std::string("up ") + to_string(kind) + " peer=" + peer_id_ + " remote=" + remote_);
  arm_idle_timer();
  do_read();
}

void Connection::set_frame_handler(FrameHandler h) {
  on_frame_ = std::move(h);
}

uint64_t Connection::add_close_listener(CloseHandler h) {
  uint64_t id = next_listener_++;
  if (state_.load() == ConnState::Closed) {
    boost::asio::post(socket_.get_executor(), [h]() { h("already closed"); });
    return id;
  }
  close_listeners_.emplace(id, std::move(h));
  return id;
}

void Connection::remove_close_listener(uint64_t id) {
  close_listeners_.erase(id);
}

void Connection::do_read() {
  auto self = shared_from_this();
  read_frame([this, self](const boost::system::error_code& ec, protocol::MsgType type,
                          std::vector<uint8_t> payload) {
    if (state_.load() == ConnState::Closed) return;
    if (ec) {
      do_close(ec == boost::asio::error::eof ? "peer closed" : "read: " + ec.message());
      return;
    }
    last_rx_ = std::chrono::steady_clock::now();
    handle_frame(type, payload);
    if (state_.load() != ConnState::Closed) do_read();
  });
}

void Connection::handle_frame(protocol::MsgType type, const std::vector<uint8_t>& payload) {
  if (type == protocol::MsgType::PING) {
    send(protocol::MsgType::PONG, {});
    return;
  }
  if (type == protocol::MsgType::PONG) return;

  if (!on_frame_) {
    log(std::string("no handler for ") + protocol::msg_type_name(type));
    return;
  }
  try {
    on_frame_(type, payload);
  } catch (const std::exception& e) {
    Logger::instance().warn("[conn " + std::to_string(id_) + "] " + protocol::msg_type_name(type) +
                            " handler failed: " + e.what());
  }
}

void Connection::send(protocol::MsgType type, const std::vector<uint8_t>& payload) {
  auto self = shared_from_this();
  auto frame = std::make_shared<OutFrame>();
  frame->bytes = protocol::make_frame(type, payload);
  boost::asio::dispatch(socket_.get_executor(), [this, self, frame]() {
    if (state_.load() == ConnState::Closed) return;
    bool writing = !outq_.empty();
    outq_.push_back(std::move(*frame));
    if (!writing) do_write();
  });
}

void Connection::do_write() {
  auto self = shared_from_this();
  boost::asio::async_write(socket_,
    boost::asio::buffer(outq_.front().bytes),
    [this, self](boost::system::error_code ec, std::size_t) {
      if (state_.load() == ConnState::Closed) return;
      if (ec) {
        do_close("write: " + ec.message());
        return;
      }
      last_tx_ = std::chrono::steady_clock::now();
      outq_.pop_front();
      if (!outq_.empty()) do_write();
    });
}

void Connection::arm_idle_timer() {
  if (idle_timeout_.count() <= 0) return;
  auto self = shared_from_this();
  auto tick = std::max(idle_timeout_ / 3, std::chrono::milliseconds(50));
  idle_timer_.expires_after(tick);
  idle_timer_.async_wait([this, self, tick](boost::system::error_code ec) {
    if (ec || state_.load() == ConnState::Closed) return;
    auto now = std::chrono::steady_clock::now();
    if (now - last_rx_ > idle_timeout_) {
      do_close("idle timeout");
      return;
    }
    if (users_.load() > 0 && now - last_tx_ >= tick) {
      send(protocol::MsgType::PING, {});
    }
    arm_idle_timer();
  });
}

void Connection::close(const std::string& reason) {
  auto self = shared_from_this();
  boost::asio::dispatch(socket_.get_executor(), [this, self, reason]() { do_close(reason); });
}

void Connection::do_close(const std::string& reason) {
  if (state_.exchange(ConnState::Closed) == ConnState::Closed) return;
  Logger::instance().info("[conn " + std::to_string(id_) + "] closed peer=" + peer_id_ + ": " + reason);

  boost::system::error_code ec;
  idle_timer_.cancel();
  handshake_timer_.cancel();
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);

  auto listeners = std::move(close_listeners_);
  close_listeners_.clear();
  for (auto& kv : listeners) {
    auto h = kv.second;
    boost::asio::post(socket_.get_executor(), [h, reason]() { h(reason); });
  }
}

} // namespace dropway::net
