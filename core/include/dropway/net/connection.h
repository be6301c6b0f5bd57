#pragma once
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "dropway/protocol/message.h"

namespace dropway::net {

enum class ConnState { Connecting, Direct, Relayed, Closed };
enum class TransportKind { Direct, Relayed };

const char* to_string(ConnState s);
const char* to_string(TransportKind k);

// One framed transport session to a peer. Everything below runs on the
// io_context thread; send() and close() may be called from anywhere.
class Connection : public std::enable_shared_from_this<Connection> {
public:
  using FrameHandler = std::function<void(protocol::MsgType, const std::vector<uint8_t>&)>;
  using CloseHandler = std::function<void(const std::string& reason)>;
  using ReadHandler = std::function<void(const boost::system::error_code&, protocol::MsgType, std::vector<uint8_t>)>;
  using HandshakeHandler = std::function<void(bool ok, const std::string& detail)>;

  Connection(boost::asio::ip::tcp::socket socket, std::chrono::milliseconds idle_timeout);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Dialer side: HELLO{local, expected} -> HELLO_ACK naming `expected_peer`.
  void client_handshake(const std::string& local_id, const std::string& expected_peer,
                        std::chrono::milliseconds timeout, HandshakeHandler cb);

  // Listener side: HELLO naming us (or nobody) -> HELLO_ACK.
  void server_handshake(const std::string& local_id, std::chrono::milliseconds timeout, HandshakeHandler cb);

  // One frame, before start(). Used by the handshake and the relay rendezvous.
  void read_frame(ReadHandler cb);

  // Enters Direct/Relayed, starts the read loop and the idle timer.
  void start(TransportKind kind);

  void set_frame_handler(FrameHandler h);
  uint64_t add_close_listener(CloseHandler h);
  void remove_close_listener(uint64_t id);

  void send(protocol::MsgType type, const std::vector<uint8_t>& payload);
  void close(const std::string& reason);

  // Sessions using the connection; while > 0 an idle link is kept alive with PING.
  void attach() { users_++; }
  void detach() { users_--; }

  ConnState state() const { return state_.load(); }
  bool is_open() const { return state_.load() != ConnState::Closed; }
  TransportKind kind() const { return kind_; }
  // True when this side sent HELLO, i.e. dialed the connection.
  bool outbound() const { return outbound_; }
  const std::string& peer_id() const { return peer_id_; }
  const std::string& remote_address() const { return remote_; }
  uint64_t id() const { return id_; }

private:
  void log(const std::string& s);

  void do_read();
  void handle_frame(protocol::MsgType type, const std::vector<uint8_t>& payload);
  void do_write();
  void arm_idle_timer();
  void do_close(const std::string& reason);

  boost::asio::ip::tcp::socket socket_;
  boost::asio::steady_timer idle_timer_;
  boost::asio::steady_timer handshake_timer_;
  std::chrono::milliseconds idle_timeout_;
  std::chrono::steady_clock::time_point last_rx_;
  std::chrono::steady_clock::time_point last_tx_;

  std::atomic<ConnState> state_{ConnState::Connecting};
  TransportKind kind_ = TransportKind::Direct;
  bool outbound_ = false;
  std::atomic<int> users_{0};
  std::string peer_id_;
  std::string remote_;
  uint64_t id_;

  FrameHandler on_frame_;
  std::map<uint64_t, CloseHandler> close_listeners_;
  uint64_t next_listener_ = 1;

  struct OutFrame {
    std::vector<uint8_t> bytes;
  };
  std::deque<OutFrame> outq_;
};

} // namespace dropway::net
