#pragma once

#include "dropway/net/connection.h"
#include "dropway/ticket/ticket.h"
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dropway::net {

enum class ConnectError { Unreachable, Timeout };

const char* to_string(ConnectError e);

// Result of resolve(): which path worked, or why none did.
struct ResolveOutcome {
  enum class Kind { Direct, Relayed, Unreachable, Timeout };

  Kind kind = Kind::Unreachable;
  std::shared_ptr<Connection> connection;  // set for Direct and Relayed
  std::string detail;

  bool ok() const { return connection != nullptr; }
  std::optional<ConnectError> error() const;
};

const char* to_string(ResolveOutcome::Kind k);

struct ConnectionSettings {
  std::string local_peer_id;
  std::chrono::milliseconds address_timeout{3000};
  std::chrono::milliseconds handshake_timeout{5000};
  std::chrono::milliseconds idle_timeout{60000};
};

class ResolveAttempt;

// Ticket -> live connection, direct addresses first, relay last.
// One pooled connection per peer id; concurrent resolves for a peer share one attempt.
//
// When both peers dial each other at once, each side ends up with two
// connections. Both sides pool the one dialed by the lower peer id. The other
// one is parked: it stays open for sessions already bound to it, is promoted
// if the pooled one closes, and otherwise closes on its idle timeout.
class ConnectionManager {
 public:
  using ResolveHandler = std::function<void(const ResolveOutcome&)>;
  using FrameDispatcher =
      std::function<void(const std::shared_ptr<Connection>&, protocol::MsgType, const std::vector<uint8_t>&)>;

  ConnectionManager(boost::asio::io_context& io, ConnectionSettings settings);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // Every frame of every pooled connection goes here (io thread).
  void set_frame_dispatcher(FrameDispatcher d);

  // The handler always runs on the io thread, never inline.
  void resolve(const Ticket& ticket, std::chrono::milliseconds timeout, ResolveHandler handler);

  // Starts a handshaken connection and pools it under its peer id. A live
  // pooled connection dialed by the same side is superseded and closed; one
  // dialed by the other side is kept or parked as described above. Returns the
  // connection pooled for the peer afterwards.
  std::shared_ptr<Connection> adopt(const std::shared_ptr<Connection>& conn, TransportKind kind);

  std::shared_ptr<Connection> find(const std::string& peer_id) const;
  void close(const std::string& peer_id, const std::string& reason);
  void close_all();
  size_t size() const;

  const ConnectionSettings& settings() const { return settings_; }
  boost::asio::io_context& io() { return io_; }

 private:
  friend class ResolveAttempt;

  void complete_resolve(const std::string& peer_id, const ResolveOutcome& outcome);
  void on_closed(const std::string& peer_id, const Connection* conn, const std::string& reason);
  const std::string& dialer_of(const Connection& conn) const;

  boost::asio::io_context& io_;
  ConnectionSettings settings_;
  FrameDispatcher dispatcher_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Connection>> pool_;       // peer id -> connection
  std::unordered_map<std::string, std::vector<std::shared_ptr<Connection>>> parked_;
  std::unordered_map<std::string, std::vector<ResolveHandler>> pending_;    // peer id -> waiters
  std::unordered_map<std::string, std::shared_ptr<ResolveAttempt>> attempts_;
};

} // namespace dropway::net
