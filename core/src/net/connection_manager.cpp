#include "dropway/net/connection_manager.h"
#include "dropway/log/logger.h"
#include "dropway/protocol/peer_messages.h"
#include <algorithm>

namespace dropway::net {

using boost::asio::ip::tcp;

const char* to_string(ConnectError e) {
  return e == ConnectError::Timeout ? "timeout" : "unreachable";
}

const char* to_string(ResolveOutcome::Kind k) {
  switch (k) {
    case ResolveOutcome::Kind::Direct: return "direct";
    case ResolveOutcome::Kind::Relayed: return "relayed";
    case ResolveOutcome::Kind::Unreachable: return "unreachable";
    case ResolveOutcome::Kind::Timeout: return "timeout";
  }
  return "?";
}

std::optional<ConnectError> ResolveOutcome::error() const {
  if (kind == Kind::Unreachable) return ConnectError::Unreachable;
  if (kind == Kind::Timeout) return ConnectError::Timeout;
  return std::nullopt;
}

// One resolve in flight for one peer: each direct address in order with its
// own deadline, then the relay, all under the overall deadline. `step_`
// invalidates completions that belong to an abandoned step.
class ResolveAttempt : public std::enable_shared_from_this<ResolveAttempt> {
 public:
  ResolveAttempt(ConnectionManager& mgr, Ticket ticket, std::chrono::milliseconds timeout)
    : mgr_(mgr),
      ticket_(std::move(ticket)),
      timeout_(timeout),
      resolver_(mgr.io()),
      socket_(mgr.io()),
      deadline_timer_(mgr.io()),
      step_timer_(mgr.io()) {}

  void start() {
    auto self = shared_from_this();
    deadline_ = std::chrono::steady_clock::now() + timeout_;
    deadline_timer_.expires_at(deadline_);
    deadline_timer_.async_wait([this, self](boost::system::error_code ec) {
      if (ec || done_) return;
      abandon_step();
      finish(ResolveOutcome{ResolveOutcome::Kind::Timeout, nullptr,
                            "no path to " + ticket_.peer_id() + " within " +
                                std::to_string(timeout_.count()) + "ms"});
    });
    try_address(0);
  }

 private:
  void log(const std::string& s) {
    Logger::instance().debug("[resolve " + ticket_.peer_id().substr(0, 8) + "] " + s);
  }

  std::chrono::milliseconds remaining() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }

  void abandon_step() {
    step_++;
    boost::system::error_code ec;
    step_timer_.cancel();
    resolver_.cancel();
    socket_.close(ec);
    if (conn_) {
      conn_->close("resolve step abandoned");
      conn_.reset();
    }
  }

  void arm_step_timer(std::chrono::milliseconds limit, std::function<void()> on_expiry) {
    auto self = shared_from_this();
    uint64_t step = step_;
    step_timer_.expires_after(std::min(limit, remaining()));
    step_timer_.async_wait([this, self, step, on_expiry](boost::system::error_code ec) {
      if (ec || done_ || step != step_) return;
      on_expiry();
    });
  }

  // Resolves host:port and connects socket_, then calls next(ok, detail).
  void connect_to(const Endpoint& ep, std::function<void(bool, const std::string&)> next) {
    auto self = shared_from_this();
    uint64_t step = step_;
    resolver_.async_resolve(ep.host, std::to_string(ep.port),
      [this, self, step, next](boost::system::error_code ec, tcp::resolver::results_type results) {
        if (done_ || step != step_) return;
        if (ec) {
          next(false, "resolve: " + ec.message());
          return;
        }
        socket_ = tcp::socket(mgr_.io());
        boost::asio::async_connect(socket_, results,
          [this, self, step, next](boost::system::error_code ec2, const tcp::endpoint&) {
            if (done_ || step != step_) return;
            if (ec2) {
              next(false, "connect: " + ec2.message());
              return;
            }
            next(true, "");
          });
      });
  }

  void try_address(size_t i) {
    if (done_) return;
    if (i >= ticket_.addresses().size()) {
      try_relay();
      return;
    }
    abandon_step();
    auto self = shared_from_this();
    const Endpoint ep = ticket_.addresses()[i];
    uint64_t step = step_;
    log("trying " + ep.to_string());

    arm_step_timer(mgr_.settings().address_timeout, [this, i, ep]() {
      log(ep.to_string() + " timed out");
      try_address(i + 1);
    });

    connect_to(ep, [this, self, step, i, ep](bool ok, const std::string& detail) {
      if (!ok) {
        log(ep.to_string() + " failed: " + detail);
        try_address(i + 1);
        return;
      }
      conn_ = std::make_shared<Connection>(std::move(socket_), mgr_.settings().idle_timeout);
      conn_->client_handshake(mgr_.settings().local_peer_id, ticket_.peer_id(), mgr_.settings().handshake_timeout,
        [this, self, step, i, ep](bool hs_ok, const std::string& hs_detail) {
          if (done_ || step != step_) return;
          if (!hs_ok) {
            log(ep.to_string() + " handshake failed: " + hs_detail);
            try_address(i + 1);
            return;
          }
          auto conn = std::move(conn_);
          finish(ResolveOutcome{ResolveOutcome::Kind::Direct, conn, ep.to_string()});
        });
    });
  }

  void try_relay() {
    if (!ticket_.relay()) {
      abandon_step();
      finish(ResolveOutcome{ResolveOutcome::Kind::Unreachable, nullptr,
                            "no direct address answered and the ticket names no relay"});
      return;
    }
    abandon_step();
    auto self = shared_from_this();
    const Endpoint relay = *ticket_.relay();
    uint64_t step = step_;
    log("trying relay " + relay.to_string());

    auto unreachable = [this](const std::string& why) {
      abandon_step();
      finish(ResolveOutcome{ResolveOutcome::Kind::Unreachable, nullptr, "direct addresses and relay failed: " + why});
    };

    connect_to(relay, [this, self, step, relay, unreachable](bool ok, const std::string& detail) {
      if (!ok) {
        unreachable(relay.to_string() + " " + detail);
        return;
      }
      conn_ = std::make_shared<Connection>(std::move(socket_), mgr_.settings().idle_timeout);
      protocol::RelayPeer want{ticket_.peer_id()};
      conn_->send(protocol::MsgType::RELAY_CONNECT, want.serialize());
      conn_->read_frame([this, self, step, unreachable](const boost::system::error_code& ec,
                                                        protocol::MsgType type, std::vector<uint8_t> payload) {
        if (done_ || step != step_) return;
        if (ec) {
          unreachable("relay: " + ec.message());
          return;
        }
        if (type == protocol::MsgType::RELAY_FAIL) {
          std::string why = "relay refused";
          try {
            why = "relay: " + protocol::RelayFail::deserialize(payload).reason;
          } catch (const std::exception& e) {
            log(std::string("unreadable RELAY_FAIL: ") + e.what());
          }
          unreachable(why);
          return;
        }
        if (type != protocol::MsgType::RELAY_PAIRED) {
          unreachable(std::string("relay sent ") + protocol::msg_type_name(type));
          return;
        }
        conn_->client_handshake(mgr_.settings().local_peer_id, ticket_.peer_id(), mgr_.settings().handshake_timeout,
          [this, self, step, unreachable](bool hs_ok, const std::string& hs_detail) {
            if (done_ || step != step_) return;
            if (!hs_ok) {
              unreachable("relayed handshake: " + hs_detail);
              return;
            }
            auto conn = std::move(conn_);
            finish(ResolveOutcome{ResolveOutcome::Kind::Relayed, conn, "via relay"});
          });
      });
    });
  }

  void finish(ResolveOutcome outcome) {
    if (done_) return;
    done_ = true;
    step_++;
    deadline_timer_.cancel();
    step_timer_.cancel();
    mgr_.complete_resolve(ticket_.peer_id(), outcome);
  }

  ConnectionManager& mgr_;
  Ticket ticket_;
  std::chrono::milliseconds timeout_;
  tcp::resolver resolver_;
  tcp::socket socket_;
  std::shared_ptr<Connection> conn_;
  boost::asio::steady_timer deadline_timer_;
  boost::asio::steady_timer step_timer_;
  std::chrono::steady_clock::time_point deadline_;
  uint64_t step_ = 0;
  bool done_ = false;
};

ConnectionManager::ConnectionManager(boost::asio::io_context& io, ConnectionSettings settings)
  : io_(io), settings_(std::move(settings)) {}

ConnectionManager::~ConnectionManager() = default;

void ConnectionManager::set_frame_dispatcher(FrameDispatcher d) {
  dispatcher_ = std::move(d);
}

void ConnectionManager::resolve(const Ticket& ticket, std::chrono::milliseconds timeout, ResolveHandler handler) {
  boost::asio::post(io_, [this, ticket, timeout, handler]() {
    const std::string peer = ticket.peer_id();
    if (peer == settings_.local_peer_id) {
      handler(ResolveOutcome{ResolveOutcome::Kind::Unreachable, nullptr, "ticket names this node"});
      return;
    }

    std::shared_ptr<ResolveAttempt> attempt;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pool_.find(peer);
      if (it != pool_.end() && it->second->is_open()) {
        auto conn = it->second;
        auto kind = conn->kind() == TransportKind::Direct ? ResolveOutcome::Kind::Direct
                                                         : ResolveOutcome::Kind::Relayed;
        boost::asio::post(io_, [handler, conn, kind]() { handler(ResolveOutcome{kind, conn, "pooled"}); });
        return;
      }

      auto& waiters = pending_[peer];
      waiters.push_back(handler);
      if (waiters.size() > 1) return;  // joins the attempt already running

      attempt = std::make_shared<ResolveAttempt>(*this, ticket, timeout);
      attempts_[peer] = attempt;
    }
    Logger::instance().info("[pool] resolving " + peer);
    attempt->start();
  });
}

void ConnectionManager::complete_resolve(const std::string& peer_id, const ResolveOutcome& outcome) {
  ResolveOutcome delivered = outcome;
  if (outcome.ok()) {
    auto pooled = adopt(outcome.connection, outcome.kind == ResolveOutcome::Kind::Relayed ? TransportKind::Relayed
                                                                                        : TransportKind::Direct);
    if (pooled != outcome.connection) {
      // the peer dialed us meanwhile and its connection won the tie-break
      delivered.connection = pooled;
      delivered.kind = pooled->kind() == TransportKind::Direct ? ResolveOutcome::Kind::Direct
                                                              : ResolveOutcome::Kind::Relayed;
      delivered.detail = "pooled";
    }
    Logger::instance().info("[pool] " + peer_id + " reachable (" + to_string(delivered.kind) + ", " +
                            delivered.detail + ")");
  } else {
    Logger::instance().warn("[pool] " + peer_id + " " + to_string(outcome.kind) + ": " + outcome.detail);
  }

  std::vector<ResolveHandler> waiters;
  std::shared_ptr<ResolveAttempt> attempt;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(peer_id);
    if (it != pending_.end()) {
      waiters = std::move(it->second);
      pending_.erase(it);
    }
    auto at = attempts_.find(peer_id);
    if (at != attempts_.end()) {
      attempt = std::move(at->second);
      attempts_.erase(at);
    }
  }
  for (auto& w : waiters) {
    boost::asio::post(io_, [w, delivered]() { w(delivered); });
  }
  // keep the attempt alive until this call stack unwinds
  boost::asio::post(io_, [attempt]() {});
}

const std::string& ConnectionManager::dialer_of(const Connection& conn) const {
  return conn.outbound() ? settings_.local_peer_id : conn.peer_id();
}

std::shared_ptr<Connection> ConnectionManager::adopt(const std::shared_ptr<Connection>& conn, TransportKind kind) {
  const std::string peer = conn->peer_id();
  std::weak_ptr<Connection> weak = conn;

  conn->set_frame_handler([this, weak](protocol::MsgType type, const std::vector<uint8_t>& payload) {
    auto c = weak.lock();
    if (c && dispatcher_) dispatcher_(c, type, payload);
  });

  const Connection* raw = conn.get();
  conn->add_close_listener([this, peer, raw](const std::string& reason) { on_closed(peer, raw, reason); });

  std::shared_ptr<Connection> superseded;
  std::shared_ptr<Connection> parked;
  std::shared_ptr<Connection> pooled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = pool_[peer];
    if (!slot || slot == conn || !slot->is_open()) {
      slot = conn;
    } else if (slot->outbound() == conn->outbound()) {
      // the same side dialed again, so the old link is gone on that side
      superseded = slot;
      slot = conn;
    } else if (dialer_of(*conn) < dialer_of(*slot)) {
      parked = slot;
      slot = conn;
    } else {
      parked = conn;
    }
    if (parked) parked_[peer].push_back(parked);
    pooled = slot;
  }

  conn->start(kind);
  if (superseded) superseded->close("superseded by a new connection");
  if (parked) {
    Logger::instance().info("[pool] " + peer + " dialed from both sides; pooling connection " +
                            std::to_string(pooled->id()) + ", parking " + std::to_string(parked->id()));
  }
  return pooled;
}

void ConnectionManager::on_closed(const std::string& peer_id, const Connection* conn, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto spare = parked_.find(peer_id);
  auto it = pool_.find(peer_id);
  if (it != pool_.end() && it->second.get() == conn) {
    pool_.erase(it);
    Logger::instance().info("[pool] dropped " + peer_id + ": " + reason);
    if (spare == parked_.end()) return;
    auto& list = spare->second;
    while (!list.empty()) {
      auto next = list.front();
      list.erase(list.begin());
      if (next->is_open()) {
        pool_[peer_id] = next;
        Logger::instance().info("[pool] " + peer_id + " now uses parked connection " + std::to_string(next->id()));
        break;
      }
    }
    if (list.empty()) parked_.erase(spare);
    return;
  }

  if (spare == parked_.end()) return;
  auto& list = spare->second;
  list.erase(std::remove_if(list.begin(), list.end(),
                            [conn](const std::shared_ptr<Connection>& c) { return c.get() == conn; }),
             list.end());
  if (list.empty()) parked_.erase(spare);
}

std::shared_ptr<Connection> ConnectionManager::find(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pool_.find(peer_id);
  if (it == pool_.end() || !it->second->is_open()) return nullptr;
  return it->second;
}

void ConnectionManager::close(const std::string& peer_id, const std::string& reason) {
  std::vector<std::shared_ptr<Connection>> conns;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pool_.find(peer_id);
    if (it != pool_.end()) {
      conns.push_back(it->second);
      pool_.erase(it);
    }
    auto spare = parked_.find(peer_id);
    if (spare != parked_.end()) {
      conns.insert(conns.end(), spare->second.begin(), spare->second.end());
      parked_.erase(spare);
    }
  }
  for (auto& c : conns) c->close(reason);
}

void ConnectionManager::close_all() {
  std::unordered_map<std::string, std::shared_ptr<Connection>> all;
  std::unordered_map<std::string, std::vector<std::shared_ptr<Connection>>> spares;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    all.swap(pool_);
    spares.swap(parked_);
  }
  for (auto& kv : all) kv.second->close("shutting down");
  for (auto& kv : spares) {
    for (auto& c : kv.second) c->close("shutting down");
  }
}

size_t ConnectionManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = 0;
  for (const auto& kv : pool_) {
    if (kv.second->is_open()) n++;
  }
  return n;
}

} // namespace dropway::net
