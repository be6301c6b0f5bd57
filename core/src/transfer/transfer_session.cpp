#include "dropway/transfer/transfer_session.h"
#include "dropway/log/logger.h"

namespace dropway::transfer {

TransferSession::TransferSession(SessionEnv& env, uint64_t id, Direction direction, std::string peer_id,
                                 std::optional<Ticket> redial)
  : env_(env),
    id_(id),
    direction_(direction),
    peer_id_(std::move(peer_id)),
    redial_(std::move(redial)),
    resume_timer_(env.io) {
  status_.id = id_;
  status_.direction = direction_;
  status_.peer_id = peer_id_;
}

TransferSession::~TransferSession() = default;

TransferStatus TransferSession::status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

std::string TransferSession::file_hash_hex() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_.file_hash_hex;
}

void TransferSession::log_info(const std::string& s) const {
  Logger::instance().info(std::string("[") + (direction_ == Direction::Send ? "send " : "recv ") +
                          std::to_string(id_) + "] " + s);
}

void TransferSession::log_warn(const std::string& s) const {
  Logger::instance().warn(std::string("[") + (direction_ == Direction::Send ? "send " : "recv ") +
                          std::to_string(id_) + "] " + s);
}

void TransferSession::log_debug(const std::string& s) const {
  Logger::instance().debug(std::string("[") + (direction_ == Direction::Send ? "send " : "recv ") +
                           std::to_string(id_) + "] " + s);
}

void TransferSession::publish() {
  if (on_status_) on_status_(status());
}

void TransferSession::bind(const std::shared_ptr<net::Connection>& conn) {
  release();
  conn_ = conn;
  bound_conn_id_ = conn->id();
  conn->attach();

  std::weak_ptr<TransferSession> weak = shared_from_this();
  uint64_t conn_id = conn->id();
  close_listener_ = conn->add_close_listener([weak, conn_id](const std::string& reason) {
    auto self = weak.lock();
    if (!self || self->bound_conn_id_ != conn_id) return;
    self->on_connection_lost(reason);
  });
}

void TransferSession::release() {
  auto conn = conn_.lock();
  if (conn) {
    conn->remove_close_listener(close_listener_);
    conn->detach();
  }
  conn_.reset();
  bound_conn_id_ = 0;
  close_listener_ = 0;
}

bool TransferSession::send(protocol::MsgType type, const std::vector<uint8_t>& payload) {
  auto conn = conn_.lock();
  if (!conn || !conn->is_open()) return false;
  try {
    conn->send(type, payload);
  } catch (const protocol::ProtocolError& e) {
    abort(FailureReason::Internal, std::string(protocol::msg_type_name(type)) + " not sent: " + e.what());
    return false;
  }
  return true;
}

void TransferSession::set_state(SessionState s, const std::string& detail) {
  state_ = s;
  update_status([&](TransferStatus& st) {
    st.state = s;
    if (!detail.empty()) st.detail = detail;
  });
  log_debug(std::string("-> ") + to_string(s) + (detail.empty() ? "" : " (" + detail + ")"));
}

void TransferSession::fail(FailureReason reason, const std::string& detail) {
  if (finished()) return;
  state_ = SessionState::Failed;
  resume_timer_.cancel();
  release();
  on_finished();
  update_status([&](TransferStatus& st) {
    st.state = SessionState::Failed;
    st.failure = reason;
    st.detail = detail;
  });
  log_warn(std::string("failed: ") + to_string(reason) + ": " + detail);
}

void TransferSession::complete(SessionState terminal, const std::string& detail) {
  if (finished()) return;
  state_ = terminal;
  resume_timer_.cancel();
  release();
  on_finished();
  update_status([&](TransferStatus& st) {
    st.state = terminal;
    st.detail = detail;
  });
  log_info(std::string(to_string(terminal)) + (detail.empty() ? "" : ": " + detail));
}

void TransferSession::abort(FailureReason reason, const std::string& detail) {
  if (finished()) return;
  protocol::Cancel c{id_, detail};
  send(protocol::MsgType::CANCEL, c.serialize());
  fail(reason, detail);
}

void TransferSession::on_connection_lost(const std::string& reason) {
  if (finished()) return;
  SessionState s = state();
  if (s == SessionState::Transferring) {
    enter_resuming(reason);
    return;
  }
  if (s == SessionState::Resuming) {
    // the redialed connection dropped before RESUME_RESP; keep trying
    release();
    if (is_dialer()) schedule_redial();
    return;
  }
  fail(FailureReason::Unreachable, "connection lost: " + reason);
}

void TransferSession::enter_resuming(const std::string& reason) {
  release();
  redial_attempt_ = 0;
  set_state(SessionState::Resuming, "connection lost: " + reason);
  if (is_dialer()) {
    schedule_redial();
    return;
  }

  auto self = shared_from_this();
  resume_timer_.expires_after(env_.cfg.resume_wait);
  resume_timer_.async_wait([this, self](boost::system::error_code ec) {
    if (ec || state() != SessionState::Resuming) return;
    fail(FailureReason::Timeout, "peer did not resume within " + std::to_string(env_.cfg.resume_wait.count()) + "ms");
  });
}

void TransferSession::schedule_redial() {
  if (finished()) return;
  if (redial_attempt_ >= env_.cfg.reconnect_attempts) {
    fail(FailureReason::Unreachable, "could not reconnect after " + std::to_string(redial_attempt_) + " attempts");
    return;
  }
  redial_attempt_++;
  auto delay = env_.cfg.reconnect_backoff * redial_attempt_;
  log_info("reconnecting in " + std::to_string(delay.count()) + "ms (attempt " + std::to_string(redial_attempt_) +
           "/" + std::to_string(env_.cfg.reconnect_attempts) + ")");

  auto self = shared_from_this();
  resume_timer_.expires_after(delay);
  resume_timer_.async_wait([this, self](boost::system::error_code ec) {
    if (ec || state() != SessionState::Resuming) return;
    env_.connections.resolve(*redial_, env_.cfg.resolve_timeout, [this, self](const net::ResolveOutcome& outcome) {
      if (state() != SessionState::Resuming) return;
      if (!outcome.ok()) {
        log_warn("reconnect failed: " + outcome.detail);
        schedule_redial();
        return;
      }
      on_redialed(outcome.connection);
    });
  });
}

void TransferSession::refuse_resume(const std::shared_ptr<net::Connection>& conn, const std::string& reason) {
  log_warn("refusing RESUME: " + reason);
  protocol::OfferResp resp;
  resp.transfer_id = id_;
  resp.ok = false;
  resp.reason = reason;
  conn->send(protocol::MsgType::RESUME_RESP, resp.serialize());
}

void TransferSession::cancel_on(const std::shared_ptr<net::Connection>& conn, const std::string& reason) {
  log_info("peer asked to resume a cancelled transfer");
  protocol::Cancel c{id_, reason};
  conn->send(protocol::MsgType::CANCEL, c.serialize());
}

bool TransferSession::retire_stale_connection(const std::shared_ptr<net::Connection>& conn) {
  auto bound = connection();
  if (!bound || !bound->is_open()) return true;
  if (bound == conn) {
    refuse_resume(conn, "transfer is still running on this connection");
    return false;
  }
  log_info("peer resumed on connection " + std::to_string(conn->id()) + ", closing " + std::to_string(bound->id()));
  bound->close("peer resumed on another connection");
  return true;
}

} // namespace dropway::transfer
