#pragma once

#include "dropway/common/config.h"
#include "dropway/net/connection_manager.h"
#include "dropway/protocol/transfer_messages.h"
#include "dropway/storage/chunk_store.h"
#include "dropway/storage/file_store.h"
#include "dropway/storage/resume_store.h"
#include "dropway/ticket/ticket.h"
#include "dropway/transfer/transfer_types.h"
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dropway::transfer {

// Everything a session needs from the node. Outlives every session.
struct SessionEnv {
  boost::asio::io_context& io;
  boost::asio::thread_pool& disk;
  net::ConnectionManager& connections;
  storage::ChunkStore& chunks;
  storage::FileStore& files;
  storage::ResumeStore& resume;
  const Config& cfg;
  std::string local_peer_id;
};

// Common part of the send and receive state machines: the (non-owning)
// connection binding, status publication and connection-loss handling.
// All methods run on the io thread except status() and state().
class TransferSession : public std::enable_shared_from_this<TransferSession> {
 public:
  using StatusCallback = std::function<void(const TransferStatus&)>;

  TransferSession(SessionEnv& env, uint64_t id, Direction direction, std::string peer_id,
                  std::optional<Ticket> redial);
  virtual ~TransferSession();

  TransferSession(const TransferSession&) = delete;
  TransferSession& operator=(const TransferSession&) = delete;

  uint64_t id() const { return id_; }
  Direction direction() const { return direction_; }
  const std::string& peer_id() const { return peer_id_; }
  SessionState state() const { return state_.load(); }
  bool finished() const { return is_terminal(state_.load()); }
  TransferStatus status() const;
  std::string file_hash_hex() const;

  void set_status_callback(StatusCallback cb) { on_status_ = std::move(cb); }

  // The connection this session is bound to (null while resuming).
  std::shared_ptr<net::Connection> connection() const { return conn_.lock(); }

  virtual void on_frame(protocol::MsgType type, const std::vector<uint8_t>& payload) = 0;

  // RESUME for this transfer arrived on `conn`, i.e. the peer redialed.
  virtual void on_resume_request(const std::shared_ptr<net::Connection>& conn, const protocol::Resume& msg) = 0;

  virtual void cancel(bool discard_partial) = 0;

  // A frame for this session could not be handled: tell the peer and fail.
  void abort(FailureReason reason, const std::string& detail);

 protected:
  void bind(const std::shared_ptr<net::Connection>& conn);
  void release();
  bool send(protocol::MsgType type, const std::vector<uint8_t>& payload);

  void set_state(SessionState s, const std::string& detail = "");
  void fail(FailureReason reason, const std::string& detail);
  void complete(SessionState terminal, const std::string& detail);

  template <typename Fn>
  void update_status(Fn fn) {
    {
      std::lock_guard<std::mutex> lock(status_mutex_);
      fn(status_);
    }
    publish();
  }
  void publish();

  void log_info(const std::string& s) const;
  void log_warn(const std::string& s) const;
  void log_debug(const std::string& s) const;

  // Connection loss. Transferring -> Resuming; earlier states fail Unreachable.
  virtual void on_connection_lost(const std::string& reason);
  void enter_resuming(const std::string& reason);

  // The side holding a ticket redials; the other waits resume_wait for RESUME.
  bool is_dialer() const { return redial_.has_value(); }
  virtual void on_redialed(const std::shared_ptr<net::Connection>& conn) = 0;

  void refuse_resume(const std::shared_ptr<net::Connection>& conn, const std::string& reason);

  // Answers a RESUME for a cancelled transfer, so the peer ends CancelledByPeer.
  void cancel_on(const std::shared_ptr<net::Connection>& conn, const std::string& reason);

  // RESUME arrived on `conn` while we are still bound to another live
  // connection: the peer no longer reads that one, so it is closed. False
  // (and RESUME refused) when `conn` is the bound connection itself.
  bool retire_stale_connection(const std::shared_ptr<net::Connection>& conn);

  // Terminal transition happened; cancel subclass timers and jobs.
  virtual void on_finished() {}

  SessionEnv& env_;
  const uint64_t id_;
  const Direction direction_;
  const std::string peer_id_;
  std::optional<Ticket> redial_;

 private:
  void schedule_redial();

  std::atomic<SessionState> state_{SessionState::Initiating};
  mutable std::mutex status_mutex_;
  TransferStatus status_;
  StatusCallback on_status_;

  std::weak_ptr<net::Connection> conn_;
  uint64_t bound_conn_id_ = 0;
  uint64_t close_listener_ = 0;

  boost::asio::steady_timer resume_timer_;
  uint32_t redial_attempt_ = 0;
};

} // namespace dropway::transfer
