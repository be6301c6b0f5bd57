#include "dropway/transfer/receive_session.h"
#include "dropway/log/logger.h"
#include <filesystem>

namespace dropway::transfer {

ReceiveSession::ReceiveSession(SessionEnv& env, const std::shared_ptr<net::Connection>& conn, protocol::Offer offer)
  : TransferSession(env, offer.transfer_id, Direction::Receive, conn->peer_id(), std::nullopt),
    disk_(boost::asio::make_strand(env.disk.get_executor())),
    offer_timer_(env.io) {
  set_offer(std::move(offer));
}

void ReceiveSession::start(const std::shared_ptr<net::Connection>& conn, bool auto_accept) {
  bind(conn);
  on_offered(auto_accept);
}

ReceiveSession::ReceiveSession(SessionEnv& env, uint64_t id, const Ticket& ticket, std::optional<crypto::Digest> want)
  : TransferSession(env, id, Direction::Receive, ticket.peer_id(), ticket),
    want_(want),
    disk_(boost::asio::make_strand(env.disk.get_executor())),
    offer_timer_(env.io) {
  if (want_) {
    std::string hex = crypto::to_hex(*want_);
    update_status([&](TransferStatus& st) { st.file_hash_hex = hex; });
  }
}

void ReceiveSession::set_offer(protocol::Offer offer) {
  offer_ = std::move(offer);
  has_offer_ = true;
  tracker_ = std::make_unique<AckTracker>(offer_.chunk_count);
  std::string hex = crypto::to_hex(offer_.file_hash);
  update_status([&](TransferStatus& st) {
    st.file_name = offer_.file_name;
    st.file_hash_hex = hex;
    st.chunk_count = offer_.chunk_count;
    st.total_bytes = offer_.file_size;
  });
}

void ReceiveSession::start_fetch() {
  auto self = shared_from_this();
  set_state(SessionState::Initiating, "resolving peer");
  env_.connections.resolve(*redial_, env_.cfg.resolve_timeout, [this, self](const net::ResolveOutcome& outcome) {
    if (finished()) return;
    if (!outcome.ok()) {
      fail(outcome.kind == net::ResolveOutcome::Kind::Timeout ? FailureReason::Timeout : FailureReason::Unreachable,
           outcome.detail);
      return;
    }
    bind(outcome.connection);
    protocol::Fetch f;
    f.request_id = id_;
    f.has_hash = want_.has_value();
    if (want_) f.file_hash = *want_;
    send(protocol::MsgType::FETCH, f.serialize());
    set_state(SessionState::Initiating, "waiting for the offer");

    offer_timer_.expires_after(env_.cfg.offer_timeout);
    offer_timer_.async_wait([this, self](boost::system::error_code ec) {
      if (ec || !awaiting_offer()) return;
      fail(FailureReason::Timeout, "peer did not answer the fetch request");
    });
  });
}

void ReceiveSession::on_fetched_offer(protocol::Offer offer, bool duplicate) {
  offer_timer_.cancel();
  bool unexpected = want_ && offer.file_hash != *want_;
  set_offer(std::move(offer));
  if (unexpected || duplicate) {
    set_state(SessionState::Negotiating);
    reject(duplicate ? "duplicate transfer" : "offered a different file than requested");
    return;
  }
  on_offered(true);
}

std::optional<std::string> ReceiveSession::check_offer() const {
  if (!storage::FileStore::safe_relative_path(offer_.file_name)) return std::string("unsafe file name");
  if (offer_.chunk_size > protocol::MAX_PAYLOAD - 64) return std::string("chunk size too large");
  if (env_.files.final_exists(offer_.file_name)) return std::string("file already exists");

  std::error_code ec;
  std::string part = env_.files.get_temp_path(offer_.file_name, crypto::to_hex(offer_.file_hash));
  uint64_t needed = std::filesystem::exists(part, ec) ? 0 : offer_.file_size;
  auto space = env_.files.free_space();
  if (space && *space < needed) return std::string("insufficient disk space");
  return std::nullopt;
}

void ReceiveSession::on_offered(bool auto_accept) {
  if (auto reason = check_offer()) {
    set_state(SessionState::Negotiating);
    reject(*reason);
    return;
  }
  set_state(SessionState::Negotiating, "offer of " + offer_.file_name);
  if (auto_accept) {
    accept();
    return;
  }

  auto self = shared_from_this();
  offer_timer_.expires_after(env_.cfg.offer_timeout);
  offer_timer_.async_wait([this, self](boost::system::error_code ec) {
    if (ec || state() != SessionState::Negotiating) return;
    protocol::OfferResp resp{id_, false, "offer timed out", {}};
    send(protocol::MsgType::OFFER_RESP, resp.serialize());
    fail(FailureReason::Timeout, "offer was not accepted in time");
  });
}

void ReceiveSession::accept() {
  if (state() != SessionState::Negotiating || cancelling_) return;
  offer_timer_.cancel();
  auto self = shared_from_this();
  disk_jobs_++;

  boost::asio::post(disk_, [this, self]() {
    const std::string hash_hex = crypto::to_hex(offer_.file_hash);
    storage::ResumeRecord rec;
    bool resumed = false;
    std::string error;
    try {
      auto existing = env_.resume.load(peer_id_, hash_hex);
      std::error_code ec;
      if (existing && existing->chunk_count == offer_.chunk_count &&
          std::filesystem::exists(existing->target_path, ec) &&
          std::filesystem::file_size(existing->target_path, ec) == offer_.file_size) {
        rec = *existing;
        resumed = true;
      } else {
        rec.peer_id = peer_id_;
        rec.file_hash_hex = hash_hex;
        rec.file_name = offer_.file_name;
        rec.target_path = env_.files.get_temp_path(offer_.file_name, hash_hex);
        rec.chunk_count = offer_.chunk_count;
        storage::ChunkStore::preallocate(rec.target_path, offer_.file_size);
        env_.resume.save(rec);
      }
    } catch (const std::exception& e) {
      error = e.what();
    }

    disk_tracker_ = std::make_unique<AckTracker>(offer_.chunk_count);
    if (error.empty()) {
      for (uint32_t idx : rec.confirmed) disk_tracker_->confirm(idx);
    }

    boost::asio::post(env_.io, [this, self, rec, resumed, error]() {
      disk_jobs_--;
      if (!finished() && !error.empty()) {
        protocol::OfferResp resp{id_, false, "cannot prepare target file", {}};
        send(protocol::MsgType::OFFER_RESP, resp.serialize());
        fail(FailureReason::Internal, "cannot prepare target: " + error);
      } else if (!finished() && !cancelling_) {
        target_ = rec.target_path;
        for (uint32_t idx : rec.confirmed) tracker_->confirm(idx);
        protocol::OfferResp resp{id_, true, "", tracker_->confirmed_indices()};
        send(protocol::MsgType::OFFER_RESP, resp.serialize());
        update_status([&](TransferStatus& st) { st.target_path = target_; });
        set_state(SessionState::Transferring,
                  resumed ? "resuming with " + std::to_string(rec.confirmed.size()) + " chunks on disk" : "accepted");
        publish_progress();
        if (tracker_->complete()) verify_file();
      } else {
        target_ = rec.target_path;
      }
      if (disk_jobs_ == 0) {
        auto waiters = std::move(idle_waiters_);
        idle_waiters_.clear();
        for (auto& w : waiters) w();
      }
    });
  });
}

void ReceiveSession::reject(const std::string& reason) {
  if (finished()) return;
  offer_timer_.cancel();
  protocol::OfferResp resp{id_, false, reason, {}};
  send(protocol::MsgType::OFFER_RESP, resp.serialize());
  fail(FailureReason::Rejected, reason);
}

void ReceiveSession::on_frame(protocol::MsgType type, const std::vector<uint8_t>& payload) {
  if (finished()) return;

  switch (type) {
    case protocol::MsgType::CHUNK:
      on_chunk(payload);
      return;
    case protocol::MsgType::CANCEL: {
      auto c = protocol::Cancel::deserialize(payload);
      auto self = shared_from_this();
      cancelling_ = true;
      log_info("sender cancelled: " + c.reason);
      when_disk_idle([this, self, c]() { fail(FailureReason::CancelledByPeer, c.reason); });
      return;
    }
    case protocol::MsgType::RESUME_RESP: {
      if (state() != SessionState::Resuming || !has_offer_) return;
      auto resp = protocol::OfferResp::deserialize(payload, offer_.chunk_count);
      if (!resp.ok) {
        fail(FailureReason::Rejected, "resume refused: " + resp.reason);
        return;
      }
      set_state(SessionState::Transferring, "resumed");
      if (tracker_->complete() && !verifying_) verify_file();
      return;
    }
    case protocol::MsgType::FETCH_FAIL: {
      auto f = protocol::FetchFail::deserialize(payload);
      fail(FailureReason::Rejected, f.reason);
      return;
    }
    default:
      log_debug(std::string("ignoring ") + protocol::msg_type_name(type));
  }
}

void ReceiveSession::on_chunk(const std::vector<uint8_t>& payload) {
  if (state() != SessionState::Transferring || cancelling_ || verifying_) return;
  auto msg = protocol::ChunkMsg::deserialize(payload);
  const uint32_t idx = msg.chunk_index;
  if (idx >= offer_.chunk_count) throw protocol::ProtocolError("CHUNK: index out of range");

  if (tracker_->is_confirmed(idx)) {
    redundant_++;
    send_ack(idx);
    publish_progress();
    return;
  }
  if (pending_.count(idx)) return;

  pending_.insert(idx);
  disk_jobs_++;

  storage::Chunk chunk;
  chunk.index = idx;
  chunk.offset = uint64_t(idx) * offer_.chunk_size;
  chunk.hash = msg.hash;
  chunk.data = std::move(msg.data);
  const crypto::Digest expected = offer_.chunk_hashes[idx];
  const uint64_t left = offer_.file_size - chunk.offset;
  const size_t expected_len = static_cast<size_t>(left < offer_.chunk_size ? left : offer_.chunk_size);

  auto self = shared_from_this();
  boost::asio::post(disk_, [this, self, idx, expected, expected_len, chunk = std::move(chunk)]() {
    bool verified = chunk.data.size() == expected_len && storage::ChunkStore::verify_chunk(chunk, expected);
    std::string error;
    if (verified) {
      try {
        storage::ChunkStore::write_chunk(target_, chunk);
        disk_tracker_->confirm(idx);
      } catch (const std::exception& e) {
        error = e.what();
      }
    }
    if (verified && error.empty()) {
      storage::ResumeRecord rec;
      rec.peer_id = peer_id_;
      rec.file_hash_hex = crypto::to_hex(offer_.file_hash);
      rec.file_name = offer_.file_name;
      rec.target_path = target_;
      rec.chunk_count = offer_.chunk_count;
      rec.confirmed = disk_tracker_->confirmed_indices();
      try {
        env_.resume.save(rec);
      } catch (const std::exception& e) {
        Logger::instance().warn("[recv " + std::to_string(id_) + "] resume state not saved: " + e.what());
      }
    }
    boost::asio::post(env_.io, [this, self, idx, verified, error]() { on_chunk_stored(idx, verified, error); });
  });
}

void ReceiveSession::on_chunk_stored(uint32_t index, bool verified, const std::string& error) {
  disk_jobs_--;
  pending_.erase(index);

  if (!finished()) {
    if (!error.empty()) {
      fail_with_result(FailureReason::Internal, "writing chunk " + std::to_string(index) + ": " + error);
    } else if (!verified) {
      uint32_t n = ++failures_[index];
      if (n > env_.cfg.chunk_retry_budget) {
        fail_with_result(FailureReason::IntegrityMismatch,
                         "chunk " + std::to_string(index) + " failed verification " + std::to_string(n) + " times");
      } else {
        log_warn("chunk " + std::to_string(index) + " failed verification, requesting it again");
        protocol::ChunkAck nack{id_, index, 0};
        send(protocol::MsgType::CHUNK_NACK, nack.serialize());
      }
    } else {
      tracker_->confirm(index);
      if (!cancelling_) send_ack(index);
      publish_progress();
      if (state() == SessionState::Transferring && !cancelling_ && !verifying_ && tracker_->complete()) {
        verify_file();
      }
    }
  }

  if (disk_jobs_ == 0) {
    auto waiters = std::move(idle_waiters_);
    idle_waiters_.clear();
    for (auto& w : waiters) w();
  }
}

void ReceiveSession::send_ack(uint32_t index) {
  protocol::ChunkAck ack{id_, index, tracker_->cursor()};
  send(protocol::MsgType::CHUNK_ACK, ack.serialize());
}

void ReceiveSession::publish_progress() {
  uint64_t bytes = uint64_t(tracker_->confirmed_count()) * offer_.chunk_size;
  if (offer_.chunk_count > 0 && tracker_->is_confirmed(offer_.chunk_count - 1)) {
    bytes -= uint64_t(offer_.chunk_count) * offer_.chunk_size - offer_.file_size;
  }
  uint32_t acked = tracker_->confirmed_count();
  uint32_t redundant = redundant_;
  update_status([&](TransferStatus& st) {
    st.chunks_acked = acked;
    st.bytes_acked = bytes;
    st.redundant_chunks = redundant;
  });
}

void ReceiveSession::verify_file() {
  verifying_ = true;
  disk_jobs_++;
  log_info("all " + std::to_string(offer_.chunk_count) + " chunks stored, checking the file hash");

  auto self = shared_from_this();
  boost::asio::post(disk_, [this, self]() {
    enum class Verdict { Ok, Mismatch, Error } verdict = Verdict::Ok;
    std::string final_path;
    std::string error;
    const std::string hash_hex = crypto::to_hex(offer_.file_hash);
    try {
      if (storage::ChunkStore::hash_file(target_) == offer_.file_hash) {
        final_path = env_.files.finalize_file(target_, offer_.file_name);
      } else {
        verdict = Verdict::Mismatch;
        env_.files.cleanup(target_);
      }
    } catch (const std::exception& e) {
      verdict = Verdict::Error;
      error = e.what();
    }
    if (verdict != Verdict::Error) {
      try {
        env_.resume.remove(peer_id_, hash_hex);
      } catch (const std::exception& e) {
        Logger::instance().warn("[recv " + std::to_string(id_) + "] resume state not removed: " + e.what());
      }
    }

    boost::asio::post(env_.io, [this, self, verdict, final_path, error]() {
      disk_jobs_--;
      if (!finished()) {
        if (verdict == Verdict::Ok) {
          update_status([&](TransferStatus& st) { st.target_path = final_path; });
          protocol::Result res{id_, true, 0, "saved"};
          send(protocol::MsgType::RESULT, res.serialize());
          complete(SessionState::Completed, "saved to " + final_path);
        } else if (verdict == Verdict::Mismatch) {
          fail_with_result(FailureReason::IntegrityMismatch, "whole-file hash does not match the offer");
        } else {
          fail_with_result(FailureReason::Internal, "finalizing: " + error);
        }
      }
      if (disk_jobs_ == 0) {
        auto waiters = std::move(idle_waiters_);
        idle_waiters_.clear();
        for (auto& w : waiters) w();
      }
    });
  });
}

void ReceiveSession::fail_with_result(FailureReason reason, const std::string& detail) {
  protocol::Result res{id_, false, static_cast<uint8_t>(reason), detail};
  send(protocol::MsgType::RESULT, res.serialize());
  fail(reason, detail);
}

void ReceiveSession::when_disk_idle(std::function<void()> fn) {
  if (disk_jobs_ == 0) {
    fn();
    return;
  }
  idle_waiters_.push_back(std::move(fn));
}

void ReceiveSession::on_redialed(const std::shared_ptr<net::Connection>& conn) {
  bind(conn);
  auto self = shared_from_this();
  when_disk_idle([this, self, conn]() {
    if (state() != SessionState::Resuming || connection() != conn) return;
    protocol::Resume msg;
    msg.transfer_id = id_;
    msg.file_hash = offer_.file_hash;
    msg.chunk_count = offer_.chunk_count;
    msg.have = tracker_->confirmed_indices();
    send(protocol::MsgType::RESUME, msg.serialize());
    log_info("reconnected, resuming with " + std::to_string(msg.have.size()) + " chunks on disk");
  });
}

void ReceiveSession::on_resume_request(const std::shared_ptr<net::Connection>& conn, const protocol::Resume& msg) {
  if (!has_offer_ || msg.file_hash != offer_.file_hash || msg.chunk_count != offer_.chunk_count) {
    refuse_resume(conn, "file does not match");
    return;
  }
  if (state() == SessionState::Completed) {
    // the RESULT was lost with the old connection
    std::vector<uint32_t> all(offer_.chunk_count);
    for (uint32_t i = 0; i < offer_.chunk_count; i++) all[i] = i;
    protocol::OfferResp resp{id_, true, "", all};
    conn->send(protocol::MsgType::RESUME_RESP, resp.serialize());
    protocol::Result res{id_, true, 0, "saved"};
    conn->send(protocol::MsgType::RESULT, res.serialize());
    return;
  }
  if (state() == SessionState::Cancelled) {
    cancel_on(conn, "cancelled by receiver");
    return;
  }
  if (finished()) {
    refuse_resume(conn, "transfer is over");
    return;
  }
  if (!retire_stale_connection(conn)) return;
  if (state() == SessionState::Transferring) on_connection_lost("superseded");
  if (state() != SessionState::Resuming) {
    refuse_resume(conn, std::string("transfer is ") + to_string(state()));
    return;
  }

  bind(conn);
  auto self = shared_from_this();
  when_disk_idle([this, self, conn]() {
    if (state() != SessionState::Resuming || connection() != conn) return;
    protocol::OfferResp resp{id_, true, "", tracker_->confirmed_indices()};
    send(protocol::MsgType::RESUME_RESP, resp.serialize());
    set_state(SessionState::Transferring, "peer resumed");
    log_info("peer resumed, reported " + std::to_string(resp.have.size()) + " confirmed chunks");
    if (tracker_->complete() && !verifying_) verify_file();
  });
}

void ReceiveSession::cancel(bool discard_partial) {
  if (finished()) return;
  SessionState s = state();
  if (s == SessionState::Initiating || s == SessionState::Negotiating) {
    if (has_offer_) {
      protocol::OfferResp resp{id_, false, "cancelled by receiver", {}};
      send(protocol::MsgType::OFFER_RESP, resp.serialize());
    }
    complete(SessionState::Cancelled, "cancelled before transfer");
    return;
  }

  cancelling_ = true;
  auto self = shared_from_this();
  when_disk_idle([this, self, discard_partial]() {
    if (finished()) return;
    protocol::Cancel c{id_, "cancelled by receiver"};
    send(protocol::MsgType::CANCEL, c.serialize());
    if (discard_partial && !target_.empty()) {
      const std::string target = target_;
      const std::string hash_hex = crypto::to_hex(offer_.file_hash);
      boost::asio::post(disk_, [this, self, target, hash_hex]() {
        env_.files.cleanup(target);
        try {
          env_.resume.remove(peer_id_, hash_hex);
        } catch (const std::exception& e) {
          Logger::instance().warn("[recv " + std::to_string(id_) + "] resume state not removed: " + e.what());
        }
      });
    }
    complete(SessionState::Cancelled, discard_partial ? "partial data discarded" : "partial data kept for resume");
  });
}

void ReceiveSession::on_finished() {
  offer_timer_.cancel();
}

} // namespace dropway::transfer
