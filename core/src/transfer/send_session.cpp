#include "dropway/transfer/send_session.h"
#include "dropway/log/logger.h"
#include <algorithm>
#include <filesystem>

namespace dropway::transfer {

SendSession::SendSession(SessionEnv& env, uint64_t id, const Ticket& ticket, std::string path,
                         std::string offered_name)
  : TransferSession(env, id, Direction::Send, ticket.peer_id(), ticket),
    path_(std::move(path)),
    offered_name_(std::move(offered_name)),
    disk_(boost::asio::make_strand(env.disk.get_executor())),
    tick_timer_(env.io),
    offer_timer_(env.io) {
  std::string name = offered_name_.empty() ? std::filesystem::path(path_).filename().string() : offered_name_;
  update_status([&](TransferStatus& st) { st.file_name = name; });
}

SendSession::SendSession(SessionEnv& env, uint64_t id, std::string peer_id, std::shared_ptr<ChunkSource> source)
  : TransferSession(env, id, Direction::Send, std::move(peer_id), std::nullopt),
    path_(source->path()),
    disk_(boost::asio::make_strand(env.disk.get_executor())),
    tick_timer_(env.io),
    offer_timer_(env.io) {
  set_source(std::move(source));
}

void SendSession::set_source(std::shared_ptr<ChunkSource> source) {
  source_ = std::move(source);
  const auto& desc = source_->descriptor();
  window_ = std::make_unique<SendWindow>(desc.chunk_count, env_.cfg.window, env_.cfg.chunk_retry_budget);
  update_status([&](TransferStatus& st) {
    st.file_name = desc.name;
    st.file_hash_hex = desc.hash_hex();
    st.chunk_count = desc.chunk_count;
    st.total_bytes = desc.size;
  });
}

void SendSession::start_push() {
  if (finished()) return;
  auto self = shared_from_this();
  set_state(SessionState::Initiating, "hashing " + path_);
  boost::asio::post(disk_, [this, self]() {
    std::shared_ptr<ChunkSource> source;
    std::string error;
    try {
      source = ChunkSource::open(path_, env_.chunks, offered_name_);
    } catch (const OfferTooLarge& e) {
      error = std::string("cannot offer: ") + e.what();
    } catch (const std::exception& e) {
      error = "cannot read " + path_ + ": " + e.what();
    }
    boost::asio::post(env_.io, [this, self, source, error]() {
      if (finished()) return;
      if (!source) {
        fail(FailureReason::Internal, error);
        return;
      }
      set_source(source);
      set_state(SessionState::Initiating, "resolving peer");
      env_.connections.resolve(*redial_, env_.cfg.resolve_timeout, [this, self](const net::ResolveOutcome& outcome) {
        if (finished()) return;
        if (!outcome.ok()) {
          fail(outcome.kind == net::ResolveOutcome::Kind::Timeout ? FailureReason::Timeout : FailureReason::Unreachable,
               outcome.detail);
          return;
        }
        log_info(std::string("connected ") + net::to_string(outcome.kind) + " to " + peer_id_);
        bind(outcome.connection);
        offer();
      });
    });
  });
}

void SendSession::start_on(const std::shared_ptr<net::Connection>& conn) {
  bind(conn);
  offer();
}

void SendSession::offer() {
  const auto& desc = source_->descriptor();
  protocol::Offer o;
  o.transfer_id = id_;
  o.request_id = is_dialer() ? 0 : id_;
  o.file_name = desc.name;
  o.file_size = desc.size;
  o.chunk_size = desc.chunk_size;
  o.chunk_count = desc.chunk_count;
  o.file_hash = desc.hash;
  o.chunk_hashes = desc.chunk_hashes;
  if (!send(protocol::MsgType::OFFER, o.serialize())) {
    fail(FailureReason::Unreachable, "connection closed before the offer");
    return;
  }
  set_state(SessionState::Negotiating, "offered " + desc.name);

  auto self = shared_from_this();
  offer_timer_.expires_after(env_.cfg.offer_timeout);
  offer_timer_.async_wait([this, self](boost::system::error_code ec) {
    if (ec || state() != SessionState::Negotiating) return;
    abort_with_cancel(FailureReason::Timeout, "offer was not answered");
  });
}

void SendSession::begin_transfer(const std::vector<uint32_t>& have) {
  offer_timer_.cancel();
  window_->mark_confirmed(have);
  set_state(SessionState::Transferring,
            std::to_string(window_->acked().confirmed_count()) + "/" + std::to_string(window_->acked().chunk_count()) +
                " chunks already at the receiver");
  publish_progress();
  arm_tick();
  pump();
}

void SendSession::pump() {
  if (state() != SessionState::Transferring || !connection()) return;
  while (auto idx = window_->next()) {
    send_chunk(*idx);
  }
  if (window_->done()) {
    // all chunks acknowledged; the receiver is hashing the file
    auto self = shared_from_this();
    offer_timer_.expires_after(env_.cfg.offer_timeout);
    offer_timer_.async_wait([this, self](boost::system::error_code ec) {
      if (ec || finished()) return;
      fail(FailureReason::Timeout, "no RESULT from the receiver");
    });
  }
}

void SendSession::send_chunk(uint32_t index) {
  auto self = shared_from_this();
  auto& flight = flights_[index];
  flight.sent_at = std::chrono::steady_clock::now();
  flight.on_wire = false;
  uint64_t epoch = epoch_;
  auto source = source_;

  boost::asio::post(disk_, [this, self, source, index, epoch]() {
    storage::Chunk chunk;
    std::string error;
    try {
      chunk = source->read_verified(index);
    } catch (const std::exception& e) {
      error = e.what();
    }
    boost::asio::post(env_.io, [this, self, index, epoch, chunk = std::move(chunk), error]() {
      if (finished() || epoch != epoch_) return;
      if (!error.empty()) {
        abort_with_cancel(FailureReason::Internal, error);
        return;
      }
      auto it = flights_.find(index);
      if (it == flights_.end()) return;  // acknowledged meanwhile

      protocol::ChunkMsg msg;
      msg.transfer_id = id_;
      msg.chunk_index = index;
      msg.hash = chunk.hash;
      msg.data = chunk.data;
      if (!send(protocol::MsgType::CHUNK, msg.serialize())) return;
      it->second.sent_at = std::chrono::steady_clock::now();
      it->second.on_wire = true;
    });
  });
}

void SendSession::arm_tick() {
  auto self = shared_from_this();
  auto period = std::max(env_.cfg.chunk_timeout / 4, std::chrono::milliseconds(50));
  tick_timer_.expires_after(period);
  tick_timer_.async_wait([this, self](boost::system::error_code ec) {
    if (ec || finished()) return;
    tick();
    arm_tick();
  });
}

// A chunk round trip that expires is resent once; a second expiry means the
// connection is dead even if TCP has not noticed yet.
void SendSession::tick() {
  if (state() != SessionState::Transferring) return;
  auto now = std::chrono::steady_clock::now();
  std::vector<uint32_t> resend;
  for (auto& kv : flights_) {
    if (!kv.second.on_wire || now - kv.second.sent_at < env_.cfg.chunk_timeout) continue;
    if (kv.second.resent) {
      log_warn("chunk " + std::to_string(kv.first) + " timed out twice, dropping the connection");
      if (auto conn = connection()) conn->close("chunk round trip timed out");
      return;
    }
    kv.second.resent = true;
    resend.push_back(kv.first);
  }
  for (uint32_t idx : resend) {
    log_debug("chunk " + std::to_string(idx) + " timed out, resending");
    send_chunk(idx);
  }
}

void SendSession::publish_progress() {
  const auto& acked = window_->acked();
  const auto& desc = source_->descriptor();
  uint64_t bytes = uint64_t(acked.confirmed_count()) * desc.chunk_size;
  if (desc.chunk_count > 0 && acked.is_confirmed(desc.chunk_count - 1)) {
    bytes -= desc.chunk_size - desc.chunk_length(desc.chunk_count - 1);
  }
  update_status([&](TransferStatus& st) {
    st.chunks_acked = acked.confirmed_count();
    st.bytes_acked = bytes;
  });
}

void SendSession::on_frame(protocol::MsgType type, const std::vector<uint8_t>& payload) {
  if (finished()) return;
  const uint32_t count = source_ ? source_->descriptor().chunk_count : 0;

  switch (type) {
    case protocol::MsgType::OFFER_RESP: {
      if (state() != SessionState::Negotiating) return;
      auto resp = protocol::OfferResp::deserialize(payload, count);
      if (!resp.ok) {
        fail(FailureReason::Rejected, resp.reason);
        return;
      }
      log_info("accepted, receiver holds " + std::to_string(resp.have.size()) + " chunks");
      begin_transfer(resp.have);
      return;
    }
    case protocol::MsgType::RESUME_RESP: {
      if (state() != SessionState::Resuming) return;
      auto resp = protocol::OfferResp::deserialize(payload, count);
      if (!resp.ok) {
        fail(FailureReason::Rejected, "resume refused: " + resp.reason);
        return;
      }
      log_info("resumed, receiver holds " + std::to_string(resp.have.size()) + " chunks");
      begin_transfer(resp.have);
      return;
    }
    case protocol::MsgType::CHUNK_ACK: {
      auto ack = protocol::ChunkAck::deserialize(payload);
      if (ack.chunk_index >= count) throw protocol::ProtocolError("CHUNK_ACK: index out of range");
      window_->on_ack(ack.chunk_index);
      flights_.erase(ack.chunk_index);
      publish_progress();
      pump();
      return;
    }
    case protocol::MsgType::CHUNK_NACK: {
      auto nack = protocol::ChunkAck::deserialize(payload);
      if (nack.chunk_index >= count) throw protocol::ProtocolError("CHUNK_NACK: index out of range");
      flights_.erase(nack.chunk_index);
      if (!window_->on_nack(nack.chunk_index)) {
        abort_with_cancel(FailureReason::IntegrityMismatch,
                          "chunk " + std::to_string(nack.chunk_index) + " failed verification too often");
        return;
      }
      log_warn("chunk " + std::to_string(nack.chunk_index) + " rejected by the receiver, resending");
      pump();
      return;
    }
    case protocol::MsgType::RESULT: {
      auto res = protocol::Result::deserialize(payload);
      offer_timer_.cancel();
      if (res.ok) {
        complete(SessionState::Completed, "receiver verified the file");
      } else {
        fail(failure_from_code(res.reason_code), "receiver: " + res.message);
      }
      return;
    }
    case protocol::MsgType::CANCEL: {
      auto c = protocol::Cancel::deserialize(payload);
      fail(FailureReason::CancelledByPeer, c.reason);
      return;
    }
    default:
      log_debug(std::string("ignoring ") + protocol::msg_type_name(type));
  }
}

void SendSession::on_connection_lost(const std::string& reason) {
  if (window_) window_->reset_in_flight();
  flights_.clear();
  epoch_++;
  TransferSession::on_connection_lost(reason);
}

void SendSession::on_redialed(const std::shared_ptr<net::Connection>& conn) {
  bind(conn);
  protocol::Resume msg;
  msg.transfer_id = id_;
  msg.file_hash = source_->descriptor().hash;
  msg.chunk_count = source_->descriptor().chunk_count;
  send(protocol::MsgType::RESUME, msg.serialize());
  log_info("reconnected, asking the receiver to resume");
}

void SendSession::on_resume_request(const std::shared_ptr<net::Connection>& conn, const protocol::Resume& msg) {
  if (state() == SessionState::Cancelled) {
    cancel_on(conn, "cancelled by sender");
    return;
  }
  if (finished() || !source_) {
    refuse_resume(conn, "transfer is over");
    return;
  }
  if (!retire_stale_connection(conn)) return;
  if (msg.file_hash != source_->descriptor().hash || msg.chunk_count != source_->descriptor().chunk_count) {
    refuse_resume(conn, "file does not match");
    return;
  }
  if (state() == SessionState::Transferring) {
    // the old connection died but its close notice has not been processed yet
    on_connection_lost("superseded");
  }
  if (state() != SessionState::Resuming) {
    refuse_resume(conn, std::string("transfer is ") + to_string(state()));
    return;
  }

  bind(conn);
  protocol::OfferResp resp;
  resp.transfer_id = id_;
  resp.ok = true;
  send(protocol::MsgType::RESUME_RESP, resp.serialize());
  log_info("peer resumed, it holds " + std::to_string(msg.have.size()) + " chunks");
  begin_transfer(msg.have);
}

void SendSession::cancel(bool) {
  if (finished()) return;
  protocol::Cancel c{id_, "cancelled by sender"};
  send(protocol::MsgType::CANCEL, c.serialize());
  complete(SessionState::Cancelled, "cancelled");
}

void SendSession::abort_with_cancel(FailureReason reason, const std::string& detail) {
  protocol::Cancel c{id_, detail};
  send(protocol::MsgType::CANCEL, c.serialize());
  fail(reason, detail);
}

void SendSession::on_finished() {
  tick_timer_.cancel();
  offer_timer_.cancel();
  flights_.clear();
  epoch_++;
}

} // namespace dropway::transfer
