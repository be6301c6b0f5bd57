#pragma once

#include "dropway/transfer/chunk_source.h"
#include "dropway/transfer/chunk_window.h"
#include "dropway/transfer/transfer_session.h"
#include <chrono>
#include <map>
#include <memory>

namespace dropway::transfer {

// Sender state machine: Initiating -> Negotiating -> Transferring (<-> Resuming)
// -> Completed | Cancelled | Failed.
class SendSession : public TransferSession {
 public:
  // Push: describe `path`, resolve `ticket`, offer. We dialed, so we redial on loss.
  // `offered_name` replaces the file name in the offer when set.
  SendSession(SessionEnv& env, uint64_t id, const Ticket& ticket, std::string path, std::string offered_name = "");

  // Pull: answer the peer's FETCH (request id == transfer id) on its connection.
  SendSession(SessionEnv& env, uint64_t id, std::string peer_id, std::shared_ptr<ChunkSource> source);

  void start_push();
  void start_on(const std::shared_ptr<net::Connection>& conn);

  void on_frame(protocol::MsgType type, const std::vector<uint8_t>& payload) override;
  void on_resume_request(const std::shared_ptr<net::Connection>& conn, const protocol::Resume& msg) override;
  void cancel(bool discard_partial) override;

 protected:
  void on_connection_lost(const std::string& reason) override;
  void on_redialed(const std::shared_ptr<net::Connection>& conn) override;
  void on_finished() override;

 private:
  struct Flight {
    std::chrono::steady_clock::time_point sent_at;
    bool resent = false;
    bool on_wire = false;
  };

  void set_source(std::shared_ptr<ChunkSource> source);
  void offer();
  void begin_transfer(const std::vector<uint32_t>& have);
  void pump();
  void send_chunk(uint32_t index);
  void arm_tick();
  void tick();
  void abort_with_cancel(FailureReason reason, const std::string& detail);
  void publish_progress();

  std::string path_;
  std::string offered_name_;
  std::shared_ptr<ChunkSource> source_;
  std::unique_ptr<SendWindow> window_;
  std::map<uint32_t, Flight> flights_;
  uint64_t epoch_ = 0;  // bumped on connection loss; stale disk reads are dropped

  boost::asio::strand<boost::asio::thread_pool::executor_type> disk_;
  boost::asio::steady_timer tick_timer_;
  boost::asio::steady_timer offer_timer_;
};

} // namespace dropway::transfer
