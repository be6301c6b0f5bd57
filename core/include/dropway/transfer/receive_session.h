#pragma once

#include "dropway/transfer/chunk_window.h"
#include "dropway/transfer/transfer_session.h"
#include <functional>
#include <map>
#include <memory>
#include <set>

namespace dropway::transfer {

// Receiver state machine. Verifies each chunk against the offer before it
// touches the disk, persists the confirmed set after every write and checks
// the whole-file hash before the .part file is renamed.
class ReceiveSession : public TransferSession {
 public:
  // Push: the peer sent OFFER on `conn`; start() binds it.
  ReceiveSession(SessionEnv& env, const std::shared_ptr<net::Connection>& conn, protocol::Offer offer);

  // Pull: we resolve `ticket` and ask for a file with FETCH; `id` is the request id.
  ReceiveSession(SessionEnv& env, uint64_t id, const Ticket& ticket, std::optional<crypto::Digest> want);

  void start_fetch();

  // Push: binds the offering connection, then accepts right away or waits
  // for accept()/reject().
  void start(const std::shared_ptr<net::Connection>& conn, bool auto_accept);

  // Pull: the OFFER answering our FETCH. A duplicate is refused.
  void on_fetched_offer(protocol::Offer offer, bool duplicate);

  bool awaiting_offer() const { return !has_offer_ && state() == SessionState::Initiating; }

  void accept();
  void reject(const std::string& reason);

  void on_frame(protocol::MsgType type, const std::vector<uint8_t>& payload) override;
  void on_resume_request(const std::shared_ptr<net::Connection>& conn, const protocol::Resume& msg) override;
  void cancel(bool discard_partial) override;

 protected:
  void on_redialed(const std::shared_ptr<net::Connection>& conn) override;
  void on_finished() override;

 private:
  void set_offer(protocol::Offer offer);
  void on_offered(bool auto_accept);
  std::optional<std::string> check_offer() const;
  void on_chunk(const std::vector<uint8_t>& payload);
  void on_chunk_stored(uint32_t index, bool verified, const std::string& error);
  void verify_file();
  void when_disk_idle(std::function<void()> fn);
  void send_ack(uint32_t index);
  void publish_progress();
  void fail_with_result(FailureReason reason, const std::string& detail);

  protocol::Offer offer_;
  bool has_offer_ = false;
  std::optional<crypto::Digest> want_;

  std::string target_;
  std::unique_ptr<AckTracker> tracker_;       // io thread
  std::unique_ptr<AckTracker> disk_tracker_;  // disk strand
  std::set<uint32_t> pending_;                // chunks with a disk job in flight
  std::map<uint32_t, uint32_t> failures_;     // verification failures per chunk
  uint32_t redundant_ = 0;
  size_t disk_jobs_ = 0;
  std::vector<std::function<void()>> idle_waiters_;
  bool cancelling_ = false;
  bool verifying_ = false;

  boost::asio::strand<boost::asio::thread_pool::executor_type> disk_;
  boost::asio::steady_timer offer_timer_;
};

} // namespace dropway::transfer
