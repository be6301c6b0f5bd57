#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "dropway/transfer/chunk_source.h"
#include "dropway/transfer/receive_session.h"
#include "dropway/transfer/send_session.h"

namespace dropway::transfer {

// Session registry and the API a GUI or the CLI drives. Public methods may be
// called from any thread; session work is posted to the io thread.
class TransferManager {
public:
  using Subscriber = std::function<void(const TransferStatus&)>;

  // Installs itself as the frame dispatcher of env.connections.
  explicit TransferManager(SessionEnv env);
  ~TransferManager();

  TransferManager(const TransferManager&) = delete;
  TransferManager& operator=(const TransferManager&) = delete;

  // Push `path` to the ticket's peer. Throws std::invalid_argument for our own ticket.
  uint64_t send_file(const Ticket& ticket, const std::string& path);

  // Sends every regular file below `dir` as its own transfer, one after the
  // other, each offered as "<dir name>/<path below dir>". Returns the transfer
  // ids in sending order; the ones not yet started stay in Initiating.
  // Throws std::invalid_argument when `dir` is not a directory, holds no
  // files, or for our own ticket.
  std::vector<uint64_t> send_directory(const Ticket& ticket, const std::string& dir);

  // Incoming offers waiting in Negotiating (auto_accept off). False for unknown ids.
  bool accept(uint64_t transfer_id);
  bool reject(uint64_t transfer_id, const std::string& reason);

  bool cancel(uint64_t transfer_id, bool discard_partial);

  uint64_t subscribe(Subscriber cb);
  void unsubscribe(uint64_t token);

  std::optional<TransferStatus> status(uint64_t transfer_id) const;
  std::vector<TransferStatus> list() const;

  // Makes `path` available to FETCH and the web bridge. Blocking (hashes the
  // file); throws StorageError, or OfferTooLarge when the chunk list does not fit one offer.
  storage::FileDescriptor share_file(const std::string& path);

  // Pull a shared file from the ticket's peer; empty hash: whatever it shares last.
  // Throws std::invalid_argument for a malformed hash or our own ticket.
  uint64_t fetch(const Ticket& ticket, const std::string& file_hash_hex);

  // Empty hash: the file shared last. nullptr when nothing matches.
  std::shared_ptr<ChunkSource> find_shared(const std::string& file_hash_hex) const;

  // Cancels every running session, keeping partial data for a later resume.
  void shutdown();

  // io thread
  void on_frame(const std::shared_ptr<net::Connection>& conn, protocol::MsgType type,
                const std::vector<uint8_t>& payload);

private:
  uint64_t generate_transfer_id() const;
  void add_session(const std::shared_ptr<TransferSession>& session);
  std::shared_ptr<TransferSession> get_session(uint64_t transfer_id) const;
  bool id_in_use(uint64_t transfer_id) const;
  bool receiving_hash(const std::string& file_hash_hex, uint64_t except) const;
  bool sending_to(const std::string& peer_id, const std::string& file_hash_hex) const;
  void notify(const TransferStatus& st);
  void on_finished(uint64_t transfer_id);

  // Files of one send_directory() call, sent one at a time.
  struct SendQueue {
    std::vector<uint64_t> ids;
    size_t next = 0;
    uint64_t active = 0;
  };
  void advance(const std::shared_ptr<SendQueue>& queue);

  void handle_offer(const std::shared_ptr<net::Connection>& conn, const std::vector<uint8_t>& payload);
  void handle_fetch(const std::shared_ptr<net::Connection>& conn, const std::vector<uint8_t>& payload);
  void handle_resume(const std::shared_ptr<net::Connection>& conn, const std::vector<uint8_t>& payload);

  SessionEnv env_;

  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, std::shared_ptr<TransferSession>> transfers_;
  std::deque<uint64_t> finished_;  // oldest first, at most cfg.history_limit
  std::unordered_map<uint64_t, std::shared_ptr<SendQueue>> queues_;  // by transfer id, until it finishes
  std::map<std::string, std::shared_ptr<ChunkSource>> shared_;  // by file hash hex
  std::string last_shared_;

  mutable std::mutex sub_mutex_;
  std::map<uint64_t, Subscriber> subscribers_;
  uint64_t next_subscriber_ = 1;
};

} // namespace dropway::transfer
