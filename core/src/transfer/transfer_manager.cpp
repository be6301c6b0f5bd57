#include "dropway/transfer/transfer_manager.h"
#include "dropway/log/logger.h"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace dropway::transfer {

TransferManager::TransferManager(SessionEnv env)
  : env_(std::move(env)) {
  env_.connections.set_frame_dispatcher(
      [this](const std::shared_ptr<net::Connection>& conn, protocol::MsgType type, const std::vector<uint8_t>& payload) {
        on_frame(conn, type, payload);
      });
}

TransferManager::~TransferManager() {
  env_.connections.set_frame_dispatcher(nullptr);
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& kv : transfers_) kv.second->set_status_callback(nullptr);
  transfers_.clear();
}

uint64_t TransferManager::generate_transfer_id() const {
  for (;;) {
    uint64_t id = crypto::random_u64();
    if (id != 0 && !id_in_use(id)) return id;
  }
}

void TransferManager::add_session(const std::shared_ptr<TransferSession>& session) {
  session->set_status_callback([this](const TransferStatus& st) {
    notify(st);
    if (is_terminal(st.state)) on_finished(st.id);
  });
  {
    std::lock_guard<std::mutex> lock(mutex_);
    transfers_[session->id()] = session;
  }
  notify(session->status());
}

// Finished sessions stay listed (and answer a late RESUME) until newer ones
// push them out of the history.
void TransferManager::on_finished(uint64_t transfer_id) {
  std::vector<std::shared_ptr<TransferSession>> evicted;
  std::shared_ptr<SendQueue> queue;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(finished_.begin(), finished_.end(), transfer_id) != finished_.end()) return;
    finished_.push_back(transfer_id);
    auto q = queues_.find(transfer_id);
    if (q != queues_.end()) {
      if (q->second->active == transfer_id) queue = q->second;
      queues_.erase(q);
    }
    while (finished_.size() > env_.cfg.history_limit) {
      auto it = transfers_.find(finished_.front());
      if (it != transfers_.end()) {
        evicted.push_back(it->second);
        transfers_.erase(it);
      }
      finished_.pop_front();
    }
  }
  // dropped outside the lock
  for (auto& s : evicted) s->set_status_callback(nullptr);
  if (queue) advance(queue);
}

// Starts the next file of the queue that was not cancelled while waiting.
void TransferManager::advance(const std::shared_ptr<SendQueue>& queue) {
  for (;;) {
    std::shared_ptr<SendSession> next;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (queue->next >= queue->ids.size()) {
        queue->active = 0;
        return;
      }
      queue->active = queue->ids[queue->next++];
      auto it = transfers_.find(queue->active);
      if (it != transfers_.end() && !it->second->finished()) {
        next = std::dynamic_pointer_cast<SendSession>(it->second);
      }
    }
    if (next) {
      boost::asio::post(env_.io, [next]() { next->start_push(); });
      return;
    }
  }
}

std::shared_ptr<TransferSession> TransferManager::get_session(uint64_t transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transfers_.find(transfer_id);
  if (it != transfers_.end()) {
    return it->second;
  }
  return nullptr;
}

bool TransferManager::id_in_use(uint64_t transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transfers_.count(transfer_id) > 0;
}

// Two receive sessions for one hash would write the same .part file.
bool TransferManager::receiving_hash(const std::string& file_hash_hex, uint64_t except) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : transfers_) {
    const auto& s = kv.second;
    if (kv.first == except || s->direction() != Direction::Receive || s->finished()) continue;
    if (s->file_hash_hex() == file_hash_hex) return true;
  }
  return false;
}

bool TransferManager::sending_to(const std::string& peer_id, const std::string& file_hash_hex) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : transfers_) {
    const auto& s = kv.second;
    if (s->direction() != Direction::Send || s->finished()) continue;
    if (s->peer_id() == peer_id && s->file_hash_hex() == file_hash_hex) return true;
  }
  return false;
}

void TransferManager::notify(const TransferStatus& st) {
  std::vector<Subscriber> subs;
  {
    std::lock_guard<std::mutex> lock(sub_mutex_);
    subs.reserve(subscribers_.size());
    for (const auto& kv : subscribers_) subs.push_back(kv.second);
  }
  for (auto& cb : subs) cb(st);
}

uint64_t TransferManager::send_file(const Ticket& ticket, const std::string& path) {
  if (ticket.peer_id() == env_.local_peer_id) throw std::invalid_argument("ticket names this node");
  uint64_t id = generate_transfer_id();
  auto session = std::make_shared<SendSession>(env_, id, ticket, path);
  add_session(session);
  Logger::instance().info("[transfers] sending " + path + " to " + ticket.peer_id() + " as " + std::to_string(id));
  boost::asio::post(env_.io, [session]() { session->start_push(); });
  return id;
}

std::vector<uint64_t> TransferManager::send_directory(const Ticket& ticket, const std::string& dir) {
  namespace fs = std::filesystem;
  if (ticket.peer_id() == env_.local_peer_id) throw std::invalid_argument("ticket names this node");

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) throw std::invalid_argument("not a directory: " + dir);
  fs::path root = fs::absolute(dir, ec).lexically_normal();
  if (ec) throw std::invalid_argument("bad directory " + dir + ": " + ec.message());
  if (!root.has_filename()) root = root.parent_path();
  const fs::path top = root.filename();
  if (top.empty()) throw std::invalid_argument("cannot send the root directory");

  // (path on disk, offered name)
  std::vector<std::pair<std::string, std::string>> files;
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;
    files.emplace_back(it->path().string(), (top / it->path().lexically_relative(root)).generic_string());
  }
  if (ec) throw storage::StorageError("walking " + root.string() + ": " + ec.message());
  if (files.empty()) throw std::invalid_argument("no files below " + root.string());
  std::sort(files.begin(), files.end(),
            [](const std::pair<std::string, std::string>& a, const std::pair<std::string, std::string>& b) {
              return a.second < b.second;
            });

  auto queue = std::make_shared<SendQueue>();
  for (const auto& f : files) {
    uint64_t id = generate_transfer_id();
    auto session = std::make_shared<SendSession>(env_, id, ticket, f.first, f.second);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue->ids.push_back(id);
      queues_[id] = queue;
    }
    add_session(session);
  }
  Logger::instance().info("[transfers] sending " + std::to_string(files.size()) + " files of " + root.string() +
                          " to " + ticket.peer_id());
  const std::vector<uint64_t> ids = queue->ids;
  advance(queue);
  return ids;
}

bool TransferManager::accept(uint64_t transfer_id) {
  auto session = std::dynamic_pointer_cast<ReceiveSession>(get_session(transfer_id));
  if (!session) return false;
  boost::asio::post(env_.io, [session]() { session->accept(); });
  return true;
}

bool TransferManager::reject(uint64_t transfer_id, const std::string& reason) {
  auto session = std::dynamic_pointer_cast<ReceiveSession>(get_session(transfer_id));
  if (!session) return false;
  boost::asio::post(env_.io, [session, reason]() {
    if (session->state() == SessionState::Negotiating) session->reject(reason);
  });
  return true;
}

bool TransferManager::cancel(uint64_t transfer_id, bool discard_partial) {
  auto session = get_session(transfer_id);
  if (!session) return false;
  boost::asio::post(env_.io, [session, discard_partial]() { session->cancel(discard_partial); });
  return true;
}

uint64_t TransferManager::subscribe(Subscriber cb) {
  std::lock_guard<std::mutex> lock(sub_mutex_);
  uint64_t token = next_subscriber_++;
  subscribers_[token] = std::move(cb);
  return token;
}

void TransferManager::unsubscribe(uint64_t token) {
  std::lock_guard<std::mutex> lock(sub_mutex_);
  subscribers_.erase(token);
}

std::optional<TransferStatus> TransferManager::status(uint64_t transfer_id) const {
  auto session = get_session(transfer_id);
  if (!session) return std::nullopt;
  return session->status();
}

std::vector<TransferStatus> TransferManager::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TransferStatus> result;
  result.reserve(transfers_.size());
  for (const auto& pair : transfers_) {
    result.push_back(pair.second->status());
  }
  return result;
}

storage::FileDescriptor TransferManager::share_file(const std::string& path) {
  auto source = ChunkSource::open(path, env_.chunks);
  const auto& desc = source->descriptor();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shared_[desc.hash_hex()] = source;
    last_shared_ = desc.hash_hex();
  }
  Logger::instance().info("[transfers] sharing " + path + " (" + desc.hash_hex() + ", " +
                          std::to_string(desc.chunk_count) + " chunks)");
  return desc;
}

std::shared_ptr<ChunkSource> TransferManager::find_shared(const std::string& file_hash_hex) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = shared_.find(file_hash_hex.empty() ? last_shared_ : file_hash_hex);
  if (it == shared_.end()) return nullptr;
  return it->second;
}

uint64_t TransferManager::fetch(const Ticket& ticket, const std::string& file_hash_hex) {
  if (ticket.peer_id() == env_.local_peer_id) throw std::invalid_argument("ticket names this node");
  std::optional<crypto::Digest> want;
  if (!file_hash_hex.empty()) {
    want = crypto::digest_from_hex(file_hash_hex);
    if (!want) throw std::invalid_argument("malformed file hash: " + file_hash_hex);
  }
  uint64_t id = generate_transfer_id();
  auto session = std::make_shared<ReceiveSession>(env_, id, ticket, want);
  add_session(session);
  Logger::instance().info("[transfers] fetching " + (file_hash_hex.empty() ? std::string("shared file") : file_hash_hex) +
                          " from " + ticket.peer_id() + " as " + std::to_string(id));
  boost::asio::post(env_.io, [session]() { session->start_fetch(); });
  return id;
}

void TransferManager::shutdown() {
  std::vector<std::shared_ptr<TransferSession>> running;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : transfers_) {
      if (!kv.second->finished()) running.push_back(kv.second);
    }
  }
  for (auto& s : running) {
    boost::asio::post(env_.io, [s]() { s->cancel(false); });
  }
}

void TransferManager::on_frame(const std::shared_ptr<net::Connection>& conn, protocol::MsgType type,
                               const std::vector<uint8_t>& payload) {
  switch (type) {
    case protocol::MsgType::OFFER:
      handle_offer(conn, payload);
      return;
    case protocol::MsgType::FETCH:
      handle_fetch(conn, payload);
      return;
    case protocol::MsgType::RESUME:
      handle_resume(conn, payload);
      return;
    default:
      break;
  }

  uint64_t id = protocol::peek_transfer_id(payload);
  auto session = get_session(id);
  if (!session || session->peer_id() != conn->peer_id() || session->connection() != conn) {
    Logger::instance().debug(std::string("[transfers] dropping ") + protocol::msg_type_name(type) + " for transfer " +
                             std::to_string(id));
    return;
  }
  try {
    session->on_frame(type, payload);
  } catch (const std::exception& e) {
    Logger::instance().warn("[transfers] " + std::string(protocol::msg_type_name(type)) + " for " + std::to_string(id) +
                            ": " + e.what());
    session->abort(FailureReason::Internal, std::string("bad ") + protocol::msg_type_name(type) + ": " + e.what());
  }
}

void TransferManager::handle_offer(const std::shared_ptr<net::Connection>& conn, const std::vector<uint8_t>& payload) {
  auto offer = protocol::Offer::deserialize(payload);
  const std::string hex = crypto::to_hex(offer.file_hash);

  auto refuse = [&](const std::string& reason) {
    Logger::instance().info("[transfers] refusing offer " + std::to_string(offer.transfer_id) + " from " +
                            conn->peer_id() + ": " + reason);
    protocol::OfferResp resp{offer.transfer_id, false, reason, {}};
    conn->send(protocol::MsgType::OFFER_RESP, resp.serialize());
  };

  if (offer.request_id != 0) {
    // answer to one of our FETCH requests
    auto pull = std::dynamic_pointer_cast<ReceiveSession>(get_session(offer.request_id));
    if (!pull || !pull->awaiting_offer() || pull->peer_id() != conn->peer_id() ||
        offer.transfer_id != offer.request_id || pull->connection() != conn) {
      refuse("unknown request");
      return;
    }
    pull->on_fetched_offer(std::move(offer), receiving_hash(hex, pull->id()));
    return;
  }

  if (id_in_use(offer.transfer_id)) {
    refuse("transfer id in use");
    return;
  }
  if (receiving_hash(hex, 0)) {
    refuse("duplicate transfer");
    return;
  }

  Logger::instance().info("[transfers] offer " + std::to_string(offer.transfer_id) + " from " + conn->peer_id() +
                          ": " + offer.file_name + " (" + std::to_string(offer.file_size) + " bytes)");
  auto session = std::make_shared<ReceiveSession>(env_, conn, std::move(offer));
  add_session(session);
  session->start(conn, env_.cfg.auto_accept);
}

void TransferManager::handle_fetch(const std::shared_ptr<net::Connection>& conn, const std::vector<uint8_t>& payload) {
  auto req = protocol::Fetch::deserialize(payload);

  auto refuse = [&](const std::string& reason) {
    Logger::instance().info("[transfers] refusing fetch " + std::to_string(req.request_id) + " from " +
                            conn->peer_id() + ": " + reason);
    protocol::FetchFail f{req.request_id, reason};
    conn->send(protocol::MsgType::FETCH_FAIL, f.serialize());
  };

  auto source = find_shared(req.has_hash ? crypto::to_hex(req.file_hash) : std::string());
  if (!source) {
    refuse("file not shared");
    return;
  }
  if (req.request_id == 0 || id_in_use(req.request_id)) {
    refuse("transfer id in use");
    return;
  }
  if (sending_to(conn->peer_id(), source->descriptor().hash_hex())) {
    refuse("duplicate transfer");
    return;
  }

  Logger::instance().info("[transfers] " + conn->peer_id() + " fetches " + source->descriptor().name);
  auto session = std::make_shared<SendSession>(env_, req.request_id, conn->peer_id(), source);
  add_session(session);
  session->start_on(conn);
}

void TransferManager::handle_resume(const std::shared_ptr<net::Connection>& conn, const std::vector<uint8_t>& payload) {
  auto msg = protocol::Resume::deserialize(payload);
  auto session = get_session(msg.transfer_id);
  if (!session || session->peer_id() != conn->peer_id()) {
    Logger::instance().info("[transfers] RESUME for unknown transfer " + std::to_string(msg.transfer_id));
    protocol::OfferResp resp{msg.transfer_id, false, "unknown transfer", {}};
    conn->send(protocol::MsgType::RESUME_RESP, resp.serialize());
    return;
  }
  session->on_resume_request(conn, msg);
}

} // namespace dropway::transfer
