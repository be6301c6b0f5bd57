#include "dropway/node/node.h"
#include "dropway/crypto/digest.h"
#include "dropway/db/db.h"
#include "dropway/db/resume_repository.h"
#include "dropway/log/logger.h"
#include <future>
#include <stdexcept>

namespace dropway {

namespace {

Config with_identity(Config cfg) {
  if (cfg.peer_id.empty()) cfg.peer_id = crypto::generate_peer_id();
  return cfg;
}

} // namespace

std::unique_ptr<storage::ResumeStore> Node::make_resume_store() {
  if (!db::db_configured()) return std::make_unique<storage::MemoryResumeStore>();
  try {
    auto store = std::make_unique<db::PgResumeStore>(db::load_db_config_from_env());
    Logger::instance().info("[node] resume state persisted in PostgreSQL");
    return store;
  } catch (const db::DbError& e) {
    Logger::instance().error(std::string("[node] PostgreSQL resume store unavailable, keeping resume state in memory: ") +
                             e.what());
    return std::make_unique<storage::MemoryResumeStore>();
  }
}

Node::Node(Config cfg)
  : Node(std::move(cfg), make_resume_store()) {}

Node::Node(Config cfg, std::unique_ptr<storage::ResumeStore> resume)
  : cfg_(with_identity(std::move(cfg))),
    disk_(cfg_.disk_threads),
    chunks_(cfg_.chunk_size),
    files_(cfg_.download_dir),
    resume_(std::move(resume)) {
  if (!files_.initialize()) throw storage::StorageError("cannot create download directory " + cfg_.download_dir);

  net::ConnectionSettings settings;
  settings.local_peer_id = cfg_.peer_id;
  settings.address_timeout = cfg_.address_timeout;
  settings.handshake_timeout = cfg_.handshake_timeout;
  settings.idle_timeout = cfg_.idle_timeout;
  connections_ = std::make_unique<net::ConnectionManager>(io_, settings);
  listener_ = std::make_unique<net::PeerListener>(io_, cfg_.listen_port, *connections_);

  if (!cfg_.relay.empty()) {
    auto relay = Endpoint::parse(cfg_.relay);
    if (!relay) throw std::invalid_argument("malformed relay address: " + cfg_.relay);
    relay_agent_ = std::make_shared<relay::RelayAgent>(io_, *relay, cfg_.peer_id, *listener_, cfg_.idle_timeout);
  }

  transfer::SessionEnv env{io_, disk_, *connections_, chunks_, files_, *resume_, cfg_, cfg_.peer_id};
  transfers_ = std::make_unique<transfer::TransferManager>(env);
  tunnel_ = std::make_unique<web::StaticTunnel>(cfg_.public_origin);
}

Node::~Node() {
  stop();
}

void Node::start() {
  listener_->start();
  if (relay_agent_) relay_agent_->start();
  work_.emplace(boost::asio::make_work_guard(io_));
  io_thread_ = std::thread([this]() {
    for (;;) {
      try {
        io_.run();
        return;
      } catch (const std::exception& e) {
        Logger::instance().error(std::string("[node] io handler threw: ") + e.what());
      }
    }
  });
  Logger::instance().info("[node] peer " + cfg_.peer_id + " listening on port " + std::to_string(port()));
}

void Node::stop() {
  if (stopped_.exchange(true)) return;

  auto shutdown = [this]() {
    listener_->stop();
    if (relay_agent_) relay_agent_->stop();
    if (web_) web_->stop();
    connections_->close_all();
  };

  if (io_thread_.joinable()) {
    std::promise<void> done;
    auto fut = done.get_future();
    boost::asio::post(io_, [&]() {
      shutdown();
      done.set_value();
    });
    fut.wait();
    // queued behind the close notifications; session timers would keep run() busy
    boost::asio::post(io_, [this]() { io_.stop(); });
    io_thread_.join();
    work_.reset();
  } else {
    shutdown();
  }
  disk_.join();
  io_.stop();
  Logger::instance().info("[node] stopped");
}

Ticket Node::ticket() const {
  std::vector<Endpoint> addresses;
  for (const auto& a : cfg_.advertise) {
    auto ep = Endpoint::parse(a);
    if (!ep) throw std::invalid_argument("malformed advertised address: " + a);
    addresses.push_back(*ep);
  }
  if (addresses.empty()) addresses.push_back(Endpoint{"127.0.0.1", port()});

  std::optional<Endpoint> relay;
  if (!cfg_.relay.empty()) relay = Endpoint::parse(cfg_.relay);
  return Ticket(cfg_.peer_id, addresses, relay);
}

web::WebBridge& Node::start_web_bridge(uint16_t port) {
  if (web_) return *web_;
  if (port == 0) port = cfg_.http_port;
  web_ = std::make_unique<web::WebBridge>(
      io_, disk_, port,
      [this](const std::string& hash_hex) { return transfers_->find_shared(hash_hex); }, *tunnel_);
  web_->start();
  return *web_;
}

} // namespace dropway
