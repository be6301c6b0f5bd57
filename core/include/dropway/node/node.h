#pragma once

#include "dropway/common/config.h"
#include "dropway/net/connection_manager.h"
#include "dropway/net/peer_listener.h"
#include "dropway/relay/relay_agent.h"
#include "dropway/storage/chunk_store.h"
#include "dropway/storage/file_store.h"
#include "dropway/storage/resume_store.h"
#include "dropway/ticket/ticket.h"
#include "dropway/transfer/transfer_manager.h"
#include "dropway/web/tunnel.h"
#include "dropway/web/web_bridge.h"
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace dropway {

// One running peer: io thread, disk pool, connection pool, listener,
// optional relay registration, transfer registry and optional web bridge.
class Node {
public:
  // Binds the peer listener. Throws on bind failure or an unusable download directory.
  explicit Node(Config cfg);

  // `resume` replaces the store chosen from the environment.
  Node(Config cfg, std::unique_ptr<storage::ResumeStore> resume);

  ~Node();

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  // Starts accepting peers, registers at the relay and runs the io thread.
  void start();

  // Closes every connection and joins the io thread and the disk pool.
  // Sessions are not cancelled, so their partial data stays resumable.
  void stop();

  const std::string& peer_id() const { return cfg_.peer_id; }
  uint16_t port() const { return listener_->port(); }
  const Config& config() const { return cfg_; }

  // Advertised addresses (or 127.0.0.1:<port>) plus the configured relay.
  Ticket ticket() const;

  transfer::TransferManager& transfers() { return *transfers_; }
  net::ConnectionManager& connections() { return *connections_; }
  storage::ResumeStore& resume_store() { return *resume_; }
  boost::asio::io_context& io() { return io_; }

  // Serves shared files over HTTP. Port 0 picks cfg.http_port (ephemeral if 0 too).
  web::WebBridge& start_web_bridge(uint16_t port = 0);
  web::WebBridge* web_bridge() { return web_.get(); }

private:
  static std::unique_ptr<storage::ResumeStore> make_resume_store();

  boost::asio::io_context io_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  Config cfg_;
  boost::asio::thread_pool disk_;

  storage::ChunkStore chunks_;
  storage::FileStore files_;
  std::unique_ptr<storage::ResumeStore> resume_;

  std::unique_ptr<net::ConnectionManager> connections_;
  std::unique_ptr<net::PeerListener> listener_;
  std::shared_ptr<relay::RelayAgent> relay_agent_;
  std::unique_ptr<transfer::TransferManager> transfers_;

  std::unique_ptr<web::StaticTunnel> tunnel_;
  std::unique_ptr<web::WebBridge> web_;

  std::thread io_thread_;
  std::atomic<bool> stopped_{false};
};

} // namespace dropway
