#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "dropway/common/config.h"
#include "dropway/log/logger.h"
#include "dropway/node/node.h"
#include "dropway/relay/relay_server.h"

using dropway::transfer::SessionState;
using dropway::transfer::TransferStatus;

static void usage() {
  std::cerr << "usage:\n"
               "  dropway listen                 receive offers (accept/reject/cancel/list/quit on stdin)\n"
               "  dropway send <ticket> <path>   push a file, or every file of a directory, to a peer\n"
               "  dropway share <path>           let peers fetch a file with our ticket\n"
               "  dropway fetch <ticket> [hash]  download a file a peer shares\n"
               "  dropway web <path>             share a file over HTTP\n"
               "  dropway relay [port]           run a relay\n";
}

// Prints state changes and every tenth of progress.
class StatusPrinter {
public:
  void operator()(const TransferStatus& st) {
    std::lock_guard<std::mutex> lock(mu_);
    auto& last = seen_[st.id];
    int tenth = st.chunk_count ? int(uint64_t(st.chunks_acked) * 10 / st.chunk_count) : 0;
    if (last.first == int(st.state) + 1 && last.second == tenth) return;
    last = {int(st.state) + 1, tenth};

    std::cout << "[" << st.id << "] " << dropway::transfer::to_string(st.direction) << " "
              << (st.file_name.empty() ? st.file_hash_hex : st.file_name) << " "
              << dropway::transfer::to_string(st.state) << " " << st.chunks_acked << "/" << st.chunk_count
              << " chunks, " << st.bytes_acked << "/" << st.total_bytes << " bytes";
    if (st.failure != dropway::transfer::FailureReason::None) {
      std::cout << " (" << dropway::transfer::to_string(st.failure) << ")";
    }
    if (!st.detail.empty()) std::cout << ": " << st.detail;
    std::cout << std::endl;
  }

private:
  std::mutex mu_;
  std::map<uint64_t, std::pair<int, int>> seen_;
};

// Blocks until transfer `id` reaches a terminal state.
static TransferStatus wait_for(dropway::Node& node, uint64_t id) {
  struct Waiter {
    std::mutex mu;
    std::condition_variable cv;
    std::optional<TransferStatus> final;
  };
  // the subscriber may still be running after unsubscribe() returns
  auto w = std::make_shared<Waiter>();
  auto token = node.transfers().subscribe([w, id](const TransferStatus& st) {
    if (st.id != id || !dropway::transfer::is_terminal(st.state)) return;
    std::lock_guard<std::mutex> lock(w->mu);
    w->final = st;
    w->cv.notify_all();
  });

  TransferStatus last;
  {
    std::unique_lock<std::mutex> lock(w->mu);
    w->cv.wait(lock, [&]() {
      if (w->final) {
        last = *w->final;
        return true;
      }
      // finished before we subscribed
      auto st = node.transfers().status(id);
      if (st) last = *st;
      return st && dropway::transfer::is_terminal(st->state);
    });
  }
  node.transfers().unsubscribe(token);
  return last;
}

// accept/reject/cancel/list on stdin until quit or EOF.
static void command_loop(dropway::Node& node) {
  std::string line;
  while (std::getline(std::cin, line)) {
    auto words = dropway::split_list(line, ' ');
    if (words.empty()) continue;
    const std::string& cmd = words[0];
    if (cmd == "quit" || cmd == "exit") break;
    if (cmd == "list") {
      for (const auto& st : node.transfers().list()) {
        std::cout << st.id << " " << dropway::transfer::to_string(st.direction) << " " << st.file_name << " "
                  << dropway::transfer::to_string(st.state) << " " << st.chunks_acked << "/" << st.chunk_count << "\n";
      }
      continue;
    }
    if (words.size() < 2) {
      std::cout << "usage: accept|reject|cancel|discard <id>\n";
      continue;
    }
    uint64_t id = 0;
    try {
      id = std::stoull(words[1]);
    } catch (const std::exception&) {
      std::cout << "bad transfer id: " << words[1] << "\n";
      continue;
    }
    bool known = false;
    if (cmd == "accept") known = node.transfers().accept(id);
    else if (cmd == "reject") known = node.transfers().reject(id, "rejected by user");
    else if (cmd == "cancel") known = node.transfers().cancel(id, false);
    else if (cmd == "discard") known = node.transfers().cancel(id, true);
    else {
      std::cout << "unknown command: " << cmd << "\n";
      continue;
    }
    if (!known) std::cout << "no such transfer: " << id << "\n";
  }
}

static int run_relay(int argc, char** argv) {
  uint16_t port = 7000;
  if (argc >= 3) port = (uint16_t)std::stoi(argv[2]);
  boost::asio::io_context io;
  dropway::relay::RelayServer server(io, port);
  server.start();
  std::cout << "relay listening on port " << server.port() << std::endl;
  io.run();
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    usage();
    return 2;
  }
  const std::string cmd = argv[1];

  try {
    dropway::Config cfg = dropway::Config::from_env();
    dropway::Logger::instance().init(cfg.log_path, cfg.log_stderr, cfg.log_debug);

    if (cmd == "relay") return run_relay(argc, argv);

    if (cmd == "fetch" || cmd == "share" || cmd == "web") cfg.auto_accept = true;
    dropway::Node node(cfg);
    StatusPrinter printer;
    node.transfers().subscribe([&printer](const TransferStatus& st) { printer(st); });
    node.start();

    if (cmd == "listen") {
      std::cout << "ticket: " << node.ticket().encode() << std::endl;
      command_loop(node);
      node.stop();
      return 0;
    }

    if (cmd == "send" && argc >= 4) {
      auto ticket = dropway::Ticket::decode(argv[2]);
      std::vector<uint64_t> ids;
      if (std::filesystem::is_directory(argv[3])) {
        ids = node.transfers().send_directory(ticket, argv[3]);
        std::cout << "sending " << ids.size() << " files" << std::endl;
      } else {
        ids.push_back(node.transfers().send_file(ticket, argv[3]));
      }
      size_t completed = 0;
      for (uint64_t id : ids) {
        if (wait_for(node, id).state == SessionState::Completed) completed++;
      }
      if (ids.size() > 1) std::cout << completed << "/" << ids.size() << " files sent" << std::endl;
      node.stop();
      return completed == ids.size() ? 0 : 1;
    }

    if (cmd == "fetch" && argc >= 3) {
      auto ticket = dropway::Ticket::decode(argv[2]);
      uint64_t id = node.transfers().fetch(ticket, argc >= 4 ? argv[3] : "");
      auto st = wait_for(node, id);
      if (st.state == SessionState::Completed) std::cout << "saved " << st.target_path << std::endl;
      node.stop();
      return st.state == SessionState::Completed ? 0 : 1;
    }

    if ((cmd == "share" || cmd == "web") && argc >= 3) {
      auto desc = node.transfers().share_file(argv[2]);
      std::cout << "sharing " << desc.name << " (" << desc.size << " bytes, " << desc.hash_hex() << ")\n";
      std::cout << "ticket: " << node.ticket().encode() << std::endl;
      if (cmd == "web") {
        auto& bridge = node.start_web_bridge();
        std::cout << "url: " << bridge.url_for(desc.hash_hex()) << std::endl;
      }
      command_loop(node);
      node.stop();
      return 0;
    }

    usage();
    node.stop();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "dropway: " << e.what() << "\n";
    return 1;
  }
}
