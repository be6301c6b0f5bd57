#include <boost/asio.hpp>
#include <iostream>
#include "dropway/common/config.h"
#include "dropway/log/logger.h"
#include "dropway/relay/relay_server.h"

// Standalone relay: dropway-relay [port]  (default DROPWAY_RELAY_PORT or 7000)
int main(int argc, char** argv) {
  uint16_t port = 7000;
  try {
    port = (uint16_t)std::stoi(dropway::getenv_or("DROPWAY_RELAY_PORT", "7000"));
    if (argc >= 2) port = (uint16_t)std::stoi(argv[1]);
  } catch (const std::exception& e) {
    std::cerr << "[relay] bad port: " << e.what() << "\n";
    return 2;
  }

  dropway::Logger::instance().init(dropway::getenv_or("DROPWAY_LOG_PATH", "./dropway-relay.log"),
                                   dropway::getenv_or("DROPWAY_LOG_STDERR", "0") == "1",
                                   dropway::getenv_or("DROPWAY_LOG_DEBUG", "0") == "1");

  try {
    boost::asio::io_context io;
    dropway::relay::RelayServer server(io, port);
    server.start();
    std::cout << "[relay] listening on port " << server.port() << "\n";
    io.run();
  } catch (const std::exception& e) {
    std::cerr << "[relay] FATAL: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
