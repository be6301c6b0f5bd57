#include "dropway/web/tunnel.h"

namespace dropway::web {

StaticTunnel::StaticTunnel(std::string origin)
  : origin_(std::move(origin)) {
  while (!origin_.empty() && origin_.back() == '/') origin_.pop_back();
}

std::string StaticTunnel::publish(uint16_t local_port) {
  if (!origin_.empty()) return origin_;
  return "http://127.0.0.1:" + std::to_string(local_port);
}

} // namespace dropway::web
