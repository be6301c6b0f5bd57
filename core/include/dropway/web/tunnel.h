#pragma once

#include <cstdint>
#include <string>

namespace dropway::web {

// Maps a local port to an origin reachable by the recipient's browser.
class TunnelProvider {
 public:
  virtual ~TunnelProvider() = default;

  // Returns the public origin, e.g. "https://abc.example.net" (no trailing slash).
  virtual std::string publish(uint16_t local_port) = 0;
  virtual void unpublish() {}
};

// No tunnel: a fixed origin (DROPWAY_PUBLIC_ORIGIN), or http://127.0.0.1:<port>.
class StaticTunnel : public TunnelProvider {
 public:
  explicit StaticTunnel(std::string origin = "");

  std::string publish(uint16_t local_port) override;

 private:
  std::string origin_;
};

} // namespace dropway::web
