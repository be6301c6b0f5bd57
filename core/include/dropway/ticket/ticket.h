#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dropway {

class TicketDecodeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct Endpoint {
  std::string host;
  uint16_t port = 0;

  std::string to_string() const;
  // "host:port" or "[v6]:port"; nullopt when malformed
  static std::optional<Endpoint> parse(const std::string& s);

  bool operator==(const Endpoint& o) const { return host == o.host && port == o.port; }
};

// How to reach a peer. Immutable once built.
class Ticket {
 public:
  static constexpr uint8_t VERSION = 1;
  static constexpr const char* PREFIX = "dropway";

  Ticket(std::string peer_id, std::vector<Endpoint> addresses, std::optional<Endpoint> relay);

  const std::string& peer_id() const { return peer_id_; }
  const std::vector<Endpoint>& addresses() const { return addresses_; }
  const std::optional<Endpoint>& relay() const { return relay_; }

  std::string encode() const;

  // Throws TicketDecodeError; never yields a partially filled ticket.
  static Ticket decode(const std::string& text);

  bool operator==(const Ticket& o) const {
    return peer_id_ == o.peer_id_ && addresses_ == o.addresses_ && relay_ == o.relay_;
  }

 private:
  std::string peer_id_;
  std::vector<Endpoint> addresses_;
  std::optional<Endpoint> relay_;
};

std::string encode_ticket(const std::string& peer_id, const std::vector<Endpoint>& addresses,
                          const std::optional<Endpoint>& relay);

} // namespace dropway
