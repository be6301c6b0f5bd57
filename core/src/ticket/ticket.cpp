#include "dropway/ticket/ticket.h"
#include "dropway/protocol/wire.h"
#include <boost/crc.hpp>
#include <cctype>
#include <string_view>

namespace dropway {

namespace {

const char* kAlphabet = "abcdefghijklmnopqrstuvwxyz234567";

std::string base32_encode(const std::vector<uint8_t>& in) {
  std::string out;
  uint32_t buffer = 0;
  int bits = 0;
  for (uint8_t b : in) {
    buffer = (buffer << 8) | b;
    bits += 8;
    while (bits >= 5) {
      out.push_back(kAlphabet[(buffer >> (bits - 5)) & 0x1F]);
      bits -= 5;
    }
  }
  if (bits > 0) out.push_back(kAlphabet[(buffer << (5 - bits)) & 0x1F]);
  return out;
}

std::vector<uint8_t> base32_decode(const std::string& in) {
  std::vector<uint8_t> out;
  uint32_t buffer = 0;
  int bits = 0;
  for (char c : in) {
    int v;
    if (c >= 'a' && c <= 'z') v = c - 'a';
    else if (c >= '2' && c <= '7') v = c - '2' + 26;
    else throw TicketDecodeError("ticket: invalid character");
    buffer = (buffer << 5) | static_cast<uint32_t>(v);
    bits += 5;
    if (bits >= 8) {
      out.push_back(static_cast<uint8_t>(buffer >> (bits - 8)));
      bits -= 8;
    }
  }
  // leftover bits are padding and must be zero
  if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0) {
    throw TicketDecodeError("ticket: non-canonical encoding");
  }
  return out;
}

uint32_t crc32_of(const uint8_t* p, size_t n) {
  boost::crc_32_type crc;
  crc.process_bytes(p, n);
  return crc.checksum();
}

Endpoint parse_endpoint_or_throw(const std::string& s) {
  auto ep = Endpoint::parse(s);
  if (!ep) throw TicketDecodeError("ticket: malformed address '" + s + "'");
  return *ep;
}

} // namespace

std::string Endpoint::to_string() const {
  if (host.find(':') != std::string::npos) return "[" + host + "]:" + std::to_string(port);
  return host + ":" + std::to_string(port);
}

std::optional<Endpoint> Endpoint::parse(const std::string& s) {
  auto colon = s.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= s.size()) return std::nullopt;
  std::string host = s.substr(0, colon);
  std::string port = s.substr(colon + 1);
  if (host.front() == '[') {
    if (host.size() < 3 || host.back() != ']') return std::nullopt;
    host = host.substr(1, host.size() - 2);
  } else if (host.find(':') != std::string::npos) {
    return std::nullopt;
  }
  if (port.size() > 5) return std::nullopt;
  for (char c : port) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }
  unsigned long p = std::stoul(port);
  if (p == 0 || p > 65535) return std::nullopt;
  return Endpoint{host, static_cast<uint16_t>(p)};
}

Ticket::Ticket(std::string peer_id, std::vector<Endpoint> addresses, std::optional<Endpoint> relay)
  : peer_id_(std::move(peer_id)), addresses_(std::move(addresses)), relay_(std::move(relay)) {
  if (peer_id_.empty()) throw std::invalid_argument("ticket: empty peer id");
  if (addresses_.size() > 255) throw std::invalid_argument("ticket: too many addresses");
}

// body:
// u8 version
// u16 peer_id_len, bytes peer_id
// u8 address_count, then u16 len + "host:port" each
// u8 has_relay, then u16 len + "host:port"
// u32 crc32 of the above
std::string Ticket::encode() const {
  protocol::ByteWriter w;
  w.u8(VERSION);
  w.str16(peer_id_);
  w.u8(static_cast<uint8_t>(addresses_.size()));
  for (const auto& a : addresses_) w.str16(a.to_string());
  w.u8(relay_ ? 1 : 0);
  if (relay_) w.str16(relay_->to_string());
  w.u32(crc32_of(w.data().data(), w.data().size()));
  return std::string(PREFIX) + std::to_string(VERSION) + base32_encode(w.data());
}

Ticket Ticket::decode(const std::string& text) {
  const std::string prefix = std::string(PREFIX) + std::to_string(VERSION);
  std::string_view sv(text);
  if (sv.substr(0, std::string_view(PREFIX).size()) != PREFIX) {
    throw TicketDecodeError("ticket: missing prefix");
  }
  if (sv.substr(0, prefix.size()) != prefix) {
    throw TicketDecodeError("ticket: unsupported version");
  }

  std::vector<uint8_t> body = base32_decode(text.substr(prefix.size()));
  if (body.size() < 5) throw TicketDecodeError("ticket: too short");

  size_t covered = body.size() - 4;
  uint32_t stored = (uint32_t(body[covered]) << 24) | (uint32_t(body[covered + 1]) << 16) |
                    (uint32_t(body[covered + 2]) << 8) | uint32_t(body[covered + 3]);
  if (crc32_of(body.data(), covered) != stored) throw TicketDecodeError("ticket: checksum mismatch");
  body.resize(covered);

  try {
    protocol::ByteReader r(body, "ticket");
    if (r.u8() != VERSION) throw TicketDecodeError("ticket: unsupported version");
    std::string peer_id = r.str16();
    if (peer_id.empty()) throw TicketDecodeError("ticket: empty peer id");
    uint8_t count = r.u8();
    std::vector<Endpoint> addresses;
    addresses.reserve(count);
    for (uint8_t i = 0; i < count; i++) addresses.push_back(parse_endpoint_or_throw(r.str16()));
    uint8_t has_relay = r.u8();
    if (has_relay > 1) throw TicketDecodeError("ticket: bad relay flag");
    std::optional<Endpoint> relay;
    if (has_relay) relay = parse_endpoint_or_throw(r.str16());
    r.expect_end();
    return Ticket(std::move(peer_id), std::move(addresses), std::move(relay));
  } catch (const protocol::ProtocolError& e) {
    throw TicketDecodeError(e.what());
  }
}

std::string encode_ticket(const std::string& peer_id, const std::vector<Endpoint>& addresses,
                          const std::optional<Endpoint>& relay) {
  return Ticket(peer_id, addresses, relay).encode();
}

} // namespace dropway
