#pragma once

#include "dropway/protocol/wire.h"
#include <string>
#include <vector>

namespace dropway::protocol {

// HELLO payload format:
// u16 peer_id_len, bytes peer_id           (dialer's identity)
// u16 expected_len, bytes expected_peer_id (who the dialer thinks it reached; may be empty)

struct Hello {
  std::string peer_id;
  std::string expected_peer_id;

  static Hello deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "HELLO");
    Hello h;
    h.peer_id = r.str16();
    h.expected_peer_id = r.str16();
    r.expect_end();
    if (h.peer_id.empty()) throw ProtocolError("HELLO: empty peer id");
    return h;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.str16(peer_id);
    w.str16(expected_peer_id);
    return w.take();
  }
};

// HELLO_ACK payload format:
// u16 peer_id_len, bytes peer_id (listener's identity)

struct HelloAck {
  std::string peer_id;

  static HelloAck deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "HELLO_ACK");
    HelloAck a;
    a.peer_id = r.str16();
    r.expect_end();
    if (a.peer_id.empty()) throw ProtocolError("HELLO_ACK: empty peer id");
    return a;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.str16(peer_id);
    return w.take();
  }
};

// RELAY_REGISTER / RELAY_CONNECT payload format:
// u16 peer_id_len, bytes peer_id
// REGISTER names the listener parking a standby socket, CONNECT names the peer to reach.

struct RelayPeer {
  std::string peer_id;

  static RelayPeer deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "RELAY");
    RelayPeer p;
    p.peer_id = r.str16();
    r.expect_end();
    if (p.peer_id.empty()) throw ProtocolError("RELAY: empty peer id");
    return p;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.str16(peer_id);
    return w.take();
  }
};

// RELAY_FAIL payload format:
// u16 reason_len, bytes reason

struct RelayFail {
  std::string reason;

  static RelayFail deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "RELAY_FAIL");
    RelayFail f;
    f.reason = r.str16();
    return f;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.str16(reason);
    return w.take();
  }
};

} // namespace dropway::protocol
