#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>
#include <arpa/inet.h>

namespace dropway::protocol {

static constexpr uint32_t MAGIC = 0x44525731; // "DRW1"
static constexpr uint8_t  VERSION = 1;
static constexpr size_t   HEADER_SIZE = 12;
static constexpr uint32_t MAX_PAYLOAD = 16 * 1024 * 1024;

enum class MsgType : uint8_t {
  HELLO     = 1,
  HELLO_ACK = 2,
  PING      = 3,
  PONG      = 4,
  // Relay rendezvous
  RELAY_REGISTER = 10,
  RELAY_CONNECT  = 11,
  RELAY_PAIRED   = 12,
  RELAY_FAIL     = 13,
  // Transfer
  OFFER       = 30,
  OFFER_RESP  = 31,
  CHUNK       = 32,
  CHUNK_ACK   = 33,
  CHUNK_NACK  = 34,
  RESUME      = 35,
  RESUME_RESP = 36,
  CANCEL      = 37,
  RESULT      = 38,
  // Pull mode
  FETCH      = 40,
  FETCH_FAIL = 41
};

class ProtocolError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

#pragma pack(push, 1)
struct MessageHeaderWire {
  uint32_t magic_be;   // network order
  uint8_t  version;
  uint8_t  type;
  uint32_t len_be;     // network order
  uint16_t reserved_be; // network order (0 for now)
};
#pragma pack(pop)

static_assert(sizeof(MessageHeaderWire) == HEADER_SIZE, "header layout");

inline MessageHeaderWire make_header(MsgType type, uint32_t len) {
  MessageHeaderWire h{};
  h.magic_be = htonl(MAGIC);
  h.version  = VERSION;
  h.type     = static_cast<uint8_t>(type);
  h.len_be   = htonl(len);
  h.reserved_be = htons(0);
  return h;
}

inline void validate_header(const MessageHeaderWire& h) {
  if (ntohl(h.magic_be) != MAGIC) throw ProtocolError("bad magic");
  if (h.version != VERSION) throw ProtocolError("bad version");
  if (ntohl(h.len_be) > MAX_PAYLOAD) throw ProtocolError("payload too large");
}

inline uint32_t payload_len(const MessageHeaderWire& h) {
  return ntohl(h.len_be);
}

// header + payload, ready for the socket
std::vector<uint8_t> make_frame(MsgType type, const std::vector<uint8_t>& payload);

const char* msg_type_name(MsgType type);

} // namespace dropway::protocol
