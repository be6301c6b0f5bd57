#include "dropway/protocol/message.h"
#include <cstring>

namespace dropway::protocol {

std::vector<uint8_t> make_frame(MsgType type, const std::vector<uint8_t>& payload) {
  if (payload.size() > MAX_PAYLOAD) throw ProtocolError("payload too large");
  MessageHeaderWire h = make_header(type, static_cast<uint32_t>(payload.size()));

  std::vector<uint8_t> out(sizeof(h) + payload.size());
  std::memcpy(out.data(), &h, sizeof(h));
  if (!payload.empty()) std::memcpy(out.data() + sizeof(h), payload.data(), payload.size());
  return out;
}

const char* msg_type_name(MsgType type) {
  switch (type) {
    case MsgType::HELLO: return "HELLO";
    case MsgType::HELLO_ACK: return "HELLO_ACK";
    case MsgType::PING: return "PING";
    case MsgType::PONG: return "PONG";
    case MsgType::RELAY_REGISTER: return "RELAY_REGISTER";
    case MsgType::RELAY_CONNECT: return "RELAY_CONNECT";
    case MsgType::RELAY_PAIRED: return "RELAY_PAIRED";
    case MsgType::RELAY_FAIL: return "RELAY_FAIL";
    case MsgType::OFFER: return "OFFER";
    case MsgType::OFFER_RESP: return "OFFER_RESP";
    case MsgType::CHUNK: return "CHUNK";
    case MsgType::CHUNK_ACK: return "CHUNK_ACK";
    case MsgType::CHUNK_NACK: return "CHUNK_NACK";
    case MsgType::RESUME: return "RESUME";
    case MsgType::RESUME_RESP: return "RESUME_RESP";
    case MsgType::CANCEL: return "CANCEL";
    case MsgType::RESULT: return "RESULT";
    case MsgType::FETCH: return "FETCH";
    case MsgType::FETCH_FAIL: return "FETCH_FAIL";
  }
  return "UNKNOWN";
}

} // namespace dropway::protocol
