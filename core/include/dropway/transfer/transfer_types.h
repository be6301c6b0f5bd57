#pragma once

#include <cstdint>
#include <string>

namespace dropway::transfer {

enum class Direction { Send, Receive };

enum class SessionState {
  Initiating,    // sender: building the offer / dialing; receiver: FETCH sent
  Negotiating,   // offer on the wire, waiting for accept or reject
  Transferring,
  Resuming,      // connection lost, acknowledgement state kept
  Completed,
  Cancelled,
  Failed
};

// Sent as the RESULT reason code, so the values are part of the wire format.
enum class FailureReason : uint8_t {
  None = 0,
  Unreachable = 1,
  Rejected = 2,
  IntegrityMismatch = 3,
  Timeout = 4,
  CancelledByPeer = 5,
  Internal = 6   // local disk or file error
};

const char* to_string(Direction d);
const char* to_string(SessionState s);
const char* to_string(FailureReason r);

FailureReason failure_from_code(uint8_t code);

inline bool is_terminal(SessionState s) {
  return s == SessionState::Completed || s == SessionState::Cancelled || s == SessionState::Failed;
}

// Snapshot handed to the GUI / CLI.
struct TransferStatus {
  uint64_t id = 0;
  Direction direction = Direction::Send;
  SessionState state = SessionState::Initiating;
  std::string peer_id;
  std::string file_name;
  std::string file_hash_hex;
  uint32_t chunks_acked = 0;
  uint32_t chunk_count = 0;
  uint64_t bytes_acked = 0;
  uint64_t total_bytes = 0;
  uint32_t redundant_chunks = 0;  // receiver: chunks that arrived already confirmed
  FailureReason failure = FailureReason::None;
  std::string detail;
  std::string target_path;        // receiver: .part while running, final path once completed
};

} // namespace dropway::transfer
