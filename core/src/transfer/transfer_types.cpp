#include "dropway/transfer/transfer_types.h"

namespace dropway::transfer {

const char* to_string(Direction d) {
  return d == Direction::Send ? "send" : "receive";
}

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::Initiating: return "initiating";
    case SessionState::Negotiating: return "negotiating";
    case SessionState::Transferring: return "transferring";
    case SessionState::Resuming: return "resuming";
    case SessionState::Completed: return "completed";
    case SessionState::Cancelled: return "cancelled";
    case SessionState::Failed: return "failed";
  }
  return "?";
}

const char* to_string(FailureReason r) {
  switch (r) {
    case FailureReason::None: return "none";
    case FailureReason::Unreachable: return "unreachable";
    case FailureReason::Rejected: return "rejected";
    case FailureReason::IntegrityMismatch: return "integrity mismatch";
    case FailureReason::Timeout: return "timeout";
    case FailureReason::CancelledByPeer: return "cancelled by peer";
    case FailureReason::Internal: return "internal error";
  }
  return "?";
}

FailureReason failure_from_code(uint8_t code) {
  if (code > static_cast<uint8_t>(FailureReason::Internal)) return FailureReason::Internal;
  return static_cast<FailureReason>(code);
}

} // namespace dropway::transfer
