#pragma once

#include <boost/dynamic_bitset.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace dropway::transfer {

// Set of confirmed chunk indices plus the resume cursor: the lowest index
// not yet confirmed. The cursor only moves forward and never passes a gap.
class AckTracker {
 public:
  explicit AckTracker(uint32_t chunk_count);

  // true when newly confirmed. Throws std::out_of_range on a bad index.
  bool confirm(uint32_t index);
  bool is_confirmed(uint32_t index) const;

  uint32_t cursor() const { return cursor_; }
  uint32_t chunk_count() const { return static_cast<uint32_t>(bits_.size()); }
  uint32_t confirmed_count() const { return static_cast<uint32_t>(bits_.count()); }
  bool complete() const { return cursor_ == bits_.size(); }

  // ascending
  std::vector<uint32_t> confirmed_indices() const;

 private:
  boost::dynamic_bitset<> bits_;
  uint32_t cursor_ = 0;
};

// Sender flow control: at most `window` unacknowledged chunks, ascending
// order, retransmissions ahead of fresh chunks, a per-chunk NACK budget.
class SendWindow {
 public:
  SendWindow(uint32_t chunk_count, uint32_t window, uint32_t retry_budget);

  // Chunks the receiver already holds; never sent afterwards.
  void mark_confirmed(const std::vector<uint32_t>& have);

  // Next chunk to put on the wire, nullopt when the window is full or nothing is left.
  std::optional<uint32_t> next();

  // false for an index that was not in flight (late or duplicate ACK)
  bool on_ack(uint32_t index);

  // Queues the chunk again; false once the chunk exceeded its retry budget.
  bool on_nack(uint32_t index);

  // Connection lost: every in-flight chunk goes back to the retransmit queue.
  void reset_in_flight();

  size_t in_flight() const { return in_flight_.size(); }
  bool is_in_flight(uint32_t index) const { return in_flight_.count(index) != 0; }
  bool done() const { return acked_.complete(); }
  const AckTracker& acked() const { return acked_; }

 private:
  AckTracker acked_;
  uint32_t window_;
  uint32_t retry_budget_;
  uint32_t next_fresh_ = 0;
  std::set<uint32_t> in_flight_;
  std::set<uint32_t> retransmit_;
  std::map<uint32_t, uint32_t> nacks_;
};

} // namespace dropway::transfer
