#include "dropway/transfer/chunk_window.h"
#include <stdexcept>
#include <string>

namespace dropway::transfer {

AckTracker::AckTracker(uint32_t chunk_count) : bits_(chunk_count) {}

bool AckTracker::confirm(uint32_t index) {
  if (index >= bits_.size()) {
    throw std::out_of_range("chunk index " + std::to_string(index) + " out of range");
  }
  if (bits_.test(index)) return false;
  bits_.set(index);
  while (cursor_ < bits_.size() && bits_.test(cursor_)) cursor_++;
  return true;
}

bool AckTracker::is_confirmed(uint32_t index) const {
  return index < bits_.size() && bits_.test(index);
}

std::vector<uint32_t> AckTracker::confirmed_indices() const {
  std::vector<uint32_t> out;
  out.reserve(bits_.count());
  for (auto i = bits_.find_first(); i != boost::dynamic_bitset<>::npos; i = bits_.find_next(i)) {
    out.push_back(static_cast<uint32_t>(i));
  }
  return out;
}

SendWindow::SendWindow(uint32_t chunk_count, uint32_t window, uint32_t retry_budget)
  : acked_(chunk_count), window_(window), retry_budget_(retry_budget) {
  if (window_ == 0) throw std::invalid_argument("window must be positive");
}

void SendWindow::mark_confirmed(const std::vector<uint32_t>& have) {
  for (uint32_t idx : have) {
    acked_.confirm(idx);
    in_flight_.erase(idx);
    retransmit_.erase(idx);
  }
}

std::optional<uint32_t> SendWindow::next() {
  if (in_flight_.size() >= window_) return std::nullopt;

  while (!retransmit_.empty()) {
    uint32_t idx = *retransmit_.begin();
    retransmit_.erase(retransmit_.begin());
    if (acked_.is_confirmed(idx) || in_flight_.count(idx)) continue;
    in_flight_.insert(idx);
    return idx;
  }

  while (next_fresh_ < acked_.chunk_count()) {
    uint32_t idx = next_fresh_++;
    if (acked_.is_confirmed(idx) || in_flight_.count(idx)) continue;
    in_flight_.insert(idx);
    return idx;
  }
  return std::nullopt;
}

bool SendWindow::on_ack(uint32_t index) {
  bool was_in_flight = in_flight_.erase(index) != 0;
  retransmit_.erase(index);
  acked_.confirm(index);
  return was_in_flight;
}

bool SendWindow::on_nack(uint32_t index) {
  if (index >= acked_.chunk_count()) throw std::out_of_range("chunk index out of range");
  if (acked_.is_confirmed(index)) return true;
  uint32_t& count = nacks_[index];
  count++;
  in_flight_.erase(index);
  if (count > retry_budget_) return false;
  retransmit_.insert(index);
  return true;
}

void SendWindow::reset_in_flight() {
  for (uint32_t idx : in_flight_) retransmit_.insert(idx);
  in_flight_.clear();
}

} // namespace dropway::transfer
