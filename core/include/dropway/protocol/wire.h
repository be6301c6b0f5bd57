#pragma once

#include "dropway/protocol/message.h"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace dropway::protocol {

// Big-endian payload builder.
class ByteWriter {
 public:
  void u8(uint8_t v) { buf_.push_back(v); }

  void u16(uint16_t v) {
    buf_.push_back(static_cast<uint8_t>(v >> 8));
    buf_.push_back(static_cast<uint8_t>(v));
  }

  void u32(uint32_t v) {
    for (int s = 24; s >= 0; s -= 8) buf_.push_back(static_cast<uint8_t>(v >> s));
  }

  void u64(uint64_t v) {
    for (int s = 56; s >= 0; s -= 8) buf_.push_back(static_cast<uint8_t>(v >> s));
  }

  void bytes(const uint8_t* p, size_t n) { buf_.insert(buf_.end(), p, p + n); }

  template <size_t N>
  void fixed(const std::array<uint8_t, N>& a) { bytes(a.data(), N); }

  // u16 length + bytes
  void str16(const std::string& s) {
    if (s.size() > 0xFFFF) throw ProtocolError("string field too long");
    u16(static_cast<uint16_t>(s.size()));
    buf_.insert(buf_.end(), s.begin(), s.end());
  }

  const std::vector<uint8_t>& data() const { return buf_; }
  std::vector<uint8_t> take() { return std::move(buf_); }

 private:
  std::vector<uint8_t> buf_;
};

// Bounds-checked reader; every failure throws ProtocolError naming the message.
class ByteReader {
 public:
  ByteReader(const std::vector<uint8_t>& buf, const char* what) : buf_(buf), what_(what) {}

  uint8_t u8() {
    need(1);
    return buf_[pos_++];
  }

  uint16_t u16() {
    need(2);
    uint16_t v = static_cast<uint16_t>((buf_[pos_] << 8) | buf_[pos_ + 1]);
    pos_ += 2;
    return v;
  }

  uint32_t u32() {
    need(4);
    uint32_t v = 0;
    for (int i = 0; i < 4; i++) v = (v << 8) | buf_[pos_ + i];
    pos_ += 4;
    return v;
  }

  uint64_t u64() {
    need(8);
    uint64_t v = 0;
    for (int i = 0; i < 8; i++) v = (v << 8) | buf_[pos_ + i];
    pos_ += 8;
    return v;
  }

  template <size_t N>
  std::array<uint8_t, N> fixed() {
    need(N);
    std::array<uint8_t, N> a{};
    for (size_t i = 0; i < N; i++) a[i] = buf_[pos_ + i];
    pos_ += N;
    return a;
  }

  std::string str16() {
    uint16_t n = u16();
    need(n);
    std::string s(reinterpret_cast<const char*>(buf_.data() + pos_), n);
    pos_ += n;
    return s;
  }

  std::vector<uint8_t> rest() {
    std::vector<uint8_t> out(buf_.begin() + static_cast<std::ptrdiff_t>(pos_), buf_.end());
    pos_ = buf_.size();
    return out;
  }

  size_t remaining() const { return buf_.size() - pos_; }

  void expect_end() const {
    if (pos_ != buf_.size()) throw ProtocolError(std::string(what_) + ": trailing bytes");
  }

 private:
  void need(size_t n) const {
    if (buf_.size() - pos_ < n) throw ProtocolError(std::string(what_) + ": payload too short");
  }

  const std::vector<uint8_t>& buf_;
  const char* what_;
  size_t pos_ = 0;
};

} // namespace dropway::protocol
