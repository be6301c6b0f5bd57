#pragma once

#include "dropway/crypto/digest.h"
#include "dropway/protocol/wire.h"
#include <cstdint>
#include <string>
#include <vector>

namespace dropway::protocol {

// Chunk index sets travel as runs:
// u32 run_count, then per run: u32 first_index, u32 length
// Runs are ascending and disjoint; every index is below `limit`.

inline void write_index_set(ByteWriter& w, const std::vector<uint32_t>& sorted) {
  std::vector<std::pair<uint32_t, uint32_t>> runs;
  for (uint32_t idx : sorted) {
    if (!runs.empty() && runs.back().first + runs.back().second == idx) {
      runs.back().second++;
    } else {
      runs.emplace_back(idx, 1);
    }
  }
  w.u32(static_cast<uint32_t>(runs.size()));
  for (const auto& run : runs) {
    w.u32(run.first);
    w.u32(run.second);
  }
}

inline std::vector<uint32_t> read_index_set(ByteReader& r, uint32_t limit) {
  uint32_t n = r.u32();
  if (n > r.remaining() / 8) throw ProtocolError("index set: run count exceeds payload");
  std::vector<uint32_t> out;
  uint64_t floor = 0;
  for (uint32_t i = 0; i < n; i++) {
    uint32_t first = r.u32();
    uint32_t len = r.u32();
    if (len == 0 || first < floor || uint64_t(first) + len > limit) {
      throw ProtocolError("index set: bad run");
    }
    for (uint32_t k = 0; k < len; k++) out.push_back(first + k);
    floor = uint64_t(first) + len;
  }
  return out;
}

// OFFER payload format:
// u64 transfer_id
// u64 request_id (FETCH that triggered this offer, 0 when pushed)
// u16 name_len, bytes file_name
// u64 file_size
// u32 chunk_size
// u32 chunk_count
// 32  file_hash (SHA-256)
// 32 * chunk_count  chunk hashes, index order

struct Offer {
  uint64_t transfer_id = 0;
  uint64_t request_id = 0;
  std::string file_name;
  uint64_t file_size = 0;
  uint32_t chunk_size = 0;
  uint32_t chunk_count = 0;
  crypto::Digest file_hash{};
  std::vector<crypto::Digest> chunk_hashes;

  // Largest chunk count whose hash list still fits in one frame.
  static uint32_t max_chunk_count(size_t name_len) {
    const size_t fixed = 8 + 8 + 2 + name_len + 8 + 4 + 4 + 32;
    if (fixed >= MAX_PAYLOAD) return 0;
    return static_cast<uint32_t>((MAX_PAYLOAD - fixed) / 32);
  }

  static Offer deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "OFFER");
    Offer o;
    o.transfer_id = r.u64();
    o.request_id = r.u64();
    o.file_name = r.str16();
    o.file_size = r.u64();
    o.chunk_size = r.u32();
    o.chunk_count = r.u32();
    o.file_hash = r.fixed<32>();
    if (o.chunk_size == 0) throw ProtocolError("OFFER: zero chunk size");
    uint64_t expected = (o.file_size + o.chunk_size - 1) / o.chunk_size;
    if (expected != o.chunk_count) throw ProtocolError("OFFER: chunk count does not match size");
    if (r.remaining() != size_t(o.chunk_count) * 32) throw ProtocolError("OFFER: chunk hash list length");
    o.chunk_hashes.reserve(o.chunk_count);
    for (uint32_t i = 0; i < o.chunk_count; i++) o.chunk_hashes.push_back(r.fixed<32>());
    r.expect_end();
    if (o.file_name.empty()) throw ProtocolError("OFFER: empty file name");
    return o;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.u64(transfer_id);
    w.u64(request_id);
    w.str16(file_name);
    w.u64(file_size);
    w.u32(chunk_size);
    w.u32(chunk_count);
    w.fixed(file_hash);
    for (const auto& h : chunk_hashes) w.fixed(h);
    return w.take();
  }
};

// OFFER_RESP and RESUME_RESP payload format:
// u64 transfer_id
// u8  status (0=OK, 1=REFUSED)
// u16 reason_len, bytes reason (empty if OK)
// index set of chunks the receiver already holds (empty when sent by a sender)

struct OfferResp {
  uint64_t transfer_id = 0;
  bool ok = false;
  std::string reason;
  std::vector<uint32_t> have;

  static OfferResp deserialize(const std::vector<uint8_t>& payload, uint32_t chunk_count) {
    ByteReader r(payload, "OFFER_RESP");
    OfferResp resp;
    resp.transfer_id = r.u64();
    resp.ok = (r.u8() == 0);
    resp.reason = r.str16();
    resp.have = read_index_set(r, chunk_count);
    r.expect_end();
    return resp;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.u64(transfer_id);
    w.u8(ok ? 0 : 1);
    w.str16(reason);
    write_index_set(w, have);
    return w.take();
  }
};

// CHUNK payload format:
// u64 transfer_id
// u32 chunk_index
// 32  chunk hash as computed by the sender
// bytes chunk_data (rest of payload)

struct ChunkMsg {
  uint64_t transfer_id = 0;
  uint32_t chunk_index = 0;
  crypto::Digest hash{};
  std::vector<uint8_t> data;

  static ChunkMsg deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "CHUNK");
    ChunkMsg c;
    c.transfer_id = r.u64();
    c.chunk_index = r.u32();
    c.hash = r.fixed<32>();
    c.data = r.rest();
    return c;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.u64(transfer_id);
    w.u32(chunk_index);
    w.fixed(hash);
    w.bytes(data.data(), data.size());
    return w.take();
  }
};

// CHUNK_ACK payload format:
// u64 transfer_id
// u32 chunk_index
// u32 resume_cursor (receiver's lowest unconfirmed index after this chunk)
//
// CHUNK_NACK uses the same layout with the cursor field unused (0).

struct ChunkAck {
  uint64_t transfer_id = 0;
  uint32_t chunk_index = 0;
  uint32_t cursor = 0;

  static ChunkAck deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "CHUNK_ACK");
    ChunkAck a;
    a.transfer_id = r.u64();
    a.chunk_index = r.u32();
    a.cursor = r.u32();
    r.expect_end();
    return a;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.u64(transfer_id);
    w.u32(chunk_index);
    w.u32(cursor);
    return w.take();
  }
};

// RESUME payload format:
// u64 transfer_id
// 32  file_hash
// u32 chunk_count
// index set of chunks the dialer holds (non-empty only when the dialer is the receiver)

struct Resume {
  uint64_t transfer_id = 0;
  crypto::Digest file_hash{};
  uint32_t chunk_count = 0;
  std::vector<uint32_t> have;

  static Resume deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "RESUME");
    Resume m;
    m.transfer_id = r.u64();
    m.file_hash = r.fixed<32>();
    m.chunk_count = r.u32();
    m.have = read_index_set(r, m.chunk_count);
    r.expect_end();
    return m;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.u64(transfer_id);
    w.fixed(file_hash);
    w.u32(chunk_count);
    write_index_set(w, have);
    return w.take();
  }
};

// CANCEL payload format:
// u64 transfer_id
// u16 reason_len, bytes reason

struct Cancel {
  uint64_t transfer_id = 0;
  std::string reason;

  static Cancel deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "CANCEL");
    Cancel c;
    c.transfer_id = r.u64();
    c.reason = r.str16();
    r.expect_end();
    return c;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.u64(transfer_id);
    w.str16(reason);
    return w.take();
  }
};

// RESULT payload format (receiver -> sender, terminal):
// u64 transfer_id
// u8  status (0=OK, 1=FAIL)
// u8  failure reason code (0 when OK)
// u16 message_len, bytes message

struct Result {
  uint64_t transfer_id = 0;
  bool ok = false;
  uint8_t reason_code = 0;
  std::string message;

  static Result deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "RESULT");
    Result res;
    res.transfer_id = r.u64();
    res.ok = (r.u8() == 0);
    res.reason_code = r.u8();
    res.message = r.str16();
    r.expect_end();
    return res;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.u64(transfer_id);
    w.u8(ok ? 0 : 1);
    w.u8(reason_code);
    w.str16(message);
    return w.take();
  }
};

// FETCH payload format:
// u64 request_id (becomes the transfer id of the resulting offer)
// u8  has_hash, then 32 bytes file_hash when 1 (0: whatever the peer shares)
//
// FETCH_FAIL: u64 request_id, u16 reason_len, bytes reason

struct Fetch {
  uint64_t request_id = 0;
  bool has_hash = false;
  crypto::Digest file_hash{};

  static Fetch deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "FETCH");
    Fetch f;
    f.request_id = r.u64();
    uint8_t flag = r.u8();
    if (flag > 1) throw ProtocolError("FETCH: bad hash flag");
    f.has_hash = (flag == 1);
    if (f.has_hash) f.file_hash = r.fixed<32>();
    r.expect_end();
    return f;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.u64(request_id);
    w.u8(has_hash ? 1 : 0);
    if (has_hash) w.fixed(file_hash);
    return w.take();
  }
};

struct FetchFail {
  uint64_t request_id = 0;
  std::string reason;

  static FetchFail deserialize(const std::vector<uint8_t>& payload) {
    ByteReader r(payload, "FETCH_FAIL");
    FetchFail f;
    f.request_id = r.u64();
    f.reason = r.str16();
    r.expect_end();
    return f;
  }

  std::vector<uint8_t> serialize() const {
    ByteWriter w;
    w.u64(request_id);
    w.str16(reason);
    return w.take();
  }
};

// Every transfer frame starts with the transfer (or request) id.
inline uint64_t peek_transfer_id(const std::vector<uint8_t>& payload) {
  ByteReader r(payload, "transfer frame");
  return r.u64();
}

} // namespace dropway::protocol
