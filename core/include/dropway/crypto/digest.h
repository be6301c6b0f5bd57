#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

struct evp_md_ctx_st;

namespace dropway::crypto {

using Digest = std::array<uint8_t, 32>;  // SHA-256

Digest sha256(const uint8_t* data, size_t len);

// Incremental SHA-256 over OpenSSL EVP.
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const uint8_t* data, size_t len);
  Digest finish();

 private:
  evp_md_ctx_st* ctx_ = nullptr;
};

std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const Digest& d);

std::optional<Digest> digest_from_hex(const std::string& hex);

// nbytes of RAND_bytes output, hex encoded
std::string random_hex(size_t nbytes);

uint64_t random_u64();

// 16 random bytes => 32 hex chars
std::string generate_peer_id();

} // namespace dropway::crypto
