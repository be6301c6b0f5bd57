#pragma once

#include "dropway/transfer/chunk_source.h"
#include "dropway/web/tunnel.h"
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace dropway::web {

struct RangeRequest {
  enum class Kind { None, Single, Multi, Invalid };

  Kind kind = Kind::None;
  uint64_t first = 0;  // inclusive, valid for Single
  uint64_t last = 0;   // inclusive, valid for Single
};

// Parses a Range header value against a body of `size` bytes.
// Units other than "bytes" are ignored (Kind::None).
RangeRequest parse_range(const std::string& header, uint64_t size);

// Content-Disposition value for downloading `name` (its last path component).
// Quotes and backslashes are escaped; a name that is not plain printable
// ASCII also gets an RFC 5987 filename* parameter.
std::string content_disposition(const std::string& name);

// HTTP face of the sender: GET|HEAD /download/<file-hash-hex> answered with
// chunk reads from the shared file, honoring single byte ranges.
class WebBridge {
 public:
  using SourceLookup = std::function<std::shared_ptr<transfer::ChunkSource>(const std::string& file_hash_hex)>;

  WebBridge(boost::asio::io_context& io, boost::asio::thread_pool& disk, uint16_t port, SourceLookup lookup,
            TunnelProvider& tunnel);

  void start();
  void stop();

  uint16_t port() const { return port_; }
  const std::string& origin() const { return origin_; }
  std::string url_for(const std::string& file_hash_hex) const;

 private:
  void do_accept();

  boost::asio::io_context& io_;
  boost::asio::thread_pool& disk_;
  boost::asio::ip::tcp::acceptor acceptor_;
  SourceLookup lookup_;
  TunnelProvider& tunnel_;
  uint16_t port_ = 0;
  std::string origin_;
};

} // namespace dropway::web
