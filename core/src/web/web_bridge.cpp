#include "dropway/web/web_bridge.h"
#include "dropway/crypto/digest.h"
#include "dropway/log/logger.h"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <chrono>
#include <optional>

namespace dropway::web {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

std::string trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

bool parse_u64(const std::string& s, uint64_t& out) {
  if (s.empty() || s.size() > 19) return false;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<uint64_t>(c - '0');
  }
  out = v;
  return true;
}

std::string to_std(beast::string_view sv) {
  return std::string(sv.data(), sv.size());
}

constexpr std::chrono::seconds kIoTimeout{30};

// One HTTP/1.1 connection; requests are served one after another.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket socket, boost::asio::thread_pool& disk, WebBridge::SourceLookup lookup)
    : stream_(std::move(socket)),
      disk_(boost::asio::make_strand(disk.get_executor())),
      lookup_(std::move(lookup)) {}

  void start() { do_read(); }

 private:
  void do_read() {
    req_ = {};
    stream_.expires_after(kIoTimeout);
    auto self = shared_from_this();
    http::async_read(stream_, buffer_, req_, [this, self](beast::error_code ec, std::size_t) {
      if (ec == http::error::end_of_stream) {
        shutdown();
        return;
      }
      if (ec) {
        Logger::instance().debug("[web] read: " + ec.message());
        return;
      }
      handle_request();
    });
  }

  void handle_request() {
    Logger::instance().debug("[web] " + to_std(req_.method_string()) + " " + to_std(req_.target()));

    if (req_.method() != http::verb::get && req_.method() != http::verb::head) {
      send_error(http::status::method_not_allowed, "method not allowed\n");
      return;
    }

    std::string target = to_std(req_.target());
    size_t q = target.find('?');
    if (q != std::string::npos) target.resize(q);
    const std::string prefix = "/download/";
    if (target.compare(0, prefix.size(), prefix) != 0) {
      send_error(http::status::not_found, "not found\n");
      return;
    }
    std::string hash = target.substr(prefix.size());
    if (!crypto::digest_from_hex(hash) || !(source_ = lookup_(hash))) {
      send_error(http::status::not_found, "not found\n");
      return;
    }

    const auto& desc = source_->descriptor();
    RangeRequest range = parse_range(to_std(req_[http::field::range]), desc.size);
    if (range.kind == RangeRequest::Kind::Invalid) {
      send_error(http::status::range_not_satisfiable, "range not satisfiable\n",
                 "bytes */" + std::to_string(desc.size));
      return;
    }
    partial_ = range.kind == RangeRequest::Kind::Single;
    begin_ = partial_ ? range.first : 0;
    end_ = partial_ ? range.last + 1 : desc.size;
    sent_ = 0;

    if (req_.method() == http::verb::head || begin_ == end_) {
      send_empty();
      return;
    }
    next_chunk_ = static_cast<uint32_t>(begin_ / desc.chunk_size);
    read_next(true);
  }

  template <class Message>
  void set_file_headers(Message& res) {
    const auto& desc = source_->descriptor();
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/octet-stream");
    res.set(http::field::content_disposition, content_disposition(desc.name));
    res.set(http::field::accept_ranges, "bytes");
    if (partial_) {
      res.set(http::field::content_range, "bytes " + std::to_string(begin_) + "-" + std::to_string(end_ - 1) + "/" +
                                              std::to_string(desc.size));
    }
    res.content_length(end_ - begin_);
    res.keep_alive(req_.keep_alive());
  }

  // HEAD, or an empty file
  void send_empty() {
    auto res = std::make_shared<http::response<http::empty_body>>(
        partial_ ? http::status::partial_content : http::status::ok, req_.version());
    set_file_headers(*res);
    stream_.expires_after(kIoTimeout);
    auto self = shared_from_this();
    http::async_write(stream_, *res, [this, self, res](beast::error_code ec, std::size_t) {
      if (ec) {
        abort("write: " + ec.message());
        return;
      }
      after_response(res->keep_alive());
    });
  }

  void send_error(http::status status, const std::string& text, const std::string& content_range = "") {
    auto res = std::make_shared<http::response<http::string_body>>(status, req_.version());
    res->set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res->set(http::field::content_type, "text/plain");
    if (!content_range.empty()) res->set(http::field::content_range, content_range);
    if (status == http::status::method_not_allowed) res->set(http::field::allow, "GET, HEAD");
    res->keep_alive(req_.keep_alive());
    res->body() = text;
    res->prepare_payload();
    stream_.expires_after(kIoTimeout);
    auto self = shared_from_this();
    http::async_write(stream_, *res, [this, self, res](beast::error_code ec, std::size_t) {
      if (ec) {
        abort("write: " + ec.message());
        return;
      }
      after_response(res->keep_alive());
    });
  }

  void read_next(bool first) {
    auto self = shared_from_this();
    auto source = source_;
    uint32_t idx = next_chunk_;
    boost::asio::post(disk_, [this, self, source, idx, first]() {
      storage::Chunk chunk;
      std::string error;
      try {
        chunk = source->read_verified(idx);
      } catch (const std::exception& e) {
        error = e.what();
      }
      boost::asio::post(stream_.get_executor(), [this, self, chunk = std::move(chunk), error, first]() mutable {
        on_chunk(std::move(chunk), error, first);
      });
    });
  }

  void on_chunk(storage::Chunk chunk, const std::string& error, bool first) {
    if (!error.empty()) {
      Logger::instance().warn("[web] " + source_->descriptor().name + ": " + error);
      if (first) {
        send_error(http::status::internal_server_error, "file is no longer available\n");
      } else {
        // headers are out: cut the response short rather than send bad bytes
        abort("chunk read failed mid-body");
      }
      return;
    }

    current_ = std::move(chunk.data);
    const uint64_t from = std::max(begin_, chunk.offset);
    const uint64_t to = std::min(end_, chunk.offset + current_.size());
    slice_off_ = static_cast<size_t>(from - chunk.offset);
    slice_len_ = static_cast<size_t>(to - from);
    next_chunk_++;

    if (first) {
      write_header();
    } else {
      write_slice();
    }
  }

  void write_header() {
    sr_.reset();
    res_ = {};
    res_.version(req_.version());
    res_.result(partial_ ? http::status::partial_content : http::status::ok);
    set_file_headers(res_);
    res_.body().data = nullptr;
    res_.body().more = true;
    sr_.emplace(res_);

    stream_.expires_after(kIoTimeout);
    auto self = shared_from_this();
    http::async_write_header(stream_, *sr_, [this, self](beast::error_code ec, std::size_t) {
      if (ec) {
        abort("write header: " + ec.message());
        return;
      }
      write_slice();
    });
  }

  void write_slice() {
    res_.body().data = current_.data() + slice_off_;
    res_.body().size = slice_len_;
    res_.body().more = true;

    stream_.expires_after(kIoTimeout);
    auto self = shared_from_this();
    http::async_write(stream_, *sr_, [this, self](beast::error_code ec, std::size_t) {
      if (ec == http::error::need_buffer) ec = {};
      if (ec) {
        abort("write body: " + ec.message());
        return;
      }
      sent_ += slice_len_;
      if (begin_ + sent_ >= end_) {
        finish_body();
      } else {
        read_next(false);
      }
    });
  }

  void finish_body() {
    res_.body().data = nullptr;
    res_.body().size = 0;
    res_.body().more = false;

    stream_.expires_after(kIoTimeout);
    auto self = shared_from_this();
    http::async_write(stream_, *sr_, [this, self](beast::error_code ec, std::size_t) {
      if (ec == http::error::need_buffer) ec = {};
      if (ec) {
        abort("finish body: " + ec.message());
        return;
      }
      Logger::instance().debug("[web] served " + std::to_string(sent_) + " bytes of " + source_->descriptor().name);
      after_response(res_.keep_alive());
    });
  }

  void after_response(bool keep_alive) {
    sr_.reset();
    current_.clear();
    source_.reset();
    if (keep_alive) {
      do_read();
    } else {
      shutdown();
    }
  }

  void shutdown() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  void abort(const std::string& why) {
    Logger::instance().debug("[web] closing connection: " + why);
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.close();
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  boost::asio::strand<boost::asio::thread_pool::executor_type> disk_;
  WebBridge::SourceLookup lookup_;

  std::shared_ptr<transfer::ChunkSource> source_;
  bool partial_ = false;
  uint64_t begin_ = 0;
  uint64_t end_ = 0;  // exclusive
  uint64_t sent_ = 0;
  uint32_t next_chunk_ = 0;

  std::vector<uint8_t> current_;
  size_t slice_off_ = 0;
  size_t slice_len_ = 0;

  http::response<http::buffer_body> res_;
  std::optional<http::response_serializer<http::buffer_body>> sr_;
};

} // namespace

std::string content_disposition(const std::string& name) {
  size_t slash = name.find_last_of('/');
  const std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

  std::string quoted;
  std::string encoded;
  bool plain = true;
  static const char* hex = "0123456789ABCDEF";
  for (unsigned char c : base) {
    if (c < 0x20 || c >= 0x7f) {
      quoted += '_';
      plain = false;
    } else {
      if (c == '"' || c == '\\') {
        quoted += '\\';
        plain = false;
      }
      quoted += static_cast<char>(c);
    }
    if (std::isalnum(c) || (c != 0 && std::strchr("!#$&+-.^_`|~", c))) {
      encoded += static_cast<char>(c);
    } else {
      encoded += '%';
      encoded += hex[c >> 4];
      encoded += hex[c & 0x0f];
    }
  }

  std::string value = "attachment; filename=\"" + quoted + "\"";
  if (!plain) value += "; filename*=UTF-8''" + encoded;
  return value;
}

RangeRequest parse_range(const std::string& header, uint64_t size) {
  RangeRequest r;
  std::string h = trim(header);
  if (h.empty()) return r;
  const std::string unit = "bytes=";
  if (h.compare(0, unit.size(), unit) != 0) return r;

  std::string range_set = trim(h.substr(unit.size()));
  if (range_set.find(',') != std::string::npos) {
    r.kind = RangeRequest::Kind::Multi;
    return r;
  }

  r.kind = RangeRequest::Kind::Invalid;
  size_t dash = range_set.find('-');
  if (dash == std::string::npos) return r;
  std::string a = trim(range_set.substr(0, dash));
  std::string b = trim(range_set.substr(dash + 1));

  uint64_t first = 0;
  uint64_t last = 0;
  if (a.empty()) {
    // suffix: the last n bytes
    uint64_t n = 0;
    if (!parse_u64(b, n) || n == 0 || size == 0) return r;
    first = size - std::min(n, size);
    last = size - 1;
  } else {
    if (!parse_u64(a, first) || first >= size) return r;
    if (b.empty()) {
      last = size - 1;
    } else {
      if (!parse_u64(b, last) || last < first) return r;
      last = std::min(last, size - 1);
    }
  }
  r.kind = RangeRequest::Kind::Single;
  r.first = first;
  r.last = last;
  return r;
}

WebBridge::WebBridge(boost::asio::io_context& io, boost::asio::thread_pool& disk, uint16_t port, SourceLookup lookup,
                     TunnelProvider& tunnel)
  : io_(io),
    disk_(disk),
    acceptor_(io, tcp::endpoint(tcp::v4(), port)),
    lookup_(std::move(lookup)),
    tunnel_(tunnel) {
  port_ = acceptor_.local_endpoint().port();
}

void WebBridge::start() {
  origin_ = tunnel_.publish(port_);
  Logger::instance().info("[web] serving downloads on port " + std::to_string(port_) + ", public origin " + origin_);
  do_accept();
}

void WebBridge::stop() {
  boost::system::error_code ec;
  acceptor_.close(ec);
  tunnel_.unpublish();
}

std::string WebBridge::url_for(const std::string& file_hash_hex) const {
  return origin_ + "/download/" + file_hash_hex;
}

void WebBridge::do_accept() {
  acceptor_.async_accept(boost::asio::make_strand(io_), [this](boost::system::error_code ec, tcp::socket socket) {
    if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) return;
    if (!ec) {
      std::make_shared<HttpSession>(std::move(socket), disk_, lookup_)->start();
    } else {
      Logger::instance().warn("[web] accept error: " + ec.message());
    }
    do_accept();
  });
}

} // namespace dropway::web
