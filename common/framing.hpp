#pragma once

#include "common/json.hpp"

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

// Big-endian length-prefixed JSON framing used on persistent relay connections:
// [4-byte BE length][UTF-8 JSON]. The mesh message transport uses its own
// decimal header (see src/messaging/frame_codec.h).

namespace common {

static constexpr std::size_t kMaxFrameSize = 1024 * 1024;
static constexpr std::size_t kMaxQueuedFrames = 1024;

inline void write_u32_be(uint32_t v, uint8_t out[4]) {
  out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[3] = static_cast<uint8_t>(v & 0xFF);
}

inline uint32_t read_u32_be(const uint8_t in[4]) {
  return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

inline std::optional<std::vector<uint8_t>> frame_json_bytes(const json& j, std::size_t max_len = kMaxFrameSize) {
  const std::string payload = j.dump(-1, ' ', false, json::error_handler_t::replace);
  if (payload.empty() || payload.size() > max_len) return std::nullopt;
  std::vector<uint8_t> out(4 + payload.size());
  write_u32_be(static_cast<uint32_t>(payload.size()), out.data());
  std::memcpy(out.data() + 4, payload.data(), payload.size());
  return out;
}

inline std::optional<json> parse_json_bytes(std::span<const uint8_t> bytes) {
  json j = json::parse(bytes.begin(), bytes.end(), nullptr, false);
  if (j.is_discarded()) return std::nullopt;
  return j;
}

// Blocking variants, used by tools and tests that talk to the hub directly.
template <class SyncWriteStream>
inline bool write_json_frame(SyncWriteStream& stream, const json& j, boost::system::error_code& ec) {
  const auto framed = frame_json_bytes(j);
  if (!framed) {
    ec = boost::asio::error::message_size;
    return false;
  }
  boost::asio::write(stream, boost::asio::buffer(*framed), ec);
  return !ec;
}

template <class SyncReadStream>
inline std::optional<json> read_json_frame(SyncReadStream& stream, boost::system::error_code& ec) {
  std::array<uint8_t, 4> header{};
  boost::asio::read(stream, boost::asio::buffer(header), ec);
  if (ec) return std::nullopt;
  const uint32_t len = read_u32_be(header.data());
  if (len == 0 || len > kMaxFrameSize) {
    ec = boost::asio::error::message_size;
    return std::nullopt;
  }
  std::vector<uint8_t> body(len);
  boost::asio::read(stream, boost::asio::buffer(body), ec);
  if (ec) return std::nullopt;
  auto j = parse_json_bytes(body);
  if (!j) ec = boost::asio::error::invalid_argument;
  return j;
}

template <class AsyncReadStream, class Handler>
inline void async_read_frame(AsyncReadStream& stream,
                             std::shared_ptr<std::array<uint8_t, 4>> header_buf,
                             std::shared_ptr<std::vector<uint8_t>> body_buf,
                             std::size_t max_len,
                             Handler&& handler) {
  boost::asio::async_read(
      stream,
      boost::asio::buffer(*header_buf),
      [&stream, header_buf, body_buf, max_len, handler = std::forward<Handler>(handler)](
          const boost::system::error_code& ec, std::size_t) mutable {
        if (ec) return handler(ec, std::vector<uint8_t>{});
        const uint32_t len = read_u32_be(header_buf->data());
        if (len == 0 || len > max_len) {
          return handler(boost::asio::error::message_size, std::vector<uint8_t>{});
        }
        body_buf->assign(len, 0);
        boost::asio::async_read(
            stream,
            boost::asio::buffer(*body_buf),
            [body_buf, handler = std::move(handler)](const boost::system::error_code& ec2,
                                                     std::size_t) mutable {
              if (ec2) return handler(ec2, std::vector<uint8_t>{});
              return handler(ec2, *body_buf);
            });
      });
}

template <class AsyncReadStream, class Handler>
inline void async_read_json(AsyncReadStream& stream, std::size_t max_len, Handler&& handler) {
  async_read_frame(stream,
                   std::make_shared<std::array<uint8_t, 4>>(),
                   std::make_shared<std::vector<uint8_t>>(),
                   max_len,
                   [handler = std::forward<Handler>(handler)](const boost::system::error_code& ec,
                                                              std::vector<uint8_t> body) mutable {
                     if (ec) return handler(ec, json{});
                     auto j = parse_json_bytes(body);
                     if (!j) return handler(boost::asio::error::invalid_argument, json{});
                     handler(ec, std::move(*j));
                   });
}

template <class AsyncWriteStream, class Handler>
inline void async_write_json(AsyncWriteStream& stream, const json& j, Handler&& handler) {
  auto framed = frame_json_bytes(j);
  if (!framed) {
    boost::asio::post(stream.get_executor(),
                      [handler = std::forward<Handler>(handler)]() mutable {
                        handler(boost::asio::error::message_size);
                      });
    return;
  }
  auto buf = std::make_shared<std::vector<uint8_t>>(std::move(*framed));
  boost::asio::async_write(
      stream,
      boost::asio::buffer(*buf),
      [buf, handler = std::forward<Handler>(handler)](const boost::system::error_code& ec,
                                                     std::size_t) mutable { handler(ec); });
}

// Serializes framed JSON writes on one stream. The first write error is
// reported once through on_error and drops everything still queued. More than
// max_pending queued frames counts as a write error (no_buffer_space), posted
// rather than reported from inside send().
template <class AsyncWriteStream>
class JsonWriteQueue : public std::enable_shared_from_this<JsonWriteQueue<AsyncWriteStream>> {
 public:
  using OnError = std::function<void(const boost::system::error_code&)>;

  explicit JsonWriteQueue(AsyncWriteStream& stream, OnError on_error = {},
                          std::size_t max_pending = kMaxQueuedFrames)
      : stream_(stream), on_error_(std::move(on_error)), max_pending_(max_pending) {}

  void send(json msg) {
    if (failed_) return;
    if (pending_.size() >= max_pending_) {
      fail(boost::asio::error::no_buffer_space);
      return;
    }
    pending_.push_back(std::move(msg));
    if (writing_) return;
    writing_ = true;
    do_write();
  }

  bool failed() const { return failed_; }

 private:
  void do_write() {
    if (pending_.empty() || failed_) {
      writing_ = false;
      return;
    }
    auto self = this->shared_from_this();
    json msg = std::move(pending_.front());
    pending_.pop_front();
    async_write_json(stream_, msg, [self](const boost::system::error_code& ec) {
      if (self->failed_) {
        self->writing_ = false;
        return;
      }
      if (ec) {
        self->writing_ = false;
        self->failed_ = true;
        self->pending_.clear();
        if (self->on_error_) self->on_error_(ec);
        return;
      }
      self->do_write();
    });
  }

  void fail(const boost::system::error_code& ec) {
    failed_ = true;
    pending_.clear();
    if (!on_error_) return;
    auto self = this->shared_from_this();
    boost::asio::post(stream_.get_executor(), [self, ec] { self->on_error_(ec); });
  }

  AsyncWriteStream& stream_;
  OnError on_error_;
  std::size_t max_pending_;
  std::deque<json> pending_;
  bool writing_ = false;
  bool failed_ = false;
};

} // namespace common
