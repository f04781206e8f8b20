#pragma once

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace messaging {

// Mesh message frame: 8 ASCII digits, zero padded, giving the byte length of
// the JSON payload that follows.
constexpr std::size_t kHeaderSize = 8;
constexpr std::size_t kMaxPayloadSize = 99'999'999;

enum class FrameError {
  None,
  Truncated,
  BadHeader,
  TooLarge,
  Timeout,
  Io,
};

std::string_view frameErrorToString(FrameError e);

// Header plus payload, or nullopt when the payload does not fit in 8 digits.
std::optional<std::string> encodeFrame(std::string_view payload);
std::optional<std::array<char, kHeaderSize>> encodeHeader(std::size_t payloadSize);

// Digits only; anything else is BadHeader. A length above maxPayload is
// TooLarge.
std::optional<std::size_t> parseHeader(std::string_view header,
                                       FrameError* err = nullptr,
                                       std::size_t maxPayload = kMaxPayloadSize);

// Blocks until the header and exactly the declared number of payload bytes
// have arrived, however the peer split them. A close before that is Truncated.
template <class SyncReadStream>
FrameError readFrame(SyncReadStream& stream,
                     std::string* payload,
                     boost::system::error_code& ec,
                     std::size_t maxPayload = kMaxPayloadSize) {
  std::array<char, kHeaderSize> header{};
  boost::asio::read(stream, boost::asio::buffer(header), ec);
  if (ec) return ec == boost::asio::error::eof ? FrameError::Truncated : FrameError::Io;

  FrameError perr = FrameError::None;
  const auto len = parseHeader(std::string_view(header.data(), header.size()), &perr, maxPayload);
  if (!len) return perr;

  payload->assign(*len, '\0');
  if (*len == 0) return FrameError::None;
  boost::asio::read(stream, boost::asio::buffer(payload->data(), payload->size()), ec);
  if (ec) return ec == boost::asio::error::eof ? FrameError::Truncated : FrameError::Io;
  return FrameError::None;
}

} // namespace messaging
