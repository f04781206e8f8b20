#include "src/messaging/frame_codec.h"

namespace messaging {

std::string_view frameErrorToString(FrameError e) {
  switch (e) {
    case FrameError::None:
      return "ok";
    case FrameError::Truncated:
      return "truncated";
    case FrameError::BadHeader:
      return "bad header";
    case FrameError::TooLarge:
      return "too large";
    case FrameError::Timeout:
      return "timeout";
    case FrameError::Io:
      return "i/o error";
  }
  return "unknown";
}

std::optional<std::array<char, kHeaderSize>> encodeHeader(std::size_t payloadSize) {
  if (payloadSize > kMaxPayloadSize) return std::nullopt;
  std::array<char, kHeaderSize> out{};
  std::size_t v = payloadSize;
  for (std::size_t i = kHeaderSize; i-- > 0;) {
    out[i] = static_cast<char>('0' + v % 10);
    v /= 10;
  }
  return out;
}

std::optional<std::string> encodeFrame(std::string_view payload) {
  const auto header = encodeHeader(payload.size());
  if (!header) return std::nullopt;
  std::string out;
  out.reserve(kHeaderSize + payload.size());
  out.append(header->data(), header->size());
  out.append(payload);
  return out;
}

std::optional<std::size_t> parseHeader(std::string_view header, FrameError* err, std::size_t maxPayload) {
  if (header.size() != kHeaderSize) {
    if (err) *err = FrameError::BadHeader;
    return std::nullopt;
  }
  std::size_t v = 0;
  for (char c : header) {
    if (c < '0' || c > '9') {
      if (err) *err = FrameError::BadHeader;
      return std::nullopt;
    }
    v = v * 10 + static_cast<std::size_t>(c - '0');
  }
  if (v > maxPayload) {
    if (err) *err = FrameError::TooLarge;
    return std::nullopt;
  }
  if (err) *err = FrameError::None;
  return v;
}

} // namespace messaging
