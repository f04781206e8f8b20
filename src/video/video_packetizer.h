#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace video {

// Two datagram layouts share the video port:
//   single:  [u32 length][jpeg bytes]
//   chunked: [u32 chunk length][u32 byte offset][u8 is_last][chunk bytes]
// All integers big-endian.
constexpr size_t kSingleHeaderBytes = 4;
constexpr size_t kChunkHeaderBytes = 9;
constexpr size_t kDefaultChunkBytes = 60000;

struct ParsedDatagram {
  bool chunked = false;
  uint32_t offset = 0;
  bool last = true;
  std::vector<uint8_t> payload;
};

// A datagram parses as chunked only when its declared chunk length matches
// the bytes that follow the 9-byte header; otherwise it must be a complete
// single-packet frame.
bool parseDatagram(const uint8_t* data, size_t len, ParsedDatagram* out);

// Frames up to `threshold` bytes go out as one single-packet datagram;
// larger ones as ordered chunks of at most `threshold` bytes.
std::vector<std::vector<uint8_t>> packetizeFrame(const uint8_t* frame,
                                                 size_t frameLen,
                                                 size_t threshold = kDefaultChunkBytes);

class Reassembler {
public:
  struct Limits {
    size_t maxSenders = 8;
    size_t maxFrameBytes = 8u << 20;
    uint64_t timeoutMs = 1000;
  };

  struct Partial {
    std::map<uint32_t, std::vector<uint8_t>> chunks; // by offset
    size_t bytes = 0;
    std::optional<uint32_t> end; // set once the last chunk is seen
    uint64_t firstSeenMs = 0;
  };

  Reassembler() = default;
  explicit Reassembler(Limits limits) : limits_(limits) {}

  // Returns a complete frame once the last chunk has arrived and every byte
  // before it is present, in any arrival order.
  std::optional<std::vector<uint8_t>> add(const std::string& sender, ParsedDatagram packet, uint64_t nowMs);
  void expire(uint64_t nowMs);
  void clear() { partialBySender_.clear(); }
  size_t pendingSenders() const { return partialBySender_.size(); }

private:
  static std::optional<std::vector<uint8_t>> tryComplete(Partial& p);

  Limits limits_;
  std::unordered_map<std::string, Partial> partialBySender_;
};

} // namespace video
