#include "src/video/video_packetizer.h"

#include <algorithm>
#include <cstring>

namespace video {

namespace {
inline void write_u32be(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[3] = static_cast<uint8_t>(v & 0xFF);
}
inline uint32_t read_u32be(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}
} // namespace

bool parseDatagram(const uint8_t* data, size_t len, ParsedDatagram* out) {
  if (!data || !out) return false;

  if (len >= kChunkHeaderBytes) {
    const uint32_t chunkLen = read_u32be(data + 0);
    const uint8_t flag = data[8];
    if (chunkLen == len - kChunkHeaderBytes && flag <= 1) {
      out->chunked = true;
      out->offset = read_u32be(data + 4);
      out->last = flag == 1;
      out->payload.assign(data + kChunkHeaderBytes, data + len);
      return true;
    }
  }

  if (len < kSingleHeaderBytes) return false;
  const uint32_t frameLen = read_u32be(data);
  if (frameLen != len - kSingleHeaderBytes) return false;
  out->chunked = false;
  out->offset = 0;
  out->last = true;
  out->payload.assign(data + kSingleHeaderBytes, data + len);
  return true;
}

std::vector<std::vector<uint8_t>> packetizeFrame(const uint8_t* frame, size_t frameLen, size_t threshold) {
  std::vector<std::vector<uint8_t>> out;
  if (!frame || frameLen == 0 || threshold == 0) return out;

  if (frameLen <= threshold) {
    std::vector<uint8_t> pkt(kSingleHeaderBytes + frameLen);
    write_u32be(pkt.data(), static_cast<uint32_t>(frameLen));
    std::memcpy(pkt.data() + kSingleHeaderBytes, frame, frameLen);
    out.push_back(std::move(pkt));
    return out;
  }

  out.reserve((frameLen + threshold - 1) / threshold);
  for (size_t off = 0; off < frameLen; off += threshold) {
    const size_t take = std::min(threshold, frameLen - off);
    std::vector<uint8_t> pkt(kChunkHeaderBytes + take);
    write_u32be(pkt.data() + 0, static_cast<uint32_t>(take));
    write_u32be(pkt.data() + 4, static_cast<uint32_t>(off));
    pkt[8] = (off + take >= frameLen) ? 1 : 0;
    std::memcpy(pkt.data() + kChunkHeaderBytes, frame + off, take);
    out.push_back(std::move(pkt));
  }
  return out;
}

std::optional<std::vector<uint8_t>> Reassembler::add(const std::string& sender, ParsedDatagram packet, uint64_t nowMs) {
  expire(nowMs);

  if (!packet.chunked) return std::move(packet.payload);

  const uint64_t chunkEnd = static_cast<uint64_t>(packet.offset) + packet.payload.size();
  if (chunkEnd > limits_.maxFrameBytes) {
    partialBySender_.erase(sender);
    return std::nullopt;
  }

  auto it = partialBySender_.find(sender);
  if (it == partialBySender_.end()) {
    if (partialBySender_.size() >= limits_.maxSenders) {
      auto oldest = std::min_element(partialBySender_.begin(), partialBySender_.end(), [](const auto& a, const auto& b) {
        return a.second.firstSeenMs < b.second.firstSeenMs;
      });
      partialBySender_.erase(oldest);
    }
    it = partialBySender_.emplace(sender, Partial{}).first;
    it->second.firstSeenMs = nowMs;
  } else if (packet.offset == 0 && it->second.chunks.count(0)) {
    // A fresh frame began before the previous one completed.
    it->second = Partial{};
    it->second.firstSeenMs = nowMs;
  }

  Partial& p = it->second;
  auto& slot = p.chunks[packet.offset];
  p.bytes -= slot.size();
  slot = std::move(packet.payload);
  p.bytes += slot.size();
  if (packet.last) p.end = static_cast<uint32_t>(chunkEnd);

  if (p.bytes > limits_.maxFrameBytes) {
    partialBySender_.erase(it);
    return std::nullopt;
  }

  auto frame = tryComplete(p);
  if (frame) partialBySender_.erase(it);
  return frame;
}

std::optional<std::vector<uint8_t>> Reassembler::tryComplete(Partial& p) {
  if (!p.end) return std::nullopt;
  uint64_t expect = 0;
  for (const auto& [off, bytes] : p.chunks) {
    if (off != expect) return std::nullopt;
    expect += bytes.size();
  }
  if (expect != *p.end) return std::nullopt;

  std::vector<uint8_t> frame;
  frame.reserve(p.bytes);
  for (const auto& [off, bytes] : p.chunks) frame.insert(frame.end(), bytes.begin(), bytes.end());
  return frame;
}

void Reassembler::expire(uint64_t nowMs) {
  for (auto it = partialBySender_.begin(); it != partialBySender_.end();) {
    if (nowMs > it->second.firstSeenMs && nowMs - it->second.firstSeenMs > limits_.timeoutMs) {
      it = partialBySender_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace video
