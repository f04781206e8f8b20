#include "src/video/video_packetizer.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> pattern(size_t n, uint8_t seed) {
  std::vector<uint8_t> v(n);
  for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>((i * 7 + seed) & 0xFF);
  return v;
}

video::ParsedDatagram parse(const std::vector<uint8_t>& pkt) {
  video::ParsedDatagram d;
  const bool ok = video::parseDatagram(pkt.data(), pkt.size(), &d);
  assert(ok);
  (void)ok;
  return d;
}

} // namespace

int main() {
  // At or under the threshold: one single-packet datagram.
  {
    const auto frame = pattern(1000, 1);
    const auto pkts = video::packetizeFrame(frame.data(), frame.size(), 1000);
    assert(pkts.size() == 1);
    assert(pkts[0].size() == video::kSingleHeaderBytes + frame.size());
    assert(pkts[0][0] == 0 && pkts[0][1] == 0 && pkts[0][2] == 0x03 && pkts[0][3] == 0xE8);

    const auto d = parse(pkts[0]);
    assert(!d.chunked && d.last && d.payload == frame);

    video::Reassembler re;
    const auto out = re.add("10.0.0.2:13001", d, 0);
    assert(out && *out == frame);
    assert(re.pendingSenders() == 0);
  }

  // Over the threshold: ordered chunks, only the final one flagged.
  {
    const auto frame = pattern(2500, 2);
    const auto pkts = video::packetizeFrame(frame.data(), frame.size(), 1000);
    assert(pkts.size() == 3);
    uint32_t expectOffset = 0;
    for (size_t i = 0; i < pkts.size(); ++i) {
      const auto d = parse(pkts[i]);
      assert(d.chunked);
      assert(d.offset == expectOffset);
      assert(d.last == (i + 1 == pkts.size()));
      expectOffset += static_cast<uint32_t>(d.payload.size());
    }
    assert(expectOffset == frame.size());
  }

  assert(video::packetizeFrame(nullptr, 10).empty());

  // Shuffled chunks, last chunk first, reassemble byte-identical.
  {
    const auto frame = pattern(130000, 3);
    auto pkts = video::packetizeFrame(frame.data(), frame.size(), 60000);
    assert(pkts.size() == 3);
    std::mt19937 rng(1234);
    std::shuffle(pkts.begin(), pkts.end(), rng);
    std::rotate(pkts.begin(), std::find_if(pkts.begin(), pkts.end(), [](const auto& p) { return p[8] == 1; }),
                pkts.end());

    video::Reassembler re;
    std::optional<std::vector<uint8_t>> out;
    for (size_t i = 0; i < pkts.size(); ++i) {
      out = re.add("peer", parse(pkts[i]), 10);
      if (i + 1 < pkts.size()) assert(!out && re.pendingSenders() == 1);
    }
    assert(out && *out == frame);
    assert(re.pendingSenders() == 0);
  }

  // Malformed datagrams.
  {
    video::ParsedDatagram d;
    const std::vector<uint8_t> tiny{0, 0};
    assert(!video::parseDatagram(tiny.data(), tiny.size(), &d));
    const std::vector<uint8_t> lies{0, 0, 0, 50, 1, 2, 3};
    assert(!video::parseDatagram(lies.data(), lies.size(), &d));
    std::vector<uint8_t> badFlag{0, 0, 0, 2, 0, 0, 0, 0, 7, 0xAA, 0xBB};
    assert(!video::parseDatagram(badFlag.data(), badFlag.size(), &d));
    badFlag[8] = 1;
    assert(video::parseDatagram(badFlag.data(), badFlag.size(), &d) && d.chunked && d.last);
    assert(!video::parseDatagram(nullptr, 4, &d));
  }

  // Incomplete frames expire.
  {
    video::Reassembler::Limits lim;
    lim.timeoutMs = 1000;
    video::Reassembler re(lim);
    const auto frame = pattern(3000, 4);
    const auto pkts = video::packetizeFrame(frame.data(), frame.size(), 1000);
    assert(!re.add("a", parse(pkts[0]), 100));
    assert(re.pendingSenders() == 1);
    re.expire(1100);
    assert(re.pendingSenders() == 1);
    re.expire(1101);
    assert(re.pendingSenders() == 0);

    // The rest alone cannot complete the expired frame.
    assert(!re.add("a", parse(pkts[1]), 1200));
    assert(!re.add("a", parse(pkts[2]), 1200));
  }

  // A new frame from the same sender replaces the unfinished one.
  {
    video::Reassembler re;
    const auto first = pattern(2000, 5);
    const auto second = pattern(2000, 6);
    const auto p1 = video::packetizeFrame(first.data(), first.size(), 1000);
    const auto p2 = video::packetizeFrame(second.data(), second.size(), 1000);
    assert(!re.add("a", parse(p1[0]), 0));
    assert(!re.add("a", parse(p2[0]), 5));
    const auto out = re.add("a", parse(p2[1]), 6);
    assert(out && *out == second);
  }

  // Pending senders are bounded; the oldest is dropped.
  {
    video::Reassembler::Limits lim;
    lim.maxSenders = 2;
    video::Reassembler re(lim);
    const auto frame = pattern(2000, 7);
    const auto pkts = video::packetizeFrame(frame.data(), frame.size(), 1000);
    assert(!re.add("s1", parse(pkts[0]), 1));
    assert(!re.add("s2", parse(pkts[0]), 2));
    assert(!re.add("s3", parse(pkts[0]), 3));
    assert(re.pendingSenders() == 2);
    assert(!re.add("s1", parse(pkts[1]), 4));
    const auto out = re.add("s3", parse(pkts[1]), 5);
    assert(out && *out == frame);
  }

  // Frames larger than the byte bound are discarded.
  {
    video::Reassembler::Limits lim;
    lim.maxFrameBytes = 1500;
    video::Reassembler re(lim);
    const auto frame = pattern(2000, 8);
    const auto pkts = video::packetizeFrame(frame.data(), frame.size(), 1000);
    assert(!re.add("big", parse(pkts[0]), 0));
    assert(!re.add("big", parse(pkts[1]), 0));
    assert(re.pendingSenders() == 0);
  }

  return 0;
}
