#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace discovery {

using Clock = std::chrono::steady_clock;

struct Peer {
  std::string ip;
  std::string username;
  uint16_t port = 0;
  Clock::time_point lastSeen{};
};

// Table of peers keyed by IP. Every mutation and every read happens under one
// mutex; reads return copies. A peer older than the timeout is never reported
// as active, whether or not prune() has run yet.
class PeerRegistry {
public:
  using PeerCallback = std::function<void(const Peer&)>;

  explicit PeerRegistry(std::chrono::milliseconds timeout = std::chrono::seconds(30));

  PeerRegistry(const PeerRegistry&) = delete;
  PeerRegistry& operator=(const PeerRegistry&) = delete;

  // Callbacks run on the mutating thread, after the lock is released.
  void setCallbacks(PeerCallback onDiscovered, PeerCallback onLost);

  // Inserts or refreshes. Returns true when the IP was not already present.
  bool upsert(const std::string& ip, const std::string& username, uint16_t port, Clock::time_point now = Clock::now());
  std::vector<Peer> prune(Clock::time_point now = Clock::now());

  std::vector<Peer> activePeers(Clock::time_point now = Clock::now()) const;
  std::optional<Peer> find(const std::string& ip, Clock::time_point now = Clock::now()) const;
  bool contains(const std::string& ip, Clock::time_point now = Clock::now()) const;

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  bool isFresh(const Peer& p, Clock::time_point now) const { return now - p.lastSeen <= timeout_; }

  const std::chrono::milliseconds timeout_;
  mutable std::mutex mu_;
  std::map<std::string, Peer> peers_;
  PeerCallback onDiscovered_;
  PeerCallback onLost_;
};

} // namespace discovery
