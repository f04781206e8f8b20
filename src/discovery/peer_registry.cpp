#include "src/discovery/peer_registry.h"

namespace discovery {

PeerRegistry::PeerRegistry(std::chrono::milliseconds timeout) : timeout_(timeout) {}

void PeerRegistry::setCallbacks(PeerCallback onDiscovered, PeerCallback onLost) {
  std::lock_guard<std::mutex> lock(mu_);
  onDiscovered_ = std::move(onDiscovered);
  onLost_ = std::move(onLost);
}

bool PeerRegistry::upsert(const std::string& ip, const std::string& username, uint16_t port, Clock::time_point now) {
  Peer snapshot;
  PeerCallback cb;
  bool inserted = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto [it, isNew] = peers_.try_emplace(ip);
    Peer& p = it->second;
    // An entry that went stale without being pruned counts as a rediscovery.
    inserted = isNew || !isFresh(p, now);
    p.ip = ip;
    p.username = username;
    p.port = port;
    p.lastSeen = now;
    if (inserted) {
      snapshot = p;
      cb = onDiscovered_;
    }
  }
  if (cb) cb(snapshot);
  return inserted;
}

std::vector<Peer> PeerRegistry::prune(Clock::time_point now) {
  std::vector<Peer> removed;
  PeerCallback cb;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = peers_.begin(); it != peers_.end();) {
      if (!isFresh(it->second, now)) {
        removed.push_back(std::move(it->second));
        it = peers_.erase(it);
      } else {
        ++it;
      }
    }
    cb = onLost_;
  }
  if (cb) {
    for (const auto& p : removed) cb(p);
  }
  return removed;
}

std::vector<Peer> PeerRegistry::activePeers(Clock::time_point now) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<Peer> out;
  out.reserve(peers_.size());
  for (const auto& [ip, p] : peers_) {
    if (isFresh(p, now)) out.push_back(p);
  }
  return out;
}

std::optional<Peer> PeerRegistry::find(const std::string& ip, Clock::time_point now) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = peers_.find(ip);
  if (it == peers_.end() || !isFresh(it->second, now)) return std::nullopt;
  return it->second;
}

bool PeerRegistry::contains(const std::string& ip, Clock::time_point now) const { return find(ip, now).has_value(); }

} // namespace discovery
