#pragma once

#include "src/discovery/peer_registry.h"

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace discovery {

// Announces this host on the LAN and keeps the PeerRegistry populated.
// Three independent async chains share one strand: the broadcaster, the
// listener, and the pruner.
class DiscoveryService {
public:
  struct Options {
    std::string username;
    uint16_t discoveryPort = 50000;
    uint16_t messagePort = 12345;
    std::chrono::milliseconds broadcastInterval{2000};
    std::chrono::milliseconds pruneInterval{10000};
  };

  DiscoveryService(boost::asio::io_context& io, PeerRegistry& registry, Options opt);
  ~DiscoveryService();

  DiscoveryService(const DiscoveryService&) = delete;
  DiscoveryService& operator=(const DiscoveryService&) = delete;

  // Binds the listener; throws std::runtime_error when the port is unavailable.
  void start();
  // Safe from any thread; the sockets close on the service strand.
  void stop();

  // Returns true when the datagram refreshed the registry.
  bool handleDatagram(std::span<const uint8_t> bytes, const std::string& sourceIp);

  void setLocalAddresses(std::set<std::string> addrs) { localAddrs_ = std::move(addrs); }
  uint16_t boundPort() const { return boundPort_; }

private:
  void broadcastOnce();
  void scheduleBroadcast();
  void schedulePrune();
  void doReceive();

  boost::asio::io_context& io_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  PeerRegistry& registry_;
  Options opt_;

  boost::asio::ip::udp::socket listenSocket_;
  boost::asio::ip::udp::socket sendSocket_;
  boost::asio::steady_timer broadcastTimer_;
  boost::asio::steady_timer pruneTimer_;
  std::array<uint8_t, 4096> recvBuf_{};
  boost::asio::ip::udp::endpoint remote_;

  std::set<std::string> localAddrs_;
  std::vector<boost::asio::ip::address_v4> targets_;
  uint16_t boundPort_ = 0;
  bool stopped_ = false;
};

} // namespace discovery
