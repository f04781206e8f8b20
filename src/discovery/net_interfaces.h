#pragma once

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio/ip/address_v4.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace discovery {

struct InterfaceAddress {
  std::string name;
  boost::asio::ip::address_v4 address;
  std::optional<boost::asio::ip::address_v4> broadcast;
  bool loopback = false;
};

// Up IPv4 interfaces, loopback included.
std::vector<InterfaceAddress> listIpv4Interfaces();

// Limited broadcast first, then each up, non-loopback interface's directed
// broadcast address, deduplicated.
std::vector<boost::asio::ip::address_v4> broadcastTargets(const std::vector<InterfaceAddress>& ifaces);

// Every address this host answers on (dotted quad), used to ignore our own
// discovery datagrams.
std::set<std::string> localAddresses(const std::vector<InterfaceAddress>& ifaces);

} // namespace discovery
