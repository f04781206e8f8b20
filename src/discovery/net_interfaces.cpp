#include "src/discovery/net_interfaces.h"

#include "common/util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace discovery {

namespace {

boost::asio::ip::address_v4 toAddress(const sockaddr* sa) {
  const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
  return boost::asio::ip::address_v4(ntohl(in->sin_addr.s_addr));
}

} // namespace

std::vector<InterfaceAddress> listIpv4Interfaces() {
  std::vector<InterfaceAddress> out;
  ifaddrs* ifaddr = nullptr;
  if (::getifaddrs(&ifaddr) != 0) {
    common::log(std::string("discovery: getifaddrs failed: ") + std::strerror(errno));
    return out;
  }
  for (ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
    if (!(ifa->ifa_flags & IFF_UP)) continue;

    InterfaceAddress ia;
    ia.name = ifa->ifa_name ? ifa->ifa_name : "";
    ia.address = toAddress(ifa->ifa_addr);
    ia.loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
    if ((ifa->ifa_flags & IFF_BROADCAST) && ifa->ifa_broadaddr) {
      ia.broadcast = toAddress(ifa->ifa_broadaddr);
    }
    out.push_back(std::move(ia));
  }
  ::freeifaddrs(ifaddr);
  return out;
}

std::vector<boost::asio::ip::address_v4> broadcastTargets(const std::vector<InterfaceAddress>& ifaces) {
  std::vector<boost::asio::ip::address_v4> out;
  out.push_back(boost::asio::ip::address_v4::broadcast());
  for (const auto& ia : ifaces) {
    if (ia.loopback || !ia.broadcast) continue;
    if (std::find(out.begin(), out.end(), *ia.broadcast) == out.end()) out.push_back(*ia.broadcast);
  }
  return out;
}

std::set<std::string> localAddresses(const std::vector<InterfaceAddress>& ifaces) {
  std::set<std::string> out;
  out.insert("127.0.0.1");
  for (const auto& ia : ifaces) out.insert(ia.address.to_string());
  return out;
}

} // namespace discovery
