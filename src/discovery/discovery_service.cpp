#include "src/discovery/discovery_service.h"

#include "src/discovery/net_interfaces.h"
#include "src/protocol/envelope.h"

#include "common/util.hpp"

#include <stdexcept>

namespace discovery {

using boost::asio::ip::udp;

DiscoveryService::DiscoveryService(boost::asio::io_context& io, PeerRegistry& registry, Options opt)
    : io_(io),
      strand_(boost::asio::make_strand(io)),
      registry_(registry),
      opt_(std::move(opt)),
      listenSocket_(strand_),
      sendSocket_(strand_),
      broadcastTimer_(strand_),
      pruneTimer_(strand_) {}

DiscoveryService::~DiscoveryService() {
  boost::system::error_code ignored;
  listenSocket_.close(ignored);
  sendSocket_.close(ignored);
}

void DiscoveryService::start() {
  const auto ifaces = listIpv4Interfaces();
  if (localAddrs_.empty()) localAddrs_ = localAddresses(ifaces);
  targets_ = broadcastTargets(ifaces);

  boost::system::error_code ec;
  listenSocket_.open(udp::v4(), ec);
  if (!ec) listenSocket_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (!ec) listenSocket_.bind(udp::endpoint(boost::asio::ip::address_v4::any(), opt_.discoveryPort), ec);
  if (ec) {
    throw std::runtime_error("discovery: cannot bind UDP port " + std::to_string(opt_.discoveryPort) + ": " +
                             ec.message());
  }
  boundPort_ = listenSocket_.local_endpoint().port();

  sendSocket_.open(udp::v4(), ec);
  if (!ec) sendSocket_.set_option(boost::asio::socket_base::broadcast(true), ec);
  if (ec) {
    // Listening alone still lets us learn about peers.
    common::log("discovery: broadcast socket unavailable: " + ec.message());
  }

  std::string targetList;
  for (const auto& t : targets_) {
    if (!targetList.empty()) targetList += ", ";
    targetList += t.to_string();
  }
  common::log("discovery: listening on udp/" + std::to_string(boundPort_) + ", broadcasting to " + targetList);

  boost::asio::post(strand_, [this] {
    broadcastOnce();
    scheduleBroadcast();
    doReceive();
    schedulePrune();
  });
}

void DiscoveryService::stop() {
  boost::asio::post(strand_, [this] {
    if (stopped_) return;
    stopped_ = true;
    boost::system::error_code ignored;
    broadcastTimer_.cancel();
    pruneTimer_.cancel();
    listenSocket_.close(ignored);
    sendSocket_.close(ignored);
  });
}

void DiscoveryService::broadcastOnce() {
  if (stopped_ || !sendSocket_.is_open()) return;
  protocol::Discovery d;
  d.username = opt_.username;
  d.port = opt_.messagePort;
  d.timestamp = common::unix_time_seconds();
  const std::string payload = protocol::encode(d);

  for (const auto& target : targets_) {
    boost::system::error_code ec;
    sendSocket_.send_to(boost::asio::buffer(payload), udp::endpoint(target, opt_.discoveryPort), 0, ec);
    if (ec) common::trace("discovery: send to " + target.to_string() + " failed: " + ec.message());
  }
}

void DiscoveryService::scheduleBroadcast() {
  broadcastTimer_.expires_after(opt_.broadcastInterval);
  broadcastTimer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || stopped_) return;
    broadcastOnce();
    scheduleBroadcast();
  });
}

void DiscoveryService::schedulePrune() {
  pruneTimer_.expires_after(opt_.pruneInterval);
  pruneTimer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || stopped_) return;
    registry_.prune();
    schedulePrune();
  });
}

void DiscoveryService::doReceive() {
  listenSocket_.async_receive_from(
      boost::asio::buffer(recvBuf_), remote_, [this](const boost::system::error_code& ec, std::size_t n) {
        if (ec == boost::asio::error::operation_aborted || stopped_) return;
        if (ec) {
          common::log("discovery: receive error: " + ec.message());
        } else {
          handleDatagram(std::span<const uint8_t>(recvBuf_.data(), n), remote_.address().to_string());
        }
        doReceive();
      });
}

bool DiscoveryService::handleDatagram(std::span<const uint8_t> bytes, const std::string& sourceIp) {
  if (localAddrs_.count(sourceIp)) return false;

  std::string err;
  const auto env =
      protocol::decode(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()), &err);
  if (!env) {
    common::trace("discovery: malformed datagram from " + sourceIp + ": " + err);
    return false;
  }
  const auto* d = std::get_if<protocol::Discovery>(&*env);
  if (!d) {
    common::trace("discovery: ignoring " + std::string(protocol::typeName(*env)) + " from " + sourceIp);
    return false;
  }
  registry_.upsert(sourceIp, d->username, d->port);
  return true;
}

} // namespace discovery
