#pragma once

#include "common/framing.hpp"

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

class RelayHub;

// One connected client. Frames are 4-byte big-endian length + JSON.
class HubSession : public std::enable_shared_from_this<HubSession> {
public:
  HubSession(RelayHub& hub, boost::asio::ip::tcp::socket socket);

  void start();
  void stop();

  const std::string& id() const { return id_; }
  const std::string& username() const { return username_; }
  bool registered() const { return registered_; }
  bool failed() const { return writer_->failed(); }

  void send(common::json msg) { writer_->send(std::move(msg)); }

private:
  void doRead();
  void handleMessage(common::json msg);

  RelayHub& hub_;
  boost::asio::ip::tcp::socket socket_;
  std::shared_ptr<common::JsonWriteQueue<boost::asio::ip::tcp::socket>> writer_;
  std::string id_;
  std::string username_;
  bool registered_ = false;
  bool stopped_ = false;
};

// Star-topology relay. Runs on a single io_context thread; every session
// callback and every map mutation happens there.
class RelayHub {
public:
  // A client with more than maxQueuedFrames unsent frames is dropped as if
  // its write had failed.
  explicit RelayHub(boost::asio::io_context& io, std::size_t maxQueuedFrames = common::kMaxQueuedFrames);

  // Throws std::runtime_error when the endpoint cannot be bound.
  void listen(const boost::asio::ip::tcp::endpoint& ep);
  void stop();

  uint16_t boundPort() const { return boundPort_; }
  size_t clientCount() const { return clients_.size(); }

  common::json peerListJson() const;

private:
  friend class HubSession;

  void doAccept();

  void onConnected(const std::shared_ptr<HubSession>& s);
  void onDisconnected(const std::string& id);
  void onRegister(const std::shared_ptr<HubSession>& s, std::string username);
  void onSignal(const std::shared_ptr<HubSession>& s, common::json msg);
  void onOther(const std::shared_ptr<HubSession>& s, common::json msg);

  // Exact id, otherwise the first client whose id is `<target>:<port>`.
  std::shared_ptr<HubSession> findTarget(std::string_view target) const;
  void broadcast(const common::json& msg, std::string_view exceptId);
  void broadcastPeerList();

  boost::asio::ip::tcp::acceptor acceptor_;
  std::size_t maxQueuedFrames_;
  uint16_t boundPort_ = 0;
  bool stopping_ = false;
  std::map<std::string, std::shared_ptr<HubSession>> clients_;
};

} // namespace relay
