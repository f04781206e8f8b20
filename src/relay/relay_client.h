#pragma once

#include "common/framing.hpp"
#include "src/protocol/envelope.h"

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace relay {

// Persistent connection to a RelayHub. All callbacks run on the io_context
// thread.
class RelayClient : public std::enable_shared_from_this<RelayClient> {
public:
  struct Config {
    std::string host;
    uint16_t port = 0;
    std::string username;
    std::chrono::milliseconds connectTimeout{10000};
  };

  struct Handlers {
    std::function<void()> onRegistered;
    std::function<void(const std::vector<protocol::PeerListEntry>&)> onPeerList;
    // Anything that is not a peer list or an error, already carrying the
    // hub-injected `sender`.
    std::function<void(const common::json&)> onMessage;
    std::function<void(const std::string& message)> onError;
    std::function<void()> onClosed;
  };

  RelayClient(boost::asio::io_context& io, Config cfg);

  void start(Handlers handlers);
  void stop();

  bool connected() const { return writer_ != nullptr && !stopped_; }
  const std::vector<protocol::PeerListEntry>& peers() const { return peers_; }

  void send(common::json msg);
  void sendText(const std::string& content);
  // offer / answer / ice-candidate routed by the hub to `target` only.
  void sendSignal(const protocol::Envelope& signal);

private:
  void connect(const boost::asio::ip::tcp::resolver::results_type& results);
  void readLoop();
  void handleMessage(const common::json& j);

  boost::asio::io_context& io_;
  Config cfg_;
  Handlers handlers_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::ip::tcp::resolver resolver_;
  std::shared_ptr<common::JsonWriteQueue<boost::asio::ip::tcp::socket>> writer_;
  std::vector<protocol::PeerListEntry> peers_;
  bool stopped_ = false;
};

} // namespace relay
