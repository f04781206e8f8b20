#pragma once

#include "src/discovery/peer_registry.h"
#include "src/protocol/envelope.h"

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace storage {
class FileStore;
class MessageHistory;
} // namespace storage

namespace messaging {

enum class SendStatus {
  Ok,
  UnknownPeer,
  Unreachable,
  Timeout,
  Malformed,
};

std::string_view sendStatusToString(SendStatus s);

// Receives what MessageTransport accepted. Called from io threads.
class MessageSink {
public:
  virtual ~MessageSink() = default;
  virtual void onText(const std::string& ip, const std::string& username, const std::string& content,
                      double timestamp) = 0;
  virtual void onFile(const std::string& ip, const std::string& username, const std::string& filename,
                      const std::string& storedName) = 0;
};

// One framed envelope per TCP connection, both directions. Inbound
// connections from IPs the registry does not know are closed unread.
class MessageTransport {
public:
  struct Options {
    std::string username;
    uint16_t listenPort = 12345; // 0 picks an ephemeral port
    std::chrono::milliseconds sendTimeout{10000};
    std::chrono::milliseconds stallTimeout{30000};
    // Inbound frames declaring more than this are dropped unread.
    std::size_t maxFrameBytes = 64 * 1024 * 1024;
  };

  MessageTransport(boost::asio::io_context& io,
                   const discovery::PeerRegistry& registry,
                   storage::FileStore& files,
                   MessageSink& sink,
                   Options opt,
                   storage::MessageHistory* history = nullptr);
  ~MessageTransport();

  MessageTransport(const MessageTransport&) = delete;
  MessageTransport& operator=(const MessageTransport&) = delete;

  // Throws std::runtime_error when the listen port cannot be bound.
  void start();
  void stop();
  uint16_t boundPort() const { return boundPort_; }

  // Blocking, bounded by sendTimeout. send() refuses peers the registry does
  // not currently list; sendTo() skips that check.
  SendStatus send(const std::string& ip, const protocol::Envelope& env);
  SendStatus sendTo(const std::string& ip, uint16_t port, const protocol::Envelope& env);
  SendStatus sendText(const std::string& ip, const std::string& content);
  SendStatus sendFile(const std::string& ip, const std::filesystem::path& path);

  // Dispatches one received payload. Returns false for malformed or
  // unexpected envelopes.
  bool handlePayload(const std::string& ip, std::string_view payload);

private:
  class Session;

  void doAccept();
  void recordHistory(const std::string& ip, const std::string& username, const std::string& content,
                     const char* type, bool outgoing);

  boost::asio::io_context& io_;
  const discovery::PeerRegistry& registry_;
  storage::FileStore& files_;
  MessageSink& sink_;
  storage::MessageHistory* history_;
  Options opt_;

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::tcp::acceptor acceptor_;
  uint16_t boundPort_ = 0;
};

} // namespace messaging
