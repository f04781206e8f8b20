#include "src/messaging/message_transport.h"

#include "src/messaging/frame_codec.h"
#include "src/storage/file_store.h"
#include "src/storage/message_history.h"

#include "common/util.hpp"

#include <array>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>

namespace messaging {

using boost::asio::ip::tcp;

std::string_view sendStatusToString(SendStatus s) {
  switch (s) {
    case SendStatus::Ok:
      return "ok";
    case SendStatus::UnknownPeer:
      return "unknown peer";
    case SendStatus::Unreachable:
      return "unreachable";
    case SendStatus::Timeout:
      return "timeout";
    case SendStatus::Malformed:
      return "malformed";
  }
  return "unknown";
}

// Reads exactly one frame from an accepted connection, then closes it. A
// connection that stops delivering bytes for stallTimeout is dropped.
class MessageTransport::Session : public std::enable_shared_from_this<MessageTransport::Session> {
public:
  Session(MessageTransport& owner, tcp::socket socket, std::string ip)
      : owner_(owner), socket_(std::move(socket)), timer_(socket_.get_executor()), ip_(std::move(ip)) {}

  void start() {
    armTimer();
    auto self = shared_from_this();
    boost::asio::async_read(socket_, boost::asio::buffer(header_),
                            [self](const boost::system::error_code& ec, std::size_t) { self->onHeader(ec); });
  }

private:
  void armTimer() {
    timer_.expires_after(owner_.opt_.stallTimeout);
    auto self = shared_from_this();
    timer_.async_wait([self](const boost::system::error_code& ec) {
      if (ec) return;
      common::log("messaging: connection from " + self->ip_ + " stalled, dropping (" +
                  std::string(frameErrorToString(FrameError::Timeout)) + ")");
      self->close();
    });
  }

  void onHeader(const boost::system::error_code& ec) {
    if (ec) {
      fail(ec);
      return;
    }
    FrameError err = FrameError::None;
    const auto len = parseHeader(std::string_view(header_.data(), header_.size()), &err, owner_.opt_.maxFrameBytes);
    if (!len) {
      common::log("messaging: " + std::string(frameErrorToString(err)) + " from " + ip_);
      close();
      return;
    }
    payload_.assign(*len, '\0');
    if (*len == 0) {
      onPayload({});
      return;
    }
    armTimer();
    auto self = shared_from_this();
    boost::asio::async_read(socket_, boost::asio::buffer(payload_.data(), payload_.size()),
                            [self](const boost::system::error_code& ec2, std::size_t) { self->onPayload(ec2); });
  }

  void onPayload(const boost::system::error_code& ec) {
    if (ec) {
      fail(ec);
      return;
    }
    timer_.cancel();
    owner_.handlePayload(ip_, payload_);
    close();
  }

  void fail(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) return;
    const FrameError err = ec == boost::asio::error::eof ? FrameError::Truncated : FrameError::Io;
    common::log("messaging: " + std::string(frameErrorToString(err)) + " frame from " + ip_ + ": " + ec.message());
    close();
  }

  void close() {
    boost::system::error_code ignored;
    timer_.cancel();
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  MessageTransport& owner_;
  tcp::socket socket_;
  boost::asio::steady_timer timer_;
  std::string ip_;
  std::array<char, kHeaderSize> header_{};
  std::string payload_;
};

MessageTransport::MessageTransport(boost::asio::io_context& io,
                                   const discovery::PeerRegistry& registry,
                                   storage::FileStore& files,
                                   MessageSink& sink,
                                   Options opt,
                                   storage::MessageHistory* history)
    : io_(io),
      registry_(registry),
      files_(files),
      sink_(sink),
      history_(history),
      opt_(std::move(opt)),
      strand_(boost::asio::make_strand(io)),
      acceptor_(strand_) {}

MessageTransport::~MessageTransport() {
  boost::system::error_code ignored;
  acceptor_.close(ignored);
}

void MessageTransport::start() {
  boost::system::error_code ec;
  const tcp::endpoint ep(boost::asio::ip::address_v4::any(), opt_.listenPort);
  acceptor_.open(ep.protocol(), ec);
  if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(ep, ec);
  if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("messaging: cannot listen on tcp/" + std::to_string(opt_.listenPort) + ": " +
                             ec.message());
  }
  boundPort_ = acceptor_.local_endpoint().port();
  common::log("messaging: listening on 0.0.0.0:" + std::to_string(boundPort_));
  boost::asio::post(strand_, [this] { doAccept(); });
}

void MessageTransport::stop() {
  boost::asio::post(strand_, [this] {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
  });
}

void MessageTransport::doAccept() {
  acceptor_.async_accept(boost::asio::make_strand(io_), [this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) common::log("messaging: accept error: " + ec.message());
      if (!acceptor_.is_open()) return;
    } else {
      boost::system::error_code epEc;
      const auto ep = socket.remote_endpoint(epEc);
      const std::string ip = epEc ? std::string() : ep.address().to_string();
      if (ip.empty() || !registry_.contains(ip)) {
        common::log("messaging: rejected connection from unknown source " + (ip.empty() ? "?" : ip));
        boost::system::error_code ignored;
        socket.close(ignored);
      } else {
        std::make_shared<Session>(*this, std::move(socket), ip)->start();
      }
    }
    doAccept();
  });
}

SendStatus MessageTransport::send(const std::string& ip, const protocol::Envelope& env) {
  const auto peer = registry_.find(ip);
  if (!peer) return SendStatus::UnknownPeer;
  return sendTo(ip, peer->port, env);
}

SendStatus MessageTransport::sendTo(const std::string& ip, uint16_t port, const protocol::Envelope& env) {
  const auto frame = encodeFrame(protocol::encode(env));
  if (!frame) {
    common::log("messaging: " + std::string(protocol::typeName(env)) + " to " + ip + " exceeds the frame limit");
    return SendStatus::Malformed;
  }

  boost::system::error_code addrEc;
  const auto addr = boost::asio::ip::make_address(ip, addrEc);
  if (addrEc) {
    common::log("messaging: invalid peer ip: " + ip);
    return SendStatus::Unreachable;
  }

  // Private loop so the connect and write share one deadline without
  // touching the shared io_context.
  boost::asio::io_context io;
  tcp::socket socket(io);
  boost::asio::steady_timer timer(io);
  bool timedOut = false;
  boost::system::error_code result = boost::asio::error::would_block;

  timer.expires_after(opt_.sendTimeout);
  timer.async_wait([&](const boost::system::error_code& ec) {
    if (ec) return;
    timedOut = true;
    boost::system::error_code ignored;
    socket.close(ignored);
  });
  socket.async_connect(tcp::endpoint(addr, port), [&](const boost::system::error_code& ec) {
    if (ec) {
      result = ec;
      timer.cancel();
      return;
    }
    boost::asio::async_write(socket, boost::asio::buffer(*frame), [&](const boost::system::error_code& ec2, std::size_t) {
      result = ec2;
      timer.cancel();
    });
  });
  io.run();

  if (timedOut) {
    common::log("messaging: send to " + ip + " timed out");
    return SendStatus::Timeout;
  }
  if (result) {
    common::log("messaging: send to " + ip + ":" + std::to_string(port) + " failed: " + result.message());
    return SendStatus::Unreachable;
  }
  boost::system::error_code ignored;
  socket.shutdown(tcp::socket::shutdown_both, ignored);
  socket.close(ignored);
  return SendStatus::Ok;
}

SendStatus MessageTransport::sendText(const std::string& ip, const std::string& content) {
  protocol::Text t;
  t.username = opt_.username;
  t.content = content;
  t.timestamp = common::unix_time_seconds();
  const SendStatus st = send(ip, t);
  if (st == SendStatus::Ok) recordHistory(ip, opt_.username, content, "text", true);
  return st;
}

SendStatus MessageTransport::sendFile(const std::string& ip, const std::filesystem::path& path) {
  if (!registry_.contains(ip)) return SendStatus::UnknownPeer;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    common::log("messaging: cannot read " + path.string());
    return SendStatus::Malformed;
  }
  protocol::File f;
  f.username = opt_.username;
  f.filename = path.filename().string();
  f.content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  f.timestamp = common::unix_time_seconds();

  const SendStatus st = send(ip, f);
  if (st == SendStatus::Ok) recordHistory(ip, opt_.username, f.filename, "file", true);
  return st;
}

bool MessageTransport::handlePayload(const std::string& ip, std::string_view payload) {
  std::string err;
  const auto env = protocol::decode(payload, &err);
  if (!env) {
    common::log("messaging: malformed message from " + ip + ": " + err);
    return false;
  }

  const auto unexpected = [&] {
    common::log("messaging: unexpected " + std::string(protocol::typeName(*env)) + " from " + ip);
    return false;
  };

  return std::visit(protocol::Overloaded{
                        [&](const protocol::Text& t) {
                          sink_.onText(ip, t.username, t.content, t.timestamp);
                          recordHistory(ip, t.username, t.content, "text", false);
                          return true;
                        },
                        [&](const protocol::File& f) {
                          std::string storeErr;
                          const auto stored = files_.store(f.filename, f.content, &storeErr);
                          if (!stored) {
                            common::log("messaging: failed to store " + f.filename + " from " + ip + ": " + storeErr);
                            return false;
                          }
                          common::log("messaging: stored " + std::to_string(f.content.size()) + " bytes from " + ip +
                                      " as " + *stored);
                          sink_.onFile(ip, f.username, f.filename, *stored);
                          recordHistory(ip, f.username, *stored, "file", false);
                          return true;
                        },
                        [&](const protocol::Discovery&) { return unexpected(); },
                        [&](const protocol::CallRequest&) { return unexpected(); },
                        [&](const protocol::CallAccepted&) { return unexpected(); },
                        [&](const protocol::CallRejected&) { return unexpected(); },
                        [&](const protocol::CallEnded&) { return unexpected(); },
                        [&](const protocol::Busy&) { return unexpected(); },
                        [&](const protocol::Offer&) { return unexpected(); },
                        [&](const protocol::Answer&) { return unexpected(); },
                        [&](const protocol::IceCandidate&) { return unexpected(); },
                        [&](const protocol::Register&) { return unexpected(); },
                        [&](const protocol::PeerList&) { return unexpected(); },
                    },
                    *env);
}

void MessageTransport::recordHistory(const std::string& ip, const std::string& username, const std::string& content,
                                     const char* type, bool outgoing) {
  if (!history_) return;
  std::string err;
  if (!history_->append(storage::makeRecord(ip, username, content, type, outgoing), &err)) {
    common::log("history: append failed: " + err);
  }
}

} // namespace messaging
