#include "src/relay/relay_client.h"

#include "common/util.hpp"

namespace relay {

using boost::asio::ip::tcp;
using common::json;

RelayClient::RelayClient(boost::asio::io_context& io, Config cfg)
    : io_(io), cfg_(std::move(cfg)), socket_(io), resolver_(io) {}

void RelayClient::start(Handlers handlers) {
  handlers_ = std::move(handlers);
  auto self = shared_from_this();
  resolver_.async_resolve(cfg_.host, std::to_string(cfg_.port),
                          [self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                            if (ec) {
                              common::log("relay: resolve " + self->cfg_.host + " failed: " + ec.message());
                              self->stop();
                              return;
                            }
                            self->connect(results);
                          });
}

void RelayClient::stop() {
  if (stopped_) return;
  stopped_ = true;
  resolver_.cancel();
  boost::system::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  if (ec) common::trace("relay: close: " + ec.message());
  if (handlers_.onClosed) handlers_.onClosed();
}

void RelayClient::connect(const tcp::resolver::results_type& results) {
  auto self = shared_from_this();
  auto timer = std::make_shared<boost::asio::steady_timer>(io_);
  timer->expires_after(cfg_.connectTimeout);
  timer->async_wait([self](const boost::system::error_code& ec) {
    if (ec) return;
    common::log("relay: connect to hub timed out");
    self->stop();
  });

  boost::asio::async_connect(socket_, results, [self, timer](const boost::system::error_code& ec, const tcp::endpoint& ep) {
    timer->cancel();
    if (ec) {
      if (!self->stopped_) common::log("relay: connect failed: " + ec.message());
      self->stop();
      return;
    }
    self->writer_ = std::make_shared<common::JsonWriteQueue<tcp::socket>>(
        self->socket_, [weak = std::weak_ptr<RelayClient>(self)](const boost::system::error_code& wec) {
          auto s = weak.lock();
          if (!s) return;
          common::log("relay: write failed: " + wec.message());
          s->stop();
        });
    common::log("relay: connected to hub " + common::endpoint_to_string(ep));
    self->send(protocol::toJson(protocol::Register{self->cfg_.username}));
    if (self->handlers_.onRegistered) self->handlers_.onRegistered();
    self->readLoop();
  });
}

void RelayClient::send(json msg) {
  if (!writer_ || stopped_) return;
  writer_->send(std::move(msg));
}

void RelayClient::sendText(const std::string& content) {
  protocol::Text t;
  t.username = cfg_.username;
  t.content = content;
  t.timestamp = common::unix_time_seconds();
  send(protocol::toJson(t));
}

void RelayClient::sendSignal(const protocol::Envelope& signal) { send(protocol::toJson(signal)); }

void RelayClient::readLoop() {
  auto self = shared_from_this();
  common::async_read_json(socket_, common::kMaxFrameSize, [self](const boost::system::error_code& ec, json j) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted && !self->stopped_) {
        common::log("relay: hub connection lost: " + ec.message());
      }
      self->stop();
      return;
    }
    self->handleMessage(j);
    if (!self->stopped_) self->readLoop();
  });
}

void RelayClient::handleMessage(const json& j) {
  if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) return;
  const std::string type = j["type"].get<std::string>();

  if (type == "error") {
    const std::string message = j.value("message", std::string("unknown error"));
    const std::string target = j.contains("target") && j["target"].is_string() ? j["target"].get<std::string>() : "";
    common::log("relay: hub error: " + message + (target.empty() ? "" : " (" + target + ")"));
    if (handlers_.onError) handlers_.onError(message);
    return;
  }
  if (type == "peer_list") {
    std::string err;
    auto env = protocol::fromJson(j, &err);
    if (!env || !std::holds_alternative<protocol::PeerList>(*env)) {
      common::trace("relay: bad peer_list: " + err);
      return;
    }
    peers_ = std::get<protocol::PeerList>(*env).peers;
    if (handlers_.onPeerList) handlers_.onPeerList(peers_);
    return;
  }
  if (handlers_.onMessage) handlers_.onMessage(j);
}

} // namespace relay
