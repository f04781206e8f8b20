#include "src/relay/relay_hub.h"

#include "common/util.hpp"

#include <stdexcept>

namespace relay {

using boost::asio::ip::tcp;
using common::json;

namespace {

bool is_signal_type(std::string_view type) { return type == "offer" || type == "answer" || type == "ice-candidate"; }

json error_message(std::string_view message) {
  json j;
  j["type"] = "error";
  j["message"] = std::string(message);
  return j;
}

} // namespace

HubSession::HubSession(RelayHub& hub, tcp::socket socket) : hub_(hub), socket_(std::move(socket)) {
  boost::system::error_code ec;
  const auto ep = socket_.remote_endpoint(ec);
  id_ = ec ? "unknown" : common::endpoint_to_string(ep);
}

void HubSession::start() {
  std::weak_ptr<HubSession> weak = shared_from_this();
  writer_ = std::make_shared<common::JsonWriteQueue<tcp::socket>>(
      socket_,
      [weak](const boost::system::error_code& ec) {
        auto self = weak.lock();
        if (!self) return;
        common::log("relay: write to " + self->id_ + " failed: " + ec.message());
        self->stop();
      },
      hub_.maxQueuedFrames_);
  common::log("relay: client connected from " + id_);
  doRead();
}

void HubSession::stop() {
  if (stopped_) return;
  stopped_ = true;
  boost::system::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  if (ec) common::trace("relay: close " + id_ + ": " + ec.message());
  hub_.onDisconnected(id_);
}

void HubSession::doRead() {
  auto self = shared_from_this();
  common::async_read_json(socket_, common::kMaxFrameSize, [self](const boost::system::error_code& ec, json msg) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted && ec != boost::asio::error::eof) {
        common::log("relay: read from " + self->id_ + " failed: " + ec.message());
      }
      self->stop();
      return;
    }
    self->handleMessage(std::move(msg));
    if (!self->stopped_) self->doRead();
  });
}

void HubSession::handleMessage(json msg) {
  const auto typeIt = msg.find("type");
  if (!msg.is_object() || typeIt == msg.end() || !typeIt->is_string()) {
    send(error_message("missing/invalid field: type"));
    return;
  }
  const std::string type = typeIt->get<std::string>();
  auto self = shared_from_this();

  if (type == "register") {
    std::string name = "Anonymous";
    if (auto it = msg.find("username"); it != msg.end() && it->is_string() && !it->get<std::string>().empty()) {
      name = it->get<std::string>();
    }
    username_ = name;
    registered_ = true;
    hub_.onRegister(self, std::move(name));
    return;
  }
  if (is_signal_type(type)) {
    hub_.onSignal(self, std::move(msg));
    return;
  }
  hub_.onOther(self, std::move(msg));
}

RelayHub::RelayHub(boost::asio::io_context& io, std::size_t maxQueuedFrames)
    : acceptor_(io), maxQueuedFrames_(maxQueuedFrames) {}

void RelayHub::listen(const tcp::endpoint& ep) {
  boost::system::error_code ec;
  acceptor_.open(ep.protocol(), ec);
  if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(ep, ec);
  if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("relay: cannot listen on " + common::endpoint_to_string(ep) + ": " + ec.message());
  }
  boundPort_ = acceptor_.local_endpoint().port();
  common::log("relay: hub listening on " + common::endpoint_to_string(acceptor_.local_endpoint()));
  doAccept();
}

void RelayHub::stop() {
  stopping_ = true;
  boost::system::error_code ec;
  acceptor_.close(ec);
  if (ec) common::trace("relay: acceptor close: " + ec.message());
  std::vector<std::shared_ptr<HubSession>> snapshot;
  for (const auto& [id, s] : clients_) snapshot.push_back(s);
  for (const auto& s : snapshot) s->stop();
  clients_.clear();
}

void RelayHub::doAccept() {
  acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) common::log("relay: accept error: " + ec.message());
      return;
    }
    auto session = std::make_shared<HubSession>(*this, std::move(socket));
    onConnected(session);
    session->start();
    doAccept();
  });
}

void RelayHub::onConnected(const std::shared_ptr<HubSession>& s) { clients_[s->id()] = s; }

void RelayHub::onDisconnected(const std::string& id) {
  if (clients_.erase(id) == 0 || stopping_) return;
  common::log("relay: client " + id + " left (" + std::to_string(clients_.size()) + " connected)");
  broadcastPeerList();
}

void RelayHub::onRegister(const std::shared_ptr<HubSession>& s, std::string username) {
  common::log("relay: " + s->id() + " registered as " + username);
  broadcastPeerList();
}

void RelayHub::onSignal(const std::shared_ptr<HubSession>& s, json msg) {
  const auto targetIt = msg.find("target");
  if (targetIt == msg.end() || !targetIt->is_string()) {
    s->send(error_message("missing/invalid field: target"));
    return;
  }
  const std::string target = targetIt->get<std::string>();
  msg["sender"] = s->id();
  msg["sender_username"] = s->username();
  msg["timestamp"] = common::format_time(std::chrono::system_clock::now(), "%H:%M:%S", false);

  auto dest = findTarget(target);
  if (!dest) {
    json err = error_message("target not connected");
    err["target"] = target;
    s->send(std::move(err));
    common::trace("relay: " + msg["type"].get<std::string>() + " from " + s->id() + " to missing " + target);
    return;
  }
  dest->send(std::move(msg));
}

void RelayHub::onOther(const std::shared_ptr<HubSession>& s, json msg) {
  msg["sender"] = s->id();
  msg["timestamp"] = common::format_time(std::chrono::system_clock::now(), "%H:%M:%S", false);
  broadcast(msg, s->id());
}

std::shared_ptr<HubSession> RelayHub::findTarget(std::string_view target) const {
  if (auto it = clients_.find(std::string(target)); it != clients_.end()) return it->second;
  const std::string prefix = std::string(target) + ":";
  for (const auto& [id, s] : clients_) {
    if (id.compare(0, prefix.size(), prefix) == 0) return s;
  }
  return nullptr;
}

void RelayHub::broadcast(const json& msg, std::string_view exceptId) {
  std::vector<std::shared_ptr<HubSession>> snapshot;
  snapshot.reserve(clients_.size());
  for (const auto& [id, s] : clients_) {
    if (id != exceptId) snapshot.push_back(s);
  }
  for (const auto& s : snapshot) {
    if (s->failed()) continue;
    s->send(msg);
  }
}

json RelayHub::peerListJson() const {
  json peers = json::array();
  for (const auto& [id, s] : clients_) {
    if (!s->registered()) continue;
    peers.push_back(json{{"id", id}, {"username", s->username()}});
  }
  return json{{"type", "peer_list"}, {"peers", std::move(peers)}};
}

void RelayHub::broadcastPeerList() { broadcast(peerListJson(), {}); }

} // namespace relay
