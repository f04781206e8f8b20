#include "src/call/call_signaling.h"

#include "common/util.hpp"

#include <stdexcept>

namespace call {

using boost::asio::ip::udp;

std::string_view stateToString(State s) {
  switch (s) {
    case State::Idle:
      return "idle";
    case State::Calling:
      return "calling";
    case State::Ringing:
      return "ringing";
    case State::InCall:
      return "in_call";
  }
  return "unknown";
}

std::string_view startResultToString(StartResult r) {
  switch (r) {
    case StartResult::Started:
      return "started";
    case StartResult::UnknownPeer:
      return "unknown peer";
    case StartResult::AlreadyInCall:
      return "already in a call";
    case StartResult::SendFailed:
      return "send failed";
  }
  return "unknown";
}

std::string_view endReasonToString(EndReason r) {
  switch (r) {
    case EndReason::LocalHangup:
      return "local hangup";
    case EndReason::RemoteHangup:
      return "remote hangup";
    case EndReason::Rejected:
      return "rejected";
    case EndReason::Busy:
      return "busy";
    case EndReason::Timeout:
      return "timeout";
    case EndReason::DeviceUnavailable:
      return "device unavailable";
    case EndReason::Shutdown:
      return "shutdown";
  }
  return "unknown";
}

CallSignalingEngine::CallSignalingEngine(boost::asio::io_context& io,
                                         const discovery::PeerRegistry& registry,
                                         MediaFactory mediaFactory,
                                         Options opt)
    : io_(io),
      registry_(registry),
      mediaFactory_(std::move(mediaFactory)),
      opt_(std::move(opt)),
      strand_(boost::asio::make_strand(io)),
      controlSocket_(strand_),
      answerTimer_(strand_),
      sendSocket_(io) {}

CallSignalingEngine::~CallSignalingEngine() {
  std::lock_guard<std::mutex> lock(mu_);
  if (media_) media_->stop();
}

void CallSignalingEngine::setObserver(CallObserver observer) {
  std::lock_guard<std::mutex> lock(mu_);
  observer_ = std::move(observer);
}

void CallSignalingEngine::start() {
  boost::system::error_code ec;
  controlSocket_.open(udp::v4(), ec);
  if (!ec) controlSocket_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (!ec) controlSocket_.bind(udp::endpoint(boost::asio::ip::address_v4::any(), opt_.localPorts.control), ec);
  if (ec) {
    throw std::runtime_error("call: cannot bind control port " + std::to_string(opt_.localPorts.control) + ": " +
                             ec.message());
  }
  boundControlPort_ = controlSocket_.local_endpoint().port();

  {
    std::lock_guard<std::mutex> lock(sendMu_);
    sendSocket_.open(udp::v4(), ec);
  }
  if (ec) throw std::runtime_error("call: cannot open send socket: " + ec.message());

  common::log("call: control channel on udp/" + std::to_string(boundControlPort_));
  boost::asio::post(strand_, [this] { doReceive(); });
}

void CallSignalingEngine::stop() {
  Notes notes;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != State::Idle && session_) {
      sendControl(session_->peerIp, peerControlPortLocked(), protocol::CallEnded{});
      endLocked(EndReason::Shutdown, notes);
    }
  }
  flush(notes);

  boost::asio::post(strand_, [this] {
    boost::system::error_code ignored;
    answerTimer_.cancel();
    controlSocket_.close(ignored);
  });
  std::lock_guard<std::mutex> lock(sendMu_);
  boost::system::error_code ignored;
  sendSocket_.close(ignored);
}

void CallSignalingEngine::doReceive() {
  controlSocket_.async_receive_from(
      boost::asio::buffer(recvBuf_), remote_, [this](const boost::system::error_code& ec, std::size_t n) {
        if (ec == boost::asio::error::operation_aborted || !controlSocket_.is_open()) return;
        if (ec) {
          common::log("call: receive error: " + ec.message());
        } else {
          std::string err;
          const auto env = protocol::decode(std::string_view(recvBuf_.data(), n), &err);
          const std::string ip = remote_.address().to_string();
          if (!env) {
            common::log("call: malformed control datagram from " + ip + ": " + err);
          } else {
            onControlMessage(*env, ip);
          }
        }
        doReceive();
      });
}

void CallSignalingEngine::armAnswerTimer(uint64_t callId) {
  boost::asio::post(strand_, [this, callId] {
    answerTimer_.expires_after(opt_.answerTimeout);
    answerTimer_.async_wait([this, callId](const boost::system::error_code& ec) {
      if (ec) return;
      onAnswerTimeout(callId);
    });
  });
}

void CallSignalingEngine::onAnswerTimeout(uint64_t callId) {
  Notes notes;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (callId != callId_ || !session_) return;
    if (state_ == State::Calling) {
      common::log("call: no answer from " + session_->peerIp);
      sendControl(session_->peerIp, peerControlPortLocked(), protocol::CallEnded{});
      endLocked(EndReason::Timeout, notes);
    } else if (state_ == State::Ringing) {
      common::log("call: incoming call from " + session_->peerIp + " was not answered");
      sendControl(session_->peerIp, peerControlPortLocked(), protocol::CallRejected{"timeout"});
      endLocked(EndReason::Timeout, notes);
    }
  }
  flush(notes);
}

bool CallSignalingEngine::sendControl(const std::string& ip, uint16_t port, const protocol::Envelope& env) {
  boost::system::error_code ec;
  const auto addr = boost::asio::ip::make_address(ip, ec);
  if (ec) {
    common::log("call: invalid peer ip: " + ip);
    return false;
  }
  const std::string payload = protocol::encode(env);
  std::lock_guard<std::mutex> lock(sendMu_);
  if (!sendSocket_.is_open()) return false;
  sendSocket_.send_to(boost::asio::buffer(payload), udp::endpoint(addr, port), 0, ec);
  if (ec) {
    common::log("call: send " + std::string(protocol::typeName(env)) + " to " + ip + " failed: " + ec.message());
    return false;
  }
  common::trace("call: sent " + std::string(protocol::typeName(env)) + " to " + ip + ":" + std::to_string(port));
  return true;
}

uint16_t CallSignalingEngine::peerControlPortLocked() const {
  if (session_ && session_->peerPorts.control != 0) return session_->peerPorts.control;
  return opt_.peerControlPort;
}

void CallSignalingEngine::setStateLocked(State to, Notes& notes) {
  const State from = state_;
  if (from == to) return;
  state_ = to;
  common::log("call: " + std::string(stateToString(from)) + " -> " + std::string(stateToString(to)));
  if (observer_.onStateChanged) notes.push_back([cb = observer_.onStateChanged, from, to] { cb(from, to); });
}

bool CallSignalingEngine::startMediaLocked(std::string* err) {
  media_ = mediaFactory_ ? mediaFactory_(*session_) : nullptr;
  if (!media_) {
    if (err) *err = "no media available";
    return false;
  }
  if (!media_->start(err)) {
    media_->stop();
    media_.reset();
    return false;
  }
  return true;
}

void CallSignalingEngine::endLocked(EndReason reason, Notes& notes) {
  if (media_) {
    media_->stop();
    media_.reset();
  }
  const std::string peer = session_ ? session_->peerIp : std::string();
  session_.reset();
  ++callId_;
  setStateLocked(State::Idle, notes);
  common::log("call: ended with " + (peer.empty() ? std::string("?") : peer) + " (" +
              std::string(endReasonToString(reason)) + ")");
  if (observer_.onCallEnded) notes.push_back([cb = observer_.onCallEnded, peer, reason] { cb(peer, reason); });
}

void CallSignalingEngine::flush(Notes& notes) {
  for (auto& n : notes) n();
  notes.clear();
}

StartResult CallSignalingEngine::initiate(const std::string& ip, protocol::CallKind kind) {
  Notes notes;
  StartResult result = StartResult::Started;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != State::Idle) return StartResult::AlreadyInCall;
    const auto peer = registry_.find(ip);
    if (!peer) return StartResult::UnknownPeer;

    CallSession s;
    s.peerIp = ip;
    s.peerUsername = peer->username;
    s.role = Role::Caller;
    s.kind = kind;
    s.localPorts = opt_.localPorts;
    session_ = s;

    protocol::CallRequest req;
    req.username = opt_.username;
    req.kind = kind;
    req.ports = opt_.localPorts;
    if (!sendControl(ip, peerControlPortLocked(), req)) {
      session_.reset();
      return StartResult::SendFailed;
    }
    ++callId_;
    setStateLocked(State::Calling, notes);
    armAnswerTimer(callId_);
    common::log("call: calling " + peer->username + " (" + ip + "), " +
                std::string(protocol::callKindToString(kind)));
  }
  flush(notes);
  return result;
}

bool CallSignalingEngine::accept() {
  Notes notes;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != State::Ringing || !session_) return false;

    std::string err;
    if (!startMediaLocked(&err)) {
      common::log("call: cannot start media: " + err);
      sendControl(session_->peerIp, peerControlPortLocked(), protocol::CallRejected{"device unavailable"});
      endLocked(EndReason::DeviceUnavailable, notes);
    } else {
      sendControl(session_->peerIp, peerControlPortLocked(), protocol::CallAccepted{opt_.localPorts});
      setStateLocked(State::InCall, notes);
      if (observer_.onCallStarted) notes.push_back([cb = observer_.onCallStarted, s = *session_] { cb(s); });
    }
  }
  flush(notes);
  return true;
}

bool CallSignalingEngine::reject() {
  Notes notes;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != State::Ringing || !session_) return false;
    sendControl(session_->peerIp, peerControlPortLocked(), protocol::CallRejected{});
    endLocked(EndReason::Rejected, notes);
  }
  flush(notes);
  return true;
}

bool CallSignalingEngine::hangup() {
  Notes notes;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == State::Idle || !session_) return false;
    sendControl(session_->peerIp, peerControlPortLocked(), protocol::CallEnded{});
    endLocked(EndReason::LocalHangup, notes);
  }
  flush(notes);
  return true;
}

State CallSignalingEngine::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::optional<CallSession> CallSignalingEngine::session() const {
  std::lock_guard<std::mutex> lock(mu_);
  return session_;
}

void CallSignalingEngine::onControlMessage(const protocol::Envelope& env, const std::string& fromIp) {
  Notes notes;
  {
    std::lock_guard<std::mutex> lock(mu_);

    if (const auto* req = std::get_if<protocol::CallRequest>(&env)) {
      const uint16_t replyPort = req->ports.control != 0 ? req->ports.control : opt_.peerControlPort;
      if (state_ != State::Idle) {
        common::log("call: busy, refusing call from " + fromIp);
        sendControl(fromIp, replyPort, protocol::Busy{});
        return;
      }
      if (!registry_.contains(fromIp)) {
        common::log("call: ignoring call_request from unknown source " + fromIp);
        return;
      }
      CallSession s;
      s.peerIp = fromIp;
      s.peerUsername = req->username;
      s.role = Role::Callee;
      s.kind = req->kind;
      s.localPorts = opt_.localPorts;
      s.peerPorts = req->ports;
      session_ = s;
      ++callId_;
      setStateLocked(State::Ringing, notes);
      armAnswerTimer(callId_);
      common::log("call: incoming " + std::string(protocol::callKindToString(req->kind)) + " call from " +
                  req->username + " (" + fromIp + ")");
      if (observer_.onIncomingCall) notes.push_back([cb = observer_.onIncomingCall, s] { cb(s); });
    } else if (!session_ || session_->peerIp != fromIp) {
      common::trace("call: ignoring " + std::string(protocol::typeName(env)) + " from " + fromIp);
      return;
    } else if (const auto* acc = std::get_if<protocol::CallAccepted>(&env)) {
      if (state_ != State::Calling) return;
      session_->peerPorts = acc->ports;
      std::string err;
      if (!startMediaLocked(&err)) {
        common::log("call: cannot start media: " + err);
        sendControl(fromIp, peerControlPortLocked(), protocol::CallEnded{});
        endLocked(EndReason::DeviceUnavailable, notes);
      } else {
        setStateLocked(State::InCall, notes);
        if (observer_.onCallStarted) notes.push_back([cb = observer_.onCallStarted, s = *session_] { cb(s); });
      }
    } else if (const auto* rej = std::get_if<protocol::CallRejected>(&env)) {
      if (state_ != State::Calling) return;
      endLocked(rej->reason == "timeout" ? EndReason::Timeout : EndReason::Rejected, notes);
    } else if (std::holds_alternative<protocol::Busy>(env)) {
      if (state_ != State::Calling) return;
      endLocked(EndReason::Busy, notes);
    } else if (std::holds_alternative<protocol::CallEnded>(env)) {
      endLocked(EndReason::RemoteHangup, notes);
    } else {
      common::trace("call: ignoring " + std::string(protocol::typeName(env)) + " on control channel");
    }
  }
  flush(notes);
}

} // namespace call
