#pragma once

#include "src/discovery/peer_registry.h"
#include "src/protocol/envelope.h"

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace call {

enum class State {
  Idle,
  Calling,
  Ringing,
  InCall,
};

enum class Role {
  Caller,
  Callee,
};

enum class StartResult {
  Started,
  UnknownPeer,
  AlreadyInCall,
  SendFailed,
};

enum class EndReason {
  LocalHangup,
  RemoteHangup,
  Rejected,
  Busy,
  Timeout,
  DeviceUnavailable,
  Shutdown,
};

std::string_view stateToString(State s);
std::string_view startResultToString(StartResult r);
std::string_view endReasonToString(EndReason r);

struct CallSession {
  std::string peerIp;
  std::string peerUsername;
  Role role = Role::Caller;
  protocol::CallKind kind = protocol::CallKind::Audio;
  protocol::MediaPorts localPorts;
  protocol::MediaPorts peerPorts; // zero until negotiated
};

// Media for one established call. start() opens devices and sockets;
// stop() must release all of them before returning and be safe to repeat.
class MediaSession {
public:
  virtual ~MediaSession() = default;
  virtual bool start(std::string* err) = 0;
  virtual void stop() = 0;
};

using MediaFactory = std::function<std::unique_ptr<MediaSession>(const CallSession&)>;

struct CallObserver {
  std::function<void(const CallSession&)> onIncomingCall;
  std::function<void(State from, State to)> onStateChanged;
  std::function<void(const CallSession&)> onCallStarted;
  std::function<void(const std::string& peerIp, EndReason)> onCallEnded;
};

// Single-slot call state machine driven by UDP control datagrams. Every
// transition happens under one mutex; observer callbacks run after it is
// released.
class CallSignalingEngine {
public:
  struct Options {
    std::string username;
    protocol::MediaPorts localPorts;
    // Where to reach a peer before it has told us its ports.
    uint16_t peerControlPort = 13002;
    std::chrono::milliseconds answerTimeout{30000};
  };

  CallSignalingEngine(boost::asio::io_context& io,
                      const discovery::PeerRegistry& registry,
                      MediaFactory mediaFactory,
                      Options opt);
  ~CallSignalingEngine();

  CallSignalingEngine(const CallSignalingEngine&) = delete;
  CallSignalingEngine& operator=(const CallSignalingEngine&) = delete;

  void setObserver(CallObserver observer);

  // Binds the control port (localPorts.control); throws std::runtime_error
  // when it is unavailable.
  void start();
  // Hangs up any call, then closes the control socket on the strand.
  // Handlers capture the engine, so the io_context must stop running them
  // before the engine is destroyed.
  void stop();

  StartResult initiate(const std::string& ip, protocol::CallKind kind);
  bool accept();
  bool reject();
  // Idempotent; returns false when there was nothing to end.
  bool hangup();

  State state() const;
  std::optional<CallSession> session() const;
  uint16_t boundControlPort() const { return boundControlPort_; }

  void onControlMessage(const protocol::Envelope& env, const std::string& fromIp);

private:
  using Notes = std::vector<std::function<void()>>;

  void doReceive();
  void armAnswerTimer(uint64_t callId);
  void onAnswerTimeout(uint64_t callId);

  bool sendControl(const std::string& ip, uint16_t port, const protocol::Envelope& env);
  uint16_t peerControlPortLocked() const;

  void setStateLocked(State to, Notes& notes);
  bool startMediaLocked(std::string* err);
  void endLocked(EndReason reason, Notes& notes);
  static void flush(Notes& notes);

  boost::asio::io_context& io_;
  const discovery::PeerRegistry& registry_;
  MediaFactory mediaFactory_;
  Options opt_;

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::udp::socket controlSocket_;
  boost::asio::steady_timer answerTimer_;
  std::array<char, 4096> recvBuf_{};
  boost::asio::ip::udp::endpoint remote_;
  uint16_t boundControlPort_ = 0;

  std::mutex sendMu_;
  boost::asio::ip::udp::socket sendSocket_;

  mutable std::mutex mu_;
  State state_ = State::Idle;
  std::optional<CallSession> session_;
  std::unique_ptr<MediaSession> media_;
  uint64_t callId_ = 0;
  CallObserver observer_;
};

} // namespace call
