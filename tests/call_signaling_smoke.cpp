#include "src/call/call_signaling.h"
#include "src/discovery/peer_registry.h"

#include <boost/asio.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

uint16_t free_udp_port(boost::asio::io_context& io) {
  boost::asio::ip::udp::socket s(io, boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), 0));
  return s.local_endpoint().port();
}

struct MediaCounters {
  std::atomic<int> started{0};
  std::atomic<int> stopped{0};
  std::atomic<bool> failStart{false};
};

class FakeMedia : public call::MediaSession {
public:
  explicit FakeMedia(std::shared_ptr<MediaCounters> c) : c_(std::move(c)) {}
  ~FakeMedia() override { stop(); }

  bool start(std::string* err) override {
    if (c_->failStart) {
      if (err) *err = "no microphone";
      return false;
    }
    running_ = true;
    ++c_->started;
    return true;
  }
  void stop() override {
    if (!running_) return;
    running_ = false;
    ++c_->stopped;
  }

private:
  std::shared_ptr<MediaCounters> c_;
  bool running_ = false;
};

struct Endpoint {
  Endpoint(boost::asio::io_context& io, const discovery::PeerRegistry& reg, const std::string& name,
           protocol::MediaPorts ports, uint16_t peerControl, std::chrono::milliseconds answerTimeout = 5s)
      : media(std::make_shared<MediaCounters>()),
        engine(io, reg,
               [m = media](const call::CallSession&) { return std::make_unique<FakeMedia>(m); },
               options(name, ports, peerControl, answerTimeout)) {
    call::CallObserver obs;
    obs.onIncomingCall = [this](const call::CallSession& s) {
      std::lock_guard lk(mu);
      incoming.push_back(s);
    };
    obs.onCallEnded = [this](const std::string&, call::EndReason r) {
      std::lock_guard lk(mu);
      ended.push_back(r);
    };
    engine.setObserver(std::move(obs));
    engine.start();
  }

  static call::CallSignalingEngine::Options options(const std::string& name, protocol::MediaPorts ports,
                                                    uint16_t peerControl, std::chrono::milliseconds answerTimeout) {
    call::CallSignalingEngine::Options o;
    o.username = name;
    o.localPorts = ports;
    o.peerControlPort = peerControl;
    o.answerTimeout = answerTimeout;
    return o;
  }

  size_t incomingCount() {
    std::lock_guard lk(mu);
    return incoming.size();
  }
  std::vector<call::EndReason> endings() {
    std::lock_guard lk(mu);
    return ended;
  }

  std::shared_ptr<MediaCounters> media;
  call::CallSignalingEngine engine;
  std::mutex mu;
  std::vector<call::CallSession> incoming;
  std::vector<call::EndReason> ended;
};

template <class Pred>
bool wait_for(Pred pred, std::chrono::milliseconds limit = 3s) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

protocol::MediaPorts ports_for(boost::asio::io_context& io) {
  return protocol::MediaPorts{free_udp_port(io), free_udp_port(io), free_udp_port(io)};
}

} // namespace

int main() {
  using call::EndReason;
  using call::State;

  boost::asio::io_context io;
  auto guard = boost::asio::make_work_guard(io);
  std::thread runner([&] { io.run(); });

  discovery::PeerRegistry registry(30s);
  const auto portsA = ports_for(io);
  const auto portsB = ports_for(io);
  const auto portsC = ports_for(io);

  Endpoint a(io, registry, "alice", portsA, portsB.control);
  Endpoint b(io, registry, "bob", portsB, portsA.control);
  Endpoint c(io, registry, "carol", portsC, portsB.control);

  // Nobody is listed yet.
  assert(a.engine.initiate("127.0.0.1", protocol::CallKind::Audio) == call::StartResult::UnknownPeer);
  assert(a.engine.state() == State::Idle);
  registry.upsert("127.0.0.1", "loopback", 12345);

  // Call, answer, local hangup.
  {
    assert(a.engine.initiate("127.0.0.1", protocol::CallKind::Video) == call::StartResult::Started);
    assert(a.engine.state() == State::Calling);
    assert(a.engine.initiate("127.0.0.1", protocol::CallKind::Audio) == call::StartResult::AlreadyInCall);

    assert(wait_for([&] { return b.engine.state() == State::Ringing; }));
    assert(b.incomingCount() == 1);
    assert(b.incoming[0].kind == protocol::CallKind::Video);
    assert(b.incoming[0].peerPorts == portsA);
    assert(b.incoming[0].peerUsername == "alice");

    assert(b.engine.accept());
    assert(b.engine.state() == State::InCall);
    assert(wait_for([&] { return a.engine.state() == State::InCall; }));
    assert(a.engine.session()->peerPorts == portsB);
    assert(a.media->started == 1 && b.media->started == 1);

    // A third party is told we are busy; the call in progress is untouched.
    assert(c.engine.initiate("127.0.0.1", protocol::CallKind::Audio) == call::StartResult::Started);
    assert(wait_for([&] { return c.engine.state() == State::Idle; }));
    assert(c.endings().back() == EndReason::Busy);
    assert(b.engine.state() == State::InCall);

    assert(a.engine.hangup());
    assert(!a.engine.hangup());
    assert(a.engine.state() == State::Idle);
    assert(a.media->stopped == 1);
    assert(wait_for([&] { return b.engine.state() == State::Idle; }));
    assert(b.media->stopped == 1);
    assert(a.endings().back() == EndReason::LocalHangup);
    assert(b.endings().back() == EndReason::RemoteHangup);
  }

  // Callee declines.
  {
    assert(a.engine.initiate("127.0.0.1", protocol::CallKind::Audio) == call::StartResult::Started);
    assert(wait_for([&] { return b.engine.state() == State::Ringing; }));
    assert(b.engine.reject());
    assert(!b.engine.accept());
    assert(wait_for([&] { return a.engine.state() == State::Idle; }));
    assert(a.endings().back() == EndReason::Rejected);
    assert(b.endings().back() == EndReason::Rejected);
  }

  // Caller cancels before an answer.
  {
    assert(a.engine.initiate("127.0.0.1", protocol::CallKind::Audio) == call::StartResult::Started);
    assert(wait_for([&] { return b.engine.state() == State::Ringing; }));
    assert(a.engine.hangup());
    assert(wait_for([&] { return b.engine.state() == State::Idle; }));
    assert(b.endings().back() == EndReason::RemoteHangup);
  }

  // The callee's devices fail: nobody ends up in a call.
  {
    b.media->failStart = true;
    const int startedBefore = a.media->started;
    assert(a.engine.initiate("127.0.0.1", protocol::CallKind::Audio) == call::StartResult::Started);
    assert(wait_for([&] { return b.engine.state() == State::Ringing; }));
    assert(b.engine.accept());
    assert(b.engine.state() == State::Idle);
    assert(b.endings().back() == EndReason::DeviceUnavailable);
    assert(wait_for([&] { return a.engine.state() == State::Idle; }));
    assert(a.endings().back() == EndReason::Rejected);
    assert(a.media->started == startedBefore);
    b.media->failStart = false;
  }

  // An unanswered call times out on the ringing side, which tells the caller.
  const auto portsD = ports_for(io);
  const auto portsE = ports_for(io);
  Endpoint d(io, registry, "dan", portsD, portsE.control, 5s);
  Endpoint e(io, registry, "erin", portsE, portsD.control, 300ms);
  {
    assert(d.engine.initiate("127.0.0.1", protocol::CallKind::Audio) == call::StartResult::Started);
    assert(wait_for([&] { return e.engine.state() == State::Ringing; }));
    assert(wait_for([&] { return d.engine.state() == State::Idle && e.engine.state() == State::Idle; }));
    assert(d.endings().back() == EndReason::Timeout);
    assert(e.endings().back() == EndReason::Timeout);
    d.engine.stop();
    e.engine.stop();
  }

  // Control messages from a stranger do not touch the session.
  {
    assert(a.engine.initiate("127.0.0.1", protocol::CallKind::Audio) == call::StartResult::Started);
    a.engine.onControlMessage(protocol::CallEnded{}, "10.1.2.3");
    a.engine.onControlMessage(protocol::Busy{}, "10.1.2.3");
    assert(a.engine.state() == State::Calling);
    assert(wait_for([&] { return b.engine.state() == State::Ringing; }));

    // Unknown callers get no ring.
    c.engine.onControlMessage(protocol::CallRequest{"mallory", protocol::CallKind::Audio, portsA}, "10.1.2.3");
    assert(c.engine.state() == State::Idle);

    a.engine.stop();
    assert(a.engine.state() == State::Idle);
    assert(a.endings().back() == EndReason::Shutdown);
    assert(wait_for([&] { return b.engine.state() == State::Idle; }));
  }

  b.engine.stop();
  c.engine.stop();
  guard.reset();
  io.stop();
  runner.join();
  return 0;
}
