#include "common/config.hpp"
#include "common/util.hpp"
#include "src/call/call_signaling.h"
#include "src/discovery/discovery_service.h"
#include "src/discovery/peer_registry.h"
#include "src/media/media_stream_engine.h"
#include "src/messaging/message_transport.h"
#include "src/relay/relay_client.h"
#include "src/storage/file_store.h"
#include "src/storage/message_history.h"

#include <boost/asio.hpp>

#include <atomic>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace {

constexpr std::string_view kHelp =
    "Commands: /peers, /msg <ip> <text>, /file <ip> <path>, /call <ip>, /video <ip>, /accept, /reject, /hangup, "
    "/files, /history <ip> [n], /quit";

void print_line(const std::string& line) {
  std::lock_guard<std::mutex> lk(common::log_mutex());
  std::cout << line << "\n";
  std::cout.flush();
}

struct Options {
  std::optional<std::string> config_path;
  std::optional<std::string> name;
  std::optional<uint16_t> message_port;
  std::optional<uint16_t> discovery_port;
  std::optional<uint16_t> media_port;
  std::optional<std::string> data_dir;
  std::optional<std::string> video_device;
  std::optional<std::string> audio_device;
  std::optional<common::HostPort> relay;
};

// Mesh peer: discovery, framed messaging, calls and media on one host.
class App : public std::enable_shared_from_this<App>, public messaging::MessageSink {
 public:
  App(boost::asio::io_context& io, common::Config cfg)
      : io_(io),
        cfg_(std::move(cfg)),
        registry_(cfg_.peer_timeout),
        files_(cfg_.data_dir / "files"),
        history_(cfg_.data_dir),
        transport_(io, registry_, files_, *this, transport_options(cfg_), &history_),
        discovery_(io, registry_, discovery_options(cfg_)),
        calls_(io, registry_, media::makeDeviceMediaFactory(cfg_, &frames_), call_options(cfg_)),
        signals_(io, SIGINT, SIGTERM),
        stdin_(io, ::dup(STDIN_FILENO)) {}

  void run() {
    signals_.async_wait([self = shared_from_this()](const boost::system::error_code& ec, int) {
      if (ec) return;
      common::log("signal received, shutting down");
      self->shutdown();
    });

    registry_.setCallbacks(
        [](const discovery::Peer& p) { print_line("* " + p.username + " (" + p.ip + ") is online"); },
        [](const discovery::Peer& p) { print_line("* " + p.username + " (" + p.ip + ") went offline"); });

    call::CallObserver obs;
    obs.onIncomingCall = [](const call::CallSession& s) {
      print_line("* incoming " + std::string(protocol::callKindToString(s.kind)) + " call from " + s.peerUsername +
                 " (" + s.peerIp + "). /accept or /reject");
    };
    obs.onStateChanged = [](call::State from, call::State to) {
      common::trace("call: " + std::string(call::stateToString(from)) + " -> " + std::string(call::stateToString(to)));
    };
    obs.onCallStarted = [](const call::CallSession& s) { print_line("* in call with " + s.peerUsername); };
    obs.onCallEnded = [](const std::string& ip, call::EndReason r) {
      print_line("* call with " + ip + " ended: " + std::string(call::endReasonToString(r)));
    };
    calls_.setObserver(std::move(obs));

    transport_.start();
    discovery_.start();
    calls_.start();

    print_line("You are " + cfg_.username + ". Message port " + std::to_string(transport_.boundPort()) +
               ", media ports " + std::to_string(cfg_.audio_port()) + "-" + std::to_string(cfg_.control_port()) + ".");
    print_line(std::string(kHelp));
    start_stdin_read();
  }

  void onText(const std::string& ip, const std::string& username, const std::string& content, double) override {
    print_line("[" + username + "@" + ip + "] " + content);
  }

  void onFile(const std::string& ip, const std::string& username, const std::string& filename,
              const std::string& storedName) override {
    print_line("[" + username + "@" + ip + "] sent file " + filename + " (saved as " + storedName + ")");
  }

 private:
  static messaging::MessageTransport::Options transport_options(const common::Config& cfg) {
    messaging::MessageTransport::Options o;
    o.username = cfg.username;
    o.listenPort = cfg.message_port;
    o.sendTimeout = cfg.send_timeout;
    o.maxFrameBytes = cfg.max_message_bytes;
    return o;
  }

  static discovery::DiscoveryService::Options discovery_options(const common::Config& cfg) {
    discovery::DiscoveryService::Options o;
    o.username = cfg.username;
    o.discoveryPort = cfg.discovery_port;
    o.messagePort = cfg.message_port;
    o.broadcastInterval = cfg.broadcast_interval;
    o.pruneInterval = cfg.prune_interval;
    return o;
  }

  static call::CallSignalingEngine::Options call_options(const common::Config& cfg) {
    call::CallSignalingEngine::Options o;
    o.username = cfg.username;
    o.localPorts = protocol::MediaPorts{cfg.audio_port(), cfg.video_port(), cfg.control_port()};
    o.peerControlPort = cfg.control_port();
    o.answerTimeout = cfg.call_answer_timeout;
    return o;
  }

  void start_stdin_read() {
    auto self = shared_from_this();
    boost::asio::async_read_until(stdin_, stdin_buf_, '\n', [self](const boost::system::error_code& ec, std::size_t) {
      if (ec) {
        if (ec != boost::asio::error::operation_aborted) self->shutdown();
        return;
      }
      std::istream is(&self->stdin_buf_);
      std::string line;
      std::getline(is, line);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      self->handle_stdin_line(line);
      if (!self->shutting_down_) self->start_stdin_read();
    });
  }

  // Sends block for up to the send timeout, so they run off the io thread.
  template <class Fn>
  void run_blocking(Fn fn) {
    boost::asio::post(workers_, std::move(fn));
  }

  void handle_stdin_line(const std::string& line) {
    if (line.empty()) return;
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;

    if (cmd == "/quit") {
      shutdown();
      return;
    }
    if (cmd == "/help") {
      print_line(std::string(kHelp));
      return;
    }
    if (cmd == "/peers") {
      const auto peers = registry_.activePeers();
      if (peers.empty()) print_line("no peers online");
      for (const auto& p : peers) print_line("  " + p.ip + "  " + p.username + "  (port " + std::to_string(p.port) + ")");
      return;
    }
    if (cmd == "/msg") {
      std::string ip;
      in >> ip;
      std::string text;
      std::getline(in, text);
      while (!text.empty() && text.front() == ' ') text.erase(text.begin());
      if (ip.empty() || text.empty()) {
        print_line("usage: /msg <ip> <text>");
        return;
      }
      run_blocking([self = shared_from_this(), ip, text] {
        const auto st = self->transport_.sendText(ip, text);
        if (st != messaging::SendStatus::Ok) {
          print_line("! message to " + ip + " failed: " + std::string(messaging::sendStatusToString(st)));
        }
      });
      return;
    }
    if (cmd == "/file") {
      std::string ip;
      in >> ip;
      std::string path;
      std::getline(in, path);
      while (!path.empty() && path.front() == ' ') path.erase(path.begin());
      if (ip.empty() || path.empty()) {
        print_line("usage: /file <ip> <path>");
        return;
      }
      run_blocking([self = shared_from_this(), ip, path] {
        const auto st = self->transport_.sendFile(ip, path);
        if (st != messaging::SendStatus::Ok) {
          print_line("! file to " + ip + " failed: " + std::string(messaging::sendStatusToString(st)));
        } else {
          print_line("* sent " + path + " to " + ip);
        }
      });
      return;
    }
    if (cmd == "/call" || cmd == "/video") {
      std::string ip;
      in >> ip;
      if (ip.empty()) {
        print_line("usage: " + cmd + " <ip>");
        return;
      }
      const auto kind = cmd == "/video" ? protocol::CallKind::Video : protocol::CallKind::Audio;
      const auto r = calls_.initiate(ip, kind);
      if (r == call::StartResult::Started) {
        print_line("* calling " + ip + "...");
      } else {
        print_line("! cannot call " + ip + ": " + std::string(call::startResultToString(r)));
      }
      return;
    }
    if (cmd == "/accept") {
      if (!calls_.accept()) print_line("! no incoming call to accept");
      return;
    }
    if (cmd == "/reject") {
      if (!calls_.reject()) print_line("! no incoming call to reject");
      return;
    }
    if (cmd == "/hangup") {
      if (!calls_.hangup()) print_line("! not in a call");
      return;
    }
    if (cmd == "/files") {
      std::string err;
      const auto list = files_.list(&err);
      if (!err.empty()) print_line("! " + err);
      if (list.empty() && err.empty()) print_line("no received files");
      for (const auto& f : list) print_line("  " + f.name + "  " + std::to_string(f.size) + " bytes");
      return;
    }
    if (cmd == "/history") {
      std::string ip;
      std::string count;
      in >> ip >> count;
      size_t limit = 20;
      if (!count.empty()) {
        const auto res = std::from_chars(count.data(), count.data() + count.size(), limit);
        if (res.ec != std::errc() || res.ptr != count.data() + count.size()) {
          print_line("usage: /history <ip> [n]");
          return;
        }
      }
      if (ip.empty()) {
        print_line("usage: /history <ip> [n]");
        return;
      }
      for (const auto& r : history_.query(ip, limit)) {
        const std::string who = r.outgoing ? "me" : r.senderUsername;
        print_line("  " + r.timestamp + " " + who + ": " + (r.type == "file" ? "[file] " : "") + r.content);
      }
      std::string err;
      if (!history_.markRead(ip, &err)) print_line("! " + err);
      return;
    }
    print_line("unknown command. " + std::string(kHelp));
  }

  void shutdown() {
    if (shutting_down_.exchange(true)) return;

    common::log("shutting down");
    calls_.stop();
    discovery_.stop();
    transport_.stop();
    workers_.join();

    boost::system::error_code ec;
    signals_.cancel(ec);
    stdin_.close(ec);
    io_.stop();
  }

  boost::asio::io_context& io_;
  common::Config cfg_;
  discovery::PeerRegistry registry_;
  storage::DirectoryFileStore files_;
  storage::JsonMessageHistory history_;
  media::LoggingFrameSink frames_;
  messaging::MessageTransport transport_;
  discovery::DiscoveryService discovery_;
  call::CallSignalingEngine calls_;
  boost::asio::thread_pool workers_{1};

  boost::asio::signal_set signals_;
  boost::asio::posix::stream_descriptor stdin_;
  boost::asio::streambuf stdin_buf_;
  std::atomic<bool> shutting_down_{false};
};

// Star-topology client: everything goes through one hub connection.
class RelayApp : public std::enable_shared_from_this<RelayApp> {
 public:
  RelayApp(boost::asio::io_context& io, common::Config cfg, common::HostPort hub)
      : io_(io), cfg_(std::move(cfg)), signals_(io, SIGINT, SIGTERM), stdin_(io, ::dup(STDIN_FILENO)) {
    relay::RelayClient::Config rc;
    rc.host = hub.host;
    rc.port = hub.port;
    rc.username = cfg_.username;
    client_ = std::make_shared<relay::RelayClient>(io, std::move(rc));
  }

  void run() {
    signals_.async_wait([self = shared_from_this()](const boost::system::error_code& ec, int) {
      if (ec) return;
      common::log("signal received, shutting down");
      self->shutdown();
    });

    relay::RelayClient::Handlers h;
    h.onRegistered = [this] { print_line("You are " + cfg_.username + " on the hub. Type to broadcast; /peers, /quit"); };
    h.onPeerList = [](const std::vector<protocol::PeerListEntry>& peers) {
      print_line("* " + std::to_string(peers.size()) + " peer(s) on the hub");
    };
    h.onMessage = [](const common::json& j) {
      const std::string type = j.value("type", std::string());
      const std::string who = j.value("username", j.value("sender", std::string("?")));
      if (type == "text") {
        print_line("[" + who + "] " + j.value("content", std::string()));
      } else {
        print_line("* " + type + " from " + j.value("sender", std::string("?")));
      }
    };
    h.onError = [](const std::string& message) { print_line("! hub: " + message); };
    h.onClosed = [self = weak_from_this()] {
      if (auto s = self.lock()) s->shutdown();
    };
    client_->start(std::move(h));
    start_stdin_read();
  }

 private:
  void start_stdin_read() {
    auto self = shared_from_this();
    boost::asio::async_read_until(stdin_, stdin_buf_, '\n', [self](const boost::system::error_code& ec, std::size_t) {
      if (ec) {
        if (ec != boost::asio::error::operation_aborted) self->shutdown();
        return;
      }
      std::istream is(&self->stdin_buf_);
      std::string line;
      std::getline(is, line);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      self->handle_stdin_line(line);
      if (!self->shutting_down_) self->start_stdin_read();
    });
  }

  void handle_stdin_line(const std::string& line) {
    if (line.empty()) return;
    if (line == "/quit") {
      shutdown();
      return;
    }
    if (line == "/peers") {
      for (const auto& p : client_->peers()) print_line("  " + p.id + "  " + p.username);
      return;
    }
    if (line.front() == '/') {
      print_line("commands: /peers, /quit; anything else is broadcast");
      return;
    }
    client_->sendText(line);
  }

  void shutdown() {
    if (shutting_down_.exchange(true)) return;
    common::log("shutting down");
    client_->stop();
    boost::system::error_code ec;
    signals_.cancel(ec);
    stdin_.close(ec);
    io_.stop();
  }

  boost::asio::io_context& io_;
  common::Config cfg_;
  std::shared_ptr<relay::RelayClient> client_;
  boost::asio::signal_set signals_;
  boost::asio::posix::stream_descriptor stdin_;
  boost::asio::streambuf stdin_buf_;
  std::atomic<bool> shutting_down_{false};
};

std::optional<Options> parse_args(int argc, char** argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto get_val = [&](std::string_view flag) -> std::optional<std::string> {
      if (a == flag) {
        if (i + 1 >= argc) return std::nullopt;
        return std::string(argv[++i]);
      }
      return std::nullopt;
    };
    auto get_port = [&](std::string_view flag, std::optional<uint16_t>* out) -> std::optional<bool> {
      auto v = get_val(flag);
      if (!v) return std::nullopt;
      *out = common::parse_port(*v);
      return out->has_value();
    };

    if (auto v = get_val("--config")) {
      opt.config_path = *v;
      continue;
    }
    if (auto v = get_val("--name")) {
      if (v->empty() || v->size() > 32 || v->find('\n') != std::string::npos) return std::nullopt;
      opt.name = *v;
      continue;
    }
    if (auto ok = get_port("--port", &opt.message_port)) {
      if (!*ok) return std::nullopt;
      continue;
    }
    if (auto ok = get_port("--discovery-port", &opt.discovery_port)) {
      if (!*ok) return std::nullopt;
      continue;
    }
    if (auto ok = get_port("--media-port", &opt.media_port)) {
      if (!*ok) return std::nullopt;
      continue;
    }
    if (auto v = get_val("--data-dir")) {
      opt.data_dir = *v;
      continue;
    }
    if (auto v = get_val("--video-device")) {
      opt.video_device = *v;
      continue;
    }
    if (auto v = get_val("--audio-device")) {
      opt.audio_device = *v;
      continue;
    }
    if (auto v = get_val("--relay")) {
      opt.relay = common::parse_host_port(*v);
      if (!opt.relay) return std::nullopt;
      continue;
    }
    return std::nullopt;
  }
  return opt;
}

bool build_config(const Options& opt, common::Config* cfg, std::string* err) {
  const std::filesystem::path path = opt.config_path ? std::filesystem::path(*opt.config_path)
                                                     : common::default_config_path();
  if (!common::load_config_file(path, cfg, err)) return false;
  if (opt.name) cfg->username = *opt.name;
  if (opt.message_port) cfg->message_port = *opt.message_port;
  if (opt.discovery_port) cfg->discovery_port = *opt.discovery_port;
  if (opt.media_port) {
    if (*opt.media_port > 65533) {
      if (err) *err = "--media-port must leave room for three ports";
      return false;
    }
    cfg->media_base_port = *opt.media_port;
  }
  if (opt.data_dir) cfg->data_dir = *opt.data_dir;
  if (opt.video_device) cfg->video_device = *opt.video_device;
  if (opt.audio_device) cfg->audio_device = *opt.audio_device;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  const auto opt = parse_args(argc, argv);
  if (!opt) {
    std::cerr << "Usage: " << argv[0]
              << " [--name <name>] [--config <path>] [--port <port>] [--discovery-port <port>] [--media-port <port>]"
                 " [--data-dir <dir>] [--video-device <path>] [--audio-device <name>] [--relay <host:port>]\n";
    return 2;
  }

  common::Config cfg;
  std::string err;
  if (!build_config(*opt, &cfg, &err)) {
    std::cerr << "config: " << err << "\n";
    return 2;
  }

  try {
    boost::asio::io_context io;
    if (opt->relay) {
      auto app = std::make_shared<RelayApp>(io, cfg, *opt->relay);
      app->run();
      io.run();
      return 0;
    }
    auto app = std::make_shared<App>(io, cfg);
    app->run();
    io.run();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}
