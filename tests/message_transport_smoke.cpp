#include "src/discovery/peer_registry.h"
#include "src/messaging/frame_codec.h"
#include "src/messaging/message_transport.h"
#include "src/storage/file_store.h"
#include "src/storage/message_history.h"

#include <boost/asio.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

using namespace std::chrono_literals;

struct RecordingSink : messaging::MessageSink {
  void onText(const std::string& ip, const std::string& username, const std::string& content, double) override {
    std::lock_guard lk(mu);
    texts.push_back(ip + "|" + username + "|" + content);
  }
  void onFile(const std::string& ip, const std::string&, const std::string& filename,
              const std::string& storedName) override {
    std::lock_guard lk(mu);
    files.push_back(ip + "|" + filename + "|" + storedName);
  }
  size_t textCount() {
    std::lock_guard lk(mu);
    return texts.size();
  }
  size_t fileCount() {
    std::lock_guard lk(mu);
    return files.size();
  }

  std::mutex mu;
  std::vector<std::string> texts;
  std::vector<std::string> files;
};

template <class Pred>
bool wait_for(Pred pred, std::chrono::milliseconds limit = 3s) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(10ms);
  }
  return true;
}

} // namespace

int main() {
  const auto root = std::filesystem::temp_directory_path() / ("lanchat_transport_" + std::to_string(::getpid()));
  std::filesystem::remove_all(root);

  boost::asio::io_context io;
  auto guard = boost::asio::make_work_guard(io);
  std::thread runner([&] { io.run(); });

  discovery::PeerRegistry registry(30s);
  storage::DirectoryFileStore files(root / "files");
  storage::JsonMessageHistory history(root);
  RecordingSink sink;

  messaging::MessageTransport::Options opt;
  opt.username = "tester";
  opt.listenPort = 0;
  opt.sendTimeout = 2s;
  opt.stallTimeout = 300ms;
  opt.maxFrameBytes = 64 * 1024;
  messaging::MessageTransport transport(io, registry, files, sink, opt, &history);
  transport.start();
  const uint16_t port = transport.boundPort();
  assert(port != 0);

  // No message to a peer the registry does not list.
  assert(transport.sendText("127.0.0.1", "nope") == messaging::SendStatus::UnknownPeer);
  assert(transport.sendFile("127.0.0.1", root / "missing") == messaging::SendStatus::UnknownPeer);

  // Inbound from an unknown source is closed unread.
  assert(transport.sendTo("127.0.0.1", port, protocol::Text{"ghost", "boo", 0}) == messaging::SendStatus::Ok);
  std::this_thread::sleep_for(200ms);
  assert(sink.textCount() == 0);

  registry.upsert("127.0.0.1", "self", port);

  // Text round trip through the listener; both directions land in history.
  assert(transport.sendText("127.0.0.1", "hello there") == messaging::SendStatus::Ok);
  assert(wait_for([&] { return sink.textCount() == 1; }));
  assert(sink.texts[0] == "127.0.0.1|tester|hello there");
  assert(wait_for([&] { return history.query("127.0.0.1").size() == 2; }));
  {
    const auto recs = history.query("127.0.0.1");
    assert(recs[0].outgoing || recs[1].outgoing);
    assert(history.stats("127.0.0.1").unread == 1);
  }

  // File transfer is stored under a timestamped name.
  {
    std::filesystem::create_directories(root / "out");
    const auto src = root / "out" / "notes.txt";
    std::ofstream(src, std::ios::binary) << "file body\n";
    assert(transport.sendFile("127.0.0.1", src) == messaging::SendStatus::Ok);
    assert(wait_for([&] { return sink.fileCount() == 1; }));
    const auto listed = files.list();
    assert(listed.size() == 1);
    assert(listed[0].name.size() > std::string("notes.txt").size());
    assert(listed[0].name.substr(listed[0].name.size() - 10) == "_notes.txt");
    const auto bytes = files.read(listed[0].name);
    assert(bytes && std::string(bytes->begin(), bytes->end()) == "file body\n");
  }

  // Text from a non-UTF-8 terminal is delivered with replacement characters.
  assert(transport.sendText("127.0.0.1", "caf\xe9") == messaging::SendStatus::Ok);
  assert(wait_for([&] { return sink.textCount() == 2; }));
  {
    std::lock_guard lk(sink.mu);
    assert(sink.texts[1] == "127.0.0.1|tester|caf\xEF\xBF\xBD");
  }

  // Reading a file that does not exist is not a send.
  assert(transport.sendFile("127.0.0.1", root / "out" / "absent.bin") == messaging::SendStatus::Malformed);

  // Nothing listening.
  {
    boost::asio::ip::tcp::acceptor probe(io, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), 0));
    const uint16_t closedPort = probe.local_endpoint().port();
    probe.close();
    assert(transport.sendTo("127.0.0.1", closedPort, protocol::Text{"x", "y", 0}) ==
           messaging::SendStatus::Unreachable);
  }

  // Malformed or unexpected payloads are contained.
  assert(!transport.handlePayload("127.0.0.1", "{oops"));
  assert(!transport.handlePayload("127.0.0.1", R"({"type":"busy"})"));
  assert(!transport.handlePayload("127.0.0.1", R"({"type":"call_ended"})"));
  assert(!transport.handlePayload("127.0.0.1", R"({"type":"discovery","username":"x","port":50000})"));
  assert(!transport.handlePayload("127.0.0.1", R"({"type":"peer_list","peers":[]})"));
  assert(transport.handlePayload("127.0.0.1", R"({"type":"text","content":"direct"})"));
  assert(sink.texts.back() == "127.0.0.1|Unknown|direct");

  // A sender that stalls mid-frame is dropped.
  {
    boost::asio::io_context cio;
    boost::asio::ip::tcp::socket s(cio);
    s.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), port));
    boost::asio::write(s, boost::asio::buffer(std::string("00000100{\"type\"")));
    char c = 0;
    boost::system::error_code ec;
    const auto began = std::chrono::steady_clock::now();
    s.read_some(boost::asio::buffer(&c, 1), ec);
    assert(ec);
    assert(std::chrono::steady_clock::now() - began < 3s);
  }

  // A frame declaring more than maxFrameBytes is dropped without dispatch.
  {
    const size_t before = sink.textCount();
    const std::string body = R"({"type":"text","content":")" + std::string(100000, 'z') + R"("})";
    const std::string frame = *messaging::encodeFrame(body);
    boost::asio::io_context cio;
    boost::asio::ip::tcp::socket s(cio);
    s.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), port));
    boost::system::error_code ec;
    boost::asio::write(s, boost::asio::buffer(frame), ec);
    char c = 0;
    s.read_some(boost::asio::buffer(&c, 1), ec);
    assert(ec);
    std::this_thread::sleep_for(100ms);
    assert(sink.textCount() == before);
  }

  transport.stop();
  guard.reset();
  io.stop();
  runner.join();
  std::filesystem::remove_all(root);
  return 0;
}
