#include "src/relay/relay_client.h"
#include "src/relay/relay_hub.h"

#include "common/framing.hpp"
#include "common/util.hpp"

#include <boost/asio.hpp>

#include <cassert>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using boost::asio::ip::tcp;
using common::json;

struct Client {
  Client(boost::asio::io_context& io, uint16_t hubPort, const char* fromIp = "127.0.0.1", int receiveBuffer = 0)
      : socket(io) {
    socket.open(tcp::v4());
    if (receiveBuffer > 0) socket.set_option(boost::asio::socket_base::receive_buffer_size(receiveBuffer));
    socket.bind(tcp::endpoint(boost::asio::ip::make_address_v4(fromIp), 0));
    socket.connect(tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), hubPort));
    id = common::endpoint_to_string(socket.local_endpoint());
  }

  void send(const json& j) {
    boost::system::error_code ec;
    const bool ok = common::write_json_frame(socket, j, ec);
    assert(ok && !ec);
    (void)ok;
  }

  json read() {
    boost::system::error_code ec;
    auto j = common::read_json_frame(socket, ec);
    assert(j && !ec);
    return *j;
  }

  json readPeerList(size_t expected) {
    const json j = read();
    assert(j["type"] == "peer_list");
    assert(j["peers"].size() == expected);
    return j;
  }

  tcp::socket socket;
  std::string id;
};

struct Seen {
  bool registered = false;
  bool closed = false;
  size_t peers = 0;
  std::vector<json> messages;
  std::vector<std::string> errors;
};

relay::RelayClient::Handlers record_into(Seen& seen) {
  relay::RelayClient::Handlers h;
  h.onRegistered = [&seen] { seen.registered = true; };
  h.onPeerList = [&seen](const std::vector<protocol::PeerListEntry>& peers) { seen.peers = peers.size(); };
  h.onMessage = [&seen](const json& j) { seen.messages.push_back(j); };
  h.onError = [&seen](const std::string& message) { seen.errors.push_back(message); };
  h.onClosed = [&seen] { seen.closed = true; };
  return h;
}

template <class Pred>
bool run_until(boost::asio::io_context& io, Pred pred) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    if (io.stopped()) io.restart();
    io.run_for(std::chrono::milliseconds(10));
  }
  return true;
}

} // namespace

int main() {
  boost::asio::io_context hubIo;
  relay::RelayHub hub(hubIo, 16);
  hub.listen(tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), 0));
  const uint16_t port = hub.boundPort();
  assert(port != 0);
  std::thread runner([&] { hubIo.run(); });

  boost::asio::io_context io;

  // Registration produces a peer list for everyone connected.
  Client a(io, port);
  a.send(json{{"type", "register"}, {"username", "alice"}});
  {
    const json list = a.readPeerList(1);
    assert(list["peers"][0]["id"] == a.id);
    assert(list["peers"][0]["username"] == "alice");
  }

  Client b(io, port);
  b.send(json{{"type", "register"}});
  b.readPeerList(2);
  {
    const json list = a.readPeerList(2);
    bool sawAnonymous = false;
    for (const auto& p : list["peers"]) sawAnonymous |= p["username"] == "Anonymous";
    assert(sawAnonymous);
  }

  Client c(io, port, "127.0.0.2");
  c.send(json{{"type", "register"}, {"username", "carol"}});
  c.readPeerList(3);
  a.readPeerList(3);
  b.readPeerList(3);

  // Signals reach only the addressed client, stamped with the sender.
  b.send(json{{"type", "offer"}, {"target", a.id}, {"sdp", "v=0"}});
  {
    const json offer = a.read();
    assert(offer["type"] == "offer");
    assert(offer["sdp"] == "v=0");
    assert(offer["sender"] == b.id);
    assert(offer["sender_username"] == "Anonymous");
    assert(offer["timestamp"].get<std::string>().size() == 8);
  }

  // A bare IP addresses the first client connected from it.
  a.send(json{{"type", "ice-candidate"}, {"target", "127.0.0.2"}, {"candidate", "c1"}});
  {
    const json cand = c.read();
    assert(cand["type"] == "ice-candidate");
    assert(cand["sender"] == a.id);
    assert(cand["sender_username"] == "alice");
  }

  // Routing errors go back to the sender.
  a.send(json{{"type", "answer"}, {"target", "10.9.9.9:1"}});
  {
    const json err = a.read();
    assert(err["type"] == "error");
    assert(err["message"] == "target not connected");
    assert(err["target"] == "10.9.9.9:1");
  }
  a.send(json{{"type", "answer"}});
  assert(a.read()["message"] == "missing/invalid field: target");
  a.send(json{{"foo", 1}});
  assert(a.read()["message"] == "missing/invalid field: type");

  // Anything else is broadcast to everyone but the sender.
  a.send(json{{"type", "text"}, {"content", "hello all"}});
  for (Client* other : {&b, &c}) {
    const json msg = other->read();
    assert(msg["type"] == "text");
    assert(msg["content"] == "hello all");
    assert(msg["sender"] == a.id);
    assert(msg.contains("timestamp"));
  }

  // A departure refreshes the list; the sender saw no echo of its own text.
  b.socket.close();
  a.readPeerList(2);
  c.readPeerList(2);

  // A client that stops reading overflows its queue and is dropped. The
  // others keep receiving every broadcast and get a fresh peer list.
  {
    Client stalled(io, port, "127.0.0.1", 4096);
    stalled.send(json{{"type", "register"}, {"username", "slow"}});
    stalled.readPeerList(3);
    a.readPeerList(3);
    c.readPeerList(3);

    const std::string bulk(200 * 1024, 'q');
    int sent = 0;
    int received = 0;
    bool dropped = false;
    while (!dropped && sent < 400) {
      a.send(json{{"type", "text"}, {"content", bulk}});
      ++sent;
      const json msg = c.read();
      if (msg["type"] == "peer_list") {
        assert(msg["peers"].size() == 2);
        dropped = true;
      } else {
        assert(msg["type"] == "text");
        ++received;
      }
    }
    assert(dropped);
    a.readPeerList(2);

    a.send(json{{"type", "text"}, {"content", "after"}});
    ++sent;
    for (;;) {
      const json msg = c.read();
      assert(msg["type"] == "text");
      ++received;
      if (msg["content"] == "after") break;
    }
    assert(received == sent);

    std::promise<size_t> count;
    boost::asio::post(hubIo, [&] { count.set_value(hub.clientCount()); });
    assert(count.get_future().get() == 2);
  }

  boost::asio::post(hubIo, [&] { hub.stop(); });
  runner.join();

  boost::system::error_code ec;
  assert(!common::read_json_frame(a.socket, ec));
  assert(ec);

  // RelayClient against a hub on the same io_context.
  {
    boost::asio::io_context cio;
    relay::RelayHub hub2(cio);
    hub2.listen(tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), 0));

    Seen dora;
    Seen eve;
    auto dc = std::make_shared<relay::RelayClient>(cio, relay::RelayClient::Config{"127.0.0.1", hub2.boundPort(), "dora"});
    auto ec2 = std::make_shared<relay::RelayClient>(cio, relay::RelayClient::Config{"127.0.0.1", hub2.boundPort(), "eve"});
    dc->start(record_into(dora));
    ec2->start(record_into(eve));
    assert(run_until(cio, [&] { return dora.peers == 2 && eve.peers == 2; }));
    assert(dora.registered && eve.registered && dc->connected());

    dc->sendText("hi eve");
    assert(run_until(cio, [&] { return !eve.messages.empty(); }));
    assert(eve.messages[0]["type"] == "text");
    assert(eve.messages[0]["content"] == "hi eve");
    assert(eve.messages[0]["username"] == "dora");
    assert(dora.messages.empty());

    std::string doraId;
    for (const auto& p : ec2->peers()) {
      if (p.username == "dora") doraId = p.id;
    }
    assert(!doraId.empty());
    protocol::Offer offer;
    offer.target = doraId;
    offer.data = "v=0";
    ec2->sendSignal(offer);
    assert(run_until(cio, [&] { return !dora.messages.empty(); }));
    assert(dora.messages[0]["type"] == "offer");
    assert(dora.messages[0]["sender_username"] == "eve");

    protocol::Answer lost;
    lost.target = "10.9.9.9";
    ec2->sendSignal(lost);
    assert(run_until(cio, [&] { return !eve.errors.empty(); }));
    assert(eve.errors[0] == "target not connected");

    hub2.stop();
    assert(run_until(cio, [&] { return dora.closed && eve.closed; }));
    assert(!dc->connected());
  }

  // Nothing listening: the client reports closure instead of hanging.
  {
    boost::asio::io_context cio;
    uint16_t closedPort = 0;
    {
      tcp::acceptor probe(cio, tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), 0));
      closedPort = probe.local_endpoint().port();
    }
    Seen seen;
    auto client = std::make_shared<relay::RelayClient>(cio, relay::RelayClient::Config{"127.0.0.1", closedPort, "x"});
    client->start(record_into(seen));
    assert(run_until(cio, [&] { return seen.closed; }));
    assert(!seen.registered);
  }

  return 0;
}
