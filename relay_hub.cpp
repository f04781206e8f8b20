#include "common/util.hpp"
#include "src/relay/relay_hub.h"

#include <boost/asio.hpp>

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc != 3) {
    std::cerr << "Usage: " << argv[0] << " <bind_ip> <port>\n";
    std::cerr << "Example: " << argv[0] << " 0.0.0.0 8765\n";
    return 2;
  }

  const auto port = common::parse_port(argv[2]);
  if (!port) {
    std::cerr << "Invalid port\n";
    return 2;
  }

  boost::system::error_code ec;
  const auto addr = boost::asio::ip::make_address(argv[1], ec);
  if (ec) {
    std::cerr << "Invalid bind address: " << ec.message() << "\n";
    return 2;
  }

  try {
    boost::asio::io_context io;
    relay::RelayHub hub(io);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& sec, int) {
      if (sec) return;
      common::log("signal received, shutting down");
      hub.stop();
      io.stop();
    });

    hub.listen(boost::asio::ip::tcp::endpoint(addr, *port));
    io.run();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}
