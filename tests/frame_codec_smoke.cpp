#include "src/messaging/frame_codec.h"

#include <boost/asio.hpp>

#include <cassert>
#include <string>

int main() {
  using boost::asio::local::stream_protocol;

  // Header encoding is eight zero-padded decimal digits.
  {
    const auto frame = messaging::encodeFrame("hello");
    assert(frame && *frame == "00000005hello");
    assert(messaging::encodeHeader(messaging::kMaxPayloadSize).has_value());
    assert(!messaging::encodeHeader(messaging::kMaxPayloadSize + 1).has_value());

    messaging::FrameError err = messaging::FrameError::None;
    assert(messaging::parseHeader("00000000", &err) == 0u);
    assert(messaging::parseHeader("99999999", &err) == 99999999u);
    assert(!messaging::parseHeader("0000012a", &err));
    assert(err == messaging::FrameError::BadHeader);
    assert(!messaging::parseHeader("+0000012", &err));
    assert(!messaging::parseHeader(" 0000012", &err));
    assert(!messaging::parseHeader("0001", &err));
    assert(messaging::frameErrorToString(messaging::FrameError::Truncated) == "truncated");

    assert(messaging::parseHeader("00001000", &err, 1000) == 1000u);
    assert(!messaging::parseHeader("00001001", &err, 1000));
    assert(err == messaging::FrameError::TooLarge);
  }

  // A frame split across several writes is read back whole.
  {
    boost::asio::io_context io;
    stream_protocol::socket a(io);
    stream_protocol::socket b(io);
    boost::asio::local::connect_pair(a, b);

    const std::string payload = R"({"type":"text","content":"split"})";
    const std::string frame = *messaging::encodeFrame(payload);
    boost::asio::write(a, boost::asio::buffer(frame.data(), 3));
    boost::asio::write(a, boost::asio::buffer(frame.data() + 3, 7));
    boost::asio::write(a, boost::asio::buffer(frame.data() + 10, frame.size() - 10));

    std::string got;
    boost::system::error_code ec;
    assert(messaging::readFrame(b, &got, ec) == messaging::FrameError::None);
    assert(got == payload);
  }

  // Two frames back to back on one stream stay separate.
  {
    boost::asio::io_context io;
    stream_protocol::socket a(io);
    stream_protocol::socket b(io);
    boost::asio::local::connect_pair(a, b);

    const std::string both = *messaging::encodeFrame("first") + *messaging::encodeFrame("");
    boost::asio::write(a, boost::asio::buffer(both));
    std::string got;
    boost::system::error_code ec;
    assert(messaging::readFrame(b, &got, ec) == messaging::FrameError::None && got == "first");
    assert(messaging::readFrame(b, &got, ec) == messaging::FrameError::None && got.empty());
  }

  // Close before the declared length arrives.
  {
    boost::asio::io_context io;
    stream_protocol::socket a(io);
    stream_protocol::socket b(io);
    boost::asio::local::connect_pair(a, b);

    boost::asio::write(a, boost::asio::buffer(std::string("00000010abc")));
    a.close();
    std::string got;
    boost::system::error_code ec;
    assert(messaging::readFrame(b, &got, ec) == messaging::FrameError::Truncated);
  }

  // Close in the middle of the header.
  {
    boost::asio::io_context io;
    stream_protocol::socket a(io);
    stream_protocol::socket b(io);
    boost::asio::local::connect_pair(a, b);

    boost::asio::write(a, boost::asio::buffer(std::string("0000")));
    a.close();
    std::string got;
    boost::system::error_code ec;
    assert(messaging::readFrame(b, &got, ec) == messaging::FrameError::Truncated);
  }

  // A declared length over the cap is refused before any payload is read.
  {
    boost::asio::io_context io;
    stream_protocol::socket a(io);
    stream_protocol::socket b(io);
    boost::asio::local::connect_pair(a, b);

    boost::asio::write(a, boost::asio::buffer(*messaging::encodeFrame(std::string(64, 'x'))));
    std::string got = "untouched";
    boost::system::error_code ec;
    assert(messaging::readFrame(b, &got, ec, 32) == messaging::FrameError::TooLarge);
    assert(got == "untouched");
  }

  // Non-digit header.
  {
    boost::asio::io_context io;
    stream_protocol::socket a(io);
    stream_protocol::socket b(io);
    boost::asio::local::connect_pair(a, b);

    boost::asio::write(a, boost::asio::buffer(std::string("LENGTH:5hello")));
    std::string got;
    boost::system::error_code ec;
    assert(messaging::readFrame(b, &got, ec) == messaging::FrameError::BadHeader);
  }

  return 0;
}
