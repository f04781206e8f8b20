#pragma once

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace common {

inline std::string format_time(std::chrono::system_clock::time_point tp, const char* fmt, bool utc) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  if (utc) {
    gmtime_r(&t, &tm);
  } else {
    localtime_r(&t, &tm);
  }
  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

inline std::string iso_timestamp_utc() {
  return format_time(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%SZ", true);
}

// Local wall-clock stamp used in stored file and backup names.
inline std::string compact_timestamp_local() {
  return format_time(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S", false);
}

inline double unix_time_seconds() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

inline std::mutex& log_mutex() {
  static std::mutex m;
  return m;
}

inline void log(std::string_view msg) {
  std::string line = "[" + iso_timestamp_utc() + "] ";
  line.append(msg);
  line.push_back('\n');
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cerr << line;
}

inline bool trace_enabled() {
  static const bool enabled = [] {
    const char* v = std::getenv("LANCHAT_TRACE");
    return v && *v && std::string_view(v) != "0";
  }();
  return enabled;
}

inline void trace(std::string_view msg) {
  if (!trace_enabled()) return;
  log(std::string("trace: ").append(msg));
}

template <class Endpoint>
inline std::string endpoint_to_string(const Endpoint& ep) {
  std::ostringstream oss;
  oss << ep.address().to_string() << ":" << ep.port();
  return oss.str();
}

inline std::string base64_encode(std::span<const uint8_t> data) {
  static constexpr char kB64[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  std::size_t i = 0;
  while (i + 3 <= data.size()) {
    const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8) |
                       (static_cast<uint32_t>(data[i + 2]));
    out.push_back(kB64[(v >> 18) & 0x3F]);
    out.push_back(kB64[(v >> 12) & 0x3F]);
    out.push_back(kB64[(v >> 6) & 0x3F]);
    out.push_back(kB64[v & 0x3F]);
    i += 3;
  }

  const std::size_t rem = data.size() - i;
  if (rem == 1) {
    const uint32_t v = static_cast<uint32_t>(data[i]) << 16;
    out.push_back(kB64[(v >> 18) & 0x3F]);
    out.push_back(kB64[(v >> 12) & 0x3F]);
    out.push_back('=');
    out.push_back('=');
  } else if (rem == 2) {
    const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1]) << 8);
    out.push_back(kB64[(v >> 18) & 0x3F]);
    out.push_back(kB64[(v >> 12) & 0x3F]);
    out.push_back(kB64[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

inline std::optional<std::vector<uint8_t>> base64_decode(std::string_view s) {
  // Tolerate embedded line breaks (some encoders wrap at 76 columns).
  std::string b64;
  b64.reserve(s.size());
  for (char c : s) {
    if (c == '\r' || c == '\n') continue;
    b64.push_back(c);
  }
  if (b64.size() % 4 != 0) return std::nullopt;

  auto val = [](unsigned char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    if (c == '=') return -2;
    return -1;
  };

  std::vector<uint8_t> out;
  out.reserve((b64.size() / 4) * 3);

  for (std::size_t i = 0; i < b64.size(); i += 4) {
    const int v0 = val(static_cast<unsigned char>(b64[i]));
    const int v1 = val(static_cast<unsigned char>(b64[i + 1]));
    const int v2 = val(static_cast<unsigned char>(b64[i + 2]));
    const int v3 = val(static_cast<unsigned char>(b64[i + 3]));
    if (v0 < 0 || v1 < 0 || v2 == -1 || v3 == -1) return std::nullopt;
    // Padding is only valid in the final quantum.
    if ((v2 == -2 || v3 == -2) && i + 4 != b64.size()) return std::nullopt;
    if (v2 == -2 && v3 != -2) return std::nullopt;

    const uint32_t n0 = static_cast<uint32_t>(v0);
    const uint32_t n1 = static_cast<uint32_t>(v1);
    const uint32_t n2 = (v2 == -2) ? 0u : static_cast<uint32_t>(v2);
    const uint32_t n3 = (v3 == -2) ? 0u : static_cast<uint32_t>(v3);
    const uint32_t v = (n0 << 18) | (n1 << 12) | (n2 << 6) | n3;

    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    if (v2 != -2) out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    if (v3 != -2) out.push_back(static_cast<uint8_t>(v & 0xFF));
  }
  return out;
}

struct HostPort {
  std::string host;
  uint16_t port = 0;
};

inline std::optional<uint16_t> parse_port(std::string_view s) {
  if (s.empty() || s.size() > 5) return std::nullopt;
  unsigned long v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + static_cast<unsigned long>(c - '0');
  }
  if (v == 0 || v > 65535) return std::nullopt;
  return static_cast<uint16_t>(v);
}

inline std::optional<HostPort> parse_host_port(std::string_view s) {
  auto trim = [](std::string_view v) {
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front()))) v.remove_prefix(1);
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.remove_suffix(1);
    return v;
  };
  s = trim(s);
  const auto colon = s.rfind(':');
  if (colon == std::string_view::npos) return std::nullopt;
  const std::string_view host = trim(s.substr(0, colon));
  const auto port = parse_port(trim(s.substr(colon + 1)));
  if (host.empty() || !port) return std::nullopt;
  return HostPort{std::string(host), *port};
}

} // namespace common
