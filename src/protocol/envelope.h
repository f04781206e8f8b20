#pragma once

#include "common/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace protocol {

enum class CallKind {
  Audio,
  Video,
  Both,
};

std::string_view callKindToString(CallKind k);
std::optional<CallKind> callKindFromString(std::string_view s);
inline bool callKindHasVideo(CallKind k) { return k != CallKind::Audio; }

struct MediaPorts {
  uint16_t audio = 0;
  uint16_t video = 0;
  uint16_t control = 0;

  bool operator==(const MediaPorts&) const = default;
};

struct Discovery {
  std::string username;
  uint16_t port = 0;
  double timestamp = 0;
};

struct Text {
  std::string username;
  std::string content;
  double timestamp = 0;
};

struct File {
  std::string username;
  std::string filename;
  std::vector<uint8_t> content; // base64 on the wire
  double timestamp = 0;
};

struct CallRequest {
  std::string username;
  CallKind kind = CallKind::Audio;
  MediaPorts ports;
};

struct CallAccepted {
  MediaPorts ports;
};

struct CallRejected {
  std::string reason; // empty when the callee declined
};

struct CallEnded {};

struct Busy {};

// Relay signaling. `sender` is filled in by the hub; `data` is opaque
// (SDP or ICE candidate payload).
struct Offer {
  std::string target;
  std::string sender;
  common::json data;
};

struct Answer {
  std::string target;
  std::string sender;
  common::json data;
};

struct IceCandidate {
  std::string target;
  std::string sender;
  common::json data;
};

struct Register {
  std::string username;
};

struct PeerListEntry {
  std::string id;
  std::string username;
};

struct PeerList {
  std::vector<PeerListEntry> peers;
};

using Envelope = std::variant<Discovery,
                              Text,
                              File,
                              CallRequest,
                              CallAccepted,
                              CallRejected,
                              CallEnded,
                              Busy,
                              Offer,
                              Answer,
                              IceCandidate,
                              Register,
                              PeerList>;

std::string_view typeName(const Envelope& e);
common::json toJson(const Envelope& e);
std::string encode(const Envelope& e);

// Returns nullopt on a missing/unknown `type` or a missing/mistyped field;
// `err` receives the reason.
std::optional<Envelope> fromJson(const common::json& j, std::string* err = nullptr);
std::optional<Envelope> decode(std::string_view text, std::string* err = nullptr);

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace protocol
