#include "src/protocol/envelope.h"

#include "common/util.hpp"

namespace protocol {

using common::json;

namespace {

bool getString(const json& j, const char* key, std::string* out, std::string* err) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    if (err) *err = std::string("missing/invalid field: ") + key;
    return false;
  }
  *out = it->get<std::string>();
  return true;
}

void getOptionalString(const json& j, const char* key, std::string* out) {
  const auto it = j.find(key);
  if (it != j.end() && it->is_string()) *out = it->get<std::string>();
}

bool getPort(const json& j, const char* key, uint16_t* out, std::string* err) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) {
    if (err) *err = std::string("missing/invalid field: ") + key;
    return false;
  }
  const auto v = it->get<int64_t>();
  if (v <= 0 || v > 65535) {
    if (err) *err = std::string("port out of range: ") + key;
    return false;
  }
  *out = static_cast<uint16_t>(v);
  return true;
}

double getTimestamp(const json& j) {
  const auto it = j.find("timestamp");
  if (it != j.end() && it->is_number()) return it->get<double>();
  return 0;
}

json portsToJson(const MediaPorts& p) {
  return json{{"audio", p.audio}, {"video", p.video}, {"control", p.control}};
}

bool portsFromJson(const json& j, MediaPorts* out, std::string* err) {
  const auto it = j.find("ports");
  if (it == j.end() || !it->is_object()) {
    if (err) *err = "missing/invalid field: ports";
    return false;
  }
  return getPort(*it, "audio", &out->audio, err) && getPort(*it, "video", &out->video, err) &&
         getPort(*it, "control", &out->control, err);
}

template <class Signal>
json signalToJson(const char* type, const char* dataKey, const Signal& s) {
  json j{{"type", type}, {"target", s.target}, {dataKey, s.data}};
  if (!s.sender.empty()) j["sender"] = s.sender;
  return j;
}

template <class Signal>
std::optional<Envelope> signalFromJson(const json& j, const char* dataKey, std::string* err) {
  Signal s;
  if (!getString(j, "target", &s.target, err)) return std::nullopt;
  getOptionalString(j, "sender", &s.sender);
  if (const auto it = j.find(dataKey); it != j.end()) s.data = *it;
  return Envelope{std::move(s)};
}

} // namespace

std::string_view callKindToString(CallKind k) {
  switch (k) {
    case CallKind::Audio:
      return "audio";
    case CallKind::Video:
      return "video";
    case CallKind::Both:
      return "both";
  }
  return "audio";
}

std::optional<CallKind> callKindFromString(std::string_view s) {
  if (s == "audio") return CallKind::Audio;
  if (s == "video") return CallKind::Video;
  if (s == "both") return CallKind::Both;
  return std::nullopt;
}

std::string_view typeName(const Envelope& e) {
  return std::visit(Overloaded{
                        [](const Discovery&) { return std::string_view("discovery"); },
                        [](const Text&) { return std::string_view("text"); },
                        [](const File&) { return std::string_view("file"); },
                        [](const CallRequest&) { return std::string_view("call_request"); },
                        [](const CallAccepted&) { return std::string_view("call_accepted"); },
                        [](const CallRejected&) { return std::string_view("call_rejected"); },
                        [](const CallEnded&) { return std::string_view("call_ended"); },
                        [](const Busy&) { return std::string_view("busy"); },
                        [](const Offer&) { return std::string_view("offer"); },
                        [](const Answer&) { return std::string_view("answer"); },
                        [](const IceCandidate&) { return std::string_view("ice-candidate"); },
                        [](const Register&) { return std::string_view("register"); },
                        [](const PeerList&) { return std::string_view("peer_list"); },
                    },
                    e);
}

json toJson(const Envelope& e) {
  return std::visit(
      Overloaded{
          [](const Discovery& d) {
            // ws_port mirrors port for older peers that read it.
            return json{{"type", "discovery"},
                        {"username", d.username},
                        {"port", d.port},
                        {"ws_port", d.port},
                        {"timestamp", d.timestamp}};
          },
          [](const Text& t) {
            return json{{"type", "text"},
                        {"content", t.content},
                        {"username", t.username},
                        {"timestamp", t.timestamp}};
          },
          [](const File& f) {
            return json{{"type", "file"},
                        {"filename", f.filename},
                        {"content", common::base64_encode(f.content)},
                        {"username", f.username},
                        {"timestamp", f.timestamp}};
          },
          [](const CallRequest& r) {
            return json{{"type", "call_request"},
                        {"username", r.username},
                        {"call_type", std::string(callKindToString(r.kind))},
                        {"ports", portsToJson(r.ports)}};
          },
          [](const CallAccepted& a) { return json{{"type", "call_accepted"}, {"ports", portsToJson(a.ports)}}; },
          [](const CallRejected& r) {
            json j{{"type", "call_rejected"}};
            if (!r.reason.empty()) j["reason"] = r.reason;
            return j;
          },
          [](const CallEnded&) { return json{{"type", "call_ended"}}; },
          [](const Busy&) { return json{{"type", "busy"}}; },
          [](const Offer& o) { return signalToJson("offer", "sdp", o); },
          [](const Answer& a) { return signalToJson("answer", "sdp", a); },
          [](const IceCandidate& c) { return signalToJson("ice-candidate", "candidate", c); },
          [](const Register& r) { return json{{"type", "register"}, {"username", r.username}}; },
          [](const PeerList& l) {
            json peers = json::array();
            for (const auto& p : l.peers) peers.push_back(json{{"id", p.id}, {"username", p.username}});
            return json{{"type", "peer_list"}, {"peers", std::move(peers)}};
          },
      },
      e);
}

// Invalid UTF-8 in user-supplied strings becomes U+FFFD instead of throwing.
std::string encode(const Envelope& e) { return toJson(e).dump(-1, ' ', false, json::error_handler_t::replace); }

std::optional<Envelope> fromJson(const json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "envelope is not an object";
    return std::nullopt;
  }
  std::string type;
  if (!getString(j, "type", &type, err)) return std::nullopt;

  if (type == "discovery") {
    Discovery d;
    if (!getString(j, "username", &d.username, err) || !getPort(j, "port", &d.port, err)) return std::nullopt;
    d.timestamp = getTimestamp(j);
    return Envelope{std::move(d)};
  }
  if (type == "text") {
    Text t;
    if (!getString(j, "content", &t.content, err)) return std::nullopt;
    t.username = "Unknown";
    getOptionalString(j, "username", &t.username);
    t.timestamp = getTimestamp(j);
    return Envelope{std::move(t)};
  }
  if (type == "file") {
    File f;
    std::string b64;
    if (!getString(j, "filename", &f.filename, err) || !getString(j, "content", &b64, err)) return std::nullopt;
    auto bytes = common::base64_decode(b64);
    if (!bytes) {
      if (err) *err = "file content is not valid base64";
      return std::nullopt;
    }
    f.content = std::move(*bytes);
    f.username = "Unknown";
    getOptionalString(j, "username", &f.username);
    f.timestamp = getTimestamp(j);
    return Envelope{std::move(f)};
  }
  if (type == "call_request") {
    CallRequest r;
    std::string kind = "both";
    getOptionalString(j, "call_type", &kind);
    const auto k = callKindFromString(kind);
    if (!k) {
      if (err) *err = "unknown call_type: " + kind;
      return std::nullopt;
    }
    r.kind = *k;
    r.username = "Unknown";
    getOptionalString(j, "username", &r.username);
    if (!portsFromJson(j, &r.ports, err)) return std::nullopt;
    return Envelope{std::move(r)};
  }
  if (type == "call_accepted") {
    CallAccepted a;
    if (!portsFromJson(j, &a.ports, err)) return std::nullopt;
    return Envelope{a};
  }
  if (type == "call_rejected") {
    CallRejected r;
    getOptionalString(j, "reason", &r.reason);
    return Envelope{std::move(r)};
  }
  if (type == "call_ended") return Envelope{CallEnded{}};
  if (type == "busy") return Envelope{Busy{}};
  if (type == "offer") return signalFromJson<Offer>(j, "sdp", err);
  if (type == "answer") return signalFromJson<Answer>(j, "sdp", err);
  if (type == "ice-candidate") return signalFromJson<IceCandidate>(j, "candidate", err);
  if (type == "register") {
    Register r;
    if (!getString(j, "username", &r.username, err)) return std::nullopt;
    return Envelope{std::move(r)};
  }
  if (type == "peer_list") {
    const auto it = j.find("peers");
    if (it == j.end() || !it->is_array()) {
      if (err) *err = "missing/invalid field: peers";
      return std::nullopt;
    }
    PeerList l;
    for (const auto& p : *it) {
      PeerListEntry e;
      if (!p.is_object() || !getString(p, "id", &e.id, err)) return std::nullopt;
      getOptionalString(p, "username", &e.username);
      l.peers.push_back(std::move(e));
    }
    return Envelope{std::move(l)};
  }

  if (err) *err = "unknown type: " + type;
  return std::nullopt;
}

std::optional<Envelope> decode(std::string_view text, std::string* err) {
  json j = json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "invalid JSON";
    return std::nullopt;
  }
  return fromJson(j, err);
}

} // namespace protocol
