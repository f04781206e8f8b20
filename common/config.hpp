#pragma once

#include "common/json.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace common {

struct Config {
  std::string username = "Anonymous";

  uint16_t discovery_port = 50000;
  uint16_t message_port = 12345;
  // Audio listens on media_base_port, video on +1, call control on +2.
  uint16_t media_base_port = 13000;

  std::chrono::milliseconds broadcast_interval{2000};
  std::chrono::milliseconds prune_interval{10000};
  std::chrono::milliseconds peer_timeout{30000};
  std::chrono::milliseconds send_timeout{10000};
  std::chrono::milliseconds call_answer_timeout{30000};
  // Largest inbound message frame accepted; at most 99999999.
  std::size_t max_message_bytes = 64 * 1024 * 1024;

  std::string video_device = "/dev/video0";
  int video_width = 640;
  int video_height = 480;
  int video_fps = 15;
  int jpeg_quality = 80;
  std::size_t video_chunk_threshold = 60000;
  std::chrono::milliseconds reassembly_timeout{1000};

  std::string audio_device = "default";
  int audio_rate = 44100;
  int audio_channels = 1;
  int audio_frames_per_packet = 1024;

  std::filesystem::path data_dir = "data";

  uint16_t audio_port() const { return media_base_port; }
  uint16_t video_port() const { return static_cast<uint16_t>(media_base_port + 1); }
  uint16_t control_port() const { return static_cast<uint16_t>(media_base_port + 2); }
};

inline std::filesystem::path resolve_config_root() {
  if (const char* env = std::getenv("LANCHAT_CONFIG_DIR"); env && *env) {
    return std::filesystem::path(env);
  }
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "lanchat";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "lanchat";
  }
  return std::filesystem::path(".") / "lanchat";
}

inline std::filesystem::path default_config_path() { return resolve_config_root() / "config.json"; }

namespace detail {

template <class T>
bool read_field(const json& j, const char* key, T* out, std::string* error_out) {
  const auto it = j.find(key);
  if (it == j.end()) return true;
  try {
    *out = it->get<T>();
    return true;
  } catch (const json::exception&) {
    if (error_out) *error_out = std::string("invalid value for '") + key + "'";
    return false;
  }
}

inline bool read_ms(const json& j, const char* key, std::chrono::milliseconds* out, std::string* error_out) {
  int64_t ms = out->count();
  if (!read_field(j, key, &ms, error_out)) return false;
  if (ms <= 0) {
    if (error_out) *error_out = std::string("'") + key + "' must be positive";
    return false;
  }
  *out = std::chrono::milliseconds(ms);
  return true;
}

} // namespace detail

// Overlays the keys present in `j` onto `cfg`. Unknown keys are ignored.
inline bool apply_config_json(const json& j, Config* cfg, std::string* error_out = nullptr) {
  if (!cfg) return false;
  if (!j.is_object()) {
    if (error_out) *error_out = "config root must be an object";
    return false;
  }
  std::string data_dir = cfg->data_dir.string();
  const bool ok = detail::read_field(j, "username", &cfg->username, error_out) &&
                  detail::read_field(j, "discovery_port", &cfg->discovery_port, error_out) &&
                  detail::read_field(j, "message_port", &cfg->message_port, error_out) &&
                  detail::read_field(j, "media_base_port", &cfg->media_base_port, error_out) &&
                  detail::read_ms(j, "broadcast_interval_ms", &cfg->broadcast_interval, error_out) &&
                  detail::read_ms(j, "prune_interval_ms", &cfg->prune_interval, error_out) &&
                  detail::read_ms(j, "peer_timeout_ms", &cfg->peer_timeout, error_out) &&
                  detail::read_ms(j, "send_timeout_ms", &cfg->send_timeout, error_out) &&
                  detail::read_ms(j, "call_answer_timeout_ms", &cfg->call_answer_timeout, error_out) &&
                  detail::read_field(j, "max_message_bytes", &cfg->max_message_bytes, error_out) &&
                  detail::read_field(j, "video_device", &cfg->video_device, error_out) &&
                  detail::read_field(j, "video_width", &cfg->video_width, error_out) &&
                  detail::read_field(j, "video_height", &cfg->video_height, error_out) &&
                  detail::read_field(j, "video_fps", &cfg->video_fps, error_out) &&
                  detail::read_field(j, "jpeg_quality", &cfg->jpeg_quality, error_out) &&
                  detail::read_field(j, "video_chunk_threshold", &cfg->video_chunk_threshold, error_out) &&
                  detail::read_ms(j, "reassembly_timeout_ms", &cfg->reassembly_timeout, error_out) &&
                  detail::read_field(j, "audio_device", &cfg->audio_device, error_out) &&
                  detail::read_field(j, "audio_rate", &cfg->audio_rate, error_out) &&
                  detail::read_field(j, "audio_channels", &cfg->audio_channels, error_out) &&
                  detail::read_field(j, "audio_frames_per_packet", &cfg->audio_frames_per_packet, error_out) &&
                  detail::read_field(j, "data_dir", &data_dir, error_out);
  if (!ok) return false;
  cfg->data_dir = data_dir;

  if (cfg->video_width <= 0 || cfg->video_height <= 0 || cfg->video_fps <= 0) {
    if (error_out) *error_out = "video geometry and fps must be positive";
    return false;
  }
  if (cfg->max_message_bytes == 0 || cfg->max_message_bytes > 99'999'999) {
    if (error_out) *error_out = "max_message_bytes must be within 1..99999999";
    return false;
  }
  if (cfg->jpeg_quality < 1 || cfg->jpeg_quality > 100) {
    if (error_out) *error_out = "jpeg_quality must be within 1..100";
    return false;
  }
  // A chunk plus its 9-byte header has to fit one UDP datagram.
  if (cfg->video_chunk_threshold == 0 || cfg->video_chunk_threshold > 65498) {
    if (error_out) *error_out = "video_chunk_threshold must be within 1..65498";
    return false;
  }
  if (cfg->audio_rate <= 0 || cfg->audio_channels <= 0 || cfg->audio_frames_per_packet <= 0) {
    if (error_out) *error_out = "audio parameters must be positive";
    return false;
  }
  if (cfg->media_base_port == 0 || cfg->media_base_port > 65533) {
    if (error_out) *error_out = "media_base_port must leave room for three ports";
    return false;
  }
  return true;
}

// A missing file leaves `cfg` untouched and succeeds; an unreadable or
// malformed one fails.
inline bool load_config_file(const std::filesystem::path& path, Config* cfg, std::string* error_out = nullptr) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::ifstream in(path);
  if (!in) {
    if (error_out) *error_out = "cannot open " + path.string();
    return false;
  }
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    if (error_out) *error_out = "malformed JSON in " + path.string();
    return false;
  }
  return apply_config_json(j, cfg, error_out);
}

} // namespace common
