#include "common/config.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

int main() {
  namespace fs = std::filesystem;
  using namespace std::chrono_literals;

  // Defaults.
  {
    common::Config cfg;
    assert(cfg.discovery_port == 50000);
    assert(cfg.message_port == 12345);
    assert(cfg.audio_port() == 13000 && cfg.video_port() == 13001 && cfg.control_port() == 13002);
    assert(cfg.peer_timeout == 30s);
    assert(cfg.video_chunk_threshold == 60000);
  }

  // Present keys overlay; absent and unknown keys leave values alone.
  {
    common::Config cfg;
    std::string err;
    const auto j = common::json::parse(R"({
      "username": "alice",
      "message_port": 2000,
      "peer_timeout_ms": 5000,
      "jpeg_quality": 50,
      "data_dir": "/tmp/lanchat-data",
      "something_else": true
    })");
    assert(common::apply_config_json(j, &cfg, &err));
    assert(cfg.username == "alice");
    assert(cfg.message_port == 2000);
    assert(cfg.peer_timeout == 5s);
    assert(cfg.jpeg_quality == 50);
    assert(cfg.data_dir == fs::path("/tmp/lanchat-data"));
    assert(cfg.discovery_port == 50000);
  }

  // Bad values name the offending key.
  {
    common::Config cfg;
    std::string err;
    assert(!common::apply_config_json(common::json::parse(R"({"video_fps":"fast"})"), &cfg, &err));
    assert(err == "invalid value for 'video_fps'");
    assert(!common::apply_config_json(common::json::parse(R"({"send_timeout_ms":0})"), &cfg, &err));
    assert(err == "'send_timeout_ms' must be positive");
    assert(!common::apply_config_json(common::json::parse(R"({"jpeg_quality":101})"), &cfg, &err));
    assert(err == "jpeg_quality must be within 1..100");
    common::Config fresh;
    assert(!common::apply_config_json(common::json::parse(R"({"video_chunk_threshold":0})"), &fresh, &err));
    assert(!common::apply_config_json(common::json::parse(R"({"media_base_port":65535})"), &fresh, &err));
    assert(!common::apply_config_json(common::json::parse("[1,2]"), &fresh, &err));
    assert(err == "config root must be an object");

    common::Config sized;
    assert(sized.max_message_bytes == 64u * 1024u * 1024u);
    assert(!common::apply_config_json(common::json::parse(R"({"max_message_bytes":100000000})"), &sized, &err));
    assert(err == "max_message_bytes must be within 1..99999999");
    sized.max_message_bytes = 1;
    assert(common::apply_config_json(common::json::parse(R"({"max_message_bytes":4096})"), &sized, &err));
    assert(sized.max_message_bytes == 4096);
  }

  // Files: missing is fine, malformed is not.
  {
    const auto dir = fs::temp_directory_path() / ("lanchat_config_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);

    common::Config cfg;
    std::string err;
    assert(common::load_config_file(dir / "absent.json", &cfg, &err));
    assert(cfg.username == "Anonymous");

    std::ofstream(dir / "good.json") << R"({"username":"bob","media_base_port":14000})";
    assert(common::load_config_file(dir / "good.json", &cfg, &err));
    assert(cfg.username == "bob" && cfg.control_port() == 14002);

    std::ofstream(dir / "bad.json") << "{ username: ";
    assert(!common::load_config_file(dir / "bad.json", &cfg, &err));
    assert(err.find("malformed JSON") == 0);

    ::setenv("LANCHAT_CONFIG_DIR", dir.c_str(), 1);
    assert(common::default_config_path() == dir / "config.json");
    ::unsetenv("LANCHAT_CONFIG_DIR");

    fs::remove_all(dir);
  }

  return 0;
}
