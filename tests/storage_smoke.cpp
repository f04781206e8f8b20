#include "src/storage/file_store.h"
#include "src/storage/message_history.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> bytes(const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); }

size_t count_backups(const fs::path& dir) {
  size_t n = 0;
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;
  for (const auto& e : fs::directory_iterator(dir)) {
    if (e.path().filename().string().rfind("messages_", 0) == 0) ++n;
  }
  return n;
}

} // namespace

int main() {
  const auto root = fs::temp_directory_path() / ("lanchat_storage_" + std::to_string(::getpid()));
  fs::remove_all(root);

  // File store.
  {
    storage::DirectoryFileStore store(root / "files");
    assert(store.list().empty());

    const auto a = store.store("report.pdf", bytes("one"));
    const auto b = store.store("report.pdf", bytes("two"));
    assert(a && b && *a != *b);
    assert(a->size() == std::string("YYYYmmdd_HHMMSS_report.pdf").size());
    assert(a->substr(8, 1) == "_" && a->substr(15, 1) == "_");
    assert(b->size() >= std::string("YYYYmmdd_HHMMSS_report.pdf").size());
    assert(store.read(*b) == bytes("two"));

    // Directory components never escape the store.
    const auto c = store.store("../../etc/passwd", bytes("x"));
    assert(c && c->find('/') == std::string::npos);
    assert(fs::exists(root / "files" / *c));
    const auto d = store.store("C:\\Users\\me\\photo.jpg", bytes("y"));
    assert(d && d->substr(d->size() - 10) == "_photo.jpg");

    std::string err;
    assert(!store.store("..", bytes("z"), &err));
    assert(err == "invalid filename");
    assert(!store.read("../secret", &err));
    assert(!store.read("nope.txt", &err));

    const auto listed = store.list();
    assert(listed.size() == 4);
    assert(listed[0].name <= listed[1].name);

    assert(store.remove(*a, &err));
    assert(!store.remove(*a, &err));
    assert(store.list().size() == 3);
  }

  // Message history.
  {
    const auto dir = root / "history";
    {
      storage::JsonMessageHistory h(dir, 2);
      assert(h.append(storage::makeRecord("10.0.0.2", "bob", "hi", "text", false)));
      assert(h.append(storage::makeRecord("10.0.0.2", "me", "hello", "text", true)));
      assert(h.append(storage::makeRecord("10.0.0.3", "eve", "20240101_000000_x.bin", "file", false)));
      assert(h.append(storage::makeRecord("10.0.0.2", "bob", "again", "text", false)));

      const auto all = h.query("10.0.0.2");
      assert(all.size() == 3);
      assert(all[0].content == "hi" && all[2].content == "again");
      const auto last = h.query("10.0.0.2", 1);
      assert(last.size() == 1 && last[0].content == "again");

      auto s = h.stats("10.0.0.2");
      assert(s.total == 3 && s.unread == 2 && s.text == 3 && s.file == 0);
      assert(s.lastMessageTime.has_value());
      assert(h.stats().total == 4 && h.stats().file == 1);

      assert(h.markRead("10.0.0.2"));
      assert(h.stats("10.0.0.2").unread == 0);
      assert(h.stats("10.0.0.3").unread == 1);
      assert(count_backups(h.backupDir()) >= 1);
      assert(count_backups(h.backupDir()) <= 2);
    }

    // Reload sees the persisted records.
    {
      storage::JsonMessageHistory h(dir, 2);
      assert(h.stats().total == 4);
      assert(h.stats("10.0.0.2").unread == 0);
    }

    // A corrupt main file falls back to the newest valid backup.
    {
      std::ofstream(dir / "messages.json", std::ios::trunc) << "{ not json";
      storage::JsonMessageHistory h(dir, 2);
      const auto total = h.stats().total;
      assert(total >= 1 && total <= 4);
      std::ifstream in(dir / "messages.json");
      const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
      assert(text.find("not json") == std::string::npos);
    }
  }

  // Record JSON uses the stored key names.
  {
    auto r = storage::makeRecord("10.0.0.9", "zed", "x", "text", false);
    const auto j = storage::recordToJson(r);
    assert(j["sender_ip"] == "10.0.0.9");
    assert(j["sender_username"] == "zed");
    assert(j["read"] == false);
    assert(r.id.find("_10.0.0.9") != std::string::npos);
    const auto back = storage::recordFromJson(j);
    assert(back && back->content == "x");
    assert(!storage::recordFromJson(common::json::array()));
  }

  fs::remove_all(root);
  return 0;
}
