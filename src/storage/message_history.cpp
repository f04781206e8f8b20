#include "src/storage/message_history.h"

#include "common/util.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>

namespace storage {

namespace fs = std::filesystem;

common::json recordToJson(const MessageRecord& r) {
  return {
      {"id", r.id},
      {"sender_ip", r.senderIp},
      {"sender_username", r.senderUsername},
      {"content", r.content},
      {"type", r.type},
      {"timestamp", r.timestamp},
      {"read", r.read},
      {"outgoing", r.outgoing},
  };
}

std::optional<MessageRecord> recordFromJson(const common::json& j) {
  if (!j.is_object()) return std::nullopt;
  const auto ip = j.find("sender_ip");
  const auto content = j.find("content");
  const auto ts = j.find("timestamp");
  if (ip == j.end() || !ip->is_string() || content == j.end() || !content->is_string() || ts == j.end() ||
      !ts->is_string()) {
    return std::nullopt;
  }
  MessageRecord r;
  r.senderIp = ip->get<std::string>();
  r.content = content->get<std::string>();
  r.timestamp = ts->get<std::string>();
  r.senderUsername = j.value("sender_username", std::string("Anonymous"));
  r.type = j.value("type", std::string("text"));
  r.read = j.value("read", false);
  r.outgoing = j.value("outgoing", false);
  r.id = j.value("id", std::string{});
  return r;
}

MessageRecord makeRecord(std::string peerIp, std::string username, std::string content, std::string type, bool outgoing) {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count();

  MessageRecord r;
  r.id = std::to_string(ms) + "_" + peerIp;
  r.senderIp = std::move(peerIp);
  r.senderUsername = std::move(username);
  r.content = std::move(content);
  r.type = std::move(type);
  r.timestamp = common::format_time(now, "%Y-%m-%dT%H:%M:%S", false);
  r.outgoing = outgoing;
  // Our own messages never count as unread.
  r.read = outgoing;
  return r;
}

JsonMessageHistory::JsonMessageHistory(fs::path dataDir, std::size_t keepBackups)
    : dataDir_(std::move(dataDir)), keepBackups_(keepBackups) {
  load();
}

bool JsonMessageHistory::readFile(const fs::path& p, std::vector<MessageRecord>* out) const {
  std::ifstream in(p);
  if (!in) return false;
  const common::json j = common::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_array()) return false;
  std::vector<MessageRecord> recs;
  recs.reserve(j.size());
  for (const auto& v : j) {
    auto r = recordFromJson(v);
    if (!r) return false;
    recs.push_back(std::move(*r));
  }
  *out = std::move(recs);
  return true;
}

void JsonMessageHistory::load() {
  std::error_code ec;
  if (!fs::exists(messagesPath(), ec)) return;
  if (readFile(messagesPath(), &records_)) return;

  common::log("history: failed to load " + messagesPath().string());
  if (!restoreFromBackup()) records_.clear();
}

bool JsonMessageHistory::restoreFromBackup() {
  std::error_code ec;
  if (!fs::exists(backupDir(), ec)) return false;

  std::vector<fs::path> backups;
  for (const auto& entry : fs::directory_iterator(backupDir(), ec)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind("messages_", 0) == 0 && entry.path().extension() == ".json") backups.push_back(entry.path());
  }
  std::sort(backups.begin(), backups.end());

  for (auto it = backups.rbegin(); it != backups.rend(); ++it) {
    std::vector<MessageRecord> recs;
    if (!readFile(*it, &recs)) continue;
    fs::copy_file(*it, messagesPath(), fs::copy_options::overwrite_existing, ec);
    if (ec) {
      common::log("history: failed to restore " + it->filename().string() + ": " + ec.message());
      return false;
    }
    records_ = std::move(recs);
    common::log("history: restored messages from backup " + it->filename().string());
    return true;
  }
  return false;
}

bool JsonMessageHistory::backup(std::string* err) {
  std::error_code ec;
  if (!fs::exists(messagesPath(), ec)) return true;
  fs::create_directories(backupDir(), ec);
  if (ec) {
    if (err) *err = "failed to create backup directory: " + ec.message();
    return false;
  }

  const fs::path dst = backupDir() / ("messages_" + common::compact_timestamp_local() + ".json");
  fs::copy_file(messagesPath(), dst, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    if (err) *err = "failed to write backup: " + ec.message();
    return false;
  }

  std::vector<fs::path> backups;
  for (const auto& entry : fs::directory_iterator(backupDir(), ec)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind("messages_", 0) == 0 && entry.path().extension() == ".json") backups.push_back(entry.path());
  }
  std::sort(backups.begin(), backups.end());
  while (backups.size() > keepBackups_) {
    fs::remove(backups.front(), ec);
    backups.erase(backups.begin());
  }
  return true;
}

bool JsonMessageHistory::save(std::string* err) {
  std::error_code ec;
  fs::create_directories(dataDir_, ec);
  if (ec) {
    if (err) *err = "failed to create " + dataDir_.string() + ": " + ec.message();
    return false;
  }

  common::json arr = common::json::array();
  for (const auto& r : records_) arr.push_back(recordToJson(r));

  // Written beside the target, then renamed over it.
  const fs::path tmp = messagesPath().string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      if (err) *err = "cannot open " + tmp.string();
      return false;
    }
    out << arr.dump(2, ' ', false, common::json::error_handler_t::replace);
    if (!out) {
      if (err) *err = "short write to " + tmp.string();
      return false;
    }
  }
  fs::rename(tmp, messagesPath(), ec);
  if (ec) {
    if (err) *err = "failed to replace " + messagesPath().string() + ": " + ec.message();
    return false;
  }
  return true;
}

bool JsonMessageHistory::append(const MessageRecord& rec, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!backup(err)) return false;
  records_.push_back(rec);
  if (!save(err)) {
    records_.pop_back();
    return false;
  }
  return true;
}

std::vector<MessageRecord> JsonMessageHistory::query(const std::string& peerIp, std::size_t limit) {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<MessageRecord> out;
  for (const auto& r : records_) {
    if (r.senderIp == peerIp) out.push_back(r);
  }
  if (limit > 0 && out.size() > limit) out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(limit));
  return out;
}

bool JsonMessageHistory::markRead(const std::string& peerIp, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  bool changed = false;
  for (auto& r : records_) {
    if (r.senderIp == peerIp && !r.read) {
      r.read = true;
      changed = true;
    }
  }
  if (!changed) return true;
  return save(err);
}

HistoryStats JsonMessageHistory::stats(const std::optional<std::string>& peerIp) {
  std::lock_guard<std::mutex> lock(mu_);
  HistoryStats s;
  for (const auto& r : records_) {
    if (peerIp && r.senderIp != *peerIp) continue;
    ++s.total;
    if (!r.read) ++s.unread;
    if (r.type == "file") {
      ++s.file;
    } else {
      ++s.text;
    }
    if (!s.lastMessageTime || r.timestamp > *s.lastMessageTime) s.lastMessageTime = r.timestamp;
  }
  return s;
}

} // namespace storage
