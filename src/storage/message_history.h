#pragma once

#include "common/json.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace storage {

struct MessageRecord {
  std::string id;
  // The remote peer's IP, for both directions.
  std::string senderIp;
  std::string senderUsername;
  std::string content;
  std::string type = "text"; // "text" or "file"
  std::string timestamp;     // local ISO-8601
  bool read = false;
  bool outgoing = false;
};

struct HistoryStats {
  std::size_t total = 0;
  std::size_t unread = 0;
  std::size_t text = 0;
  std::size_t file = 0;
  std::optional<std::string> lastMessageTime;
};

common::json recordToJson(const MessageRecord& r);
std::optional<MessageRecord> recordFromJson(const common::json& j);

// Fills id and timestamp for a record about to be appended.
MessageRecord makeRecord(std::string peerIp, std::string username, std::string content, std::string type, bool outgoing);

class MessageHistory {
public:
  virtual ~MessageHistory() = default;

  virtual bool append(const MessageRecord& rec, std::string* err = nullptr) = 0;
  // Oldest first; limit 0 returns everything.
  virtual std::vector<MessageRecord> query(const std::string& peerIp, std::size_t limit = 0) = 0;
  virtual bool markRead(const std::string& peerIp, std::string* err = nullptr) = 0;
  virtual HistoryStats stats(const std::optional<std::string>& peerIp = std::nullopt) = 0;
};

// `<data>/messages.json` holding a JSON array. Each rewrite first copies the
// current file to `<data>/backups/messages_<stamp>.json`, keeping the newest
// `keepBackups`. A corrupt main file is replaced by the newest backup on load.
class JsonMessageHistory : public MessageHistory {
public:
  explicit JsonMessageHistory(std::filesystem::path dataDir, std::size_t keepBackups = 5);

  bool append(const MessageRecord& rec, std::string* err = nullptr) override;
  std::vector<MessageRecord> query(const std::string& peerIp, std::size_t limit = 0) override;
  bool markRead(const std::string& peerIp, std::string* err = nullptr) override;
  HistoryStats stats(const std::optional<std::string>& peerIp = std::nullopt) override;

  std::filesystem::path messagesPath() const { return dataDir_ / "messages.json"; }
  std::filesystem::path backupDir() const { return dataDir_ / "backups"; }

private:
  void load();
  bool readFile(const std::filesystem::path& p, std::vector<MessageRecord>* out) const;
  bool restoreFromBackup();
  bool backup(std::string* err);
  bool save(std::string* err);

  const std::filesystem::path dataDir_;
  const std::size_t keepBackups_;
  std::mutex mu_;
  std::vector<MessageRecord> records_;
};

} // namespace storage
