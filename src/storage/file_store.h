#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace storage {

struct StoredFileInfo {
  std::string name;
  uint64_t size = 0;
  std::filesystem::file_time_type modified{};
};

// Where received file payloads land. Implementations pick a stored name that
// never overwrites an existing file.
class FileStore {
public:
  virtual ~FileStore() = default;

  // Returns the stored name, or nullopt with `err` set.
  virtual std::optional<std::string> store(const std::string& filename,
                                           std::span<const uint8_t> bytes,
                                           std::string* err = nullptr) = 0;
  virtual std::vector<StoredFileInfo> list(std::string* err = nullptr) = 0;
  virtual std::optional<std::vector<uint8_t>> read(const std::string& name, std::string* err = nullptr) = 0;
  virtual bool remove(const std::string& name, std::string* err = nullptr) = 0;
};

// Flat directory of files named `YYYYmmdd_HHMMSS_<basename>`, with `_N`
// inserted before the extension on collision.
class DirectoryFileStore : public FileStore {
public:
  explicit DirectoryFileStore(std::filesystem::path dir);

  std::optional<std::string> store(const std::string& filename,
                                   std::span<const uint8_t> bytes,
                                   std::string* err = nullptr) override;
  std::vector<StoredFileInfo> list(std::string* err = nullptr) override;
  std::optional<std::vector<uint8_t>> read(const std::string& name, std::string* err = nullptr) override;
  bool remove(const std::string& name, std::string* err = nullptr) override;

  const std::filesystem::path& dir() const { return dir_; }

  // Strips any directory components a remote peer may have sent. Returns an
  // empty string for names that reduce to nothing usable.
  static std::string sanitizeName(const std::string& filename);

private:
  bool ensureDir(std::string* err);
  std::optional<std::filesystem::path> resolveExisting(const std::string& name, std::string* err) const;

  const std::filesystem::path dir_;
  std::mutex mu_;
};

} // namespace storage
