#include "src/storage/file_store.h"

#include "common/util.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace storage {

namespace fs = std::filesystem;

DirectoryFileStore::DirectoryFileStore(fs::path dir) : dir_(std::move(dir)) {}

std::string DirectoryFileStore::sanitizeName(const std::string& filename) {
  // Peers may send either separator regardless of their platform.
  const auto slash = filename.find_last_of("/\\");
  std::string base = slash == std::string::npos ? filename : filename.substr(slash + 1);
  std::string out;
  out.reserve(base.size());
  for (char c : base) {
    if (static_cast<unsigned char>(c) < 0x20) continue;
    out.push_back(c);
  }
  if (out == "." || out == "..") return {};
  return out;
}

bool DirectoryFileStore::ensureDir(std::string* err) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    if (err) *err = "failed to create " + dir_.string() + ": " + ec.message();
    return false;
  }
  return true;
}

std::optional<std::string> DirectoryFileStore::store(const std::string& filename,
                                                     std::span<const uint8_t> bytes,
                                                     std::string* err) {
  const std::string base = sanitizeName(filename);
  if (base.empty()) {
    if (err) *err = "invalid filename";
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (!ensureDir(err)) return std::nullopt;

  const fs::path basePath(base);
  const std::string stem = basePath.stem().string();
  const std::string ext = basePath.extension().string();
  const std::string prefix = common::compact_timestamp_local() + "_";

  std::string name = prefix + base;
  std::error_code ec;
  for (int n = 1; fs::exists(dir_ / name, ec); ++n) {
    name = prefix + stem + "_" + std::to_string(n) + ext;
  }

  std::ofstream out(dir_ / name, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err) *err = "cannot open " + (dir_ / name).string() + " for writing";
    return std::nullopt;
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    if (err) *err = "short write to " + (dir_ / name).string();
    out.close();
    fs::remove(dir_ / name, ec);
    return std::nullopt;
  }
  return name;
}

std::vector<StoredFileInfo> DirectoryFileStore::list(std::string* err) {
  std::vector<StoredFileInfo> out;
  std::lock_guard<std::mutex> lock(mu_);
  std::error_code ec;
  if (!fs::exists(dir_, ec)) return out;

  for (const auto& entry : fs::directory_iterator(dir_, ec)) {
    std::error_code fileEc;
    if (!entry.is_regular_file(fileEc)) continue;
    StoredFileInfo info;
    info.name = entry.path().filename().string();
    info.size = entry.file_size(fileEc);
    info.modified = entry.last_write_time(fileEc);
    out.push_back(std::move(info));
  }
  if (ec && err) *err = "failed to list " + dir_.string() + ": " + ec.message();
  std::sort(out.begin(), out.end(), [](const StoredFileInfo& a, const StoredFileInfo& b) { return a.name < b.name; });
  return out;
}

std::optional<fs::path> DirectoryFileStore::resolveExisting(const std::string& name, std::string* err) const {
  if (name.empty() || sanitizeName(name) != name) {
    if (err) *err = "invalid filename";
    return std::nullopt;
  }
  const fs::path p = dir_ / name;
  std::error_code ec;
  if (!fs::exists(p, ec)) {
    if (err) *err = "file " + name + " not found";
    return std::nullopt;
  }
  if (!fs::is_regular_file(p, ec)) {
    if (err) *err = name + " is not a file";
    return std::nullopt;
  }
  return p;
}

std::optional<std::vector<uint8_t>> DirectoryFileStore::read(const std::string& name, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto p = resolveExisting(name, err);
  if (!p) return std::nullopt;
  std::ifstream in(*p, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open " + p->string();
    return std::nullopt;
  }
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool DirectoryFileStore::remove(const std::string& name, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto p = resolveExisting(name, err);
  if (!p) return false;
  std::error_code ec;
  if (!fs::remove(*p, ec)) {
    if (err) *err = "failed to delete " + name + (ec ? ": " + ec.message() : std::string{});
    return false;
  }
  return true;
}

} // namespace storage
