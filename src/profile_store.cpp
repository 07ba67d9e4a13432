#include "phon/profile_store.hpp"

#include "phon/errors.hpp"
#include "log.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#if defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace phon {
namespace {

// Flushes a file or directory to stable storage. Other platforms rely on the
// rename alone.
bool sync_to_disk(const std::filesystem::path& path, bool directory) {
#if defined(__unix__) || defined(__APPLE__)
  const int fd = ::open(path.c_str(), directory ? (O_RDONLY | O_DIRECTORY) : O_RDONLY);
  if (fd < 0) {
    return false;
  }
  const bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
#else
  (void)path;
  (void)directory;
  return true;
#endif
}

void require_safe_id(const std::string& profile_id) {
  if (profile_id.empty() || profile_id == "." || profile_id == ".." ||
      profile_id.find_first_of("/\\") != std::string::npos) {
    throw std::invalid_argument("Invalid profile id: '" + profile_id + "'");
  }
}

} // namespace

FileProfileStore::FileProfileStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileProfileStore::path_for(const std::string& profile_id) const {
  require_safe_id(profile_id);
  return root_ / (profile_id + ".json");
}

std::optional<std::string> FileProfileStore::read(const std::string& profile_id) {
  const auto path = path_for(profile_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw StorageCorrupt(profile_id, "cannot open " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  if (stream.bad()) {
    throw StorageCorrupt(profile_id, "read error on " + path.string());
  }
  return content;
}

void FileProfileStore::write(const std::string& profile_id, const std::string& document) {
  const auto path = path_for(profile_id);
  auto tmp = path;
  tmp += ".tmp";

  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw StorageWriteFailed(profile_id, "cannot create " + root_.string() + ": " + ec.message());
  }

  {
    std::ofstream stream(tmp, std::ios::binary | std::ios::trunc);
    if (!stream) {
      throw StorageWriteFailed(profile_id, "cannot open " + tmp.string());
    }
    stream.write(document.data(), static_cast<std::streamsize>(document.size()));
    stream.flush();
    if (!stream) {
      stream.close();
      std::filesystem::remove(tmp, ec);
      throw StorageWriteFailed(profile_id, "short write to " + tmp.string());
    }
  }
  if (!sync_to_disk(tmp, false)) {
    std::filesystem::remove(tmp, ec);
    throw StorageWriteFailed(profile_id, "cannot sync " + tmp.string());
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw StorageWriteFailed(profile_id, "cannot replace " + path.string() + ": " + ec.message());
  }
  if (!sync_to_disk(root_, true)) {
    log::warn("store", "could not sync directory " + root_.string());
  }
  log::debug("store", "wrote " + path.string());
}

void FileProfileStore::quarantine(const std::string& profile_id) {
  const auto path = path_for(profile_id);
  auto target = path;
  target += ".corrupt";
  std::error_code ec;
  std::filesystem::rename(path, target, ec);
  if (ec) {
    log::warn("store", "could not quarantine " + path.string() + ": " + ec.message());
    return;
  }
  log::warn("store", "moved unreadable profile to " + target.string());
}

std::optional<std::string> MemoryProfileStore::read(const std::string& profile_id) {
  auto it = documents_.find(profile_id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryProfileStore::write(const std::string& profile_id, const std::string& document) {
  ++write_calls_;
  if (failing_writes_ > 0) {
    --failing_writes_;
    throw StorageWriteFailed(profile_id, "injected failure");
  }
  documents_[profile_id] = document;
}

void MemoryProfileStore::quarantine(const std::string& profile_id) {
  auto it = documents_.find(profile_id);
  if (it == documents_.end()) {
    return;
  }
  quarantined_[profile_id] = std::move(it->second);
  documents_.erase(it);
}

} // namespace phon
