#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace phon {

// Durable home of serialized profiles. `write` throws StorageWriteFailed.
class ProfileStore {
public:
  virtual ~ProfileStore() = default;

  virtual std::optional<std::string> read(const std::string& profile_id) = 0;

  virtual void write(const std::string& profile_id, const std::string& document) = 0;

  // Moves an unreadable record aside so a fresh one can take its place.
  virtual void quarantine(const std::string& profile_id) = 0;
};

// One JSON document per profile at <root>/<profile_id>.json.
class FileProfileStore : public ProfileStore {
public:
  explicit FileProfileStore(std::filesystem::path root);

  std::optional<std::string> read(const std::string& profile_id) override;
  void write(const std::string& profile_id, const std::string& document) override;
  void quarantine(const std::string& profile_id) override;

  std::filesystem::path path_for(const std::string& profile_id) const;
  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
};

class MemoryProfileStore : public ProfileStore {
public:
  std::optional<std::string> read(const std::string& profile_id) override;
  void write(const std::string& profile_id, const std::string& document) override;
  void quarantine(const std::string& profile_id) override;

  // The next `count` writes throw StorageWriteFailed.
  void fail_next_writes(int count) { failing_writes_ = count; }
  int write_calls() const { return write_calls_; }
  bool quarantined(const std::string& profile_id) const {
    return quarantined_.count(profile_id) > 0;
  }
  void put(const std::string& profile_id, const std::string& document) {
    documents_[profile_id] = document;
  }

private:
  std::map<std::string, std::string> documents_;
  std::map<std::string, std::string> quarantined_;
  int failing_writes_ = 0;
  int write_calls_ = 0;
};

} // namespace phon
