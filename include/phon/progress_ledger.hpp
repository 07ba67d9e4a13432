#pragma once

#include "profile_store.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace phon {

struct MasteryRecord {
  std::uint64_t attempts = 0;
  std::uint64_t correct = 0;
  std::uint64_t explored = 0;      // attempts that came from Explore (counted in attempts/correct)
  std::int64_t last_seen_ms = 0;
  nlohmann::json extra = nlohmann::json::object();  // unknown fields, re-written unchanged
};

struct ProgressSnapshot {
  std::string profile_id;
  std::map<std::string, MasteryRecord> mastery;
  Tier current_tier = Tier::Easy;
  std::int64_t total_stars = 0;
  int best_streak = 0;
  std::int64_t sessions_played = 0;
  std::int64_t created_at_ms = 0;
  std::int64_t updated_at_ms = 0;
  nlohmann::json extra = nlohmann::json::object();
};

enum class LoadStatus {
  Loaded,     // existing record read
  Created,    // no record, fresh snapshot
  Recovered   // record was unreadable, quarantined and replaced by a fresh snapshot
};

/**
 * ProgressLedger: the in-memory, always-consistent view of one profile's
 * progress plus explicit, batched persistence through a ProfileStore.
 * Not thread-safe; driven from the session thread.
 */
class ProgressLedger {
public:
  using Clock = std::function<std::int64_t()>;

  explicit ProgressLedger(ProfileStore& store, double explore_weight = 0.25,
                          Clock clock = {});

  // Throws ProfileNotFound or StorageCorrupt; adopts the snapshot on success.
  const ProgressSnapshot& load(const std::string& profile_id);

  // Loads, or falls back to a fresh snapshot. Never throws for storage problems;
  // `problem` receives the StorageCorrupt message when status is Recovered.
  LoadStatus open(const std::string& profile_id, std::string* problem = nullptr);

  void start_fresh(const std::string& profile_id);

  void record_outcome(const std::string& letter_id, bool correct);
  void record_explored(const std::string& letter_id);

  double mastery_score(const std::string& letter_id) const;
  std::uint64_t scored_attempts(const std::string& letter_id) const;
  const MasteryRecord* record(const std::string& letter_id) const;

  void add_stars(int stars);
  void note_streak(int streak);
  void note_session_played();
  void set_tier(Tier tier);
  // Explicit external reset; the engine itself never lowers the tier.
  void reset_tier(Tier tier) { set_tier(tier); }
  Tier tier() const { return snapshot_.current_tier; }

  // Throws StorageWriteFailed.
  void persist();

  const ProgressSnapshot& snapshot() const { return snapshot_; }
  const std::string& profile_id() const { return snapshot_.profile_id; }
  bool dirty() const { return dirty_; }

private:
  MasteryRecord& touch(const std::string& letter_id);
  std::int64_t now() const;

  ProfileStore& store_;
  double explore_weight_;
  Clock clock_;
  ProgressSnapshot snapshot_;
  bool dirty_ = false;
};

// Weighted correct/attempts; 0 when there are no attempts.
double mastery_score(const MasteryRecord& record, double explore_weight);

} // namespace phon
