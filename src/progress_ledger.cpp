#include "phon/progress_ledger.hpp"

#include "phon/errors.hpp"
#include "json_bridge.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace phon {
namespace {

std::int64_t system_now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

double mastery_score(const MasteryRecord& record, double explore_weight) {
  if (record.attempts == 0) {
    return 0.0;
  }
  const double explored = static_cast<double>(record.explored);
  const double scored_attempts = static_cast<double>(record.attempts - record.explored);
  const double scored_correct = static_cast<double>(record.correct - record.explored);
  const double attempts = scored_attempts + explore_weight * explored;
  if (attempts <= 0.0) {
    return 0.0;
  }
  const double correct = scored_correct + explore_weight * explored;
  return std::clamp(correct / attempts, 0.0, 1.0);
}

ProgressLedger::ProgressLedger(ProfileStore& store, double explore_weight, Clock clock)
    : store_(store), explore_weight_(explore_weight), clock_(std::move(clock)) {}

std::int64_t ProgressLedger::now() const {
  return clock_ ? clock_() : system_now_ms();
}

const ProgressSnapshot& ProgressLedger::load(const std::string& profile_id) {
  auto document = store_.read(profile_id);
  if (!document.has_value()) {
    throw ProfileNotFound(profile_id);
  }
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(*document);
  } catch (const nlohmann::json::exception& ex) {
    throw StorageCorrupt(profile_id, ex.what());
  }
  ProgressSnapshot snapshot;
  try {
    snapshot = bridge::progress_snapshot_from_json(parsed);
  } catch (const std::exception& ex) {
    throw StorageCorrupt(profile_id, ex.what());
  }
  if (snapshot.profile_id != profile_id) {
    throw StorageCorrupt(profile_id, "record belongs to '" + snapshot.profile_id + "'");
  }
  snapshot_ = std::move(snapshot);
  dirty_ = false;
  return snapshot_;
}

LoadStatus ProgressLedger::open(const std::string& profile_id, std::string* problem) {
  try {
    load(profile_id);
    log::debug("ledger", "loaded profile " + profile_id);
    return LoadStatus::Loaded;
  } catch (const ProfileNotFound&) {
    log::debug("ledger", "creating profile " + profile_id);
    start_fresh(profile_id);
    return LoadStatus::Created;
  } catch (const StorageCorrupt& ex) {
    log::warn("ledger", ex.what());
    if (problem) {
      *problem = ex.what();
    }
    store_.quarantine(profile_id);
    start_fresh(profile_id);
    return LoadStatus::Recovered;
  }
}

void ProgressLedger::start_fresh(const std::string& profile_id) {
  snapshot_ = ProgressSnapshot{};
  snapshot_.profile_id = profile_id;
  snapshot_.created_at_ms = now();
  snapshot_.updated_at_ms = snapshot_.created_at_ms;
  dirty_ = true;
}

MasteryRecord& ProgressLedger::touch(const std::string& letter_id) {
  if (letter_id.empty()) {
    throw std::invalid_argument("ProgressLedger: empty letter id");
  }
  auto& record = snapshot_.mastery[letter_id];
  record.last_seen_ms = now();
  dirty_ = true;
  return record;
}

void ProgressLedger::record_outcome(const std::string& letter_id, bool correct) {
  auto& record = touch(letter_id);
  record.attempts += 1;
  if (correct) {
    record.correct += 1;
  }
}

void ProgressLedger::record_explored(const std::string& letter_id) {
  auto& record = touch(letter_id);
  record.attempts += 1;
  record.correct += 1;
  record.explored += 1;
}

double ProgressLedger::mastery_score(const std::string& letter_id) const {
  const auto* found = record(letter_id);
  if (!found) {
    return 0.0;
  }
  return phon::mastery_score(*found, explore_weight_);
}

std::uint64_t ProgressLedger::scored_attempts(const std::string& letter_id) const {
  const auto* found = record(letter_id);
  if (!found) {
    return 0;
  }
  return found->attempts - found->explored;
}

const MasteryRecord* ProgressLedger::record(const std::string& letter_id) const {
  auto it = snapshot_.mastery.find(letter_id);
  if (it == snapshot_.mastery.end()) {
    return nullptr;
  }
  return &it->second;
}

void ProgressLedger::add_stars(int stars) {
  if (stars <= 0) {
    return;
  }
  snapshot_.total_stars += stars;
  dirty_ = true;
}

void ProgressLedger::note_streak(int streak) {
  if (streak > snapshot_.best_streak) {
    snapshot_.best_streak = streak;
    dirty_ = true;
  }
}

void ProgressLedger::note_session_played() {
  snapshot_.sessions_played += 1;
  dirty_ = true;
}

void ProgressLedger::set_tier(Tier tier) {
  if (snapshot_.current_tier != tier) {
    snapshot_.current_tier = tier;
    dirty_ = true;
  }
}

void ProgressLedger::persist() {
  if (snapshot_.profile_id.empty()) {
    throw std::logic_error("ProgressLedger::persist called before a profile was opened");
  }
  ProgressSnapshot outgoing = snapshot_;
  outgoing.updated_at_ms = now();
  std::string document;
  try {
    document = bridge::to_json(outgoing).dump(2);
  } catch (const nlohmann::json::exception& ex) {
    throw StorageWriteFailed(outgoing.profile_id, ex.what());
  }
  store_.write(outgoing.profile_id, document);
  snapshot_.updated_at_ms = outgoing.updated_at_ms;
  dirty_ = false;
  log::debug("ledger", "persisted profile " + snapshot_.profile_id);
}

} // namespace phon
