#include "json_bridge.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace phon::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj[key];
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

[[noreturn]] void out_of_range(std::string_view key) {
  throw std::invalid_argument("Value out of range for field '" + std::string(key) + "'");
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  constexpr auto lo = std::numeric_limits<int>::min();
  constexpr auto hi = std::numeric_limits<int>::max();
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(hi)) {
      out_of_range(key);
    }
    return static_cast<int>(v);
  }
  if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v < lo || v > hi) {
      out_of_range(key);
    }
    return static_cast<int>(v);
  }
  if (value.is_number_float()) {
    const double v = std::round(value.get<double>());
    if (!std::isfinite(v) || v < static_cast<double>(lo) || v > static_cast<double>(hi)) {
      out_of_range(key);
    }
    return static_cast<int>(v);
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::int64_t json_to_int64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      out_of_range(key);
    }
    return static_cast<std::int64_t>(v);
  }
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::uint64_t json_to_count(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(value.get<std::int64_t>());
  }
  throw std::invalid_argument("Expected non-negative integer for field '" + std::string(key) +
                              "'");
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

// Copies every member whose key is not in `known`.
nlohmann::json unknown_fields(const nlohmann::json& obj,
                              std::initializer_list<std::string_view> known) {
  nlohmann::json extra = nlohmann::json::object();
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    bool is_known = false;
    for (auto name : known) {
      if (it.key() == name) {
        is_known = true;
        break;
      }
    }
    if (!is_known) {
      extra[it.key()] = it.value();
    }
  }
  return extra;
}

void merge_extra(nlohmann::json& out, const nlohmann::json& extra) {
  if (!extra.is_object()) {
    return;
  }
  for (auto it = extra.begin(); it != extra.end(); ++it) {
    if (!out.contains(it.key())) {
      out[it.key()] = it.value();
    }
  }
}

nlohmann::json to_json(const MasteryRecord& record) {
  nlohmann::json j = nlohmann::json::object();
  j["attempts"] = record.attempts;
  j["correct"] = record.correct;
  j["explored"] = record.explored;
  j["lastSeen"] = record.last_seen_ms;
  merge_extra(j, record.extra);
  return j;
}

MasteryRecord mastery_record_from_json(const nlohmann::json& json_record,
                                       const std::string& letter_id) {
  if (!json_record.is_object()) {
    throw std::invalid_argument("Mastery record for '" + letter_id + "' must be an object");
  }
  MasteryRecord record;
  assign_if_present(json_record, "attempts",
                    [&](const nlohmann::json& v) { record.attempts = json_to_count(v, "attempts"); });
  assign_if_present(json_record, "correct",
                    [&](const nlohmann::json& v) { record.correct = json_to_count(v, "correct"); });
  assign_if_present(json_record, "explored",
                    [&](const nlohmann::json& v) { record.explored = json_to_count(v, "explored"); });
  assign_if_present(json_record, "lastSeen",
                    [&](const nlohmann::json& v) { record.last_seen_ms = json_to_int64(v, "lastSeen"); });
  if (record.correct > record.attempts) {
    throw std::invalid_argument("Mastery record for '" + letter_id +
                                "' has more correct answers than attempts");
  }
  if (record.explored > record.correct) {
    throw std::invalid_argument("Mastery record for '" + letter_id +
                                "' has more explored outcomes than correct answers");
  }
  record.extra = unknown_fields(json_record, {"attempts", "correct", "explored", "lastSeen"});
  return record;
}

} // namespace

nlohmann::json to_json(const ProgressSnapshot& snapshot) {
  nlohmann::json j = nlohmann::json::object();
  j["format"] = kProgressFormat;
  j["profileId"] = snapshot.profile_id;
  nlohmann::json mastery = nlohmann::json::object();
  for (const auto& [letter_id, record] : snapshot.mastery) {
    mastery[letter_id] = to_json(record);
  }
  j["perLetterMastery"] = std::move(mastery);
  j["currentTier"] = to_string(snapshot.current_tier);
  j["totalStars"] = snapshot.total_stars;
  j["bestStreak"] = snapshot.best_streak;
  j["sessionsPlayed"] = snapshot.sessions_played;
  j["createdAt"] = snapshot.created_at_ms;
  j["updatedAt"] = snapshot.updated_at_ms;
  merge_extra(j, snapshot.extra);
  return j;
}

ProgressSnapshot progress_snapshot_from_json(const nlohmann::json& json_snapshot) {
  if (!json_snapshot.is_object()) {
    throw std::invalid_argument("Progress record must be a JSON object");
  }
  assign_if_present(json_snapshot, "format", [](const nlohmann::json& v) {
    const int format = json_to_int(v, "format");
    if (format != kProgressFormat) {
      throw std::invalid_argument("Unsupported progress format " + std::to_string(format));
    }
  });

  ProgressSnapshot snapshot;
  if (!assign_if_present(json_snapshot, "profileId", [&](const nlohmann::json& v) {
        snapshot.profile_id = json_to_string(v, "profileId");
      })) {
    throw std::invalid_argument("Missing field 'profileId'");
  }
  assign_if_present(json_snapshot, "perLetterMastery", [&](const nlohmann::json& v) {
    if (!v.is_object()) {
      throw std::invalid_argument("Expected object for field 'perLetterMastery'");
    }
    for (auto it = v.begin(); it != v.end(); ++it) {
      snapshot.mastery[it.key()] = mastery_record_from_json(it.value(), it.key());
    }
  });
  assign_if_present(json_snapshot, "currentTier", [&](const nlohmann::json& v) {
    snapshot.current_tier = tier_from_string(json_to_string(v, "currentTier"));
  });
  assign_if_present(json_snapshot, "totalStars", [&](const nlohmann::json& v) {
    snapshot.total_stars = json_to_int64(v, "totalStars");
  });
  assign_if_present(json_snapshot, "bestStreak",
                    [&](const nlohmann::json& v) { snapshot.best_streak = json_to_int(v, "bestStreak"); });
  assign_if_present(json_snapshot, "sessionsPlayed", [&](const nlohmann::json& v) {
    snapshot.sessions_played = json_to_int64(v, "sessionsPlayed");
  });
  assign_if_present(json_snapshot, "createdAt",
                    [&](const nlohmann::json& v) { snapshot.created_at_ms = json_to_int64(v, "createdAt"); });
  assign_if_present(json_snapshot, "updatedAt",
                    [&](const nlohmann::json& v) { snapshot.updated_at_ms = json_to_int64(v, "updatedAt"); });
  if (snapshot.total_stars < 0 || snapshot.best_streak < 0 || snapshot.sessions_played < 0) {
    throw std::invalid_argument("Progress counters must not be negative");
  }
  snapshot.extra = unknown_fields(json_snapshot,
                                  {"format", "profileId", "perLetterMastery", "currentTier",
                                   "totalStars", "bestStreak", "sessionsPlayed", "createdAt",
                                   "updatedAt"});
  return snapshot;
}

nlohmann::json to_json(const EngineConfig& config) {
  nlohmann::json j = nlohmann::json::object();
  j["starMilestone"] = config.star_milestone;
  j["levelUpThreshold"] = config.level_up_threshold;
  j["levelUpMinSamples"] = config.level_up_min_samples;
  j["exploreWeight"] = config.explore_weight;
  j["selectionFloor"] = config.selection_floor;
  j["findChoices"] = config.find_choices;
  j["persistAttempts"] = config.persist_attempts;
  j["seed"] = config.seed;
  return j;
}

EngineConfig engine_config_from_json(const nlohmann::json& json_config, const EngineConfig& base) {
  if (!json_config.is_object()) {
    throw std::invalid_argument("Engine config must be a JSON object");
  }
  EngineConfig config = base;
  assign_if_present(json_config, "starMilestone", [&](const nlohmann::json& v) {
    config.star_milestone = json_to_int(v, "starMilestone");
  });
  assign_if_present(json_config, "levelUpThreshold", [&](const nlohmann::json& v) {
    config.level_up_threshold = json_to_double(v, "levelUpThreshold");
  });
  assign_if_present(json_config, "levelUpMinSamples", [&](const nlohmann::json& v) {
    config.level_up_min_samples = json_to_int(v, "levelUpMinSamples");
  });
  assign_if_present(json_config, "exploreWeight", [&](const nlohmann::json& v) {
    config.explore_weight = json_to_double(v, "exploreWeight");
  });
  assign_if_present(json_config, "selectionFloor", [&](const nlohmann::json& v) {
    config.selection_floor = json_to_double(v, "selectionFloor");
  });
  assign_if_present(json_config, "findChoices",
                    [&](const nlohmann::json& v) { config.find_choices = json_to_int(v, "findChoices"); });
  assign_if_present(json_config, "persistAttempts", [&](const nlohmann::json& v) {
    config.persist_attempts = json_to_int(v, "persistAttempts");
  });
  assign_if_present(json_config, "seed",
                    [&](const nlohmann::json& v) { config.seed = json_to_count(v, "seed"); });
  config.validate();
  return config;
}

nlohmann::json to_json(const PresentedItem& item) {
  nlohmann::json j = nlohmann::json::object();
  j["mode"] = to_string(item.mode);
  j["tier"] = to_string(item.tier);
  j["letter"] = item.letter_id;
  if (item.word.has_value()) {
    j["word"] = *item.word;
    j["wordLetters"] = item.word_letters;
    j["position"] = item.position;
  }
  if (!item.choices.empty()) {
    j["choices"] = item.choices;
  }
  if (!item.hint.empty()) {
    j["hint"] = item.hint;
  }
  return j;
}

nlohmann::json to_json(const Feedback& feedback) {
  nlohmann::json j = nlohmann::json::object();
  j["correct"] = feedback.correct;
  j["streak"] = feedback.streak;
  j["starsEarned"] = feedback.stars_earned;
  j["starAwarded"] = feedback.star_awarded;
  j["letter"] = feedback.letter_id;
  if (feedback.word_position.has_value()) {
    j["position"] = *feedback.word_position;
    j["wordComplete"] = feedback.word_complete;
  }
  return j;
}

nlohmann::json to_json(const Notice& notice) {
  nlohmann::json j = nlohmann::json::object();
  j["code"] = to_string(notice.code);
  j["message"] = notice.message;
  if (!notice.detail.empty()) {
    j["detail"] = notice.detail;
  }
  return j;
}

nlohmann::json to_json(const SessionSummary& summary) {
  nlohmann::json j = nlohmann::json::object();
  j["profileId"] = summary.profile_id;
  j["mode"] = to_string(summary.mode);
  j["tier"] = to_string(summary.tier);
  j["starsEarned"] = summary.stars_earned;
  j["bestStreak"] = summary.best_streak;
  j["answered"] = summary.answered;
  j["correct"] = summary.correct;
  j["explored"] = summary.explored;
  j["levelUps"] = summary.level_ups;
  j["degraded"] = summary.degraded;
  j["persisted"] = summary.persisted;
  return j;
}

} // namespace phon::bridge
