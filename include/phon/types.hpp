#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace phon {

enum class Tier {
  Easy,
  Medium,
  Hard
};

inline std::string to_string(Tier tier) {
  switch (tier) {
    case Tier::Easy: return "easy";
    case Tier::Medium: return "medium";
    case Tier::Hard: return "hard";
  }
  return "easy";
}

inline Tier tier_from_string(const std::string& value) {
  if (value == "easy") {
    return Tier::Easy;
  }
  if (value == "medium") {
    return Tier::Medium;
  }
  if (value == "hard") {
    return Tier::Hard;
  }
  throw std::invalid_argument("Unknown tier: " + value);
}

// Tiers never skip: Easy -> Medium -> Hard, Hard is terminal.
inline std::optional<Tier> next_tier(Tier tier) {
  switch (tier) {
    case Tier::Easy: return Tier::Medium;
    case Tier::Medium: return Tier::Hard;
    case Tier::Hard: return std::nullopt;
  }
  return std::nullopt;
}

enum class ExerciseMode {
  Explore,
  FindLetter,
  SoundOutWords
};

inline std::string to_string(ExerciseMode mode) {
  switch (mode) {
    case ExerciseMode::Explore: return "explore";
    case ExerciseMode::FindLetter: return "find_letter";
    case ExerciseMode::SoundOutWords: return "sound_out_words";
  }
  return "explore";
}

inline ExerciseMode exercise_mode_from_string(const std::string& value) {
  if (value == "explore") {
    return ExerciseMode::Explore;
  }
  if (value == "find_letter" || value == "find") {
    return ExerciseMode::FindLetter;
  }
  if (value == "sound_out_words" || value == "soundout") {
    return ExerciseMode::SoundOutWords;
  }
  throw std::invalid_argument("Unknown exercise mode: " + value);
}

struct Letter {
  std::string id;        // single grapheme, UTF-8
  std::string sound_id;  // elongated phoneme handed to the synthesizer
  std::string glyph;
  std::string name;      // spoken letter name
  Tier tier = Tier::Easy;
};

struct Word {
  std::string text;
  std::vector<std::string> letters;
  Tier tier = Tier::Easy;
  std::string hint;
};

// What the UI boundary is asked to show.
struct PresentedItem {
  ExerciseMode mode = ExerciseMode::Explore;
  Tier tier = Tier::Easy;
  std::string letter_id;               // target letter, or the active letter of a word
  std::optional<std::string> word;     // Sound-Out-Words only
  std::vector<std::string> word_letters;
  std::size_t position = 0;            // active index into word_letters
  std::vector<std::string> choices;    // Find-the-Letter only
  std::string hint;
};

struct Feedback {
  bool correct = false;
  int streak = 0;
  int stars_earned = 0;  // stars earned this session so far
  bool star_awarded = false;
  std::string letter_id;
  std::optional<std::size_t> word_position;
  bool word_complete = false;
};

struct SessionSummary {
  std::string profile_id;
  ExerciseMode mode = ExerciseMode::Explore;
  Tier tier = Tier::Easy;
  int stars_earned = 0;
  int best_streak = 0;
  int answered = 0;
  int correct = 0;
  int explored = 0;
  int level_ups = 0;
  bool degraded = false;
  bool persisted = false;
};

} // namespace phon
