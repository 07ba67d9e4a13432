#include "scoring.hpp"

#include "../src/rng.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>

namespace phon::scoring {

double selection_weight(double mastery, double floor) {
  return (1.0 - std::clamp(mastery, 0.0, 1.0)) + floor;
}

double word_mastery(const Word& word, const ProgressLedger& ledger) {
  if (word.letters.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto& id : word.letters) {
    sum += ledger.mastery_score(id);
  }
  return sum / static_cast<double>(word.letters.size());
}

std::size_t pick_candidate(const std::vector<double>& mastery, double floor,
                           std::optional<std::size_t> exclude, std::uint64_t& rng_state) {
  if (mastery.empty()) {
    throw std::invalid_argument("pick_candidate: no candidates");
  }
  std::vector<double> weights;
  weights.reserve(mastery.size());
  for (double m : mastery) {
    weights.push_back(selection_weight(m, floor));
  }
  if (exclude.has_value() && *exclude < weights.size() && weights.size() > 1) {
    weights[*exclude] = 0.0;
  }
  return weighted_pick(weights, rng_state);
}

std::vector<const Letter*> practised_letters(const Curriculum& curriculum, Tier tier,
                                             ExerciseMode mode) {
  if (mode != ExerciseMode::SoundOutWords) {
    return curriculum.letters_by_difficulty(tier);
  }
  std::set<std::string> spelled;
  for (const auto* word : curriculum.words_by_difficulty(tier)) {
    spelled.insert(word->letters.begin(), word->letters.end());
  }
  std::vector<const Letter*> out;
  for (const auto& letter : curriculum.letters()) {
    if (spelled.count(letter.id) != 0) {
      out.push_back(&letter);
    }
  }
  return out;
}

TierReadiness tier_readiness(const Curriculum& curriculum, const ProgressLedger& ledger,
                             Tier tier, ExerciseMode mode, const EngineConfig& config) {
  TierReadiness readiness;
  readiness.tier = tier;
  const auto letters = practised_letters(curriculum, tier, mode);
  readiness.letters = letters.size();
  if (letters.empty()) {
    return readiness;
  }
  const auto min_samples = static_cast<std::uint64_t>(std::max(0, config.level_up_min_samples));
  double sum = 0.0;
  for (const auto* letter : letters) {
    sum += ledger.mastery_score(letter->id);
    if (ledger.scored_attempts(letter->id) >= min_samples) {
      readiness.letters_sampled += 1;
    }
  }
  readiness.average_mastery = sum / static_cast<double>(letters.size());
  readiness.ready = readiness.letters_sampled == readiness.letters &&
                    readiness.average_mastery >= config.level_up_threshold;
  return readiness;
}

} // namespace phon::scoring
