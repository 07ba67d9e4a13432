#pragma once

#include "phon/config.hpp"
#include "phon/curriculum.hpp"
#include "phon/progress_ledger.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace phon::scoring {

struct TierReadiness {
  Tier tier = Tier::Easy;
  double average_mastery = 0.0;
  std::size_t letters = 0;
  std::size_t letters_sampled = 0;  // letters with enough scored attempts
  bool ready = false;
};

// Lower mastery gives a higher weight; `floor` keeps mastered items in play.
double selection_weight(double mastery, double floor);

// Mean mastery of the letters a word spells.
double word_mastery(const Word& word, const ProgressLedger& ledger);

// Weighted-random index, never `exclude` when more than one candidate exists.
std::size_t pick_candidate(const std::vector<double>& mastery, double floor,
                           std::optional<std::size_t> exclude, std::uint64_t& rng_state);

// Letters a mode practises at `tier`: the tier's own letters for letter drills,
// the letters spelled by the tier's words for Sound-Out-Words.
std::vector<const Letter*> practised_letters(const Curriculum& curriculum, Tier tier,
                                             ExerciseMode mode);

TierReadiness tier_readiness(const Curriculum& curriculum, const ProgressLedger& ledger,
                             Tier tier, ExerciseMode mode, const EngineConfig& config);

} // namespace phon::scoring
