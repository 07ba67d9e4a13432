#pragma once

#include "phon/curriculum.hpp"

#include <vector>

namespace phon::builtin {

// Swedish alphabet: letter name for Explore, elongated phoneme for the
// synthesizer (children with verbal dyspraxia need slow, clear sounds).
const std::vector<Letter>& swedish_letters();

const std::vector<WordEntry>& swedish_words();

} // namespace phon::builtin
