#pragma once

#include "explore.hpp"
#include "find_letter.hpp"
#include "sound_out.hpp"

#include <stdexcept>
#include <variant>

namespace phon {

using ModeState = std::variant<ExploreMode, FindLetterMode, SoundOutMode>;

inline ModeState make_mode(ExerciseMode mode) {
  switch (mode) {
    case ExerciseMode::Explore: return ExploreMode{};
    case ExerciseMode::FindLetter: return FindLetterMode{};
    case ExerciseMode::SoundOutWords: return SoundOutMode{};
  }
  throw std::invalid_argument("Unknown exercise mode");
}

} // namespace phon
