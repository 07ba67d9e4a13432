#pragma once

#include "mode.hpp"

namespace phon {

/**
 * SoundOutMode: a word is spoken, then the child confirms its letters one
 * position at a time while each letter's sound is played. A wrong
 * confirmation is scored but the word still advances to completion.
 */
class SoundOutMode {
public:
  static constexpr ExerciseMode kMode = ExerciseMode::SoundOutWords;

  std::optional<PresentedItem> next_item(ModeContext& ctx);
  SubmitResult submit(ModeContext& ctx, const Answer& answer);
  void replay(ModeContext& ctx) const;

  const std::optional<PresentedItem>& current() const { return item_; }
  bool mid_word() const { return item_.has_value() && !complete_; }

private:
  std::optional<PresentedItem> item_;
  std::string previous_word_;
  bool complete_ = false;
};

} // namespace phon
