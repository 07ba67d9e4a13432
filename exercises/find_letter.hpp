#pragma once

#include "mode.hpp"

namespace phon {

/**
 * FindLetterMode: a target sound is played and the child picks the matching
 * letter from a shuffled set of choices. Wrong picks may be retried until the
 * target is found; the item then closes until the next `next_item`.
 */
class FindLetterMode {
public:
  static constexpr ExerciseMode kMode = ExerciseMode::FindLetter;

  std::optional<PresentedItem> next_item(ModeContext& ctx);
  SubmitResult submit(ModeContext& ctx, const Answer& answer);
  void replay(ModeContext& ctx) const;

  const std::optional<PresentedItem>& current() const { return item_; }
  bool mid_word() const { return false; }
  bool solved() const { return solved_; }

private:
  std::vector<std::string> build_choices(ModeContext& ctx, const Letter& target) const;

  std::optional<PresentedItem> item_;
  std::string previous_target_;
  bool solved_ = false;
};

} // namespace phon
