#pragma once

#include "mode.hpp"

namespace phon {

// Free exploration: the child taps any letter and hears it.
class ExploreMode {
public:
  static constexpr ExerciseMode kMode = ExerciseMode::Explore;

  // Explore waits for the child; nothing is presented on request.
  std::optional<PresentedItem> next_item(ModeContext& ctx);
  SubmitResult submit(ModeContext& ctx, const Answer& answer);
  void replay(ModeContext& ctx) const;

  const std::optional<PresentedItem>& current() const { return item_; }
  bool mid_word() const { return false; }

private:
  void speak_letter(ModeContext& ctx, const Letter& letter) const;

  std::optional<PresentedItem> item_;
};

} // namespace phon
