#include "explore.hpp"

#include <stdexcept>

namespace phon {

std::optional<PresentedItem> ExploreMode::next_item(ModeContext& /*ctx*/) {
  return std::nullopt;
}

SubmitResult ExploreMode::submit(ModeContext& ctx, const Answer& answer) {
  const auto* request = std::get_if<ExploreRequest>(&answer);
  if (!request) {
    throw std::invalid_argument("Explore mode only accepts explore requests");
  }
  const Letter& letter = ctx.curriculum.letter(request->letter_id);

  PresentedItem item;
  item.mode = kMode;
  item.tier = ctx.tier;
  item.letter_id = letter.id;
  item_ = item;

  speak_letter(ctx, letter);

  SubmitResult result;
  ModeOutcome outcome;
  outcome.kind = ModeOutcome::Kind::Explored;
  outcome.letter_id = letter.id;
  outcome.correct = true;
  result.outcome = outcome;
  result.presented = std::move(item);
  return result;
}

void ExploreMode::replay(ModeContext& ctx) const {
  if (!item_) {
    return;
  }
  speak_letter(ctx, ctx.curriculum.letter(item_->letter_id));
}

// "A. a. aaa": glyph, letter name, then the elongated sound.
void ExploreMode::speak_letter(ModeContext& ctx, const Letter& letter) const {
  ctx.say(SpeechRequest::text(letter.glyph), UtterancePriority::Interrupt);
  if (!letter.name.empty()) {
    ctx.say(SpeechRequest::text(letter.name));
  }
  ctx.say(SpeechRequest::sound(letter.sound_id));
}

} // namespace phon
