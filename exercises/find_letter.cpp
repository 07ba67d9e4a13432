#include "find_letter.hpp"

#include "../scoring/scoring.hpp"
#include "../src/log.hpp"
#include "../src/rng.hpp"

#include <algorithm>
#include <stdexcept>

namespace phon {

std::optional<PresentedItem> FindLetterMode::next_item(ModeContext& ctx) {
  const auto candidates = ctx.curriculum.letters_by_difficulty(ctx.tier);
  if (candidates.empty()) {
    throw std::logic_error("No letters available for tier " + to_string(ctx.tier));
  }
  std::vector<double> mastery;
  mastery.reserve(candidates.size());
  std::optional<std::size_t> exclude;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    mastery.push_back(ctx.ledger.mastery_score(candidates[i]->id));
    if (candidates[i]->id == previous_target_) {
      exclude = i;
    }
  }
  const auto index =
      scoring::pick_candidate(mastery, ctx.config.selection_floor, exclude, ctx.rng_state);
  const Letter& target = *candidates[index];

  PresentedItem item;
  item.mode = kMode;
  item.tier = ctx.tier;
  item.letter_id = target.id;
  item.choices = build_choices(ctx, target);
  item_ = item;
  previous_target_ = target.id;
  solved_ = false;

  log::debug("find", "target=" + target.id + " choices=" + std::to_string(item.choices.size()));
  ctx.say(SpeechRequest::sound(target.sound_id), UtterancePriority::Interrupt);
  return item;
}

std::vector<std::string> FindLetterMode::build_choices(ModeContext& ctx,
                                                       const Letter& target) const {
  std::vector<std::string> distractors;
  for (const auto& letter : ctx.curriculum.letters()) {
    // A distractor that sounds like the target could not be told apart.
    if (letter.id != target.id && letter.sound_id != target.sound_id) {
      distractors.push_back(letter.id);
    }
  }
  shuffle_in_place(distractors, ctx.rng_state);
  const auto wanted = static_cast<std::size_t>(std::max(1, ctx.config.find_choices) - 1);
  if (distractors.size() > wanted) {
    distractors.resize(wanted);
  }
  std::vector<std::string> choices = std::move(distractors);
  choices.push_back(target.id);
  shuffle_in_place(choices, ctx.rng_state);
  return choices;
}

SubmitResult FindLetterMode::submit(ModeContext& ctx, const Answer& answer) {
  const auto* selection = std::get_if<SelectLetter>(&answer);
  if (!selection) {
    throw std::invalid_argument("Find-the-Letter only accepts letter selections");
  }
  if (!item_) {
    throw std::logic_error("select_letter called before next_item");
  }
  if (solved_) {
    throw std::logic_error("Letter already found; request the next item");
  }
  const Letter& picked = ctx.curriculum.letter(selection->letter_id);
  const Letter& target = ctx.curriculum.letter(item_->letter_id);

  SubmitResult result;
  ModeOutcome outcome;
  outcome.kind = ModeOutcome::Kind::Scored;
  outcome.letter_id = target.id;
  outcome.correct = picked.id == target.id;
  result.outcome = outcome;

  if (outcome.correct) {
    solved_ = true;
  } else {
    // Let the child hear the difference before trying again.
    ctx.say(SpeechRequest::sound(picked.sound_id), UtterancePriority::Interrupt);
    ctx.say(SpeechRequest::sound(target.sound_id));
  }
  return result;
}

void FindLetterMode::replay(ModeContext& ctx) const {
  if (!item_) {
    return;
  }
  const Letter& target = ctx.curriculum.letter(item_->letter_id);
  ctx.say(SpeechRequest::sound(target.sound_id), UtterancePriority::Interrupt);
}

} // namespace phon
