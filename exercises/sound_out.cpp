#include "sound_out.hpp"

#include "../scoring/scoring.hpp"
#include "../src/log.hpp"

#include <stdexcept>

namespace phon {

std::optional<PresentedItem> SoundOutMode::next_item(ModeContext& ctx) {
  const auto candidates = ctx.curriculum.words_by_difficulty(ctx.tier);
  if (candidates.empty()) {
    throw std::logic_error("No words available for tier " + to_string(ctx.tier));
  }
  if (mid_word()) {
    log::debug("soundout", "abandoning word " + *item_->word);
  }
  std::vector<double> mastery;
  mastery.reserve(candidates.size());
  std::optional<std::size_t> exclude;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    mastery.push_back(scoring::word_mastery(*candidates[i], ctx.ledger));
    if (candidates[i]->text == previous_word_) {
      exclude = i;
    }
  }
  const auto index =
      scoring::pick_candidate(mastery, ctx.config.selection_floor, exclude, ctx.rng_state);
  const Word& word = *candidates[index];

  PresentedItem item;
  item.mode = kMode;
  item.tier = ctx.tier;
  item.word = word.text;
  item.word_letters = word.letters;
  item.position = 0;
  item.letter_id = word.letters.front();
  item.hint = word.hint;
  item_ = item;
  previous_word_ = word.text;
  complete_ = false;

  log::debug("soundout", "word=" + word.text);
  ctx.say(SpeechRequest::text(word.text), UtterancePriority::Interrupt);
  ctx.say(SpeechRequest::sound(ctx.curriculum.letter(item.letter_id).sound_id));
  return item;
}

SubmitResult SoundOutMode::submit(ModeContext& ctx, const Answer& answer) {
  const auto* confirm = std::get_if<ConfirmLetter>(&answer);
  if (!confirm) {
    throw std::invalid_argument("Sound-Out-Words only accepts letter confirmations");
  }
  if (!item_) {
    throw std::logic_error("confirm_letter_in_word called before next_item");
  }
  if (complete_) {
    throw std::logic_error("Word already complete; request the next item");
  }
  if (confirm->position != item_->position) {
    throw std::invalid_argument("Expected position " + std::to_string(item_->position) +
                                ", got " + std::to_string(confirm->position));
  }
  ctx.curriculum.letter(confirm->letter_id);  // rejects unknown letters

  const std::size_t position = item_->position;
  const std::string& expected = item_->word_letters[position];

  SubmitResult result;
  ModeOutcome outcome;
  outcome.kind = ModeOutcome::Kind::Scored;
  outcome.letter_id = expected;
  outcome.correct = confirm->letter_id == expected;
  outcome.word_position = position;

  const std::size_t next = position + 1;
  if (next < item_->word_letters.size()) {
    item_->position = next;
    item_->letter_id = item_->word_letters[next];
    ctx.say(SpeechRequest::sound(ctx.curriculum.letter(item_->letter_id).sound_id));
    result.presented = *item_;
  } else {
    complete_ = true;
    outcome.word_complete = true;
    // Blend: the whole word once more after its last sound.
    ctx.say(SpeechRequest::text(*item_->word));
  }
  result.outcome = outcome;
  return result;
}

void SoundOutMode::replay(ModeContext& ctx) const {
  if (!item_) {
    return;
  }
  ctx.say(SpeechRequest::text(*item_->word), UtterancePriority::Interrupt);
  if (!complete_) {
    ctx.say(SpeechRequest::sound(ctx.curriculum.letter(item_->letter_id).sound_id));
  }
}

} // namespace phon
