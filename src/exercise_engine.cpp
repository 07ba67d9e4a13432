#include "phon/exercise_engine.hpp"

#include "../scoring/scoring.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace phon {
namespace {

std::uint64_t seed_from_clock() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto seed = static_cast<std::uint64_t>(now);
  return seed == 0 ? 1 : seed;
}

} // namespace

ExerciseEngine::ExerciseEngine(const Curriculum& curriculum, ProgressLedger& ledger,
                               SpeechQueue& speech, EngineConfig config, ExerciseMode mode,
                               UiListener* listener)
    : curriculum_(curriculum),
      ledger_(ledger),
      speech_(speech),
      config_(std::move(config)),
      listener_(listener),
      mode_(make_mode(mode)) {
  config_.validate();
  state_.profile_id = ledger_.profile_id();
  state_.mode = mode;
  state_.tier = ledger_.tier();
  rng_state_ = config_.seed != 0 ? config_.seed : seed_from_clock();
}

ModeContext ExerciseEngine::context() {
  return ModeContext{curriculum_, ledger_, speech_, config_, rng_state_, state_.tier};
}

std::optional<PresentedItem> ExerciseEngine::next_item() {
  poll_speech_failures();
  auto ctx = context();
  auto item = std::visit([&ctx](auto& mode) { return mode.next_item(ctx); }, mode_);
  if (item) {
    emit_presented(*item);
  }
  return item;
}

SubmitResult ExerciseEngine::dispatch(const Answer& answer) {
  poll_speech_failures();
  auto ctx = context();
  auto result = std::visit([&ctx, &answer](auto& mode) { return mode.submit(ctx, answer); },
                           mode_);
  if (result.presented) {
    emit_presented(*result.presented);
  }
  return result;
}

Feedback ExerciseEngine::select_letter(const std::string& letter_id) {
  auto result = dispatch(SelectLetter{letter_id});
  if (!result.outcome) {
    throw std::logic_error("select_letter produced no outcome");
  }
  return score(*result.outcome);
}

Feedback ExerciseEngine::confirm_letter_in_word(std::size_t position,
                                                const std::string& letter_id) {
  auto result = dispatch(ConfirmLetter{position, letter_id});
  if (!result.outcome) {
    throw std::logic_error("confirm_letter_in_word produced no outcome");
  }
  return score(*result.outcome);
}

PresentedItem ExerciseEngine::request_explore(const std::string& letter_id) {
  auto result = dispatch(ExploreRequest{letter_id});
  if (!result.outcome || !result.presented) {
    throw std::logic_error("request_explore produced no item");
  }
  ledger_.record_explored(result.outcome->letter_id);
  state_.explored += 1;
  return *result.presented;
}

void ExerciseEngine::replay() {
  poll_speech_failures();
  auto ctx = context();
  std::visit([&ctx](const auto& mode) { mode.replay(ctx); }, mode_);
}

Feedback ExerciseEngine::score(const ModeOutcome& outcome) {
  ledger_.record_outcome(outcome.letter_id, outcome.correct);
  state_.answered += 1;

  Feedback feedback;
  feedback.correct = outcome.correct;
  feedback.letter_id = outcome.letter_id;
  feedback.word_position = outcome.word_position;
  feedback.word_complete = outcome.word_complete;

  if (outcome.correct) {
    state_.correct += 1;
    state_.streak += 1;
    state_.best_streak = std::max(state_.best_streak, state_.streak);
    if (state_.streak % config_.star_milestone == 0) {
      state_.stars_earned += 1;
      feedback.star_awarded = true;
    }
  } else {
    state_.streak = 0;
  }
  feedback.streak = state_.streak;
  feedback.stars_earned = state_.stars_earned;

  log::debug("engine", "letter=" + outcome.letter_id + (outcome.correct ? " correct" : " miss") +
                           " streak=" + std::to_string(state_.streak) +
                           " stars=" + std::to_string(state_.stars_earned));
  if (listener_) {
    listener_->on_feedback(feedback);
  }
  check_level_up();
  return feedback;
}

std::optional<Tier> ExerciseEngine::check_level_up() {
  if (mid_word()) {
    return std::nullopt;
  }
  const auto next = next_tier(state_.tier);
  if (!next) {
    return std::nullopt;
  }
  const auto readiness = scoring::tier_readiness(curriculum_, ledger_, state_.tier,
                                                  state_.mode, config_);
  if (!readiness.ready) {
    return std::nullopt;
  }
  log::debug("engine", "level up " + to_string(state_.tier) + " -> " + to_string(*next) +
                           " avg=" + std::to_string(readiness.average_mastery));
  state_.tier = *next;
  state_.level_ups += 1;
  ledger_.set_tier(*next);
  if (listener_) {
    listener_->on_level_up(*next);
  }
  return next;
}

int ExerciseEngine::take_unfolded_stars() {
  const int delta = state_.stars_earned - state_.stars_folded;
  state_.stars_folded = state_.stars_earned;
  return delta;
}

void ExerciseEngine::poll_speech_failures() {
  auto failures = speech_.take_failures();
  if (failures.empty()) {
    return;
  }
  for (const auto& failure : failures) {
    log::warn("engine", "speech unavailable for '" + failure.request.value + "': " +
                            failure.error);
  }
  if (state_.degraded) {
    return;
  }
  state_.degraded = true;
  Notice notice;
  notice.code = ErrorCode::SynthesisFailed;
  notice.message = "The sounds are taking a break. Keep playing with your eyes!";
  notice.detail = failures.front().error;
  raise_notice(std::move(notice));
}

void ExerciseEngine::raise_notice(Notice notice) {
  if (listener_) {
    listener_->on_notice(notice);
  }
  notices_.push_back(std::move(notice));
}

std::vector<Notice> ExerciseEngine::take_notices() {
  std::vector<Notice> out;
  out.swap(notices_);
  return out;
}

void ExerciseEngine::emit_presented(const PresentedItem& item) {
  if (listener_) {
    listener_->on_item_presented(item);
  }
}

std::optional<PresentedItem> ExerciseEngine::current_item() const {
  return std::visit([](const auto& mode) { return mode.current(); }, mode_);
}

bool ExerciseEngine::mid_word() const {
  return std::visit([](const auto& mode) { return mode.mid_word(); }, mode_);
}

SessionSummary ExerciseEngine::summary() const {
  SessionSummary summary;
  summary.profile_id = state_.profile_id;
  summary.mode = state_.mode;
  summary.tier = state_.tier;
  summary.stars_earned = state_.stars_earned;
  summary.best_streak = state_.best_streak;
  summary.answered = state_.answered;
  summary.correct = state_.correct;
  summary.explored = state_.explored;
  summary.level_ups = state_.level_ups;
  summary.degraded = state_.degraded;
  return summary;
}

} // namespace phon
