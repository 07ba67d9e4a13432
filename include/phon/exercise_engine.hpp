#pragma once

#include "config.hpp"
#include "curriculum.hpp"
#include "errors.hpp"
#include "progress_ledger.hpp"
#include "speech_queue.hpp"
#include "types.hpp"
#include "ui_events.hpp"

#include "../../exercises/modes.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace phon {

struct SessionState {
  std::string profile_id;
  ExerciseMode mode = ExerciseMode::Explore;
  Tier tier = Tier::Easy;
  int streak = 0;
  int best_streak = 0;
  int stars_earned = 0;
  int stars_folded = 0;  // part of stars_earned already added to the ledger
  int answered = 0;
  int correct = 0;
  int explored = 0;
  int level_ups = 0;
  bool degraded = false;  // speech failed at least once; feedback is visual-only
};

/**
 * ExerciseEngine: runs one exercise mode for one profile. Presents items,
 * scores answers into the ledger, tracks streak and stars, and advances the
 * tier. Speech goes through the shared SpeechQueue; events go to the
 * optional listener. Not thread-safe.
 */
class ExerciseEngine {
public:
  ExerciseEngine(const Curriculum& curriculum, ProgressLedger& ledger, SpeechQueue& speech,
                 EngineConfig config, ExerciseMode mode, UiListener* listener = nullptr);

  // Presents the next item of the active mode; nothing in Explore.
  std::optional<PresentedItem> next_item();

  Feedback select_letter(const std::string& letter_id);
  Feedback confirm_letter_in_word(std::size_t position, const std::string& letter_id);
  PresentedItem request_explore(const std::string& letter_id);
  void replay();

  // Advances one tier when the current one is mastered. Never mid-word.
  std::optional<Tier> check_level_up();

  // Stars earned since the last call; the caller adds them to the ledger.
  int take_unfolded_stars();

  std::vector<Notice> take_notices();
  void poll_speech_failures();

  std::optional<PresentedItem> current_item() const;
  bool mid_word() const;
  const SessionState& state() const { return state_; }
  SessionSummary summary() const;

private:
  ModeContext context();
  SubmitResult dispatch(const Answer& answer);
  Feedback score(const ModeOutcome& outcome);
  void emit_presented(const PresentedItem& item);
  void raise_notice(Notice notice);

  const Curriculum& curriculum_;
  ProgressLedger& ledger_;
  SpeechQueue& speech_;
  EngineConfig config_;
  UiListener* listener_;
  ModeState mode_;
  SessionState state_;
  std::uint64_t rng_state_ = 0;
  std::vector<Notice> notices_;
};

} // namespace phon
