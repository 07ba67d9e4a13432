#pragma once

#include "config.hpp"
#include "curriculum.hpp"
#include "errors.hpp"
#include "exercise_engine.hpp"
#include "profile_store.hpp"
#include "progress_ledger.hpp"
#include "speech_queue.hpp"
#include "types.hpp"
#include "ui_events.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace phon {

struct SessionHandle {
  std::string session_id;
  std::string profile_id;
};

class SessionController {
public:
  virtual ~SessionController() = default;

  // Loads (or creates) the profile and starts a session in `mode`.
  // Throws SessionAlreadyActive if the profile already has one.
  virtual SessionHandle start_session(const std::string& profile_id, ExerciseMode mode) = 0;

  // Silences speech, folds earned stars into the ledger and persists.
  virtual void pause(const SessionHandle& handle) = 0;

  // Unpauses and replays the current prompt.
  virtual void resume(const SessionHandle& handle) = 0;

  virtual SessionSummary end(const SessionHandle& handle) = 0;

  virtual std::optional<PresentedItem> next_item(const SessionHandle& handle) = 0;

  virtual Feedback select_letter(const SessionHandle& handle, const std::string& letter_id) = 0;

  virtual Feedback confirm_letter_in_word(const SessionHandle& handle, std::size_t position,
                                          const std::string& letter_id) = 0;

  virtual PresentedItem request_explore(const SessionHandle& handle,
                                        const std::string& letter_id) = 0;

  virtual void replay(const SessionHandle& handle) = 0;

  virtual bool is_active(const std::string& profile_id) const = 0;

  virtual bool is_paused(const SessionHandle& handle) const = 0;

  virtual const SessionState& session_state(const SessionHandle& handle) const = 0;

  virtual const ProgressSnapshot& progress(const SessionHandle& handle) const = 0;

  // Recoverable problems raised since the last call, oldest first.
  virtual std::vector<Notice> take_notices() = 0;
};

std::unique_ptr<SessionController> make_session_controller(const Curriculum& curriculum,
                                                           ProfileStore& store,
                                                           SpeechQueue& speech,
                                                           EngineConfig config = EngineConfig{},
                                                           UiListener* listener = nullptr);

} // namespace phon
