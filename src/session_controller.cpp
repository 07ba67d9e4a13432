#include "phon/session_controller.hpp"

#include "log.hpp"

#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace phon {
namespace {

constexpr const char* kFreshStartMessage = "Let's start a fresh adventure!";
constexpr const char* kSaveFailedMessage = "We couldn't save your stars this time. Keep playing!";

struct SessionData {
  SessionHandle handle;
  std::unique_ptr<ProgressLedger> ledger;
  std::unique_ptr<ExerciseEngine> engine;
  bool paused = false;
};

class SessionControllerImpl : public SessionController {
public:
  SessionControllerImpl(const Curriculum& curriculum, ProfileStore& store, SpeechQueue& speech,
                        EngineConfig config, UiListener* listener)
      : curriculum_(curriculum),
        store_(store),
        speech_(speech),
        config_(std::move(config)),
        listener_(listener) {
    config_.validate();
  }

  SessionHandle start_session(const std::string& profile_id, ExerciseMode mode) override {
    if (active_profiles_.count(profile_id) != 0) {
      throw SessionAlreadyActive(profile_id);
    }
    auto ledger = std::make_unique<ProgressLedger>(store_, config_.explore_weight);
    std::string problem;
    const auto status = ledger->open(profile_id, &problem);
    if (status == LoadStatus::Recovered) {
      raise_notice(Notice{ErrorCode::StorageCorrupt, kFreshStartMessage, problem});
    }

    SessionData session;
    session.handle.session_id = generate_session_id();
    session.handle.profile_id = profile_id;
    session.engine = std::make_unique<ExerciseEngine>(curriculum_, *ledger, speech_, config_,
                                                      mode, listener_);
    session.ledger = std::move(ledger);

    const SessionHandle handle = session.handle;
    sessions_.emplace(handle.session_id, std::move(session));
    active_profiles_.insert(profile_id);
    log::debug("session", "start " + handle.session_id + " profile=" + profile_id +
                              " mode=" + to_string(mode));
    return handle;
  }

  void pause(const SessionHandle& handle) override {
    auto& session = get_session(handle);
    if (session.paused) {
      return;
    }
    speech_.cancel_all();
    fold_progress(session);
    persist_with_retry(session);
    session.paused = true;
    log::debug("session", "pause " + handle.session_id);
  }

  void resume(const SessionHandle& handle) override {
    auto& session = get_session(handle);
    if (!session.paused) {
      return;
    }
    session.paused = false;
    session.engine->replay();
    drain_engine_notices(session);
    log::debug("session", "resume " + handle.session_id);
  }

  SessionSummary end(const SessionHandle& handle) override {
    auto& session = get_session(handle);
    speech_.cancel_all();
    fold_progress(session);
    session.ledger->note_session_played();
    const bool persisted = persist_with_retry(session);
    session.engine->poll_speech_failures();
    drain_engine_notices(session);

    SessionSummary summary = session.engine->summary();
    summary.persisted = persisted;
    active_profiles_.erase(session.handle.profile_id);
    log::debug("session", "end " + handle.session_id + " stars=" +
                              std::to_string(summary.stars_earned) +
                              " persisted=" + (persisted ? "yes" : "no"));
    sessions_.erase(handle.session_id);
    return summary;
  }

  std::optional<PresentedItem> next_item(const SessionHandle& handle) override {
    auto& session = get_running_session(handle);
    auto item = session.engine->next_item();
    drain_engine_notices(session);
    return item;
  }

  Feedback select_letter(const SessionHandle& handle, const std::string& letter_id) override {
    auto& session = get_running_session(handle);
    auto feedback = session.engine->select_letter(letter_id);
    drain_engine_notices(session);
    return feedback;
  }

  Feedback confirm_letter_in_word(const SessionHandle& handle, std::size_t position,
                                  const std::string& letter_id) override {
    auto& session = get_running_session(handle);
    auto feedback = session.engine->confirm_letter_in_word(position, letter_id);
    drain_engine_notices(session);
    return feedback;
  }

  PresentedItem request_explore(const SessionHandle& handle,
                                const std::string& letter_id) override {
    auto& session = get_running_session(handle);
    auto item = session.engine->request_explore(letter_id);
    drain_engine_notices(session);
    return item;
  }

  void replay(const SessionHandle& handle) override {
    auto& session = get_running_session(handle);
    session.engine->replay();
    drain_engine_notices(session);
  }

  bool is_active(const std::string& profile_id) const override {
    return active_profiles_.count(profile_id) != 0;
  }

  bool is_paused(const SessionHandle& handle) const override {
    return get_session(handle).paused;
  }

  const SessionState& session_state(const SessionHandle& handle) const override {
    return get_session(handle).engine->state();
  }

  const ProgressSnapshot& progress(const SessionHandle& handle) const override {
    return get_session(handle).ledger->snapshot();
  }

  std::vector<Notice> take_notices() override {
    for (auto& entry : sessions_) {
      drain_engine_notices(entry.second);
    }
    std::vector<Notice> out;
    out.swap(notices_);
    return out;
  }

private:
  SessionData& get_session(const SessionHandle& handle) const {
    auto it = sessions_.find(handle.session_id);
    if (it == sessions_.end()) {
      throw std::runtime_error("Unknown session id");
    }
    return it->second;
  }

  SessionData& get_running_session(const SessionHandle& handle) {
    auto& session = get_session(handle);
    if (session.paused) {
      throw std::logic_error("Session " + handle.session_id + " is paused");
    }
    return session;
  }

  // Moves unfolded stars and the best streak into the ledger.
  void fold_progress(SessionData& session) {
    const int stars = session.engine->take_unfolded_stars();
    if (stars > 0) {
      session.ledger->add_stars(stars);
    }
    session.ledger->note_streak(session.engine->state().best_streak);
  }

  bool persist_with_retry(SessionData& session) {
    std::string last_error;
    for (int attempt = 1; attempt <= config_.persist_attempts; ++attempt) {
      try {
        session.ledger->persist();
        return true;
      } catch (const StorageWriteFailed& ex) {
        last_error = ex.what();
        log::warn("session", "persist attempt " + std::to_string(attempt) + "/" +
                                 std::to_string(config_.persist_attempts) + " failed: " +
                                 last_error);
      }
    }
    raise_notice(Notice{ErrorCode::StorageWriteFailed, kSaveFailedMessage, last_error});
    return false;
  }

  void drain_engine_notices(SessionData& session) {
    for (auto& notice : session.engine->take_notices()) {
      notices_.push_back(std::move(notice));
    }
  }

  void raise_notice(Notice notice) {
    if (listener_) {
      listener_->on_notice(notice);
    }
    notices_.push_back(std::move(notice));
  }

  std::string generate_session_id() {
    std::ostringstream oss;
    oss << "sess-" << (++session_counter_);
    return oss.str();
  }

  const Curriculum& curriculum_;
  ProfileStore& store_;
  SpeechQueue& speech_;
  EngineConfig config_;
  UiListener* listener_;
  mutable std::unordered_map<std::string, SessionData> sessions_;
  std::unordered_set<std::string> active_profiles_;
  std::vector<Notice> notices_;
  std::uint64_t session_counter_ = 0;
};

} // namespace

std::unique_ptr<SessionController> make_session_controller(const Curriculum& curriculum,
                                                           ProfileStore& store,
                                                           SpeechQueue& speech,
                                                           EngineConfig config,
                                                           UiListener* listener) {
  return std::make_unique<SessionControllerImpl>(curriculum, store, speech, std::move(config),
                                                 listener);
}

} // namespace phon
