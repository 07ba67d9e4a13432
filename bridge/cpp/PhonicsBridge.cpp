#include "PhonicsBridge.h"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>

#include "phon/config.hpp"
#include "phon/curriculum.hpp"
#include "phon/errors.hpp"
#include "phon/profile_store.hpp"
#include "phon/session_controller.hpp"
#include "phon/speech_queue.hpp"
#include "phon/ui_events.hpp"
#include "../../src/json_bridge.hpp"

namespace {

// Forwards synthesis to host callbacks; completions come back by token.
class HostSynthesizer : public phon::Synthesizer {
public:
  void set_callbacks(phon_speak_fn speak, phon_stop_fn stop, void* user_data) {
    std::scoped_lock guard(mutex_);
    speak_ = speak;
    stop_ = stop;
    user_data_ = user_data;
  }

  void speak(const phon::SpeechRequest& request, Completion done) override {
    phon_speak_fn speak_fn = nullptr;
    void* user_data = nullptr;
    unsigned long long token = 0;
    {
      std::scoped_lock guard(mutex_);
      speak_fn = speak_;
      user_data = user_data_;
      if (speak_fn) {
        token = ++next_token_;
        pending_.emplace(token, std::move(done));
      }
    }
    if (!speak_fn) {
      done(false, "no synthesizer registered");
      return;
    }
    const int kind = request.kind == phon::SpeechRequest::Kind::Sound ? 1 : 0;
    speak_fn(token, kind, request.value.c_str(), user_data);
  }

  void stop() override {
    phon_stop_fn stop_fn = nullptr;
    void* user_data = nullptr;
    {
      std::scoped_lock guard(mutex_);
      stop_fn = stop_;
      user_data = user_data_;
    }
    if (stop_fn) {
      stop_fn(user_data);
    }
  }

  void finished(unsigned long long token, bool ok, const std::string& error) {
    Completion done;
    {
      std::scoped_lock guard(mutex_);
      auto it = pending_.find(token);
      if (it == pending_.end()) {
        return;
      }
      done = std::move(it->second);
      pending_.erase(it);
    }
    done(ok, error);
  }

private:
  std::mutex mutex_;
  phon_speak_fn speak_ = nullptr;
  phon_stop_fn stop_ = nullptr;
  void* user_data_ = nullptr;
  unsigned long long next_token_ = 0;
  std::unordered_map<unsigned long long, Completion> pending_;
};

// Collects UI events until the next envelope is built.
class EventCollector : public phon::UiListener {
public:
  void on_item_presented(const phon::PresentedItem& item) override {
    nlohmann::json event = nlohmann::json::object();
    event["type"] = "itemPresented";
    event["item"] = phon::bridge::to_json(item);
    events_.push_back(std::move(event));
  }

  void on_feedback(const phon::Feedback& feedback) override {
    nlohmann::json event = nlohmann::json::object();
    event["type"] = "feedback";
    event["feedback"] = phon::bridge::to_json(feedback);
    events_.push_back(std::move(event));
  }

  void on_level_up(phon::Tier new_tier) override {
    nlohmann::json event = nlohmann::json::object();
    event["type"] = "levelUp";
    event["tier"] = phon::to_string(new_tier);
    events_.push_back(std::move(event));
  }

  void on_notice(const phon::Notice& notice) override {
    nlohmann::json event = nlohmann::json::object();
    event["type"] = "notice";
    event["notice"] = phon::bridge::to_json(notice);
    events_.push_back(std::move(event));
  }

  nlohmann::json take() {
    nlohmann::json out = std::move(events_);
    events_ = nlohmann::json::array();
    return out;
  }

private:
  nlohmann::json events_ = nlohmann::json::array();
};

struct EngineState {
  std::mutex mutex;
  HostSynthesizer synth;
  std::unique_ptr<phon::SpeechQueue> speech;
  std::optional<phon::Curriculum> curriculum;
  EventCollector events;
  std::unique_ptr<phon::FileProfileStore> store;
  std::unique_ptr<phon::SessionController> controller;
  std::optional<phon::SessionHandle> session;
  std::string storage_root = "phonics_profiles";
  phon::EngineConfig config;
};

EngineState& state() {
  static EngineState instance;
  return instance;
}

phon::SessionController& ensure_controller() {
  auto& s = state();
  if (!s.curriculum) {
    s.curriculum = phon::load_curriculum();
  }
  if (!s.speech) {
    s.speech = std::make_unique<phon::SpeechQueue>(s.synth);
  }
  if (!s.controller) {
    s.store = std::make_unique<phon::FileProfileStore>(s.storage_root);
    s.controller =
        phon::make_session_controller(*s.curriculum, *s.store, *s.speech, s.config, &s.events);
  }
  return *s.controller;
}

// Drops the controller so the next session picks up new settings.
void reset_controller() {
  auto& s = state();
  s.controller.reset();
  s.store.reset();
}

char* copy_string(const std::string& value) {
  char* buffer = static_cast<char*>(std::malloc(value.size() + 1));
  if (!buffer) {
    return nullptr;
  }
  std::memcpy(buffer, value.c_str(), value.size());
  buffer[value.size()] = '\0';
  return buffer;
}

char* copy_json(nlohmann::json payload) {
  auto& s = state();
  payload["events"] = s.events.take();
  return copy_string(payload.dump());
}

nlohmann::json ok_envelope() {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  return payload;
}

nlohmann::json error_envelope(const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["message"] = message;
  return payload;
}

nlohmann::json error_envelope(const phon::PhonicsError& error) {
  nlohmann::json payload = error_envelope(std::string(error.what()));
  payload["code"] = phon::to_string(error.code());
  return payload;
}

// Runs `body` against the active session, converting exceptions to envelopes.
char* with_session(const std::function<nlohmann::json(phon::SessionController&,
                                                       const phon::SessionHandle&)>& body) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  if (!s.session.has_value() || !s.controller) {
    return copy_json(error_envelope("No active session"));
  }
  try {
    return copy_json(body(*s.controller, *s.session));
  } catch (const phon::PhonicsError& ex) {
    return copy_json(error_envelope(ex));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

std::string safe_string(const char* value) {
  return value ? std::string(value) : std::string();
}

} // namespace

extern "C" {

char* phon_set_storage_root(const char* path) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  if (s.session.has_value()) {
    return copy_json(error_envelope("Cannot change storage root during a session"));
  }
  if (!path || *path == '\0') {
    return copy_json(error_envelope("Missing storage root"));
  }
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return copy_json(error_envelope("Cannot create storage root: " + ec.message()));
  }
  s.storage_root = path;
  reset_controller();
  return copy_json(ok_envelope());
}

char* phon_set_config(const char* config_json) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  if (s.session.has_value()) {
    return copy_json(error_envelope("Cannot change config during a session"));
  }
  if (!config_json) {
    return copy_json(error_envelope("Missing config json"));
  }
  try {
    auto json_config = nlohmann::json::parse(config_json);
    s.config = phon::bridge::engine_config_from_json(json_config, s.config);
    reset_controller();
    nlohmann::json payload = ok_envelope();
    payload["config"] = phon::bridge::to_json(s.config);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

void phon_set_synthesizer(phon_speak_fn speak, phon_stop_fn stop, void* user_data) {
  state().synth.set_callbacks(speak, stop, user_data);
}

void phon_speech_finished(unsigned long long token, int ok, const char* error) {
  state().synth.finished(token, ok != 0, safe_string(error));
}

int phon_has_active_session(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  return s.session.has_value() ? 1 : 0;
}

char* phon_start_session(const char* profile_id, const char* mode) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  if (!profile_id || *profile_id == '\0') {
    return copy_json(error_envelope("Missing profile id"));
  }
  try {
    const auto exercise_mode = phon::exercise_mode_from_string(mode ? mode : "explore");
    if (s.session.has_value()) {
      throw phon::SessionAlreadyActive(s.session->profile_id);
    }
    auto& controller = ensure_controller();
    s.session = controller.start_session(profile_id, exercise_mode);
    nlohmann::json payload = ok_envelope();
    payload["sessionId"] = s.session->session_id;
    payload["tier"] = phon::to_string(controller.progress(*s.session).current_tier);
    payload["totalStars"] = controller.progress(*s.session).total_stars;
    return copy_json(payload);
  } catch (const phon::PhonicsError& ex) {
    return copy_json(error_envelope(ex));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* phon_next_item(void) {
  return with_session([](phon::SessionController& controller, const phon::SessionHandle& handle) {
    nlohmann::json payload = ok_envelope();
    auto item = controller.next_item(handle);
    payload["item"] = item ? phon::bridge::to_json(*item) : nlohmann::json();
    return payload;
  });
}

char* phon_select_letter(const char* letter_id) {
  const std::string id = safe_string(letter_id);
  return with_session([&id](phon::SessionController& controller,
                            const phon::SessionHandle& handle) {
    nlohmann::json payload = ok_envelope();
    payload["feedback"] = phon::bridge::to_json(controller.select_letter(handle, id));
    return payload;
  });
}

char* phon_confirm_letter(int position, const char* letter_id) {
  const std::string id = safe_string(letter_id);
  return with_session([position, &id](phon::SessionController& controller,
                                      const phon::SessionHandle& handle) {
    if (position < 0) {
      throw std::invalid_argument("Position must not be negative");
    }
    nlohmann::json payload = ok_envelope();
    payload["feedback"] = phon::bridge::to_json(
        controller.confirm_letter_in_word(handle, static_cast<std::size_t>(position), id));
    return payload;
  });
}

char* phon_request_explore(const char* letter_id) {
  const std::string id = safe_string(letter_id);
  return with_session([&id](phon::SessionController& controller,
                            const phon::SessionHandle& handle) {
    nlohmann::json payload = ok_envelope();
    payload["item"] = phon::bridge::to_json(controller.request_explore(handle, id));
    return payload;
  });
}

char* phon_replay(void) {
  return with_session([](phon::SessionController& controller, const phon::SessionHandle& handle) {
    controller.replay(handle);
    return ok_envelope();
  });
}

char* phon_pause(void) {
  return with_session([](phon::SessionController& controller, const phon::SessionHandle& handle) {
    controller.pause(handle);
    return ok_envelope();
  });
}

char* phon_resume(void) {
  return with_session([](phon::SessionController& controller, const phon::SessionHandle& handle) {
    controller.resume(handle);
    return ok_envelope();
  });
}

char* phon_end_session(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  if (!s.session.has_value() || !s.controller) {
    return copy_json(ok_envelope());
  }
  try {
    const phon::SessionHandle handle = *s.session;
    s.session.reset();
    auto summary = s.controller->end(handle);
    nlohmann::json payload = ok_envelope();
    payload["summary"] = phon::bridge::to_json(summary);
    return copy_json(payload);
  } catch (const phon::PhonicsError& ex) {
    return copy_json(error_envelope(ex));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

void phon_free_string(char* ptr) {
  if (ptr != nullptr) {
    std::free(ptr);
  }
}

} // extern "C"
