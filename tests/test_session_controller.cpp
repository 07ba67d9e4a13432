#include "phon/errors.hpp"
#include "phon/profile_store.hpp"
#include "phon/session_controller.hpp"

#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using phon::testing::FakeSynthesizer;
using phon::testing::RecordingListener;
using phon::testing::TestSuite;

namespace {

constexpr std::chrono::milliseconds kWait(2000);

struct Rig {
  explicit Rig(phon::EngineConfig config = seeded())
      : curriculum(phon::load_curriculum()), speech(synth) {
    controller = phon::make_session_controller(curriculum, store, speech, config, &listener);
  }

  static phon::EngineConfig seeded() {
    phon::EngineConfig config;
    config.seed = 7;
    return config;
  }

  // Answers `count` Find-the-Letter items correctly.
  void answer_correctly(const phon::SessionHandle& handle, int count) {
    for (int i = 0; i < count; ++i) {
      auto item = controller->next_item(handle);
      controller->select_letter(handle, item->letter_id);
    }
  }

  phon::Curriculum curriculum;
  phon::MemoryProfileStore store;
  FakeSynthesizer synth;
  phon::SpeechQueue speech;
  RecordingListener listener;
  std::unique_ptr<phon::SessionController> controller;
};

template <typename Exception, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void test_start_and_end(TestSuite& suite) {
  Rig rig;
  const auto handle = rig.controller->start_session("ella", phon::ExerciseMode::FindLetter);
  suite.require(!handle.session_id.empty(), "session id should be assigned");
  suite.require(rig.controller->is_active("ella"), "profile should be active");
  suite.require(rig.controller->progress(handle).profile_id == "ella", "fresh profile is created");

  rig.answer_correctly(handle, 5);
  const auto summary = rig.controller->end(handle);
  suite.require(summary.stars_earned == 1 && summary.best_streak == 5,
                "summary should report one star and streak 5");
  suite.require(summary.answered == 5 && summary.correct == 5, "summary should count answers");
  suite.require(summary.persisted, "end should persist");
  suite.require(!rig.controller->is_active("ella"), "ending frees the profile");

  const auto stored = rig.store.read("ella");
  suite.require(stored.has_value(), "profile should be stored");
  if (stored) {
    const auto doc = nlohmann::json::parse(*stored);
    suite.require(doc["totalStars"] == 1, "stars are folded into the ledger");
    suite.require(doc["bestStreak"] == 5, "best streak is folded into the ledger");
    suite.require(doc["sessionsPlayed"] == 1, "the session is counted");
  }

  const auto again = rig.controller->start_session("ella", phon::ExerciseMode::Explore);
  suite.require(rig.controller->progress(again).total_stars == 1, "next session sees saved stars");
  suite.require(again.session_id != handle.session_id, "session ids are not reused");
  suite.require(throws<std::runtime_error>([&] { rig.controller->next_item(handle); }),
                "an ended session is unknown");
  rig.controller->end(again);
}

void test_already_active(TestSuite& suite) {
  Rig rig;
  const auto handle = rig.controller->start_session("ella", phon::ExerciseMode::FindLetter);
  rig.answer_correctly(handle, 2);

  bool threw = false;
  try {
    rig.controller->start_session("ella", phon::ExerciseMode::SoundOutWords);
  } catch (const phon::SessionAlreadyActive& ex) {
    threw = ex.code() == phon::ErrorCode::SessionAlreadyActive;
  }
  suite.require(threw, "second session for the same profile should be rejected");
  suite.require(rig.controller->session_state(handle).streak == 2,
                "the running session is untouched");
  suite.require(rig.controller->session_state(handle).mode == phon::ExerciseMode::FindLetter,
                "the running session keeps its mode");

  const auto other = rig.controller->start_session("omar", phon::ExerciseMode::Explore);
  suite.require(rig.controller->is_active("omar"), "another profile may play at the same time");
  rig.controller->end(other);
  rig.controller->end(handle);
}

void test_pause_resume(TestSuite& suite) {
  Rig rig;
  const auto handle = rig.controller->start_session("ella", phon::ExerciseMode::FindLetter);
  rig.answer_correctly(handle, 5);
  suite.require(rig.speech.wait_idle(kWait), "speech should settle");
  rig.synth.clear_spoken();

  rig.controller->pause(handle);
  suite.require(rig.controller->is_paused(handle), "session should be paused");
  suite.require(rig.store.write_calls() == 1, "pause persists once");
  suite.require(rig.controller->progress(handle).total_stars == 1, "pause folds earned stars");
  suite.require(throws<std::logic_error>([&] { rig.controller->next_item(handle); }),
                "commands on a paused session are rejected");
  suite.require(throws<std::logic_error>([&] { rig.controller->select_letter(handle, "A"); }),
                "answers on a paused session are rejected");

  rig.controller->pause(handle);
  suite.require(rig.store.write_calls() == 1, "pausing twice does nothing");

  rig.controller->resume(handle);
  suite.require(!rig.controller->is_paused(handle), "session should run again");
  suite.require(rig.synth.wait_for_spoken(1, kWait), "resume replays the prompt");

  const auto summary = rig.controller->end(handle);
  suite.require(summary.stars_earned == 1, "session earned one star");
  const auto doc = nlohmann::json::parse(*rig.store.read("ella"));
  suite.require(doc["totalStars"] == 1, "stars folded at pause are not counted twice");
}

void test_persist_retry(TestSuite& suite) {
  {
    Rig rig;
    const auto handle = rig.controller->start_session("ella", phon::ExerciseMode::FindLetter);
    rig.answer_correctly(handle, 1);
    rig.store.fail_next_writes(2);
    const auto summary = rig.controller->end(handle);
    suite.require(summary.persisted, "third attempt should succeed");
    suite.require(rig.store.write_calls() == 3, "two failures then one success");
    suite.require(rig.controller->take_notices().empty(), "recovered writes raise no notice");
  }
  {
    Rig rig;
    const auto handle = rig.controller->start_session("ella", phon::ExerciseMode::FindLetter);
    rig.answer_correctly(handle, 1);
    rig.store.fail_next_writes(10);
    const auto summary = rig.controller->end(handle);
    suite.require(!summary.persisted, "all attempts failed");
    suite.require(rig.store.write_calls() == 3, "retries are bounded by persist_attempts");
    const auto notices = rig.controller->take_notices();
    suite.require(notices.size() == 1 && notices.front().code == phon::ErrorCode::StorageWriteFailed,
                  "final failure becomes a StorageWriteFailed notice");
    suite.require(!notices.empty() && !notices.front().detail.empty(),
                  "notice carries the technical detail");
    suite.require(rig.listener.notices.size() == 1, "listener sees the notice");
    suite.require(!rig.controller->is_active("ella"), "the session still ends");
  }
}

void test_corrupt_profile(TestSuite& suite) {
  Rig rig;
  rig.store.put("ella", "{definitely not json");
  const auto handle = rig.controller->start_session("ella", phon::ExerciseMode::SoundOutWords);
  suite.require(rig.store.quarantined("ella"), "corrupt record should be quarantined");
  const auto notices = rig.controller->take_notices();
  suite.require(notices.size() == 1 && notices.front().code == phon::ErrorCode::StorageCorrupt,
                "corruption raises a StorageCorrupt notice");
  suite.require(!notices.empty() && notices.front().message == "Let's start a fresh adventure!",
                "the notice is child friendly");
  suite.require(rig.controller->progress(handle).mastery.empty(), "progress starts fresh");

  auto item = rig.controller->next_item(handle);
  suite.require(item && item->word.has_value(), "the session is playable");
  rig.controller->end(handle);
}

void test_command_routing(TestSuite& suite) {
  Rig rig;
  const auto words = rig.controller->start_session("ella", phon::ExerciseMode::SoundOutWords);
  auto item = rig.controller->next_item(words);
  if (!item) {
    suite.require(false, "sound-out should present a word");
    return;
  }
  for (std::size_t i = 0; i < item->word_letters.size(); ++i) {
    const auto feedback =
        rig.controller->confirm_letter_in_word(words, i, item->word_letters[i]);
    suite.require(feedback.correct, "confirming the right letter is correct");
    suite.require(feedback.word_complete == (i + 1 == item->word_letters.size()),
                  "the word completes on its last letter");
  }
  rig.controller->replay(words);
  suite.require(throws<std::invalid_argument>([&] { rig.controller->request_explore(words, "A"); }),
                "explore requests need Explore mode");
  rig.controller->end(words);

  const auto explore = rig.controller->start_session("ella", phon::ExerciseMode::Explore);
  const auto shown = rig.controller->request_explore(explore, "Ö");
  suite.require(shown.letter_id == "Ö", "explore presents the tapped letter");
  const auto summary = rig.controller->end(explore);
  suite.require(summary.explored == 1 && summary.answered == 0, "explore is counted separately");
  const auto doc = nlohmann::json::parse(*rig.store.read("ella"));
  suite.require(doc["perLetterMastery"]["Ö"]["explored"] == 1, "explored outcome is persisted");
  suite.require(doc["sessionsPlayed"] == 2, "both sessions are counted");
}

void test_level_up_persists(TestSuite& suite) {
  phon::EngineConfig config = Rig::seeded();
  config.level_up_min_samples = 1;
  Rig rig(config);
  const auto handle = rig.controller->start_session("ella", phon::ExerciseMode::FindLetter);
  // 10 easy letters; each needs one correct answer.
  for (int i = 0; i < 400 && rig.listener.level_ups.empty(); ++i) {
    auto item = rig.controller->next_item(handle);
    rig.controller->select_letter(handle, item->letter_id);
  }
  suite.require(rig.listener.level_ups.size() == 1, "one level-up expected");
  suite.require(rig.controller->session_state(handle).tier == phon::Tier::Medium,
                "session should move to medium");
  const auto summary = rig.controller->end(handle);
  suite.require(summary.level_ups == 1 && summary.tier == phon::Tier::Medium,
                "summary should report the level-up");
  const auto doc = nlohmann::json::parse(*rig.store.read("ella"));
  suite.require(doc["currentTier"] == "medium", "the new tier is persisted");
}

} // namespace

int main() {
  TestSuite suite;
  test_start_and_end(suite);
  test_already_active(suite);
  test_pause_resume(suite);
  test_persist_retry(suite);
  test_corrupt_profile(suite);
  test_command_routing(suite);
  test_level_up_persists(suite);

  if (!suite.ok) {
    std::cerr << "Session controller tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Session controller tests passed" << std::endl;
  return 0;
}
