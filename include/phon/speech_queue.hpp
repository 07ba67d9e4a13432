#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <unordered_map>
#include <vector>

namespace phon {

struct SpeechRequest {
  enum class Kind { Text, Sound };
  Kind kind = Kind::Text;
  std::string value;

  static SpeechRequest text(std::string value) { return {Kind::Text, std::move(value)}; }
  static SpeechRequest sound(std::string sound_id) { return {Kind::Sound, std::move(sound_id)}; }
};

/**
 * Synthesizer: the external TTS backend. `speak` must return promptly and
 * report the outcome through `done` exactly once, from any thread (it may
 * also call `done` before returning). `stop` interrupts the current
 * utterance; a stopped utterance may still report through `done`.
 */
class Synthesizer {
public:
  using Completion = std::function<void(bool ok, const std::string& error)>;

  virtual ~Synthesizer() = default;
  virtual void speak(const SpeechRequest& request, Completion done) = 0;
  virtual void stop() = 0;
};

enum class UtterancePriority {
  Queued,     // appended behind whatever is queued
  Interrupt   // cancel_all() then append, atomically
};

enum class UtteranceState {
  Queued,
  Playing,
  Completed,
  Cancelled,
  Failed
};

std::string to_string(UtteranceState state);

inline bool is_terminal(UtteranceState state) {
  return state == UtteranceState::Completed || state == UtteranceState::Cancelled ||
         state == UtteranceState::Failed;
}

struct Utterance {
  SpeechRequest request;
  UtterancePriority priority = UtterancePriority::Queued;
};

struct UtteranceHandle {
  std::uint64_t id = 0;
  bool valid() const { return id != 0; }
};

struct SpeechFailure {
  UtteranceHandle handle;
  SpeechRequest request;
  std::string error;
};

/**
 * SpeechQueue: strictly FIFO, one utterance playing at a time. A single mutex
 * guards the queue and the playing slot; a worker thread launches synthesis.
 * An utterance cancelled before the worker picks it never reaches the
 * synthesizer.
 *
 * Only the most recent kRetainedStates terminal states are kept; `state` of an
 * older handle throws like an unknown one and `cancel` ignores it. Completions
 * handed to the synthesizer stay safe to call after the queue is destroyed.
 */
class SpeechQueue {
public:
  static constexpr std::size_t kRetainedStates = 1024;

  explicit SpeechQueue(Synthesizer& synth);
  ~SpeechQueue();

  SpeechQueue(const SpeechQueue&) = delete;
  SpeechQueue& operator=(const SpeechQueue&) = delete;

  UtteranceHandle enqueue(Utterance utterance);
  void cancel(UtteranceHandle handle);
  void cancel_all();

  UtteranceState state(UtteranceHandle handle) const;
  std::vector<SpeechFailure> take_failures();

  bool idle() const;
  bool wait_idle(std::chrono::milliseconds timeout);
  void shutdown();

private:
  struct Entry {
    std::uint64_t id = 0;
    SpeechRequest request;
  };

  // Shared with every outstanding completion; cleared when the queue dies.
  struct CompletionRoute {
    std::mutex mutex;
    SpeechQueue* queue = nullptr;
  };

  void worker_loop();
  void on_complete(std::uint64_t id, bool ok, const std::string& error);
  void cancel_queued_locked();
  void stop_playing(std::unique_lock<std::mutex>& lock);
  void release_after_stop(std::uint64_t id);
  void stop_synth() noexcept;
  bool idle_locked() const;
  bool is_playing_locked(std::uint64_t id) const;
  void finish_locked(std::uint64_t id, UtteranceState state);

  Synthesizer& synth_;
  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  mutable std::condition_variable idle_cv_;
  std::deque<Entry> queue_;
  std::optional<Entry> playing_;
  std::unordered_map<std::uint64_t, UtteranceState> states_;
  std::deque<std::uint64_t> finished_;  // terminal ids, oldest first
  std::shared_ptr<CompletionRoute> route_;
  std::vector<SpeechFailure> failures_;
  std::uint64_t next_id_ = 1;
  bool launching_ = false;          // worker is inside synth_.speak()
  bool stop_after_launch_ = false;  // cancelled while launching; worker stops it
  bool stop_in_flight_ = false;     // synth_.stop() running; nothing new may start
  bool stopping_ = false;
  std::thread worker_;
};

} // namespace phon
