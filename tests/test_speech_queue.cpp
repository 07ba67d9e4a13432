#include "phon/speech_queue.hpp"

#include "test_support.hpp"

#include <chrono>
#include <cstddef>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using phon::SpeechRequest;
using phon::Utterance;
using phon::UtterancePriority;
using phon::UtteranceState;
using phon::testing::FakeSynthesizer;
using phon::testing::TestSuite;

namespace {

constexpr std::chrono::milliseconds kWait(2000);

Utterance text(const std::string& value,
               UtterancePriority priority = UtterancePriority::Queued) {
  return Utterance{SpeechRequest::text(value), priority};
}

void test_fifo_order(TestSuite& suite) {
  FakeSynthesizer synth(false);
  phon::SpeechQueue queue(synth);
  const auto a = queue.enqueue(text("a"));
  const auto b = queue.enqueue(text("b"));
  const auto c = queue.enqueue(text("c"));

  suite.require(synth.wait_for_spoken(1, kWait), "first utterance should start");
  suite.require(queue.state(a) == UtteranceState::Playing, "a should be playing");
  suite.require(queue.state(b) == UtteranceState::Queued, "b should wait behind a");

  synth.complete_current();
  suite.require(queue.state(a) == UtteranceState::Completed, "a should complete");
  suite.require(synth.wait_for_spoken(2, kWait), "b should start after a");
  synth.complete_current();
  suite.require(synth.wait_for_spoken(3, kWait), "c should start after b");
  synth.complete_current();

  suite.require(queue.wait_idle(kWait), "queue should drain");
  suite.require(synth.spoken() == std::vector<std::string>({"a", "b", "c"}),
                "utterances should play in FIFO order");
  suite.require(queue.state(b) == UtteranceState::Completed &&
                    queue.state(c) == UtteranceState::Completed,
                "all utterances should complete");
}

void test_cancel_queued(TestSuite& suite) {
  FakeSynthesizer synth(false);
  phon::SpeechQueue queue(synth);
  const auto a = queue.enqueue(text("a"));
  const auto b = queue.enqueue(text("b"));
  suite.require(synth.wait_for_spoken(1, kWait), "a should start");

  queue.cancel(b);
  suite.require(queue.state(b) == UtteranceState::Cancelled, "queued b should be cancelled");
  synth.complete_current();
  suite.require(queue.wait_idle(kWait), "queue should drain");
  suite.require(synth.spoken() == std::vector<std::string>({"a"}),
                "an utterance cancelled before it starts never starts");
  suite.require(queue.state(a) == UtteranceState::Completed, "a should complete");

  queue.cancel(a);
  suite.require(queue.state(a) == UtteranceState::Completed, "terminal states are final");
}

void test_cancel_playing(TestSuite& suite) {
  FakeSynthesizer synth(false);
  phon::SpeechQueue queue(synth);
  const auto a = queue.enqueue(text("a"));
  const auto b = queue.enqueue(text("b"));
  suite.require(synth.wait_for_spoken(1, kWait), "a should start");

  queue.cancel(a);
  suite.require(queue.state(a) == UtteranceState::Cancelled, "playing a should be cancelled");
  suite.require(synth.wait_for_spoken(2, kWait), "b should start after a is stopped");
  suite.require(synth.stop_calls() == 1, "cancelling the playing utterance stops the synthesizer");
  suite.require(queue.state(a) == UtteranceState::Cancelled,
                "late interrupted report must not change a cancelled utterance");
  synth.complete_current();
  suite.require(queue.wait_idle(kWait), "queue should drain");
  suite.require(queue.state(b) == UtteranceState::Completed, "b should complete");
}

void test_cancel_all_then_enqueue(TestSuite& suite) {
  FakeSynthesizer synth(false);
  phon::SpeechQueue queue(synth);
  const auto u1 = queue.enqueue(text("u1"));
  const auto u2 = queue.enqueue(text("u2"));
  const auto u3 = queue.enqueue(text("u3"));
  suite.require(synth.wait_for_spoken(1, kWait), "u1 should start");

  queue.cancel_all();
  const auto u4 = queue.enqueue(text("u4"));

  suite.require(synth.wait_for_spoken(2, kWait), "u4 should start");
  suite.require(queue.state(u4) == UtteranceState::Playing, "u4 should be the one playing");
  synth.complete_current();
  suite.require(queue.wait_idle(kWait), "queue should drain");

  suite.require(synth.spoken() == std::vector<std::string>({"u1", "u4"}),
                "after cancel_all only the new utterance plays");
  suite.require(queue.state(u1) == UtteranceState::Cancelled, "u1 should be cancelled");
  suite.require(queue.state(u2) == UtteranceState::Cancelled, "u2 should be cancelled");
  suite.require(queue.state(u3) == UtteranceState::Cancelled, "u3 should be cancelled");
  suite.require(queue.state(u4) == UtteranceState::Completed, "u4 should complete");
}

void test_interrupt_priority(TestSuite& suite) {
  FakeSynthesizer synth(false);
  phon::SpeechQueue queue(synth);
  queue.enqueue(text("old1"));
  const auto old2 = queue.enqueue(text("old2"));
  suite.require(synth.wait_for_spoken(1, kWait), "old1 should start");

  const auto fresh = queue.enqueue(text("fresh", UtterancePriority::Interrupt));
  const auto tail = queue.enqueue(text("tail"));
  suite.require(synth.wait_for_spoken(2, kWait), "fresh should start");
  synth.complete_current();
  suite.require(synth.wait_for_spoken(3, kWait), "tail should follow fresh");
  synth.complete_current();
  suite.require(queue.wait_idle(kWait), "queue should drain");

  suite.require(synth.spoken() == std::vector<std::string>({"old1", "fresh", "tail"}),
                "interrupt should drop older utterances and keep later ones");
  suite.require(queue.state(old2) == UtteranceState::Cancelled, "old2 should be cancelled");
  suite.require(queue.state(fresh) == UtteranceState::Completed, "fresh should complete");
  suite.require(queue.state(tail) == UtteranceState::Completed, "tail should complete");
}

void test_failure_continues(TestSuite& suite) {
  FakeSynthesizer synth(true);
  synth.fail_on("broken");
  phon::SpeechQueue queue(synth);
  const auto a = queue.enqueue(text("a"));
  const auto broken = queue.enqueue(Utterance{SpeechRequest::sound("broken")});
  const auto c = queue.enqueue(text("c"));
  suite.require(queue.wait_idle(kWait), "queue should drain despite a failure");

  suite.require(queue.state(a) == UtteranceState::Completed, "a should complete");
  suite.require(queue.state(broken) == UtteranceState::Failed, "broken should fail");
  suite.require(queue.state(c) == UtteranceState::Completed, "processing continues after failure");

  const auto failures = queue.take_failures();
  suite.require(failures.size() == 1, "one failure should be reported");
  if (!failures.empty()) {
    suite.require(failures.front().request.value == "broken", "failure should name its request");
    suite.require(failures.front().request.kind == SpeechRequest::Kind::Sound,
                  "failure should keep the request kind");
  }
  suite.require(queue.take_failures().empty(), "failures are drained once taken");
}

void test_misuse(TestSuite& suite) {
  FakeSynthesizer synth(true);
  phon::SpeechQueue queue(synth);

  bool unknown = false;
  try {
    queue.state(phon::UtteranceHandle{12345});
  } catch (const std::invalid_argument&) {
    unknown = true;
  }
  suite.require(unknown, "unknown handle should be rejected");

  queue.enqueue(text("a"));
  suite.require(queue.wait_idle(kWait), "queue should drain");
  suite.require(queue.idle(), "drained queue should be idle");
  queue.shutdown();

  bool after_shutdown = false;
  try {
    queue.enqueue(text("b"));
  } catch (const std::logic_error&) {
    after_shutdown = true;
  }
  suite.require(after_shutdown, "enqueue after shutdown should be a logic error");
  queue.shutdown();
}

void test_shutdown_cancels(TestSuite& suite) {
  FakeSynthesizer synth(false);
  auto queue = std::make_unique<phon::SpeechQueue>(synth);
  const auto a = queue->enqueue(text("a"));
  const auto b = queue->enqueue(text("b"));
  suite.require(synth.wait_for_spoken(1, kWait), "a should start");
  queue->shutdown();
  suite.require(queue->state(a) == UtteranceState::Cancelled, "shutdown cancels the playing one");
  suite.require(queue->state(b) == UtteranceState::Cancelled, "shutdown cancels queued ones");
  queue.reset();
  suite.require(synth.spoken() == std::vector<std::string>({"a"}), "nothing starts after shutdown");
}

void test_late_report_after_destruction(TestSuite& suite) {
  FakeSynthesizer synth(false);
  synth.hold_stopped(true);
  {
    phon::SpeechQueue queue(synth);
    queue.enqueue(text("a"));
    suite.require(synth.wait_for_spoken(1, kWait), "a should start");
  }
  suite.require(synth.stop_calls() == 1, "destroying the queue stops the playing utterance");
  suite.require(synth.report_stopped(), "the synthesizer still holds a completion");
}

void test_terminal_states_are_bounded(TestSuite& suite) {
  FakeSynthesizer synth(true);
  phon::SpeechQueue queue(synth);
  const auto first = queue.enqueue(text("first"));
  suite.require(queue.wait_idle(kWait), "first should finish");
  suite.require(queue.state(first) == UtteranceState::Completed, "first should complete");

  phon::UtteranceHandle last;
  for (std::size_t i = 0; i < phon::SpeechQueue::kRetainedStates + 8; ++i) {
    last = queue.enqueue(text("n"));
  }
  suite.require(queue.wait_idle(std::chrono::milliseconds(10000)), "queue should drain");
  suite.require(queue.state(last) == UtteranceState::Completed, "recent states stay visible");

  bool released = false;
  try {
    queue.state(first);
  } catch (const std::invalid_argument&) {
    released = true;
  }
  suite.require(released, "old terminal states are released");
  queue.cancel(first);
  suite.require(queue.idle(), "cancelling a released handle does nothing");
}

} // namespace

int main() {
  TestSuite suite;
  test_fifo_order(suite);
  test_cancel_queued(suite);
  test_cancel_playing(suite);
  test_cancel_all_then_enqueue(suite);
  test_interrupt_priority(suite);
  test_failure_continues(suite);
  test_misuse(suite);
  test_shutdown_cancels(suite);
  test_late_report_after_destruction(suite);
  test_terminal_states_are_bounded(suite);

  if (!suite.ok) {
    std::cerr << "Speech queue tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Speech queue tests passed" << std::endl;
  return 0;
}
