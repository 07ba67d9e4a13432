#pragma once

#include "../include/phon/config.hpp"
#include "../include/phon/curriculum.hpp"
#include "../include/phon/progress_ledger.hpp"
#include "../include/phon/speech_queue.hpp"
#include "../include/phon/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace phon {

// Commands arriving from the UI boundary.
struct SelectLetter {
  std::string letter_id;
};

struct ConfirmLetter {
  std::size_t position = 0;
  std::string letter_id;
};

struct ExploreRequest {
  std::string letter_id;
};

using Answer = std::variant<SelectLetter, ConfirmLetter, ExploreRequest>;

// Everything a mode may touch. Owned by the engine, rebuilt per call.
struct ModeContext {
  const Curriculum& curriculum;
  const ProgressLedger& ledger;
  SpeechQueue& speech;
  const EngineConfig& config;
  std::uint64_t& rng_state;
  Tier tier;

  UtteranceHandle say(SpeechRequest request,
                      UtterancePriority priority = UtterancePriority::Queued) {
    return speech.enqueue(Utterance{std::move(request), priority});
  }
};

struct ModeOutcome {
  enum class Kind { Scored, Explored };
  Kind kind = Kind::Scored;
  std::string letter_id;
  bool correct = false;
  std::optional<std::size_t> word_position;
  bool word_complete = false;
};

struct SubmitResult {
  std::optional<ModeOutcome> outcome;
  std::optional<PresentedItem> presented;  // set when the visible item changed
};

} // namespace phon
