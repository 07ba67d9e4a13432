#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace phon {

struct EngineConfig {
  int star_milestone = 5;            // one star every Nth consecutive correct answer
  double level_up_threshold = 0.8;   // average tier mastery needed to advance
  int level_up_min_samples = 3;      // scored attempts needed per letter of the tier
  double explore_weight = 0.25;      // contribution of an explored outcome to mastery
  double selection_floor = 0.1;      // keeps mastered items selectable
  int find_choices = 6;              // letters offered in Find-the-Letter, target included
  int persist_attempts = 3;          // total write attempts before surfacing a warning
  std::uint64_t seed = 0;            // 0 picks a seed from the clock

  void validate() const {
    if (star_milestone < 1) {
      throw std::invalid_argument("star_milestone must be >= 1");
    }
    if (level_up_threshold < 0.0 || level_up_threshold > 1.0) {
      throw std::invalid_argument("level_up_threshold must be in [0,1]");
    }
    if (level_up_min_samples < 0) {
      throw std::invalid_argument("level_up_min_samples must be >= 0");
    }
    if (explore_weight < 0.0 || explore_weight > 1.0) {
      throw std::invalid_argument("explore_weight must be in [0,1]");
    }
    if (selection_floor <= 0.0) {
      throw std::invalid_argument("selection_floor must be > 0");
    }
    if (find_choices < 2) {
      throw std::invalid_argument("find_choices must be >= 2");
    }
    if (persist_attempts < 1) {
      throw std::invalid_argument("persist_attempts must be >= 1");
    }
  }
};

EngineConfig load_engine_config(const std::string& path);

} // namespace phon
