#pragma once

#include "../include/phon/config.hpp"
#include "../include/phon/errors.hpp"
#include "../include/phon/progress_ledger.hpp"
#include "../include/phon/types.hpp"

#include <nlohmann/json.hpp>

namespace phon::bridge {

inline constexpr int kProgressFormat = 1;

nlohmann::json to_json(const ProgressSnapshot& snapshot);
ProgressSnapshot progress_snapshot_from_json(const nlohmann::json& json_snapshot);

nlohmann::json to_json(const EngineConfig& config);
// Overlays the keys present in `json_config` on `base`.
EngineConfig engine_config_from_json(const nlohmann::json& json_config,
                                     const EngineConfig& base = EngineConfig{});

nlohmann::json to_json(const PresentedItem& item);
nlohmann::json to_json(const Feedback& feedback);
nlohmann::json to_json(const Notice& notice);
nlohmann::json to_json(const SessionSummary& summary);

} // namespace phon::bridge
