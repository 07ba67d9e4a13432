#include "phon/config.hpp"

#include "json_bridge.hpp"
#include "log.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace phon {

EngineConfig load_engine_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open engine config: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::exception& ex) {
    throw std::invalid_argument("Engine config " + path + " is not valid JSON: " + ex.what());
  }
  EngineConfig config = bridge::engine_config_from_json(document);
  log::debug("config", "loaded " + path + " " + bridge::to_json(config).dump());
  return config;
}

} // namespace phon
