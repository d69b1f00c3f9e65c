#include "gw/settings.hpp"
#include "gw/log.hpp"
#include <fstream>
#include <stdexcept>

namespace gw {

void to_json(nlohmann::json& j, const Settings& s){
  j = {
    {"turnTimeLimitMs", s.turn_time_limit_ms},
    {"autoEndTurn", s.auto_end_turn},
    {"resourcePhaseDelayMs", s.resource_phase_delay_ms},
    {"actionExhaustedDelayMs", s.action_exhausted_delay_ms},
    {"player1Name", s.player1_name},
    {"player2Name", s.player2_name},
    {"logLevel", s.log_level},
  };
}

void from_json(const nlohmann::json& j, Settings& s){
  Settings d;
  s.turn_time_limit_ms        = j.value("turnTimeLimitMs", d.turn_time_limit_ms);
  s.auto_end_turn             = j.value("autoEndTurn", d.auto_end_turn);
  s.resource_phase_delay_ms   = j.value("resourcePhaseDelayMs", d.resource_phase_delay_ms);
  s.action_exhausted_delay_ms = j.value("actionExhaustedDelayMs", d.action_exhausted_delay_ms);
  s.player1_name              = j.value("player1Name", d.player1_name);
  s.player2_name              = j.value("player2Name", d.player2_name);
  s.log_level                 = j.value("logLevel", d.log_level);
  if (s.turn_time_limit_ms < 0 || s.resource_phase_delay_ms < 0 || s.action_exhausted_delay_ms < 0)
    throw std::invalid_argument("settings: durations must not be negative");
}

Settings load_settings(const std::string& path, std::string* error){
  std::ifstream f(path);
  if (!f){
    if (error) *error = "cannot open " + path;
    return Settings{};
  }
  try {
    nlohmann::json j = nlohmann::json::parse(f);
    return j.get<Settings>();
  } catch (const std::exception& e){
    logger()->warn("settings {} ignored: {}", path, e.what());
    if (error) *error = e.what();
    return Settings{};
  }
}

bool save_settings(const std::string& path, const Settings& s){
  std::ofstream f(path);
  if (!f) return false;
  f << nlohmann::json(s).dump(2) << "\n";
  return bool(f);
}

} // namespace gw
