#pragma once
#include "gw/types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace gw {

struct Settings {
  int  turn_time_limit_ms{TURN_TIME_LIMIT_MS};
  bool auto_end_turn{true};              // end the turn when the timer runs out
  int  resource_phase_delay_ms{0};       // 0: resource phase waits for next_phase()
  int  action_exhausted_delay_ms{500};   // 0: advance to build at once
  std::string player1_name{"Player 1"};
  std::string player2_name{"Player 2"};
  std::string log_level{"info"};
};

void to_json(nlohmann::json& j, const Settings& s);
void from_json(const nlohmann::json& j, Settings& s);   // missing keys keep defaults

// Unreadable or malformed files yield the defaults and an error message.
Settings load_settings(const std::string& path, std::string* error = nullptr);
bool     save_settings(const std::string& path, const Settings& s);

} // namespace gw
