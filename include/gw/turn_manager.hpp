#pragma once
#include "gw/game_state.hpp"
#include "gw/resource_manager.hpp"
#include "gw/settings.hpp"
#include <cstdint>

namespace gw {

struct PhaseInfo {
  Phase phase;
  int   phase_index;
  int   total_phases;
  int   player;
  int   time_remaining_ms;
};

// Drives resource -> action -> build -> (end of turn) for the active player.
// Time is simulated: the owner feeds elapsed milliseconds to advance_time(),
// which fires timer ticks and delayed phase advances in order.
class TurnManager {
public:
  TurnManager(GameState& gs, ResourceManager& rm, Settings cfg = Settings{});
  ~TurnManager();

  TurnManager(const TurnManager&) = delete;
  TurnManager& operator=(const TurnManager&) = delete;

  bool start_game();
  bool start_turn();
  bool next_phase();
  bool use_player_action();
  bool force_end_turn();

  bool      can_advance_phase() const;
  PhaseInfo phase_info() const;

  void    advance_time(int ms);
  int64_t now_ms() const { return now_ms_; }
  int     time_remaining_ms() const { return time_remaining_ms_; }
  bool    timer_running() const { return timer_running_; }
  bool    advance_pending() const { return pending_; }

  // Re-reads phase from the game state, e.g. after a restore.
  void sync_from_state();

  // Stops the timer and lets go of the game. Safe to call twice.
  void destroy();
  bool destroyed() const { return gs_ == nullptr; }
  bool ending_turn() const { return ending_turn_; }
  const Settings& settings() const { return cfg_; }

private:
  bool end_turn(bool forced);
  void execute_resource_phase();
  void start_timer();
  void stop_timer();
  void tick_timer();
  void on_time_expired();
  void schedule_advance(int delay_ms);
  void fire_pending();

  GameState*       gs_;
  ResourceManager* rm_;
  Settings         cfg_;

  int  phase_index_{0};
  bool ending_turn_{false};
  uint64_t turn_serial_{0};

  int64_t now_ms_{0};
  bool    timer_running_{false};
  int     time_remaining_ms_{0};
  int64_t next_tick_ms_{0};

  bool     pending_{false};
  int64_t  pending_at_ms_{0};
  Phase    pending_from_{Phase::Resource};
  uint64_t pending_serial_{0};
};

} // namespace gw
