#include "gw/turn_manager.hpp"
#include "gw/log.hpp"
#include <stdexcept>

namespace gw {

TurnManager::TurnManager(GameState& gs, ResourceManager& rm, Settings cfg)
  : gs_(&gs), rm_(&rm), cfg_(std::move(cfg)), time_remaining_ms_(cfg_.turn_time_limit_ms) {
  phase_index_ = int(gs.current_phase());
}

TurnManager::~TurnManager(){ destroy(); }

bool TurnManager::start_game(){
  if (!gs_ || !gs_->start_game()) return false;
  return start_turn();
}

// ------- Turn start -------

bool TurnManager::start_turn(){
  if (!gs_ || gs_->status() != GameStatus::Playing) return false;
  GameState& g = *gs_;
  ++turn_serial_;
  pending_ = false;

  Player* p = g.player_mut(g.current_player_id());
  if (!p) throw std::logic_error("TurnManager: current player missing");
  p->is_active = true;
  p->reset_actions();
  for (auto& kv: g.units_) if (kv.second.player_id==p->id) kv.second.reset_actions();

  g.set_phase(Phase::Resource);
  phase_index_ = 0;

  rm_->clear_gathering_cooldowns(p->id);
  rm_->regenerate_resources();

  start_timer();
  execute_resource_phase();

  if (!gs_) return true;   // destroyed by a handler
  g.emit("turnStarted", {
    {"player", p->id},
    {"turnNumber", g.turn_number()},
    {"phase", to_string(g.current_phase())},
  });
  return true;
}

void TurnManager::execute_resource_phase(){
  GameState& g = *gs_;
  Player* p = g.player_mut(g.current_player_id());
  int base  = BASE_ENERGY_INCOME;
  int bonus = rm_->worker_adjacency_bonus(p->id);
  p->add_energy(base + bonus);
  p->resources_gathered += bonus;

  g.emit("resourcePhaseComplete", {
    {"player", p->id},
    {"energyGained", base + bonus},
    {"resourceBonus", bonus},
  });
  if (gs_ && cfg_.resource_phase_delay_ms > 0) schedule_advance(cfg_.resource_phase_delay_ms);
}

// ------- Phases -------

bool TurnManager::next_phase(){
  if (!gs_ || gs_->status() != GameStatus::Playing) return false;
  pending_ = false;   // a manual advance supersedes any scheduled one

  if (++phase_index_ >= PHASE_COUNT) return end_turn(false);

  GameState& g = *gs_;
  Phase np = Phase(phase_index_);
  g.set_phase(np);
  const Player* p = g.current_player();

  if (np == Phase::Action){
    g.emit("actionPhaseStarted", {{"player", p->id}, {"actionsRemaining", p->actions_remaining}});
  } else if (np == Phase::Build){
    g.emit("buildPhaseStarted", {{"player", p->id}, {"energy", p->energy}});
  }
  g.emit("phaseChanged", {{"phase", to_string(np)}, {"player", p->id}});
  return true;
}

bool TurnManager::can_advance_phase() const {
  if (!gs_) return false;
  switch (gs_->current_phase()){
    case Phase::Resource: return true;
    case Phase::Action:   return gs_->current_player()->actions_remaining == 0;
    case Phase::Build:    return true;
  }
  return true;
}

PhaseInfo TurnManager::phase_info() const {
  PhaseInfo i{Phase::Resource, phase_index_, PHASE_COUNT, 0, time_remaining_ms_};
  if (gs_){
    i.phase  = gs_->current_phase();
    i.player = gs_->current_player_id();
  }
  return i;
}

bool TurnManager::use_player_action(){
  if (!gs_ || gs_->ended()) return false;
  GameState& g = *gs_;
  Player* p = g.player_mut(g.current_player_id());
  if (!p->use_action()) return false;

  g.emit("actionUsed", {{"player", p->id}, {"actionsRemaining", p->actions_remaining}});

  if (gs_ && g.current_phase()==Phase::Action && p->actions_remaining==0){
    if (cfg_.action_exhausted_delay_ms <= 0) next_phase();
    else schedule_advance(cfg_.action_exhausted_delay_ms);
  }
  return true;
}

// ------- Turn end -------

bool TurnManager::force_end_turn(){
  if (!gs_ || gs_->status() != GameStatus::Playing) return false;
  return end_turn(true);
}

bool TurnManager::end_turn(bool forced){
  if (ending_turn_) return false;
  ending_turn_ = true;
  struct Reset { bool& f; ~Reset(){ f = false; } } reset{ending_turn_};

  GameState& g = *gs_;
  if (forced) g.emit("turnForcedEnd", {{"player", g.current_player_id()}});

  stop_timer();
  pending_ = false;

  Player* cur = g.player_mut(g.current_player_id());
  cur->is_active = false;

  g.check_victory_condition();
  if (g.ended()) return true;

  int prev = cur->id;
  int next = opponent(prev);
  g.set_current_player(next);
  if (next == 1) g.set_turn_number(g.turn_number() + 1);

  Player* np = g.player_mut(next);
  np->is_active = true;
  np->reset_actions();
  for (auto& kv: g.units_) if (kv.second.player_id==next) kv.second.reset_actions();

  logger()->info("turn passes P{} -> P{} (turn {})", prev, next, g.turn_number());
  g.emit("turnEnded", {
    {"previousPlayer", prev},
    {"nextPlayer", next},
    {"turnNumber", g.turn_number()},
  });

  start_turn();
  return true;
}

// ------- Timer -------

void TurnManager::start_timer(){
  time_remaining_ms_ = cfg_.turn_time_limit_ms;
  if (cfg_.turn_time_limit_ms <= 0){ timer_running_ = false; return; }
  timer_running_ = true;
  next_tick_ms_  = now_ms_ + TIMER_TICK_MS;
}

void TurnManager::stop_timer(){
  timer_running_ = false;
}

void TurnManager::tick_timer(){
  next_tick_ms_ += TIMER_TICK_MS;
  if (gs_->ended()){
    stop_timer();
    return;
  }
  if (gs_->status() == GameStatus::Paused) return;   // countdown holds while paused

  time_remaining_ms_ -= TIMER_TICK_MS;
  gs_->emit("turnTimerTick", {
    {"timeRemaining", time_remaining_ms_},
    {"totalTime", cfg_.turn_time_limit_ms},
  });
  if (gs_ && timer_running_ && time_remaining_ms_ <= 0) on_time_expired();
}

void TurnManager::on_time_expired(){
  stop_timer();
  if (gs_->ended()) return;
  logger()->warn("P{} ran out of time", gs_->current_player_id());
  gs_->emit("turnTimeExpired", {{"player", gs_->current_player_id()}});
  if (gs_ && cfg_.auto_end_turn && gs_->status()==GameStatus::Playing) end_turn(false);
}

void TurnManager::schedule_advance(int delay_ms){
  pending_        = true;
  pending_at_ms_  = now_ms_ + delay_ms;
  pending_from_   = gs_->current_phase();
  pending_serial_ = turn_serial_;
}

void TurnManager::fire_pending(){
  if (gs_->status() == GameStatus::Paused){
    // held like the countdown; retried a tick later
    pending_at_ms_ = now_ms_ + TIMER_TICK_MS;
    return;
  }
  pending_ = false;
  // stale if the turn or phase moved on since it was scheduled
  if (ending_turn_ || pending_serial_ != turn_serial_) return;
  if (gs_->current_phase() != pending_from_) return;
  next_phase();
}

void TurnManager::advance_time(int ms){
  if (!gs_ || ms <= 0) return;
  int64_t target = now_ms_ + ms;
  while (gs_){
    bool tick_due    = timer_running_ && next_tick_ms_ <= target;
    bool pending_due = pending_ && pending_at_ms_ <= target;
    if (!tick_due && !pending_due) break;
    if (pending_due && (!tick_due || pending_at_ms_ <= next_tick_ms_)){
      now_ms_ = pending_at_ms_;
      fire_pending();
    } else {
      now_ms_ = next_tick_ms_;
      tick_timer();
    }
  }
  now_ms_ = target;
}

void TurnManager::sync_from_state(){
  if (!gs_) return;
  phase_index_ = int(gs_->current_phase());
  pending_ = false;
  ++turn_serial_;
  if (gs_->status()==GameStatus::Playing || gs_->status()==GameStatus::Paused) start_timer();
  else stop_timer();
}

void TurnManager::destroy(){
  stop_timer();
  pending_ = false;
  gs_ = nullptr;
  rm_ = nullptr;
}

} // namespace gw
