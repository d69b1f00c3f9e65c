#include "gw/commands.hpp"
#include "gw/log.hpp"
#include <sstream>

namespace gw {

static std::string cell(Pos p){
  std::ostringstream os;
  os << "(" << p.x << "," << p.y << ")";
  return os.str();
}

// ------- Command -------

const char* Command::check_turn(EntityId unit_id, Phase phase) const {
  if (gs_.status() != GameStatus::Playing) return "The game is not in progress";
  auto* u = gs_.unit(unit_id);
  if (!u) return "Unknown unit";
  if (u->player_id != gs_.current_player_id()) return "It is not this unit's turn";
  if (gs_.current_phase() != phase) return "Wrong phase for this command";
  if (tm_ && spends_player_action() && gs_.current_player()->actions_remaining <= 0)
    return "No player actions left this turn";
  return nullptr;
}

CommandResult Command::execute(){
  CommandResult r;
  if (executed_){
    r.reason = "Command already executed";
    return r;
  }
  if (auto* why = check()){
    r.reason = why;
    return r;
  }
  // describe first: an attack may remove its target
  std::string desc = describe();
  if (!apply()){
    r.reason = "Command failed";
    return r;
  }
  executed_ = true;
  gs_.record_action(kind(), desc);
  if (tm_ && spends_player_action()) tm_->use_player_action();
  r.success = true;
  return r;
}

// ------- Move -------

const char* MoveCommand::check() const {
  if (auto* why = check_turn(unit_id_, Phase::Action)) return why;
  return gs_.check_move(unit_id_, to_.x, to_.y);
}

bool MoveCommand::apply(){
  from_ = gs_.unit(unit_id_)->pos;
  cost_ = gs_.calculate_movement_cost(unit_id_, to_.x, to_.y);
  return gs_.move_unit(unit_id_, to_.x, to_.y);
}

std::string MoveCommand::describe() const {
  auto* u = gs_.unit(unit_id_);
  std::string who = u ? std::string(u->stats().name) + " #" + std::to_string(unit_id_)
                      : "unit #" + std::to_string(unit_id_);
  return "Move " + who + " to " + cell(to_);
}

// ------- Attack -------

const char* AttackCommand::check() const {
  if (auto* why = check_turn(attacker_id_, Phase::Action)) return why;
  return gs_.check_attack(attacker_id_, target_.x, target_.y);
}

bool AttackCommand::apply(){
  damage_ = unit_damage(gs_.unit(attacker_id_)->type);
  return gs_.attack_unit(attacker_id_, target_.x, target_.y);
}

std::string AttackCommand::describe() const {
  auto t = gs_.entity_at(target_.x, target_.y);
  std::string what = t ? std::string(to_string(t.kind)) + " #" + std::to_string(t.id()) : "empty cell";
  return "Unit #" + std::to_string(attacker_id_) + " attacks " + what + " at " + cell(target_);
}

// ------- Build -------

const char* BuildCommand::check() const {
  if (gs_.status() != GameStatus::Playing) return "The game is not in progress";
  if (gs_.current_phase() != Phase::Build) return "Wrong phase for this command";
  if (tm_ && gs_.current_player()->actions_remaining <= 0) return "No player actions left this turn";
  return gs_.check_create_unit(type_, gs_.current_player_id(), at_.x, at_.y);
}

bool BuildCommand::apply(){
  auto* u = gs_.build_unit(type_, at_.x, at_.y);
  if (!u) return false;
  created_ = u->id;
  return true;
}

std::string BuildCommand::describe() const {
  auto* s = unit_stats(type_);
  return std::string("Build ") + (s ? s->name : "unit") + " at " + cell(at_);
}

// ------- Gather -------

const char* GatherCommand::check() const {
  if (auto* why = check_turn(unit_id_, Phase::Resource)) return why;
  auto* u = gs_.unit(unit_id_);
  if (!u->has_ability(ABILITY_GATHER) || !u->can_act()) return "Unit cannot gather";
  if (rm_.on_cooldown(unit_id_)) return "Unit is on gathering cooldown";
  if (!rm_.can_gather_at_position(unit_id_)) return "No resources available at nearby nodes";
  return nullptr;
}

bool GatherCommand::apply(){
  result_ = rm_.gather_resources(unit_id_);
  return result_.success;
}

std::string GatherCommand::describe() const {
  return "Unit #" + std::to_string(unit_id_) + " gathers resources";
}

// ------- CommandManager -------

CommandResult CommandManager::execute(std::unique_ptr<Command> cmd){
  if (!cmd){
    CommandResult r;
    r.reason = "No command";
    gs_.emit("commandFailed", {{"type", nullptr}, {"reason", r.reason}});
    return r;
  }
  std::string desc = cmd->describe();
  int player = gs_.current_player_id();
  CommandResult r = cmd->execute();
  if (!r.success){
    logger()->debug("{} rejected: {}", desc, r.reason);
    gs_.emit("commandFailed", {{"type", cmd->kind()}, {"description", desc}, {"reason", r.reason}});
    return r;
  }
  gs_.emit("commandExecuted", {
    {"type", cmd->kind()},
    {"description", desc},
    {"player", player},
  });
  history_.push_back(std::move(cmd));
  while (history_.size() > MAX_HISTORY) history_.pop_front();
  return r;
}

} // namespace gw
