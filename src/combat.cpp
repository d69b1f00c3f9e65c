#include "gw/game_state.hpp"
#include "gw/log.hpp"

namespace gw {

// ------- Combat -------

const char* GameState::check_attack(EntityId attacker_id, int x, int y) const {
  if (ended()) return "The game is over";
  auto* a = unit(attacker_id);
  if (!a) return "Unknown unit";
  if (!a->can_act()) return "Unit has no actions left";
  if (!in_bounds(x,y)) return "Target is off the board";
  if (chebyshev(a->pos.x, a->pos.y, x, y) > ATTACK_RANGE) return "Target is out of range";
  auto t = entity_at(x,y);
  if (!t) return "Nothing to attack there";
  if (t.player_id() == a->player_id) return "Cannot attack your own units or base";
  if (t.kind==EntityKind::Base && t.base->is_destroyed) return "Base is already destroyed";
  return nullptr;
}

bool GameState::attack_unit(EntityId attacker_id, int x, int y){
  if (auto* why = check_attack(attacker_id, x, y)){
    logger()->debug("attack_unit(#{}, {},{}) rejected: {}", attacker_id, x, y, why);
    return false;
  }
  Unit& a = units_.at(attacker_id);
  EntityId target_id = board_.at(x,y);
  int dmg = unit_damage(a.type);

  Unit* tu = unit_mut(target_id);
  Base* tb = tu ? nullptr : base_mut(target_id);
  bool destroyed = tu ? tu->take_damage(dmg) : tb->take_damage(dmg);
  int target_health = tu ? tu->health : tb->health;
  a.use_action();

  emit("unitAttacked", {
    {"attackerId", attacker_id},
    {"targetId", target_id},
    {"targetType", tu ? "unit" : "base"},
    {"damage", dmg},
    {"targetHealth", target_health},
    {"destroyed", destroyed},
  });

  if (!destroyed) return true;
  if (tu){
    logger()->info("unit #{} destroyed by #{}", target_id, attacker_id);
    remove_unit(target_id);   // runs its own victory check
  } else {
    logger()->info("player {} base destroyed", tb->player_id);
    emit("baseDestroyed", {{"baseId", target_id}, {"playerId", tb->player_id}});
    check_victory_condition();
  }
  return true;
}

std::vector<AttackTarget> GameState::valid_attack_targets(EntityId attacker_id) const {
  std::vector<AttackTarget> out;
  auto* a = unit(attacker_id);
  if (!a || !a->can_act()) return out;
  for (int dx=-ATTACK_RANGE; dx<=ATTACK_RANGE; ++dx){
    for (int dy=-ATTACK_RANGE; dy<=ATTACK_RANGE; ++dy){
      if (dx==0 && dy==0) continue;
      int x = a->pos.x + dx, y = a->pos.y + dy;
      if (!can_unit_attack(attacker_id, x, y)) continue;
      auto t = entity_at(x,y);
      out.push_back({x, y, t.kind, t.id(), unit_damage(a->type)});
    }
  }
  return out;
}

} // namespace gw
