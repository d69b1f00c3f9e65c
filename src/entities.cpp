#include "gw/entities.hpp"
#include <algorithm>
#include <stdexcept>

namespace gw {

// ------- Player -------

Player::Player(int pid): Player(pid, "Player " + std::to_string(pid)) {}

Player::Player(int pid, std::string nm): id(pid), name(std::move(nm)) {}

bool Player::spend_energy(int amount){
  if (energy < amount) return false;
  energy -= amount;
  return true;
}

bool Player::use_action(){
  if (actions_remaining <= 0) return false;
  --actions_remaining;
  return true;
}

// ------- Unit -------

Unit::Unit(EntityId uid, UnitType t, int owner, Pos p)
  : id(uid), type(t), player_id(owner), pos(p) {
  auto* s = unit_stats(t);
  if (!s) throw std::invalid_argument("Unit: unknown unit type");
  health      = s->health;
  max_health  = s->health;
  max_actions = s->movement;
  abilities   = s->abilities;
}

const UnitStats& Unit::stats() const {
  auto* s = unit_stats(type);
  if (!s) throw std::logic_error("Unit: corrupt unit type");
  return *s;
}

bool Unit::take_damage(int amount){
  health = std::max(0, health - amount);
  return health <= 0;
}

void Unit::heal(int amount){
  health = std::min(max_health, health + amount);
}

bool Unit::use_action(){
  if (!can_act()) return false;
  ++actions_used;
  return true;
}

// ------- Base -------

Base::Base(EntityId bid, int owner, Pos p): id(bid), player_id(owner), pos(p) {}

bool Base::take_damage(int amount){
  health = std::max(0, health - amount);
  if (health <= 0) is_destroyed = true;
  return is_destroyed;
}

// ------- Resource nodes -------

std::vector<ResourceNode> default_resource_nodes(){
  std::vector<ResourceNode> nodes;
  nodes.reserve(NODE_COUNT);
  int i = 0;
  for (auto& p: node_positions()){
    ResourceNode n;
    n.id  = "node_" + std::to_string(++i);
    n.pos = p;
    nodes.push_back(n);
  }
  return nodes;
}

} // namespace gw
