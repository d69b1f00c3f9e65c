#pragma once
#include "gw/types.hpp"
#include <set>
#include <string>
#include <vector>

namespace gw {

struct Player {
  int         id{0};
  std::string name;
  int         energy{STARTING_ENERGY};
  int         resources_gathered{0};   // never decreases
  int         actions_remaining{MAX_PLAYER_ACTIONS};
  std::set<EntityId> units_owned;      // keys into GameState's unit arena
  bool        is_active{false};

  Player() = default;
  explicit Player(int pid);
  Player(int pid, std::string nm);

  void add_energy(int amount){ energy += amount; }
  bool spend_energy(int amount);
  void add_unit(EntityId id){ units_owned.insert(id); }
  void remove_unit(EntityId id){ units_owned.erase(id); }
  void reset_actions(){ actions_remaining = MAX_PLAYER_ACTIONS; }
  bool use_action();
};

struct Unit {
  EntityId id{NO_ENTITY};
  UnitType type{UnitType::Worker};
  int      player_id{0};
  Pos      pos;
  int      health{0};
  int      max_health{0};
  int      actions_used{0};
  int      max_actions{0};
  uint8_t  abilities{0};

  Unit() = default;
  Unit(EntityId uid, UnitType t, int owner, Pos p);

  bool alive() const { return health > 0; }
  bool can_act() const { return actions_used < max_actions; }
  int  remaining_actions() const { return max_actions - actions_used; }
  bool has_ability(Ability a) const { return (abilities & a) != 0; }
  const UnitStats& stats() const;

  // Returns true when the hit destroys the unit.
  bool take_damage(int amount);
  void heal(int amount);
  bool use_action();
  void reset_actions(){ actions_used = 0; }
};

struct Base {
  EntityId id{NO_ENTITY};
  int      player_id{0};
  Pos      pos;
  int      health{BASE_HEALTH};
  int      max_health{BASE_HEALTH};
  bool     is_destroyed{false};

  Base() = default;
  Base(EntityId bid, int owner, Pos p);

  bool take_damage(int amount);
};

struct ResourceNode {
  std::string id;
  Pos pos;
  int value{NODE_MAX_VALUE};
  int max_value{NODE_MAX_VALUE};
  int regeneration_rate{NODE_REGEN_RATE};

  double efficiency() const { return max_value>0 ? double(value)/double(max_value) : 0.0; }
};

// The nine fixed nodes, "node_1".."node_9", full.
std::vector<ResourceNode> default_resource_nodes();

} // namespace gw
