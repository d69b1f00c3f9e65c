#include "check.hpp"
#include <cstring>

using namespace gw;
using gwtest::World;

static int test_adjacent_scouts(){
  World w;
  EntityId a = gwtest::spawn(w, UnitType::Scout, 1, Pos{10,10});
  EntityId t = gwtest::spawn(w, UnitType::Scout, 2, Pos{11,10});

  Json seen;
  w.gs.on("unitAttacked", [&](const Event& e){ seen = e.data; });

  EXPECT(w.gs.can_unit_attack(a, 11, 10), "adjacent enemy is attackable");
  EXPECT(w.gs.attack_unit(a, 11, 10), "attack");
  EXPECT(w.gs.unit(t)->health == 29, "scout deals 1");
  EXPECT(w.gs.unit(a)->actions_used == 1, "attack spends an action");
  EXPECT(seen["attackerId"] == a && seen["targetId"] == t, "payload ids");
  EXPECT(seen["targetType"] == "unit" && seen["damage"] == 1, "payload type and damage");
  EXPECT(seen["targetHealth"] == 29 && seen["destroyed"] == false, "payload health");
  return 0;
}

static int test_damage_per_type(){
  World w;
  EntityId target = gwtest::spawn(w, UnitType::Heavy, 2, Pos{12,12});
  EntityId wk = gwtest::spawn(w, UnitType::Worker,   1, Pos{11,12});
  EntityId sc = gwtest::spawn(w, UnitType::Scout,    1, Pos{13,12});
  EntityId in = gwtest::spawn(w, UnitType::Infantry, 1, Pos{12,11});
  EntityId hv = gwtest::spawn(w, UnitType::Heavy,    1, Pos{12,13});

  const struct { EntityId id; int dmg; } hits[] = {{wk,1},{sc,1},{in,2},{hv,3}};
  for (auto& h: hits){
    int before = w.gs.unit(target)->health;
    EXPECT(w.gs.attack_unit(h.id, 12, 12), "attack lands");
    EXPECT(w.gs.unit(target)->health == before - h.dmg, "damage fixed by attacker type");
  }
  EXPECT(w.gs.unit(target)->health == 200 - 7, "total damage");
  return 0;
}

static int test_range_and_targets(){
  World w;
  EntityId a  = gwtest::spawn(w, UnitType::Infantry, 1, Pos{10,10});
  gwtest::spawn(w, UnitType::Worker, 2, Pos{11,11});
  gwtest::spawn(w, UnitType::Worker, 2, Pos{12,10});
  gwtest::spawn(w, UnitType::Worker, 1, Pos{9,10});

  EXPECT(w.gs.can_unit_attack(a, 11, 11), "diagonal in range");
  EXPECT(std::strcmp(w.gs.check_attack(a, 12, 10), "Target is out of range") == 0, "two cells away");
  EXPECT(std::strcmp(w.gs.check_attack(a, 9, 10), "Cannot attack your own units or base") == 0, "own unit");
  EXPECT(std::strcmp(w.gs.check_attack(a, 10, 11), "Nothing to attack there") == 0, "empty cell");
  EXPECT(std::strcmp(w.gs.check_attack(999, 10, 11), "Unknown unit") == 0, "unknown attacker");
  EXPECT(!w.gs.attack_unit(a, 12, 10), "out of range rejected");
  EXPECT(w.gs.unit(a)->actions_used == 0, "rejected attack costs nothing");

  auto targets = w.gs.valid_attack_targets(a);
  EXPECT(targets.size() == 1, "one enemy adjacent");
  EXPECT(targets[0].x == 11 && targets[0].y == 11, "the diagonal worker");
  EXPECT(targets[0].target_type == EntityKind::Unit && targets[0].damage == 2, "target details");
  return 0;
}

static int test_out_of_actions(){
  World w;
  EntityId a = gwtest::spawn(w, UnitType::Heavy, 1, Pos{5,5});
  gwtest::spawn(w, UnitType::Infantry, 2, Pos{5,6});
  EXPECT(w.gs.attack_unit(a, 5, 6), "heavy attacks once");
  EXPECT(std::strcmp(w.gs.check_attack(a, 5, 6), "Unit has no actions left") == 0, "one action only");
  EXPECT(!w.gs.attack_unit(a, 5, 6), "second attack rejected");
  EXPECT(w.gs.valid_attack_targets(a).empty(), "no targets without actions");
  return 0;
}

static int test_destroy_unit(){
  World w;
  EntityId a = gwtest::spawn(w, UnitType::Scout, 1, Pos{10,10});
  EntityId t = gwtest::spawn(w, UnitType::Worker, 2, Pos{10,11}, 1);
  int removed = 0;
  w.gs.on("unitRemoved", [&](const Event&){ ++removed; });

  EXPECT(w.gs.attack_unit(a, 10, 11), "killing blow");
  EXPECT(w.gs.unit(t) == nullptr, "dead unit removed");
  EXPECT(w.gs.is_position_empty(10,11), "cell freed");
  EXPECT(w.gs.player(2)->units_owned.empty(), "ownership dropped");
  EXPECT(removed == 1, "unitRemoved emitted");
  EXPECT(!w.gs.ended(), "no elimination during the opening turns");
  EXPECT(w.gs.board_consistent(), "board consistent");
  return 0;
}

static int test_elimination_after_turn_five(){
  World w;
  w.gs.start_game();
  EXPECT(gwtest::edit(w, [](GameSnapshot& s){ s.turn_number = 6; }), "advance to turn 6");
  EntityId a = gwtest::spawn(w, UnitType::Scout, 1, Pos{10,10});
  gwtest::spawn(w, UnitType::Scout, 2, Pos{11,10}, 1);

  EXPECT(w.gs.attack_unit(a, 11, 10), "kill the last enemy unit");
  EXPECT(w.gs.ended(), "game over");
  EXPECT(w.gs.winner() == 1, "attacker wins by elimination");
  return 0;
}

static int test_destroy_base(){
  World w;
  EntityId b2 = gwtest::base_id(w, 2);
  EXPECT(gwtest::edit(w, [&](GameSnapshot& s){
    for (auto& b: s.bases) if (b.id == b2) b.health = 3;
  }), "weaken base");
  EntityId a = gwtest::spawn(w, UnitType::Heavy, 1, Pos{22,1});

  int destroyed = 0;
  w.gs.on("baseDestroyed", [&](const Event& e){
    if (e.data["baseId"] == b2 && e.data["playerId"] == 2) ++destroyed;
  });
  auto targets = w.gs.valid_attack_targets(a);
  EXPECT(targets.size() == 1 && targets[0].target_type == EntityKind::Base, "base is a target");

  EXPECT(w.gs.attack_unit(a, 23, 1), "hit the base");
  EXPECT(destroyed == 1, "baseDestroyed emitted");
  EXPECT(w.gs.base(b2)->is_destroyed && w.gs.base(b2)->health == 0, "base destroyed");
  EXPECT(w.gs.player_base(2) == nullptr, "no live base left");
  EXPECT(w.gs.ended() && w.gs.winner() == 1, "player 1 wins");
  EXPECT(w.gs.board().at(23,1) == b2, "rubble keeps the cell");
  EXPECT(w.gs.board_consistent(), "board consistent");
  EXPECT(!w.gs.attack_unit(a, 23, 1), "nothing more after the end");
  return 0;
}

static int test_destroyed_base_not_attackable(){
  World w;
  EntityId b2 = gwtest::base_id(w, 2);
  EXPECT(gwtest::edit(w, [&](GameSnapshot& s){
    for (auto& b: s.bases) if (b.id == b2) b.health = 0;
  }), "base already rubble");
  EntityId a = gwtest::spawn(w, UnitType::Infantry, 1, Pos{23,2});
  EXPECT(std::strcmp(w.gs.check_attack(a, 23, 1), "Base is already destroyed") == 0, "rubble is inert");
  return 0;
}

int main(){
  gwtest::quiet();
  int failures = 0;
  RUN(test_adjacent_scouts);
  RUN(test_damage_per_type);
  RUN(test_range_and_targets);
  RUN(test_out_of_actions);
  RUN(test_destroy_unit);
  RUN(test_elimination_after_turn_five);
  RUN(test_destroy_base);
  RUN(test_destroyed_base_not_attackable);
  return failures == 0 ? 0 : 1;
}
