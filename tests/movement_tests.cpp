#include "check.hpp"
#include <cstring>

using namespace gw;
using gwtest::World;

static int test_move_cost_is_manhattan(){
  World w;
  const Unit* u = w.gs.create_unit(UnitType::Worker, 1, 2, 22);
  EntityId id = u->id;

  Json seen;
  w.gs.on("unitMoved", [&](const Event& e){ seen = e.data; });

  EXPECT(w.gs.calculate_movement_cost(id, 3, 21) == 2, "cost is Manhattan distance");
  EXPECT(w.gs.move_unit(id, 3, 22), "one step");
  EXPECT(u->pos == (Pos{3,22}) && u->actions_used == 1, "one action per step");
  EXPECT(w.gs.board().at(3,22) == id && w.gs.is_position_empty(2,22), "board follows the unit");
  EXPECT(seen["unitId"] == id && seen["cost"] == 1, "unitMoved payload");
  EXPECT(seen["from"]["x"] == 2 && seen["to"]["x"] == 3, "from and to");
  EXPECT(w.gs.board_consistent(), "board consistent");
  return 0;
}

static int test_rejected_move_changes_nothing(){
  World w;
  const Unit* u = w.gs.create_unit(UnitType::Worker, 1, 2, 22);
  EntityId id = u->id;
  EXPECT(w.gs.move_unit(id, 2, 21), "spend one of two actions");

  EXPECT(std::strcmp(w.gs.check_move(id, 4, 21), "Not enough movement left") == 0, "distance 2 with 1 left");
  EXPECT(!w.gs.move_unit(id, 4, 21), "too far");
  EXPECT(u->pos == (Pos{2,21}) && u->actions_used == 1, "position and budget unchanged");
  EXPECT(w.gs.move_unit(id, 3, 21), "last step");
  EXPECT(!w.gs.move_unit(id, 3, 20), "budget exhausted");
  EXPECT(u->actions_used == u->max_actions, "never over budget");
  return 0;
}

static int test_blocked_targets(){
  World w;
  const Unit* u = w.gs.create_unit(UnitType::Scout, 1, 1, 22);
  EntityId id = u->id;
  const Unit* v = w.gs.create_unit(UnitType::Worker, 1, 2, 22);

  EXPECT(std::strcmp(w.gs.check_move(id, 1, 23), "Target is occupied") == 0, "base blocks");
  EXPECT(!w.gs.move_unit(id, 2, 22), "unit blocks");
  EXPECT(!w.gs.move_unit(id, -1, 22), "off board");
  EXPECT(!w.gs.can_unit_move_to(id, 1, 25), "off board query");
  EXPECT(!w.gs.move_unit(999, 1, 21), "unknown unit");
  EXPECT(u->pos == (Pos{1,22}) && u->actions_used == 0, "rejections leave the scout alone");
  EXPECT(v->pos == (Pos{2,22}), "blocker unmoved");
  EXPECT(w.gs.move_unit(id, 1, 18), "scout moves four");
  EXPECT(u->actions_used == 4 && !u->can_act(), "budget spent");
  EXPECT(!w.gs.move_unit(id, 1, 17), "nothing left");
  EXPECT(w.gs.valid_move_positions(id).empty(), "no moves without actions");
  return 0;
}

static int test_actions_never_exceed_max(){
  World w;
  EntityId id = gwtest::spawn(w, UnitType::Infantry, 1, Pos{12,12});
  const Unit* u = w.gs.unit(id);
  const Pos targets[] = {{12,13},{14,13},{13,13},{13,12},{12,12},{0,0},{12,11}};
  for (auto& t: targets){
    int before = u->actions_used;
    Pos from = u->pos;
    bool ok = w.gs.move_unit(id, t.x, t.y);
    EXPECT(u->actions_used <= u->max_actions, "budget respected");
    if (!ok) EXPECT(u->actions_used == before && u->pos == from, "rejected move is a no-op");
    else     EXPECT(u->actions_used == before + manhattan(from, t), "spent the distance");
  }
  EXPECT(u->actions_used == 2, "infantry spent exactly two");
  return 0;
}

static int test_valid_move_positions(){
  World w;
  EntityId id = gwtest::spawn(w, UnitType::Scout, 1, Pos{0,0});
  gwtest::spawn(w, UnitType::Worker, 2, Pos{1,0});
  auto opts = w.gs.valid_move_positions(id);
  EXPECT(!opts.empty(), "scout has moves");
  bool found_blocker = false;
  for (auto& o: opts){
    EXPECT(in_bounds(o.x, o.y), "on board");
    EXPECT(o.cost == manhattan(0,0,o.x,o.y) && o.cost >= 1 && o.cost <= 4, "cost within budget");
    EXPECT(w.gs.is_position_empty(o.x, o.y), "empty target");
    if (o.x == 1 && o.y == 0) found_blocker = true;
  }
  EXPECT(!found_blocker, "occupied cell excluded");
  // 14 cells within distance 4 of the corner, minus the blocker
  EXPECT(opts.size() == 13, "all reachable cells listed");
  return 0;
}

static int test_remove_unit(){
  World w;
  const Unit* u = w.gs.create_unit(UnitType::Worker, 1, 2, 22);
  EntityId id = u->id;
  int removed = 0;
  w.gs.on("unitRemoved", [&](const Event& e){
    if (e.data["unitId"] == id && e.data["playerId"] == 1) ++removed;
  });
  EXPECT(w.gs.remove_unit(id), "removed");
  EXPECT(removed == 1, "unitRemoved emitted");
  EXPECT(w.gs.unit(id) == nullptr && w.gs.is_position_empty(2,22), "gone from arena and board");
  EXPECT(w.gs.player(1)->units_owned.empty(), "ownership dropped");
  EXPECT(!w.gs.remove_unit(id), "second removal fails");
  EXPECT(w.gs.board_consistent(), "board consistent");
  return 0;
}

static int test_no_moves_after_end(){
  World w;
  const Unit* u = w.gs.create_unit(UnitType::Worker, 1, 2, 22);
  EntityId id = u->id;
  w.gs.end_game(1);
  EXPECT(std::strcmp(w.gs.check_move(id, 2, 21), "The game is over") == 0, "ended");
  EXPECT(!w.gs.move_unit(id, 2, 21) && u->pos == (Pos{2,22}), "no move after the end");
  EXPECT(!w.gs.remove_unit(id), "no removal after the end");
  return 0;
}

int main(){
  gwtest::quiet();
  int failures = 0;
  RUN(test_move_cost_is_manhattan);
  RUN(test_rejected_move_changes_nothing);
  RUN(test_blocked_targets);
  RUN(test_actions_never_exceed_max);
  RUN(test_valid_move_positions);
  RUN(test_remove_unit);
  RUN(test_no_moves_after_end);
  return failures == 0 ? 0 : 1;
}
