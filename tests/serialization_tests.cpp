#include "check.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace gw;
using gwtest::World;

static void populate(World& w){
  w.gs.start_game();
  w.gs.create_unit(UnitType::Worker, 1, 2, 22);
  w.gs.create_unit(UnitType::Scout, 1, 3, 23);
  w.gs.create_unit(UnitType::Heavy, 2, 22, 1);
  w.gs.record_action("build", "Build Worker at (2,22)");
}

static int test_round_trip(){
  World a;
  populate(a);
  EntityId worker = a.gs.unit_at(2,22)->id;
  a.rm.gather_resources(gwtest::spawn(a, UnitType::Worker, 1, Pos{4,21}));

  GameSnapshot snap = serialize(a.gs, a.rm);
  EXPECT(snap.units.size() == 4 && snap.bases.size() == 2 && snap.players.size() == 2, "entities captured");
  EXPECT(snap.gathering_cooldowns.size() == 1, "cooldown captured");

  World b;
  std::string err;
  EXPECT(deserialize(snap, b.gs, b.rm, &err), "restore into a fresh game");
  EXPECT(b.gs.game_id() == "test-game" && b.gs.status() == GameStatus::Playing, "header");
  for (auto& kv: a.gs.units()){
    const Unit* u = b.gs.unit(kv.first);
    EXPECT(u && u->pos == kv.second.pos && u->type == kv.second.type, "same unit, same cell");
    EXPECT(u->actions_used == kv.second.actions_used && u->health == kv.second.health, "same state");
  }
  EXPECT(b.gs.board_consistent(), "board rebuilt from positions");
  EXPECT(b.gs.board().at(2,22) == worker, "board cell holds the restored id");
  EXPECT(b.gs.player(1)->units_owned.size() == 3 && b.gs.player(2)->units_owned.size() == 1, "ownership rebuilt");
  EXPECT(b.gs.player(1)->energy == a.gs.player(1)->energy, "energy");
  EXPECT(b.rm.node("node_7")->value == 95 && b.rm.cooldowns().size() == 1, "resources restored");
  EXPECT(b.gs.action_history().size() == 1 && b.gs.action_history()[0].kind == "build", "history");

  EntityId max_id = 0;
  for (auto& kv: b.gs.units()) max_id = std::max(max_id, kv.first);
  const Unit* fresh = b.gs.create_unit(UnitType::Worker, 1, 0, 23);
  EXPECT(fresh && fresh->id > max_id, "ids continue past the restored ones");
  return 0;
}

static int test_json_shape(){
  World w;
  populate(w);
  Json j = serialize(w.gs, w.rm);
  EXPECT(j.contains("gameState") && j.contains("resourceManager"), "two sections");
  EXPECT(j["gameState"]["status"] == "playing" && j["gameState"]["currentPhase"] == "resource", "enums as names");
  EXPECT(j["gameState"]["winner"].is_null(), "no winner yet");
  EXPECT(j["gameState"]["units"][0]["type"] == "worker", "unit type name");
  EXPECT(j["gameState"]["units"][0]["abilities"].size() == 2, "worker abilities listed");
  EXPECT(j["resourceManager"]["resourceNodes"].size() == 9, "nodes");

  GameSnapshot back = snapshot_from_json(j);
  EXPECT(back.units.size() == 3 && back.units[2].type == UnitType::Heavy, "decoded units");
  EXPECT(back.current_phase == Phase::Resource && back.status == GameStatus::Playing, "decoded enums");
  EXPECT(!back.winner, "decoded null winner");

  w.gs.end_game(2);
  Json ended = serialize(w.gs, w.rm);
  EXPECT(ended["gameState"]["winner"] == 2, "winner encoded");
  EXPECT(snapshot_from_json(ended).winner == 2, "winner decoded");
  return 0;
}

static int test_malformed_json_throws(){
  World w;
  Json j = serialize(w.gs, w.rm);
  Json bad_enum = j;
  bad_enum["gameState"]["currentPhase"] = "lunch";
  bool threw = false;
  try { snapshot_from_json(bad_enum); } catch (const std::invalid_argument&){ threw = true; }
  EXPECT(threw, "unknown phase rejected");

  Json missing = j;
  missing["gameState"].erase("players");
  threw = false;
  try { snapshot_from_json(missing); } catch (const Json::exception&){ threw = true; }
  EXPECT(threw, "missing players rejected");
  return 0;
}

static int test_rejected_restores(){
  World w;
  populate(w);
  GameSnapshot good = serialize(w.gs, w.rm);
  size_t units = w.gs.units().size();

  auto rejected = [&](GameSnapshot s){
    std::string err;
    bool ok = deserialize(s, w.gs, w.rm, &err);
    return !ok && !err.empty();
  };

  GameSnapshot off = good;
  off.units[0].pos = Pos{25,3};
  EXPECT(rejected(off), "unit off the board");

  GameSnapshot clash = good;
  clash.units[0].pos = clash.bases[0].pos;
  EXPECT(rejected(clash), "unit on a base");

  GameSnapshot dup = good;
  dup.units[1].id = dup.units[0].id;
  dup.units[1].pos = Pos{10,10};
  EXPECT(rejected(dup), "repeated id");

  GameSnapshot owner = good;
  owner.units[0].player_id = 3;
  EXPECT(rejected(owner), "unknown owner");

  GameSnapshot cur = good;
  cur.current_player = 0;
  EXPECT(rejected(cur), "invalid current player");

  GameSnapshot nodes = good;
  nodes.resource_nodes[0].value = -1;
  EXPECT(rejected(nodes), "bad node value");

  GameSnapshot hp = good;
  hp.units[2].health = hp.units[2].max_health = 5000;
  EXPECT(rejected(hp), "health above the type's maximum");

  GameSnapshot used = good;
  used.units[2].max_actions = 20;
  used.units[2].actions_used = 5;
  EXPECT(rejected(used), "actions above the type's budget");

  EXPECT(w.gs.units().size() == units && w.gs.board_consistent(), "state untouched");
  EXPECT(w.rm.node("node_1")->value == 100, "nodes untouched");
  return 0;
}

static int test_restore_uses_stat_table(){
  World w;
  populate(w);
  EntityId heavy = w.gs.unit_at(22,1)->id;
  EXPECT(gwtest::edit(w, [&](GameSnapshot& s){
    for (auto& u: s.units) if (u.id == heavy){ u.max_actions = 20; u.max_health = 5000; }
  }), "inflated maxima accepted");
  const Unit* u = w.gs.unit(heavy);
  EXPECT(u->max_actions == 1 && u->max_health == 200, "maxima reset from the heavy's stats");
  EXPECT(gwtest::edit(w, [](GameSnapshot& s){ s.current_player = 2; s.current_phase = Phase::Action; }), "player 2 to act");
  EXPECT(!w.gs.move_unit(heavy, 22, 11), "no ten-cell move for a heavy");
  EXPECT(w.gs.unit(heavy)->pos == (Pos{22,1}), "heavy stays");
  return 0;
}

static int test_save_envelope(){
  World w;
  populate(w);
  std::string text = export_save(w.gs, w.rm, "2024-01-01T00:00:00Z");
  Json env = Json::parse(text);
  EXPECT(env["version"] == "1.0.0" && env["timestamp"] == "2024-01-01T00:00:00Z", "envelope header");
  EXPECT(env["metadata"]["turnNumber"] == 1 && env["metadata"]["currentPlayer"] == 1, "metadata");
  EXPECT(env["metadata"]["gameStatus"] == "playing" && env["metadata"]["playTime"] == 2, "status and play time");
  EXPECT(env.contains("gameState") && env.contains("resourceManager"), "payload sections");

  ImportResult r = import_save(text);
  EXPECT(r.success && r.error.empty(), "import");
  EXPECT(r.version == "1.0.0" && r.timestamp == "2024-01-01T00:00:00Z", "header read back");
  EXPECT(r.metadata.status == GameStatus::Playing && r.metadata.turn_number == 1, "metadata read back");
  EXPECT(r.snapshot.units.size() == 3, "snapshot read back");

  World other;
  EXPECT(deserialize(r.snapshot, other.gs, other.rm), "snapshot restores");
  EXPECT(other.gs.unit_at(22,1) && other.gs.unit_at(22,1)->type == UnitType::Heavy, "heavy restored");
  return 0;
}

static int test_import_rejections(){
  EXPECT(is_compatible_version("1.0.0") && is_compatible_version("1.7.3"), "same major");
  EXPECT(!is_compatible_version("2.0.0") && !is_compatible_version("0.9.0"), "other major");
  EXPECT(!is_compatible_version("") && !is_compatible_version("x.1"), "garbage");

  std::string now = now_iso8601();
  EXPECT(now.size() == 20 && now[4] == '-' && now[10] == 'T' && now.back() == 'Z', "UTC timestamp shape");

  ImportResult garbage = import_save("{not json");
  EXPECT(!garbage.success && garbage.error == "Invalid save data format", "parse error");

  World w;
  Json env = Json::parse(export_save(w.gs, w.rm, "t"));
  Json newer = env;
  newer["version"] = "2.0.0";
  ImportResult r = import_save(newer.dump());
  EXPECT(!r.success && r.error == "Incompatible save version: 2.0.0", "major mismatch");

  Json huge = env;
  huge["version"] = "99999999999999999999.0";
  ImportResult h = import_save(huge.dump());
  EXPECT(!h.success && h.error == "Incompatible save version: 99999999999999999999.0", "oversized major rejected");
  EXPECT(!is_compatible_version("99999999999999999999.0"), "oversized major incompatible");

  Json partial = env;
  partial.erase("metadata");
  EXPECT(import_save(partial.dump()).error == "Invalid save data structure", "missing metadata");

  Json broken = env;
  broken["gameState"]["status"] = "sleeping";
  ImportResult b = import_save(broken.dump());
  EXPECT(!b.success && !b.error.empty(), "bad enum reported, not thrown");
  return 0;
}

static int test_files(){
  World w;
  populate(w);
  std::string path = (std::filesystem::temp_directory_path() / "gridwar_serialization_test.json").string();
  EXPECT(save_to_file(path, w.gs, w.rm), "saved");
  ImportResult r = load_from_file(path);
  std::remove(path.c_str());
  EXPECT(r.success && r.snapshot.units.size() == 3, "loaded");

  ImportResult missing = load_from_file(path + ".missing");
  EXPECT(!missing.success && !missing.error.empty(), "missing file");
  return 0;
}

int main(){
  gwtest::quiet();
  int failures = 0;
  RUN(test_round_trip);
  RUN(test_json_shape);
  RUN(test_malformed_json_throws);
  RUN(test_rejected_restores);
  RUN(test_restore_uses_stat_table);
  RUN(test_save_envelope);
  RUN(test_import_rejections);
  RUN(test_files);
  return failures == 0 ? 0 : 1;
}
