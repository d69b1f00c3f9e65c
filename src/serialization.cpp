#include "gw/serialization.hpp"
#include "gw/log.hpp"
#include "gw/resource_manager.hpp"
#include <charconv>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace gw {

// ------- Snapshot -------

GameSnapshot serialize(const GameState& gs, const ResourceManager& rm){
  GameSnapshot s;
  s.game_id        = gs.game_id();
  s.status         = gs.status();
  s.current_player = gs.current_player_id();
  s.current_phase  = gs.current_phase();
  s.turn_number    = gs.turn_number();
  s.winner         = gs.winner();
  for (int pid=1; pid<=NUM_PLAYERS; ++pid) s.players.push_back(*gs.player(pid));
  for (auto& kv: gs.units()) s.units.push_back(kv.second);
  for (auto& kv: gs.bases()) s.bases.push_back(kv.second);
  s.action_history.assign(gs.action_history().begin(), gs.action_history().end());
  s.resource_nodes = rm.nodes();
  s.gathering_cooldowns.assign(rm.cooldowns().begin(), rm.cooldowns().end());
  return s;
}

bool deserialize(const GameSnapshot& snap, GameState& gs, ResourceManager& rm, std::string* error){
  // nodes are checked up front so a bad node list cannot leave gs restored alone
  if (auto* why = rm.check_restore(snap.resource_nodes)){
    logger()->warn("restore rejected: {}", why);
    if (error) *error = why;
    return false;
  }
  if (!gs.restore(snap, error)) return false;
  return rm.restore(snap.resource_nodes, snap.gathering_cooldowns, error);
}

// ------- Enums as lower-case names -------

template <class E>
static E parse_or_throw(std::optional<E> v, const Json& j, const char* what){
  if (!v) throw std::invalid_argument(std::string("unknown ") + what + ": " + j.dump());
  return *v;
}

static UnitType unit_type_from(const Json& j){
  return parse_or_throw(parse_unit_type(j.get<std::string>()), j, "unit type");
}
static Phase phase_from(const Json& j){
  return parse_or_throw(parse_phase(j.get<std::string>()), j, "phase");
}
static GameStatus status_from(const Json& j){
  return parse_or_throw(parse_status(j.get<std::string>()), j, "game status");
}

static Json ability_names(uint8_t a){
  static const std::pair<Ability, const char*> kNames[] = {
    {ABILITY_BUILD, "build"}, {ABILITY_GATHER, "gather"},
    {ABILITY_SCOUT, "scout"}, {ABILITY_FAST_MOVE, "fast_move"},
    {ABILITY_ATTACK, "attack"}, {ABILITY_DEFEND, "defend"},
    {ABILITY_HEAVY_ATTACK, "heavy_attack"}, {ABILITY_SIEGE, "siege"},
  };
  Json out = Json::array();
  for (auto& kv: kNames) if (a & kv.first) out.push_back(kv.second);
  return out;
}

// ------- Entities -------

void to_json(Json& j, const Pos& p){ j = {{"x", p.x}, {"y", p.y}}; }

void from_json(const Json& j, Pos& p){
  p.x = j.at("x").get<int>();
  p.y = j.at("y").get<int>();
}

void to_json(Json& j, const Player& p){
  j = {
    {"id", p.id},
    {"name", p.name},
    {"energy", p.energy},
    {"resourcesGathered", p.resources_gathered},
    {"actionsRemaining", p.actions_remaining},
    {"unitsOwned", p.units_owned},
    {"isActive", p.is_active},
  };
}

void from_json(const Json& j, Player& p){
  p.id                 = j.at("id").get<int>();
  p.name               = j.value("name", "Player " + std::to_string(p.id));
  p.energy             = j.at("energy").get<int>();
  p.resources_gathered = j.value("resourcesGathered", 0);
  p.actions_remaining  = j.value("actionsRemaining", MAX_PLAYER_ACTIONS);
  p.is_active          = j.value("isActive", false);
  p.units_owned.clear();
  if (j.contains("unitsOwned")) p.units_owned = j.at("unitsOwned").get<std::set<EntityId>>();
}

void to_json(Json& j, const Unit& u){
  j = {
    {"id", u.id},
    {"type", to_string(u.type)},
    {"playerId", u.player_id},
    {"position", u.pos},
    {"health", u.health},
    {"maxHealth", u.max_health},
    {"actionsUsed", u.actions_used},
    {"maxActions", u.max_actions},
    {"abilities", ability_names(u.abilities)},
  };
}

void from_json(const Json& j, Unit& u){
  UnitType t = unit_type_from(j.at("type"));
  u = Unit(j.at("id").get<EntityId>(), t, j.at("playerId").get<int>(), j.at("position").get<Pos>());
  u.health       = j.value("health", u.health);
  u.max_health   = j.value("maxHealth", u.max_health);
  u.actions_used = j.value("actionsUsed", 0);
  u.max_actions  = j.value("maxActions", u.max_actions);
}

void to_json(Json& j, const Base& b){
  j = {
    {"id", b.id},
    {"playerId", b.player_id},
    {"position", b.pos},
    {"health", b.health},
    {"maxHealth", b.max_health},
    {"isDestroyed", b.is_destroyed},
  };
}

void from_json(const Json& j, Base& b){
  b = Base(j.at("id").get<EntityId>(), j.at("playerId").get<int>(), j.at("position").get<Pos>());
  b.health       = j.value("health", BASE_HEALTH);
  b.max_health   = j.value("maxHealth", BASE_HEALTH);
  b.is_destroyed = j.value("isDestroyed", false);
}

void to_json(Json& j, const ResourceNode& n){
  j = {
    {"id", n.id},
    {"position", n.pos},
    {"value", n.value},
    {"maxValue", n.max_value},
    {"regenerationRate", n.regeneration_rate},
  };
}

void from_json(const Json& j, ResourceNode& n){
  n.id                = j.at("id").get<std::string>();
  n.pos               = j.at("position").get<Pos>();
  n.value             = j.at("value").get<int>();
  n.max_value         = j.value("maxValue", NODE_MAX_VALUE);
  n.regeneration_rate = j.value("regenerationRate", NODE_REGEN_RATE);
}

void to_json(Json& j, const ActionRecord& r){
  j = {{"turn", r.turn}, {"player", r.player}, {"type", r.kind}, {"description", r.description}};
}

void from_json(const Json& j, ActionRecord& r){
  r.turn        = j.value("turn", 0);
  r.player      = j.value("player", 0);
  r.kind        = j.value("type", std::string());
  r.description = j.value("description", std::string());
}

void to_json(Json& j, const GameSnapshot& s){
  Json state = {
    {"gameId", s.game_id},
    {"status", to_string(s.status)},
    {"currentPlayer", s.current_player},
    {"currentPhase", to_string(s.current_phase)},
    {"turnNumber", s.turn_number},
    {"winner", nullptr},
    {"players", s.players},
    {"units", s.units},
    {"bases", s.bases},
    {"actionHistory", s.action_history},
  };
  if (s.winner) state["winner"] = *s.winner;
  j = {
    {"gameState", std::move(state)},
    {"resourceManager", {
      {"resourceNodes", s.resource_nodes},
      {"gatheringCooldowns", s.gathering_cooldowns},
    }},
  };
}

void from_json(const Json& j, GameSnapshot& s){
  const Json& st = j.at("gameState");
  const Json& rm = j.at("resourceManager");

  s.game_id        = st.value("gameId", std::string());
  s.status         = status_from(st.at("status"));
  s.current_player = st.at("currentPlayer").get<int>();
  s.current_phase  = phase_from(st.at("currentPhase"));
  s.turn_number    = st.at("turnNumber").get<int>();
  s.winner.reset();
  if (st.contains("winner") && !st.at("winner").is_null()) s.winner = st.at("winner").get<int>();

  s.players = st.at("players").get<std::vector<Player>>();
  s.units   = st.at("units").get<std::vector<Unit>>();
  s.bases   = st.at("bases").get<std::vector<Base>>();
  s.action_history.clear();
  if (st.contains("actionHistory")) s.action_history = st.at("actionHistory").get<std::vector<ActionRecord>>();

  s.resource_nodes = rm.at("resourceNodes").get<std::vector<ResourceNode>>();
  s.gathering_cooldowns.clear();
  if (rm.contains("gatheringCooldowns"))
    s.gathering_cooldowns = rm.at("gatheringCooldowns").get<std::vector<EntityId>>();
}

GameSnapshot snapshot_from_json(const Json& j){
  return j.get<GameSnapshot>();
}

// ------- Save files -------

static int major_of(const std::string& version){
  std::size_t dot = version.find('.');
  std::string head = version.substr(0, dot);
  if (head.empty() || head.find_first_not_of("0123456789") != std::string::npos) return -1;
  int major = 0;
  auto res = std::from_chars(head.data(), head.data() + head.size(), major);
  if (res.ec != std::errc()) return -1;   // too many digits
  return major;
}

bool is_compatible_version(const std::string& version){
  int m = major_of(version);
  return m >= 0 && m == major_of(SAVE_VERSION);
}

std::string now_iso8601(){
  std::time_t t = std::time(nullptr);
  // single-threaded, so the shared buffer of std::gmtime is fine
  std::tm* tm = std::gmtime(&t);
  if (!tm) return "1970-01-01T00:00:00Z";
  char buf[32];
  std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%SZ", tm);
  return buf;
}

std::string export_save(const GameState& gs, const ResourceManager& rm, const std::string& timestamp){
  Json snap = serialize(gs, rm);
  Json env = {
    {"version", SAVE_VERSION},
    {"timestamp", timestamp},
    {"gameState", std::move(snap["gameState"])},
    {"resourceManager", std::move(snap["resourceManager"])},
    {"metadata", {
      {"turnNumber", gs.turn_number()},
      {"currentPlayer", gs.current_player_id()},
      {"gameStatus", to_string(gs.status())},
      {"playTime", gs.turn_number() * 2},
    }},
  };
  return env.dump(2);
}

static ImportResult import_failed(std::string why){
  logger()->warn("save import failed: {}", why);
  ImportResult r;
  r.error = std::move(why);
  return r;
}

ImportResult import_save(const std::string& text){
  Json j = Json::parse(text, nullptr, false);
  if (j.is_discarded()) return import_failed("Invalid save data format");
  if (!j.is_object()) return import_failed("Invalid save data structure");
  for (const char* key: {"version", "timestamp", "gameState", "resourceManager", "metadata"})
    if (!j.contains(key)) return import_failed("Invalid save data structure");
  if (!j["version"].is_string()) return import_failed("Invalid save data structure");

  ImportResult r;
  r.version = j["version"].get<std::string>();
  if (!is_compatible_version(r.version)) return import_failed("Incompatible save version: " + r.version);

  try {
    r.snapshot  = j.get<GameSnapshot>();
    r.timestamp = j["timestamp"].is_string() ? j["timestamp"].get<std::string>() : j["timestamp"].dump();
    const Json& m = j["metadata"];
    r.metadata.turn_number    = m.value("turnNumber", r.snapshot.turn_number);
    r.metadata.current_player = m.value("currentPlayer", r.snapshot.current_player);
    r.metadata.status = m.contains("gameStatus") ? status_from(m["gameStatus"]) : r.snapshot.status;
    r.metadata.play_time      = m.value("playTime", 0);
  } catch (const Json::exception& e){
    return import_failed(e.what());
  } catch (const std::invalid_argument& e){
    return import_failed(e.what());
  }
  r.success = true;
  return r;
}

bool save_to_file(const std::string& path, const GameState& gs, const ResourceManager& rm){
  std::ofstream f(path);
  if (!f){
    logger()->error("cannot write save file {}", path);
    return false;
  }
  f << export_save(gs, rm) << "\n";
  if (!f) return false;
  logger()->info("game {} saved to {}", gs.game_id(), path);
  return true;
}

ImportResult load_from_file(const std::string& path){
  std::ifstream f(path);
  if (!f) return import_failed("cannot open " + path);
  std::stringstream ss;
  ss << f.rdbuf();
  ImportResult r = import_save(ss.str());
  if (r.success) logger()->info("save file {} loaded (turn {})", path, r.metadata.turn_number);
  return r;
}

} // namespace gw
