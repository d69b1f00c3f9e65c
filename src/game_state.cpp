#include "gw/game_state.hpp"
#include "gw/log.hpp"
#include "gw/serialization.hpp"
#include <algorithm>
#include <random>
#include <set>

namespace gw {

// ------- EntityRef -------

EntityId EntityRef::id() const {
  if (unit) return unit->id;
  if (base) return base->id;
  return NO_ENTITY;
}

int EntityRef::player_id() const {
  if (unit) return unit->player_id;
  if (base) return base->player_id;
  return 0;
}

int EntityRef::health() const {
  if (unit) return unit->health;
  if (base) return base->health;
  return 0;
}

// ------- Setup -------

static std::string make_game_id(){
  static const char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::random_device rd;
  std::mt19937_64 rng((uint64_t(rd()) << 32) ^ rd());
  std::uniform_int_distribution<int> pick(0, 35);
  std::string id;
  for (int i=0;i<9;i++) id += kDigits[pick(rng)];
  return id;
}

GameState::GameState(std::string game_id)
  : game_id_(game_id.empty() ? make_game_id() : std::move(game_id)) {
  init_players();
  init_bases();
}

void GameState::init_players(){
  for (int i=0;i<NUM_PLAYERS;i++) players_[i] = Player(i+1);
  players_[0].is_active = true;
}

void GameState::init_bases(){
  for (int pid=1; pid<=NUM_PLAYERS; ++pid){
    Pos p = base_start(pid);
    EntityId id = next_id_++;
    bases_.emplace(id, Base(id, pid, p));
    board_.set(p.x, p.y, id);
  }
}

bool GameState::start_game(){
  if (status_ != GameStatus::Ready) return false;
  status_ = GameStatus::Playing;
  logger()->info("game {} started", game_id_);
  emit("gameStarted", {{"gameId", game_id_}});
  return true;
}

bool GameState::pause_game(){
  if (status_ != GameStatus::Playing) return false;
  status_ = GameStatus::Paused;
  emit("gamePaused", {{"turnNumber", turn_number_}});
  return true;
}

bool GameState::resume_game(){
  if (status_ != GameStatus::Paused) return false;
  status_ = GameStatus::Playing;
  emit("gameResumed", {{"turnNumber", turn_number_}});
  return true;
}

bool GameState::set_player_name(int player_id, const std::string& name){
  auto* p = player_mut(player_id);
  if (!p || name.empty()) return false;
  p->name = name;
  return true;
}

// ------- Queries -------

const Player* GameState::player(int id) const {
  return valid_player(id) ? &players_[id-1] : nullptr;
}

Player* GameState::player_mut(int id){
  return valid_player(id) ? &players_[id-1] : nullptr;
}

const Unit* GameState::unit(EntityId id) const {
  auto it = units_.find(id);
  return it==units_.end() ? nullptr : &it->second;
}

Unit* GameState::unit_mut(EntityId id){
  auto it = units_.find(id);
  return it==units_.end() ? nullptr : &it->second;
}

const Base* GameState::base(EntityId id) const {
  auto it = bases_.find(id);
  return it==bases_.end() ? nullptr : &it->second;
}

Base* GameState::base_mut(EntityId id){
  auto it = bases_.find(id);
  return it==bases_.end() ? nullptr : &it->second;
}

const Base* GameState::player_base(int player_id) const {
  for (auto& kv: bases_)
    if (kv.second.player_id==player_id && !kv.second.is_destroyed) return &kv.second;
  return nullptr;
}

std::vector<const Unit*> GameState::player_units(int player_id) const {
  std::vector<const Unit*> out;
  for (auto& kv: units_) if (kv.second.player_id==player_id) out.push_back(&kv.second);
  return out;
}

const Unit* GameState::unit_at(int x,int y) const {
  return unit(board_.at(x,y));
}

EntityRef GameState::entity_at(int x,int y) const {
  EntityRef r;
  EntityId id = board_.at(x,y);
  if (id==NO_ENTITY) return r;
  if (auto* u = unit(id)){ r.kind = EntityKind::Unit; r.unit = u; return r; }
  if (auto* b = base(id)){ r.kind = EntityKind::Base; r.base = b; return r; }
  return r;
}

bool GameState::is_within_base_radius(int player_id, int x, int y, int radius) const {
  auto* b = player_base(player_id);
  if (!b) return false;
  return manhattan(b->pos.x, b->pos.y, x, y) <= radius;
}

std::vector<MoveOption> GameState::valid_placement_positions(int player_id, int radius) const {
  std::vector<MoveOption> out;
  auto* b = player_base(player_id);
  if (!b) return out;
  for (int dx=-radius; dx<=radius; ++dx){
    for (int dy=-radius; dy<=radius; ++dy){
      if (dx==0 && dy==0) continue;
      int d = std::abs(dx) + std::abs(dy);
      if (d > radius) continue;
      int x = b->pos.x + dx, y = b->pos.y + dy;
      if (board_.empty(x,y)) out.push_back({x, y, d});
    }
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const MoveOption& a, const MoveOption& c){ return a.cost < c.cost; });
  return out;
}

std::optional<Pos> GameState::find_best_placement_near_base(int player_id) const {
  auto v = valid_placement_positions(player_id, PLACEMENT_RADIUS);
  if (v.empty()) v = valid_placement_positions(player_id, MAX_PLACEMENT_RADIUS);
  if (v.empty()) return std::nullopt;
  return Pos{v.front().x, v.front().y};
}

// ------- Unit creation -------

const char* GameState::check_create_unit(UnitType type, int player_id, int x, int y) const {
  if (ended()) return "The game is over";
  auto* s = unit_stats(type);
  if (!s) return "Unknown unit type";
  auto* p = player(player_id);
  if (!p) return "Unknown player";
  if (!in_bounds(x,y)) return "Position is off the board";
  if (!board_.empty(x,y)) return "Position is occupied";
  if (!is_within_base_radius(player_id, x, y)) return "Position is outside the base placement radius";
  if (p->energy < s->cost) return "Not enough energy";
  return nullptr;
}

const Unit* GameState::create_unit(UnitType type, int player_id, int x, int y){
  if (auto* why = check_create_unit(type, player_id, x, y)){
    logger()->debug("create_unit({}, P{}, {},{}) rejected: {}", to_string(type), player_id, x, y, why);
    return nullptr;
  }
  Player& pl = players_[player_id-1];
  pl.spend_energy(unit_stats(type)->cost);

  EntityId id = next_id_++;
  auto it = units_.emplace(id, Unit(id, type, player_id, Pos{x,y})).first;
  board_.set(x, y, id);
  pl.add_unit(id);

  const Unit& u = it->second;
  logger()->debug("P{} created {} #{} at {},{}", player_id, to_string(type), id, x, y);
  emit("unitCreated", {{"unit", u}});
  return &u;
}

const Unit* GameState::create_unit(const std::string& type, int player_id, int x, int y){
  auto t = parse_unit_type(type);
  if (!t){
    logger()->debug("create_unit: unknown unit type '{}'", type);
    return nullptr;
  }
  return create_unit(*t, player_id, x, y);
}

const Unit* GameState::build_unit(UnitType type, int x, int y){
  if (phase_ != Phase::Build){
    logger()->debug("build_unit rejected: not in the build phase");
    return nullptr;
  }
  return create_unit(type, current_player_, x, y);
}

// ------- Movement -------

const char* GameState::check_move(EntityId unit_id, int x, int y) const {
  if (ended()) return "The game is over";
  auto* u = unit(unit_id);
  if (!u) return "Unknown unit";
  if (!in_bounds(x,y)) return "Target is off the board";
  if (!board_.empty(x,y)) return "Target is occupied";
  if (manhattan(u->pos.x, u->pos.y, x, y) > u->remaining_actions()) return "Not enough movement left";
  return nullptr;
}

bool GameState::move_unit(EntityId unit_id, int x, int y){
  if (auto* why = check_move(unit_id, x, y)){
    logger()->debug("move_unit(#{}, {},{}) rejected: {}", unit_id, x, y, why);
    return false;
  }
  Unit& u = units_.at(unit_id);
  Pos from = u.pos;
  int cost = manhattan(from.x, from.y, x, y);

  board_.reset(from.x, from.y);
  u.pos = Pos{x,y};
  board_.set(x, y, unit_id);
  u.actions_used += cost;   // one action per grid step

  emit("unitMoved", {{"unitId", unit_id}, {"from", from}, {"to", u.pos}, {"cost", cost}});
  return true;
}

std::vector<MoveOption> GameState::valid_move_positions(EntityId unit_id) const {
  std::vector<MoveOption> out;
  auto* u = unit(unit_id);
  if (!u || !u->can_act()) return out;
  int r  = u->remaining_actions();
  int sx = u->pos.x, sy = u->pos.y;
  for (int x=std::max(0,sx-r); x<=std::min(G-1,sx+r); ++x){
    for (int y=std::max(0,sy-r); y<=std::min(G-1,sy+r); ++y){
      if (x==sx && y==sy) continue;
      int d = manhattan(sx,sy,x,y);
      if (d <= r && board_.empty(x,y)) out.push_back({x, y, d});
    }
  }
  return out;
}

int GameState::calculate_movement_cost(EntityId unit_id, int x, int y) const {
  auto* u = unit(unit_id);
  if (!u) return -1;
  return manhattan(u->pos.x, u->pos.y, x, y);
}

bool GameState::remove_unit(EntityId unit_id){
  if (ended()) return false;
  auto it = units_.find(unit_id);
  if (it == units_.end()) return false;
  int owner = it->second.player_id;
  Pos p = it->second.pos;

  board_.reset(p.x, p.y);
  if (auto* pl = player_mut(owner)) pl->remove_unit(unit_id);
  units_.erase(it);

  emit("unitRemoved", {{"unitId", unit_id}, {"playerId", owner}});
  check_victory_condition();  // removal can end the game
  return true;
}

// ------- History -------

void GameState::record_action(const std::string& kind, const std::string& description){
  history_.push_back(ActionRecord{turn_number_, current_player_, kind, description});
  while (history_.size() > MAX_HISTORY) history_.pop_front();
}

// ------- Restore -------

static bool fail(std::string* error, const std::string& why){
  if (error) *error = why;
  logger()->warn("restore rejected: {}", why);
  return false;
}

bool GameState::restore(const GameSnapshot& snap, std::string* error){
  if (!valid_player(snap.current_player)) return fail(error, "invalid current player");
  if (snap.turn_number < 1) return fail(error, "invalid turn number");
  if (snap.winner && !valid_player(*snap.winner)) return fail(error, "invalid winner");
  if (int(snap.players.size()) != NUM_PLAYERS) return fail(error, "expected two players");

  std::array<Player, NUM_PLAYERS> players;
  std::array<bool, NUM_PLAYERS> seen{};
  for (auto& p: snap.players){
    if (!valid_player(p.id) || seen[p.id-1]) return fail(error, "invalid or repeated player id");
    if (p.energy < 0 || p.resources_gathered < 0) return fail(error, "negative player resources");
    if (p.actions_remaining < 0 || p.actions_remaining > MAX_PLAYER_ACTIONS)
      return fail(error, "player actions out of range");
    seen[p.id-1] = true;
    players[p.id-1] = p;
    players[p.id-1].units_owned.clear();   // rebuilt from the units below
  }

  Board board;
  std::set<EntityId> ids;
  EntityId max_id = 0;
  auto place = [&](EntityId id, Pos pos) -> const char* {
    if (id == NO_ENTITY) return "entity without an id";
    if (!ids.insert(id).second) return "duplicate entity id";
    if (!in_bounds(pos.x,pos.y)) return "entity off the board";
    if (!board.empty(pos.x,pos.y)) return "two entities share a cell";
    board.set(pos.x, pos.y, id);
    max_id = std::max(max_id, id);
    return nullptr;
  };

  std::map<EntityId, Base> bases;
  for (auto& b: snap.bases){
    if (!valid_player(b.player_id)) return fail(error, "base with invalid owner");
    if (b.health < 0 || b.health > BASE_HEALTH) return fail(error, "base health out of range");
    if (auto* why = place(b.id, b.pos)) return fail(error, why);
    Base nb = b;
    nb.max_health = BASE_HEALTH;
    nb.is_destroyed = b.is_destroyed || b.health <= 0;
    bases.emplace(nb.id, nb);
  }

  std::map<EntityId, Unit> units;
  for (auto& u: snap.units){
    auto* s = unit_stats(u.type);
    if (!s) return fail(error, "unit with unknown type");
    if (!valid_player(u.player_id)) return fail(error, "unit with invalid owner");
    // maxima come from the stat table, never from the snapshot
    if (u.health <= 0 || u.health > s->health) return fail(error, "unit health out of range");
    if (u.actions_used < 0 || u.actions_used > s->movement) return fail(error, "unit actions out of range");
    if (auto* why = place(u.id, u.pos)) return fail(error, why);
    Unit nu = u;
    nu.max_health  = s->health;
    nu.max_actions = s->movement;
    nu.abilities   = s->abilities;
    units.emplace(nu.id, nu);
    players[u.player_id-1].add_unit(nu.id);
  }

  std::deque<ActionRecord> history(snap.action_history.begin(), snap.action_history.end());
  while (history.size() > MAX_HISTORY) history.pop_front();

  // validated; commit
  if (!snap.game_id.empty()) game_id_ = snap.game_id;
  status_         = snap.status;
  current_player_ = snap.current_player;
  phase_          = snap.current_phase;
  turn_number_    = snap.turn_number;
  winner_         = snap.winner;
  players_        = std::move(players);
  units_          = std::move(units);
  bases_          = std::move(bases);
  board_          = board;
  next_id_        = max_id + 1;
  history_        = std::move(history);
  logger()->info("game {} restored at turn {}", game_id_, turn_number_);
  return true;
}

bool GameState::board_consistent() const {
  int entities = 0;
  for (auto& kv: units_){
    if (board_.at(kv.second.pos.x, kv.second.pos.y) != kv.first) return false;
    ++entities;
  }
  for (auto& kv: bases_){
    if (board_.at(kv.second.pos.x, kv.second.pos.y) != kv.first) return false;
    ++entities;
  }
  return board_.occupied_count() == entities;
}

} // namespace gw
