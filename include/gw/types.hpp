#pragma once
#include <array>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace gw {

constexpr int G = 25;                  // grid size 25x25
constexpr int NUM_PLAYERS = 2;         // player ids are 1 and 2
constexpr int STARTING_ENERGY = 100;
constexpr int MAX_PLAYER_ACTIONS = 3;  // per turn

constexpr int BASE_HEALTH = 200;
constexpr int PLACEMENT_RADIUS = 3;
constexpr int MAX_PLACEMENT_RADIUS = 5; // fallback when the base area is crowded

constexpr int NODE_COUNT = 9;
constexpr int NODE_MAX_VALUE = 100;
constexpr int NODE_REGEN_RATE = 5;
constexpr int GATHER_AMOUNT = 5;
constexpr int GATHER_RANGE = 1;        // Chebyshev

constexpr int ATTACK_RANGE = 1;        // Chebyshev, diagonals included
constexpr int RESOURCE_VICTORY = 500;
constexpr int ELIMINATION_AFTER_TURN = 5;

constexpr int BASE_ENERGY_INCOME = 10;
constexpr int WORKER_NODE_BONUS = 2;   // per (worker, adjacent live node) pair

constexpr int TURN_TIME_LIMIT_MS = 120000;
constexpr int TIMER_TICK_MS = 1000;

constexpr std::size_t MAX_HISTORY = 50;

using EntityId = uint32_t;             // units and bases share one key space
constexpr EntityId NO_ENTITY = 0;

enum class UnitType : uint8_t { Worker=0, Scout=1, Infantry=2, Heavy=3 };
constexpr int UNIT_TYPE_COUNT = 4;

enum class Phase : uint8_t { Resource=0, Action=1, Build=2 };
constexpr int PHASE_COUNT = 3;

enum class GameStatus : uint8_t { Ready=0, Playing=1, Paused=2, Ended=3 };

enum class EntityKind : uint8_t { None=0, Unit=1, Base=2 };

// Ability bit flags
enum Ability : uint8_t {
  ABILITY_BUILD       = 1u << 0,
  ABILITY_GATHER      = 1u << 1,
  ABILITY_SCOUT       = 1u << 2,
  ABILITY_FAST_MOVE   = 1u << 3,
  ABILITY_ATTACK      = 1u << 4,
  ABILITY_DEFEND      = 1u << 5,
  ABILITY_HEAVY_ATTACK= 1u << 6,
  ABILITY_SIEGE       = 1u << 7,
};

struct UnitStats {
  const char* id;
  const char* name;
  int cost;
  int health;
  int attack;      // display stat; combat uses unit_damage()
  int movement;    // doubles as the per-turn action budget
  uint8_t abilities;
};

struct Pos {
  int x{0}, y{0};
  bool operator==(const Pos& o) const { return x==o.x && y==o.y; }
  bool operator!=(const Pos& o) const { return !(*this==o); }
};

inline int manhattan(int x1,int y1,int x2,int y2){ return std::abs(x1-x2) + std::abs(y1-y2); }
inline int manhattan(Pos a, Pos b){ return manhattan(a.x,a.y,b.x,b.y); }
inline int chebyshev(int x1,int y1,int x2,int y2){
  int dx = std::abs(x1-x2), dy = std::abs(y1-y2);
  return dx>dy ? dx : dy;
}
inline int chebyshev(Pos a, Pos b){ return chebyshev(a.x,a.y,b.x,b.y); }

inline bool in_bounds(int x,int y){ return 0<=x && x<G && 0<=y && y<G; }
inline bool valid_player(int id){ return id>=1 && id<=NUM_PLAYERS; }
inline int  opponent(int id){ return id==1 ? 2 : 1; }

// nullptr for a value outside the enum
const UnitStats* unit_stats(UnitType t);
int unit_damage(UnitType t);

Pos base_start(int player_id);
const std::array<Pos, NODE_COUNT>& node_positions();

const char* to_string(UnitType t);
const char* to_string(Phase p);
const char* to_string(GameStatus s);
const char* to_string(EntityKind k);

std::optional<UnitType>   parse_unit_type(const std::string& s);
std::optional<Phase>      parse_phase(const std::string& s);
std::optional<GameStatus> parse_status(const std::string& s);

} // namespace gw
