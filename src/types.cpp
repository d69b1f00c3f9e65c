#include "gw/types.hpp"

namespace gw {

// ------- Unit table -------

static const UnitStats kUnitStats[UNIT_TYPE_COUNT] = {
  {"worker",   "Worker",   10,  50,  5, 2, ABILITY_BUILD | ABILITY_GATHER},
  {"scout",    "Scout",    15,  30, 10, 4, ABILITY_SCOUT | ABILITY_FAST_MOVE},
  {"infantry", "Infantry", 25, 100, 20, 2, ABILITY_ATTACK | ABILITY_DEFEND},
  {"heavy",    "Heavy",    50, 200, 40, 1, ABILITY_HEAVY_ATTACK | ABILITY_SIEGE},
};

const UnitStats* unit_stats(UnitType t){
  int i = int(t);
  if (i<0 || i>=UNIT_TYPE_COUNT) return nullptr;
  return &kUnitStats[i];
}

int unit_damage(UnitType t){
  switch (t){
    case UnitType::Worker:   return 1;
    case UnitType::Scout:    return 1;
    case UnitType::Infantry: return 2;
    case UnitType::Heavy:    return 3;
  }
  return 1;
}

// ------- Map layout -------

Pos base_start(int player_id){
  // P1 bottom-left, P2 top-right
  return player_id==1 ? Pos{1, G-2} : Pos{G-2, 1};
}

const std::array<Pos, NODE_COUNT>& node_positions(){
  static const std::array<Pos, NODE_COUNT> kNodes = {{
    {4,4},  {12,4},  {20,4},
    {4,12}, {12,12}, {20,12},
    {4,20}, {12,20}, {20,20},
  }};
  return kNodes;
}

// ------- Names -------

const char* to_string(UnitType t){
  auto* s = unit_stats(t);
  return s ? s->id : "unknown";
}

const char* to_string(Phase p){
  switch (p){
    case Phase::Resource: return "resource";
    case Phase::Action:   return "action";
    case Phase::Build:    return "build";
  }
  return "unknown";
}

const char* to_string(GameStatus s){
  switch (s){
    case GameStatus::Ready:   return "ready";
    case GameStatus::Playing: return "playing";
    case GameStatus::Paused:  return "paused";
    case GameStatus::Ended:   return "ended";
  }
  return "unknown";
}

const char* to_string(EntityKind k){
  switch (k){
    case EntityKind::Unit: return "unit";
    case EntityKind::Base: return "base";
    default: break;
  }
  return "none";
}

std::optional<UnitType> parse_unit_type(const std::string& s){
  for (int i=0;i<UNIT_TYPE_COUNT;i++)
    if (s == kUnitStats[i].id) return UnitType(i);
  return std::nullopt;
}

std::optional<Phase> parse_phase(const std::string& s){
  for (int i=0;i<PHASE_COUNT;i++)
    if (s == to_string(Phase(i))) return Phase(i);
  return std::nullopt;
}

std::optional<GameStatus> parse_status(const std::string& s){
  for (int i=0;i<=int(GameStatus::Ended);i++)
    if (s == to_string(GameStatus(i))) return GameStatus(i);
  return std::nullopt;
}

} // namespace gw
