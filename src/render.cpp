#include "gw/render.hpp"
#include <sstream>

namespace gw {

static char glyph(const Unit& u){
  char c = '?';
  switch (u.type){
    case UnitType::Worker:   c = 'W'; break;
    case UnitType::Scout:    c = 'S'; break;
    case UnitType::Infantry: c = 'I'; break;
    case UnitType::Heavy:    c = 'H'; break;
  }
  return (u.player_id==1)? c : char(c + 32); // lowercase for player 2
}

static char glyph(const Base& b){
  if (b.is_destroyed) return 'x';
  return (b.player_id==1)? 'B' : 'b';
}

std::string render_ascii(const GameState& gs, const ResourceManager& rm){
  char grid[G][G];
  for(int y=0;y<G;y++) for(int x=0;x<G;x++) grid[y][x]='.';
  for (auto &n: rm.nodes()) grid[n.pos.y][n.pos.x] = n.value > 0 ? '*' : 'o';
  for (auto &kv: gs.bases()) grid[kv.second.pos.y][kv.second.pos.x] = glyph(kv.second);
  for (auto &kv: gs.units()) grid[kv.second.pos.y][kv.second.pos.x] = glyph(kv.second);

  std::ostringstream os;
  os << "Turn " << gs.turn_number() << " (Player " << gs.current_player_id() << ", "
     << to_string(gs.current_phase()) << " phase)";
  if (gs.status() != GameStatus::Playing) os << " [" << to_string(gs.status()) << "]";
  os << "\n   ";
  for (int x=0;x<G;x++) os << (x%10);
  os << "\n";
  for (int y=0;y<G;y++){
    os << (y<10? " ":"") << y << ' ';
    for (int x=0;x<G;x++) os << grid[y][x];
    os << "\n";
  }
  return os.str();
}

std::string render_status(const GameState& gs){
  std::ostringstream os;
  for (int pid=1; pid<=NUM_PLAYERS; ++pid){
    const Player* p = gs.player(pid);
    const Base*   b = gs.player_base(pid);
    os << (p->is_active? "> ":"  ") << p->name
       << "  energy " << p->energy
       << "  gathered " << p->resources_gathered
       << "  actions " << p->actions_remaining
       << "  units " << p->units_owned.size()
       << "  base " << (b ? b->health : 0) << "\n";
  }
  if (gs.ended()){
    auto w = gs.winner();
    os << "Game over: " << (w ? "Player " + std::to_string(*w) + " wins" : std::string("draw")) << "\n";
  }
  return os.str();
}

} // namespace gw
