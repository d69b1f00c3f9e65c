#include "gw/game_state.hpp"
#include "gw/log.hpp"

namespace gw {

// ------- Victory -------

static Json winner_json(std::optional<int> w){
  return w ? Json(*w) : Json(nullptr);
}

bool GameState::check_victory_condition(){
  if (ended()) return false;

  auto* b1 = player_base(1);
  auto* b2 = player_base(2);
  emit("victoryCheck", {
    {"player1BaseHealth", b1 ? b1->health : 0},
    {"player2BaseHealth", b2 ? b2->health : 0},
    {"gameStatus", to_string(status_)},
    {"turnNumber", turn_number_},
  });
  // a handler may have ended the game already
  if (ended()) return false;

  // 1. bases
  if (!b1 && !b2) return end_game(std::nullopt);
  if (!b1) return end_game(2);
  if (!b2) return end_game(1);

  // 2. resources
  for (auto& p: players_)
    if (p.resources_gathered >= RESOURCE_VICTORY) return end_game(p.id);

  // 3. elimination: a player with no units loses once the opening is over,
  //    provided the opponent still fields at least one unit
  if (turn_number_ > ELIMINATION_AFTER_TURN){
    for (auto& p: players_){
      const Player& other = players_[opponent(p.id)-1];
      if (p.units_owned.empty() && !other.units_owned.empty()) return end_game(other.id);
    }
  }
  return false;
}

bool GameState::end_game(std::optional<int> winner){
  if (ended()) return false;
  status_ = GameStatus::Ended;
  winner_ = winner;
  if (winner) logger()->info("game {} over: player {} wins", game_id_, *winner);
  else        logger()->info("game {} over: draw", game_id_);
  emit("gameEnded", {{"winner", winner_json(winner)}});
  return true;
}

bool GameState::player_surrender(int player_id){
  if (ended() || !valid_player(player_id)) return false;
  int w = opponent(player_id);
  emit("playerSurrendered", {{"surrenderedPlayer", player_id}, {"winner", w}});
  return end_game(w);
}

bool GameState::declare_draw(){
  if (ended()) return false;
  emit("drawDeclared", {{"turnNumber", turn_number_}});
  return end_game(std::nullopt);
}

// ------- Stalemate -------

// Could the unit do anything with a fresh action budget?
bool GameState::unit_has_options(const Unit& u) const {
  int r = u.max_actions;
  for (int dx=-r; dx<=r; ++dx){
    for (int dy=-r; dy<=r; ++dy){
      if ((dx==0 && dy==0) || std::abs(dx)+std::abs(dy) > r) continue;
      if (board_.empty(u.pos.x+dx, u.pos.y+dy)) return true;
    }
  }
  for (int dx=-ATTACK_RANGE; dx<=ATTACK_RANGE; ++dx){
    for (int dy=-ATTACK_RANGE; dy<=ATTACK_RANGE; ++dy){
      auto t = entity_at(u.pos.x+dx, u.pos.y+dy);
      if (!t || t.player_id()==u.player_id) continue;
      if (t.kind==EntityKind::Base && t.base->is_destroyed) continue;
      return true;
    }
  }
  return false;
}

bool GameState::check_stalemate(){
  if (ended()) return false;
  auto mine = player_units(current_player_);
  if (mine.empty()) return false;
  for (auto* u: mine) if (unit_has_options(*u)) return false;

  emit("stalemateDetected", {{"player", current_player_}, {"turnNumber", turn_number_}});
  return declare_draw();
}

} // namespace gw
