#pragma once
#include "gw/board.hpp"
#include "gw/entities.hpp"
#include "gw/events.hpp"
#include <array>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gw {

struct GameSnapshot;

// Tagged view of whatever occupies a cell.
struct EntityRef {
  EntityKind  kind{EntityKind::None};
  const Unit* unit{nullptr};
  const Base* base{nullptr};

  explicit operator bool() const { return kind != EntityKind::None; }
  EntityId id() const;
  int player_id() const;
  int health() const;
};

struct MoveOption   { int x, y, cost; };

struct AttackTarget {
  int        x, y;
  EntityKind target_type;
  EntityId   target_id;
  int        damage;
};

struct ActionRecord {
  int         turn{0};
  int         player{0};
  std::string kind;         // "move" | "attack" | "build" | "gather"
  std::string description;
};

// Authoritative game aggregate. Every mutator validates all of its
// preconditions first and then either applies the whole change or nothing.
class GameState {
public:
  explicit GameState(std::string game_id = std::string());

  GameState(const GameState&) = delete;
  GameState& operator=(const GameState&) = delete;

  // ------- Events -------
  EventBus&       events()       { return bus_; }
  const EventBus& events() const { return bus_; }
  HandlerId on(const std::string& ev, EventHandler fn) { return bus_.on(ev, std::move(fn)); }
  bool      off(const std::string& ev, HandlerId id)   { return bus_.off(ev, id); }
  void      emit(const std::string& ev, Json data = Json::object()) const { bus_.emit(ev, std::move(data)); }

  // ------- Status -------
  const std::string& game_id() const { return game_id_; }
  GameStatus status() const { return status_; }
  bool       ended() const { return status_ == GameStatus::Ended; }
  int        current_player_id() const { return current_player_; }
  Phase      current_phase() const { return phase_; }
  int        turn_number() const { return turn_number_; }
  std::optional<int> winner() const { return winner_; }

  bool start_game();
  bool pause_game();
  bool resume_game();
  bool set_player_name(int player_id, const std::string& name);

  // ------- Queries -------
  bool is_valid_position(int x,int y) const { return in_bounds(x,y); }
  bool is_position_empty(int x,int y) const { return board_.empty(x,y); }
  const Unit* unit_at(int x,int y) const;
  EntityRef   entity_at(int x,int y) const;
  const Board& board() const { return board_; }

  const Player* player(int id) const;
  const Player* current_player() const { return player(current_player_); }
  const Unit*   unit(EntityId id) const;
  const Base*   base(EntityId id) const;
  const Base*   player_base(int player_id) const;   // live base only
  std::vector<const Unit*> player_units(int player_id) const;
  const std::map<EntityId, Unit>& units() const { return units_; }
  const std::map<EntityId, Base>& bases() const { return bases_; }

  bool is_within_base_radius(int player_id, int x, int y, int radius = PLACEMENT_RADIUS) const;
  std::vector<MoveOption> valid_placement_positions(int player_id, int radius = PLACEMENT_RADIUS) const;
  std::optional<Pos> find_best_placement_near_base(int player_id) const;

  // ------- Units & movement -------
  // check_* return nullptr when the action is allowed, else a reason for the UI.
  const char* check_create_unit(UnitType type, int player_id, int x, int y) const;
  const char* check_move(EntityId unit_id, int x, int y) const;

  const Unit* create_unit(UnitType type, int player_id, int x, int y);
  const Unit* create_unit(const std::string& type, int player_id, int x, int y);
  const Unit* build_unit(UnitType type, int x, int y);   // current player, build phase
  bool        move_unit(EntityId unit_id, int x, int y);
  bool        remove_unit(EntityId unit_id);

  bool can_unit_move_to(EntityId unit_id, int x, int y) const { return check_move(unit_id,x,y)==nullptr; }
  std::vector<MoveOption> valid_move_positions(EntityId unit_id) const;
  int calculate_movement_cost(EntityId unit_id, int x, int y) const;

  // ------- Combat -------
  const char* check_attack(EntityId attacker_id, int x, int y) const;
  bool can_unit_attack(EntityId attacker_id, int x, int y) const { return check_attack(attacker_id,x,y)==nullptr; }
  bool attack_unit(EntityId attacker_id, int x, int y);
  std::vector<AttackTarget> valid_attack_targets(EntityId attacker_id) const;

  // ------- Victory -------
  // Returns true when this call ended the game.
  bool check_victory_condition();
  bool end_game(std::optional<int> winner);
  bool player_surrender(int player_id);
  bool declare_draw();
  bool check_stalemate();

  // ------- History -------
  void record_action(const std::string& kind, const std::string& description);
  const std::deque<ActionRecord>& action_history() const { return history_; }

  // ------- Restore -------
  // Rebuilds entities, ownership and board from a snapshot. On failure the
  // state is untouched and *error (if given) says why.
  bool restore(const GameSnapshot& snap, std::string* error = nullptr);

  // Board/entity invariant: every occupied cell names an entity standing there
  // and every entity's cell names it.
  bool board_consistent() const;

private:
  friend class TurnManager;
  friend class ResourceManager;

  Player* player_mut(int id);
  Unit*   unit_mut(EntityId id);
  Base*   base_mut(EntityId id);
  bool    unit_has_options(const Unit& u) const;

  void set_phase(Phase p) { phase_ = p; }
  void set_current_player(int id) { current_player_ = id; }
  void set_turn_number(int n) { turn_number_ = n; }

  void init_players();
  void init_bases();

  EventBus    bus_;
  std::string game_id_;
  GameStatus  status_{GameStatus::Ready};
  int         current_player_{1};
  Phase       phase_{Phase::Resource};
  int         turn_number_{1};
  std::optional<int> winner_;

  std::array<Player, NUM_PLAYERS> players_;
  std::map<EntityId, Unit> units_;
  std::map<EntityId, Base> bases_;
  Board       board_;
  EntityId    next_id_{1};
  std::deque<ActionRecord> history_;
};

} // namespace gw
