#pragma once
#include "gw/game_state.hpp"
#include "gw/resource_manager.hpp"
#include "gw/turn_manager.hpp"
#include <deque>
#include <memory>
#include <string>

namespace gw {

struct CommandResult {
  bool        success{false};
  std::string reason;   // set when !success
};

// A player's request, checked against turn ownership and phase before it
// touches the game. A command runs at most once.
class Command {
public:
  virtual ~Command() = default;

  // nullptr when the command may run now, else the reason it may not.
  virtual const char* check() const = 0;
  bool can_execute() const { return !executed_ && check()==nullptr; }

  CommandResult execute();

  virtual const char* kind() const = 0;          // "move" | "attack" | "build" | "gather"
  virtual std::string describe() const = 0;
  bool executed() const { return executed_; }

protected:
  // tm may be null: the player's action budget is then left alone.
  Command(GameState& gs, TurnManager* tm) : gs_(gs), tm_(tm) {}

  virtual bool apply() = 0;
  virtual bool spends_player_action() const { return true; }

  // Shared gate: game running, unit exists and belongs to the current player,
  // phase matches, and the player still has an action when one is needed.
  const char* check_turn(EntityId unit_id, Phase phase) const;

  GameState&   gs_;
  TurnManager* tm_;
  bool         executed_{false};
};

class MoveCommand : public Command {
public:
  MoveCommand(GameState& gs, EntityId unit_id, Pos to, TurnManager* tm = nullptr)
    : Command(gs, tm), unit_id_(unit_id), to_(to) {}

  const char* check() const override;
  const char* kind() const override { return "move"; }
  std::string describe() const override;

  Pos from() const { return from_; }
  int cost() const { return cost_; }

protected:
  bool apply() override;

private:
  EntityId unit_id_;
  Pos      to_;
  Pos      from_;
  int      cost_{0};
};

class AttackCommand : public Command {
public:
  AttackCommand(GameState& gs, EntityId attacker_id, Pos target, TurnManager* tm = nullptr)
    : Command(gs, tm), attacker_id_(attacker_id), target_(target) {}

  const char* check() const override;
  const char* kind() const override { return "attack"; }
  std::string describe() const override;

  int damage() const { return damage_; }

protected:
  bool apply() override;

private:
  EntityId attacker_id_;
  Pos      target_;
  int      damage_{0};
};

class BuildCommand : public Command {
public:
  BuildCommand(GameState& gs, UnitType type, Pos at, TurnManager* tm = nullptr)
    : Command(gs, tm), type_(type), at_(at) {}

  const char* check() const override;
  const char* kind() const override { return "build"; }
  std::string describe() const override;

  EntityId created() const { return created_; }

protected:
  bool apply() override;

private:
  UnitType type_;
  Pos      at_;
  EntityId created_{NO_ENTITY};
};

// Gathering spends the unit's action and puts it on cooldown; the player's
// action budget is not charged.
class GatherCommand : public Command {
public:
  GatherCommand(GameState& gs, ResourceManager& rm, EntityId unit_id, TurnManager* tm = nullptr)
    : Command(gs, tm), rm_(rm), unit_id_(unit_id) {}

  const char* check() const override;
  const char* kind() const override { return "gather"; }
  std::string describe() const override;

  const GatherResult& result() const { return result_; }

protected:
  bool apply() override;
  bool spends_player_action() const override { return false; }

private:
  ResourceManager& rm_;
  EntityId         unit_id_;
  GatherResult     result_;
};

// Runs commands, keeps the last MAX_HISTORY that succeeded and reports each
// outcome as commandExecuted / commandFailed on the game's event bus.
class CommandManager {
public:
  explicit CommandManager(GameState& gs) : gs_(gs) {}

  CommandResult execute(std::unique_ptr<Command> cmd);

  const std::deque<std::unique_ptr<Command>>& history() const { return history_; }
  void clear_history() { history_.clear(); }

private:
  GameState& gs_;
  std::deque<std::unique_ptr<Command>> history_;
};

} // namespace gw
