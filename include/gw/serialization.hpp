#pragma once
#include "gw/entities.hpp"
#include "gw/game_state.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gw {

class ResourceManager;

// Plain copy of everything needed to rebuild a game. The board is not part
// of it: restore derives occupancy from entity positions.
struct GameSnapshot {
  std::string        game_id;
  GameStatus         status{GameStatus::Ready};
  int                current_player{1};
  Phase              current_phase{Phase::Resource};
  int                turn_number{1};
  std::optional<int> winner;
  std::vector<Player>       players;
  std::vector<Unit>         units;
  std::vector<Base>         bases;
  std::vector<ActionRecord> action_history;

  std::vector<ResourceNode> resource_nodes;
  std::vector<EntityId>     gathering_cooldowns;
};

GameSnapshot serialize(const GameState& gs, const ResourceManager& rm);

// Restores both collaborators or neither.
bool deserialize(const GameSnapshot& snap, GameState& gs, ResourceManager& rm,
                 std::string* error = nullptr);

// ------- JSON (nlohmann ADL hooks) -------
void to_json(Json& j, const Pos& p);
void from_json(const Json& j, Pos& p);
void to_json(Json& j, const Player& p);
void from_json(const Json& j, Player& p);
void to_json(Json& j, const Unit& u);
void from_json(const Json& j, Unit& u);
void to_json(Json& j, const Base& b);
void from_json(const Json& j, Base& b);
void to_json(Json& j, const ResourceNode& n);
void from_json(const Json& j, ResourceNode& n);
void to_json(Json& j, const ActionRecord& r);
void from_json(const Json& j, ActionRecord& r);
// {"gameState": {...}, "resourceManager": {...}}
void to_json(Json& j, const GameSnapshot& s);
void from_json(const Json& j, GameSnapshot& s);
// Throws nlohmann::json::exception or std::invalid_argument on malformed input.
GameSnapshot snapshot_from_json(const Json& j);

// ------- Save files -------
constexpr const char* SAVE_VERSION = "1.0.0";

struct SaveMetadata {
  int        turn_number{1};
  int        current_player{1};
  GameStatus status{GameStatus::Ready};
  int        play_time{0};   // minutes, estimated from the turn count
};

struct ImportResult {
  bool         success{false};
  std::string  error;
  GameSnapshot snapshot;
  SaveMetadata metadata;
  std::string  timestamp;
  std::string  version;
};

bool is_compatible_version(const std::string& version);
std::string now_iso8601();

// Pretty-printed JSON save envelope.
std::string  export_save(const GameState& gs, const ResourceManager& rm,
                         const std::string& timestamp = now_iso8601());
ImportResult import_save(const std::string& text);

bool         save_to_file(const std::string& path, const GameState& gs, const ResourceManager& rm);
ImportResult load_from_file(const std::string& path);

} // namespace gw
