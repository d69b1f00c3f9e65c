#pragma once
#include "gw/entities.hpp"
#include "gw/game_state.hpp"
#include <set>
#include <string>
#include <vector>

namespace gw {

struct GatherResult {
  bool        success{false};
  int         amount{0};
  std::string node_id;
  int         node_value_remaining{0};
  std::string reason;          // set when !success
};

struct GatherSpot {
  int x, y;
  int potential;
};

struct ResourceStats {
  int    total_available{0};
  int    max_possible{0};
  double efficiency{0.0};
  int    node_count{0};
  double average_node_value{0.0};
  int    regeneration_per_turn{0};
};

// Owns the resource nodes and the per-unit gathering cooldowns. A unit that
// gathered stays on cooldown until its owner's next turn starts.
class ResourceManager {
public:
  explicit ResourceManager(GameState& gs);

  const std::vector<ResourceNode>& nodes() const { return nodes_; }
  const ResourceNode* node(const std::string& id) const;
  const ResourceNode* node_at(int x, int y) const;
  std::vector<const ResourceNode*> nodes_in_range(int x, int y, int range = GATHER_RANGE) const;

  GatherResult gather_resources(EntityId unit_id);
  int          regenerate_resources();

  bool on_cooldown(EntityId unit_id) const { return cooldowns_.count(unit_id) != 0; }
  const std::set<EntityId>& cooldowns() const { return cooldowns_; }
  void clear_gathering_cooldowns();
  void clear_gathering_cooldowns(int player_id);

  // ------- Analytics (no side effects) -------
  bool can_gather_at_position(EntityId unit_id) const;
  int  gathering_potential(int x, int y, UnitType type = UnitType::Worker) const;
  std::vector<GatherSpot> optimal_gathering_positions(const std::string& node_id) const;
  int  total_resources_available() const;
  int  calculate_player_resource_income(int player_id) const;
  ResourceStats resource_stats() const;

  // Income bonus for the resource phase: WORKER_NODE_BONUS per (worker, node)
  // pair with the worker within gathering range of a node that has value left.
  int  worker_adjacency_bonus(int player_id) const;

  // Snapshot support. restore() validates first and changes nothing on failure.
  const char* check_restore(const std::vector<ResourceNode>& nodes) const;
  bool restore(const std::vector<ResourceNode>& nodes, const std::vector<EntityId>& cooldowns,
               std::string* error = nullptr);

private:
  GameState* gs_;
  std::vector<ResourceNode> nodes_;
  std::set<EntityId> cooldowns_;
};

} // namespace gw
