#include "gw/resource_manager.hpp"
#include "gw/log.hpp"
#include <algorithm>

namespace gw {

ResourceManager::ResourceManager(GameState& gs)
  : gs_(&gs), nodes_(default_resource_nodes()) {}

const ResourceNode* ResourceManager::node(const std::string& id) const {
  for (auto& n: nodes_) if (n.id==id) return &n;
  return nullptr;
}

const ResourceNode* ResourceManager::node_at(int x, int y) const {
  for (auto& n: nodes_) if (n.pos.x==x && n.pos.y==y) return &n;
  return nullptr;
}

std::vector<const ResourceNode*> ResourceManager::nodes_in_range(int x, int y, int range) const {
  std::vector<const ResourceNode*> out;
  for (auto& n: nodes_) if (chebyshev(n.pos.x, n.pos.y, x, y) <= range) out.push_back(&n);
  return out;
}

// ------- Gathering -------

static GatherResult rejected(std::string why){
  GatherResult r;
  r.reason = std::move(why);
  return r;
}

GatherResult ResourceManager::gather_resources(EntityId unit_id){
  if (gs_->ended()) return rejected("The game is over");
  if (gs_->current_phase() != Phase::Resource)
    return rejected(std::string("Can only gather during the resource phase. Current phase: ")
                    + to_string(gs_->current_phase()));
  Unit* u = gs_->unit_mut(unit_id);
  if (!u || !u->has_ability(ABILITY_GATHER) || !u->can_act()) return rejected("Unit cannot gather");
  if (on_cooldown(unit_id)) return rejected("Unit is on gathering cooldown");

  // first node in stored order with something left
  ResourceNode* src = nullptr;
  bool any_in_range = false;
  for (auto& n: nodes_){
    if (chebyshev(n.pos.x, n.pos.y, u->pos.x, u->pos.y) > GATHER_RANGE) continue;
    any_in_range = true;
    if (n.value > 0){ src = &n; break; }
  }
  if (!any_in_range) return rejected("No resource nodes in range");
  if (!src) return rejected("No resources available at nearby nodes");

  Player* p = gs_->player_mut(u->player_id);
  if (!p) return rejected("Unit has no owner");

  int amount = std::min(GATHER_AMOUNT, src->value);
  src->value -= amount;
  p->add_energy(amount);
  p->resources_gathered += amount;
  cooldowns_.insert(unit_id);
  u->use_action();

  logger()->debug("unit #{} gathered {} from {}", unit_id, amount, src->id);
  gs_->emit("resourcesGathered", {
    {"unitId", unit_id},
    {"playerId", u->player_id},
    {"amount", amount},
    {"nodeId", src->id},
    {"nodeValueRemaining", src->value},
  });

  GatherResult r;
  r.success = true;
  r.amount = amount;
  r.node_id = src->id;
  r.node_value_remaining = src->value;
  return r;
}

int ResourceManager::regenerate_resources(){
  int total = 0;
  for (auto& n: nodes_){
    if (n.value >= n.max_value) continue;
    int amt = std::min(n.regeneration_rate, n.max_value - n.value);
    if (amt <= 0) continue;
    n.value += amt;
    total += amt;
    gs_->emit("resourceNodeRegenerated", {
      {"nodeId", n.id},
      {"regeneratedAmount", amt},
      {"currentValue", n.value},
      {"maxValue", n.max_value},
    });
  }
  return total;
}

void ResourceManager::clear_gathering_cooldowns(){
  cooldowns_.clear();
}

void ResourceManager::clear_gathering_cooldowns(int player_id){
  for (auto it = cooldowns_.begin(); it != cooldowns_.end(); ){
    auto* u = gs_->unit(*it);
    // stale entries (removed units) go too
    if (!u || u->player_id==player_id) it = cooldowns_.erase(it);
    else ++it;
  }
}

// ------- Analytics -------

bool ResourceManager::can_gather_at_position(EntityId unit_id) const {
  auto* u = gs_->unit(unit_id);
  if (!u || !u->has_ability(ABILITY_GATHER)) return false;
  for (auto* n: nodes_in_range(u->pos.x, u->pos.y)) if (n->value > 0) return true;
  return false;
}

int ResourceManager::gathering_potential(int x, int y, UnitType type) const {
  auto* s = unit_stats(type);
  if (!s || !(s->abilities & ABILITY_GATHER)) return 0;
  int total = 0;
  for (auto* n: nodes_in_range(x, y)) total += n->value;
  return total;
}

std::vector<GatherSpot> ResourceManager::optimal_gathering_positions(const std::string& node_id) const {
  std::vector<GatherSpot> out;
  auto* n = node(node_id);
  if (!n) return out;
  static const int kDirs[8][2] = {{-1,0},{1,0},{0,-1},{0,1},{-1,-1},{-1,1},{1,-1},{1,1}};
  for (auto& d: kDirs){
    int x = n->pos.x + d[0], y = n->pos.y + d[1];
    if (gs_->is_position_empty(x,y)) out.push_back({x, y, gathering_potential(x,y)});
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const GatherSpot& a, const GatherSpot& b){ return a.potential > b.potential; });
  return out;
}

int ResourceManager::total_resources_available() const {
  int t = 0;
  for (auto& n: nodes_) t += n.value;
  return t;
}

int ResourceManager::calculate_player_resource_income(int player_id) const {
  int t = 0;
  for (auto* u: gs_->player_units(player_id))
    if (u->has_ability(ABILITY_GATHER)) t += gathering_potential(u->pos.x, u->pos.y, u->type);
  return t;
}

ResourceStats ResourceManager::resource_stats() const {
  ResourceStats s;
  s.total_available = total_resources_available();
  for (auto& n: nodes_){
    s.max_possible += n.max_value;
    s.regeneration_per_turn += n.regeneration_rate;
  }
  s.node_count = int(nodes_.size());
  if (s.max_possible > 0) s.efficiency = double(s.total_available) / double(s.max_possible);
  if (s.node_count > 0)   s.average_node_value = double(s.total_available) / double(s.node_count);
  return s;
}

int ResourceManager::worker_adjacency_bonus(int player_id) const {
  int bonus = 0;
  for (auto* u: gs_->player_units(player_id)){
    if (!u->has_ability(ABILITY_GATHER)) continue;
    for (auto* n: nodes_in_range(u->pos.x, u->pos.y)) if (n->value > 0) bonus += WORKER_NODE_BONUS;
  }
  return bonus;
}

// ------- Restore -------

const char* ResourceManager::check_restore(const std::vector<ResourceNode>& nodes) const {
  std::set<std::string> ids;
  for (auto& n: nodes){
    if (n.id.empty() || !ids.insert(n.id).second) return "missing or duplicate resource node id";
    if (!in_bounds(n.pos.x, n.pos.y)) return "resource node off the board";
    if (n.max_value < 0 || n.value < 0 || n.value > n.max_value) return "resource node value out of range";
    if (n.regeneration_rate < 0) return "negative regeneration rate";
  }
  return nullptr;
}

bool ResourceManager::restore(const std::vector<ResourceNode>& nodes, const std::vector<EntityId>& cooldowns,
                              std::string* error){
  if (auto* why = check_restore(nodes)){
    if (error) *error = why;
    return false;
  }
  nodes_ = nodes;
  cooldowns_.clear();
  for (auto id: cooldowns) if (gs_->unit(id)) cooldowns_.insert(id);
  return true;
}

} // namespace gw
