#pragma once
#include "gw/types.hpp"
#include <array>

namespace gw {

inline int idx(int x, int y) { return y*G + x; }

// Dense occupancy grid: NO_ENTITY or the id of the unit/base on the cell.
// GameState keeps it in lockstep with entity positions.
class Board {
public:
  Board() { clear(); }

  void clear();
  EntityId at(int x,int y) const { return in_bounds(x,y) ? cells_[idx(x,y)] : NO_ENTITY; }
  bool     empty(int x,int y) const { return in_bounds(x,y) && cells_[idx(x,y)]==NO_ENTITY; }
  void     set(int x,int y, EntityId id);
  void     reset(int x,int y) { set(x,y,NO_ENTITY); }

  int occupied_count() const;

private:
  std::array<EntityId, G*G> cells_;
};

} // namespace gw
