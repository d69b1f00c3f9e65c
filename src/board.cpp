#include "gw/board.hpp"
#include <stdexcept>

namespace gw {

void Board::clear(){
  cells_.fill(NO_ENTITY);
}

void Board::set(int x,int y, EntityId id){
  if (!in_bounds(x,y)) throw std::out_of_range("Board::set: cell off the grid");
  cells_[idx(x,y)] = id;
}

int Board::occupied_count() const {
  int c=0;
  for (auto id: cells_) if (id!=NO_ENTITY) ++c;
  return c;
}

} // namespace gw
