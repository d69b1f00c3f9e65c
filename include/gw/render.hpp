#pragma once
#include "gw/game_state.hpp"
#include "gw/resource_manager.hpp"
#include <string>

namespace gw {

// Text board for the terminal: W/S/I/H units (lower case for player 2),
// B live base, x destroyed base, * resource node with value left, o empty node.
std::string render_ascii(const GameState& gs, const ResourceManager& rm);

// One line per player: name, energy, gathered, actions, units.
std::string render_status(const GameState& gs);

} // namespace gw
