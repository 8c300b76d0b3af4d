#pragma once

#include "game_state.hpp"
#include "grid.hpp"
#include "rng.hpp"

#include <vector>

// Advances every drone by one step, in list order.
//
// A frozen drone (frozenTurns > 0) counts down and stays put. Any other drone
// picks uniformly among its in-bounds, non-Wall neighbours that no other drone
// occupies (drones earlier in the list have already moved), or stays put when
// boxed in. The player's cell is a valid target; item cells are left intact.
void advanceDrones(std::vector<Drone>& drones, const Grid& grid, RNG& rng);
