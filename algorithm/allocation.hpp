#pragma once
#include "bay_grid.hpp"

#include <optional>

// Park a vehicle in the free bay closest to a pedestrian exit.
// Disabled vehicles ('D') only go into disabled bays, everyone else only into
// general bays (except the entrance bay next to an exit at index 0, which
// takes any vehicle).
// Returns the bay index, or std::nullopt when no bay could be found.
// Throws InvalidVehicleTag for '=', '@' and 'U'.
std::optional<int> parkVehicle(BayGrid& grid, char vehicleTag);

// Free the bay at index. Returns false if there was nothing to remove.
// Throws InvalidBayIndex when index is off the grid.
bool unparkVehicle(BayGrid& grid, int index);
