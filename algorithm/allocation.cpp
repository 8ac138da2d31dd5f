#include "allocation.hpp"

#include <string>

namespace {

bool canTake(const Bay& bay, char vehicleTag)
{
    if (isDisabledVehicle(vehicleTag)) {
        return bay.state == BayState::DisabledFree;
    }
    return bay.state == BayState::Free;
}

// Try one ring candidate; off-grid candidates are skipped.
bool tryBay(BayGrid& grid, int index, char vehicleTag)
{
    if (!grid.inBounds(index)) return false;
    if (!canTake(grid.at(index), vehicleTag)) return false;
    grid.occupy(index, vehicleTag);
    return true;
}

// Entrance bay: an exit at index 0 hands out bay 1 to whoever arrives,
// without the disabled / non-disabled check.
bool tryEntranceBay(BayGrid& grid, int exitIndex, char vehicleTag)
{
    if (exitIndex != 0 || grid.total() < 2) return false;
    if (grid.at(1).state != BayState::Free) return false;
    grid.occupy(1, vehicleTag);
    return true;
}

// No exit to anchor the ring on: first matching bay from the entrance.
std::optional<int> scanFromEntrance(BayGrid& grid, char vehicleTag)
{
    for (int i = 0; i < grid.total(); ++i) {
        if (tryBay(grid, i, vehicleTag)) return i;
    }
    return std::nullopt;
}

} // namespace

// --------------------------------------------------------
// Park
// --------------------------------------------------------

std::optional<int> parkVehicle(BayGrid& grid, char vehicleTag)
{
    if (isReservedTag(vehicleTag)) {
        throw InvalidVehicleTag(std::string("'") + vehicleTag + "' is reserved and cannot tag a vehicle");
    }

    if (grid.availableBays() == 0) {
        return std::nullopt;
    }

    const auto& exits = grid.pedestrianExits();
    if (exits.empty()) {
        return scanFromEntrance(grid, vehicleTag);
    }

    // Rings of growing radius around every exit, exits in registration order,
    // left before right at the same radius.
    for (int indent = 1;; ++indent) {
        bool anyOnGrid   = false;
        bool lastOffGrid = false;

        for (int exitIndex : exits) {
            if (tryEntranceBay(grid, exitIndex, vehicleTag)) {
                return 1;
            }

            const int left = exitIndex - indent;
            if (tryBay(grid, left, vehicleTag)) {
                return left;
            }

            const int right = exitIndex + indent;
            if (tryBay(grid, right, vehicleTag)) {
                return right;
            }

            const bool leftOn  = grid.inBounds(left);
            const bool rightOn = grid.inBounds(right);
            anyOnGrid   = anyOnGrid || leftOn || rightOn;
            lastOffGrid = !leftOn || !rightOn;
        }

        if (grid.termination() == RingTermination::LastExit) {
            if (lastOffGrid) break;
        } else if (!anyOnGrid) {
            break;
        }
    }

    return std::nullopt;
}

// --------------------------------------------------------
// Unpark
// --------------------------------------------------------

bool unparkVehicle(BayGrid& grid, int index)
{
    switch (grid.at(index).state) {
        case BayState::Free:
        case BayState::DisabledFree:
        case BayState::PedestrianExit:
            return false; // nothing to remove
        case BayState::DisabledTaken:
        case BayState::Occupied:
            grid.vacate(index);
            return true;
    }
    return false;
}
