#include "bay_grid.hpp"

#include <limits>
#include <string>
#include <utility>

bool isDisabledVehicle(char tag)
{
    return tag == DISABLED_VEHICLE;
}

bool isReservedTag(char tag)
{
    return tag == PEDESTRIAN_GLYPH || tag == DISABLED_FREE_GLYPH || tag == FREE_GLYPH;
}

char bayGlyph(const Bay& bay)
{
    switch (bay.state) {
        case BayState::PedestrianExit: return PEDESTRIAN_GLYPH;
        case BayState::DisabledFree:   return DISABLED_FREE_GLYPH;
        case BayState::DisabledTaken:  return DISABLED_TAKEN_GLYPH;
        case BayState::Free:           return FREE_GLYPH;
        case BayState::Occupied:       return bay.tag;
    }
    return FREE_GLYPH;
}

// --------------------------------------------------------
// Construction
// --------------------------------------------------------

BayGrid::BayGrid(int laneSize,
                 std::vector<int> pedestrianExits,
                 std::vector<int> disabledSpaces,
                 RingTermination termination)
    : laneSize_(laneSize)
    , termination_(termination)
    , pedestrianExits_(std::move(pedestrianExits))
    , disabledSpaces_(std::move(disabledSpaces))
{
    if (laneSize_ <= 0) {
        throw ConfigurationError("lane size must be at least 1, got " + std::to_string(laneSize_));
    }
    const long long total = static_cast<long long>(laneSize_) * laneSize_;
    if (total > std::numeric_limits<int>::max()) {
        throw ConfigurationError("lane size " + std::to_string(laneSize_) +
                                 " gives more bays than can be indexed");
    }
    total_ = static_cast<int>(total);

    for (int e : pedestrianExits_) {
        if (!inBounds(e)) {
            throw ConfigurationError("pedestrian exit " + std::to_string(e) +
                                     " is outside [0, " + std::to_string(total_) + ")");
        }
        if (!exitSet_.insert(e).second) {
            throw ConfigurationError("pedestrian exit " + std::to_string(e) + " listed twice");
        }
    }

    for (int d : disabledSpaces_) {
        if (!inBounds(d)) {
            throw ConfigurationError("disabled bay " + std::to_string(d) +
                                     " is outside [0, " + std::to_string(total_) + ")");
        }
        if (exitSet_.count(d) != 0) {
            throw ConfigurationError("bay " + std::to_string(d) +
                                     " is both a pedestrian exit and a disabled bay");
        }
        if (!disabledSet_.insert(d).second) {
            throw ConfigurationError("disabled bay " + std::to_string(d) + " listed twice");
        }
    }

    bays_.assign(static_cast<std::size_t>(total_), Bay{});
    for (int e : pedestrianExits_) bays_[e].state = BayState::PedestrianExit;
    for (int d : disabledSpaces_)  bays_[d].state = BayState::DisabledFree;
}

// --------------------------------------------------------
// Queries
// --------------------------------------------------------

const Bay& BayGrid::at(int index) const
{
    if (!inBounds(index)) {
        throw InvalidBayIndex("bay " + std::to_string(index) +
                              " is outside [0, " + std::to_string(total_) + ")");
    }
    return bays_[index];
}

int BayGrid::availableBays() const
{
    return total_ - static_cast<int>(pedestrianExits_.size()) - parkedCars_;
}

int BayGrid::freeGeneralBays() const
{
    int n = 0;
    for (const auto& b : bays_) {
        if (b.state == BayState::Free) ++n;
    }
    return n;
}

int BayGrid::freeDisabledBays() const
{
    int n = 0;
    for (const auto& b : bays_) {
        if (b.state == BayState::DisabledFree) ++n;
    }
    return n;
}

// --------------------------------------------------------
// Mutation
// --------------------------------------------------------

void BayGrid::occupy(int index, char tag)
{
    Bay& b = bays_.at(static_cast<std::size_t>(index));
    switch (b.state) {
        case BayState::DisabledFree:
            b.state = BayState::DisabledTaken;
            break;
        case BayState::Free:
            b.state = BayState::Occupied;
            b.tag   = tag;
            break;
        default:
            throw std::logic_error("bay " + std::to_string(index) + " is not free");
    }
    ++parkedCars_;
}

void BayGrid::vacate(int index)
{
    Bay& b = bays_.at(static_cast<std::size_t>(index));
    switch (b.state) {
        case BayState::DisabledTaken:
            b.state = BayState::DisabledFree;
            break;
        case BayState::Occupied:
            b.state = BayState::Free;
            b.tag   = FREE_GLYPH;
            break;
        default:
            throw std::logic_error("bay " + std::to_string(index) + " is not occupied");
    }
    --parkedCars_;
}
