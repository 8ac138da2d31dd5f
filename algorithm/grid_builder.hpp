#pragma once
#include "bay_grid.hpp"

#include <vector>

// Collects the lot description in any order, then builds the grid.
// build() throws ConfigurationError for an invalid description.
class GridBuilder {
public:
    GridBuilder& withLaneSize(int laneSize);
    GridBuilder& withPedestrianExit(int index);
    GridBuilder& withDisabledBay(int index);
    GridBuilder& withTermination(RingTermination termination);

    BayGrid build() const;

private:
    int laneSize_ = 0;
    std::vector<int> pedestrianExits_;
    std::vector<int> disabledSpaces_;
    RingTermination termination_ = RingTermination::AllExits;
};
