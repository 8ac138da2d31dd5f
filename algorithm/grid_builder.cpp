#include "grid_builder.hpp"

GridBuilder& GridBuilder::withLaneSize(int laneSize)
{
    laneSize_ = laneSize;
    return *this;
}

GridBuilder& GridBuilder::withPedestrianExit(int index)
{
    pedestrianExits_.push_back(index);
    return *this;
}

GridBuilder& GridBuilder::withDisabledBay(int index)
{
    disabledSpaces_.push_back(index);
    return *this;
}

GridBuilder& GridBuilder::withTermination(RingTermination termination)
{
    termination_ = termination;
    return *this;
}

BayGrid GridBuilder::build() const
{
    return BayGrid(laneSize_, pedestrianExits_, disabledSpaces_, termination_);
}
