#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

// --------------------------------------------------------
// Glyphs / reserved tags
// --------------------------------------------------------

constexpr char PEDESTRIAN_GLYPH     = '=';
constexpr char DISABLED_FREE_GLYPH  = '@';
constexpr char DISABLED_TAKEN_GLYPH = 'D';
constexpr char FREE_GLYPH           = 'U';

// the disabled-vehicle tag doubles as the "disabled bay taken" glyph
constexpr char DISABLED_VEHICLE     = DISABLED_TAKEN_GLYPH;

// --------------------------------------------------------
// Errors
// --------------------------------------------------------

struct ConfigurationError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

struct InvalidBayIndex : std::out_of_range {
    using std::out_of_range::out_of_range;
};

struct InvalidVehicleTag : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// --------------------------------------------------------
// Basic types
// --------------------------------------------------------

enum class BayState {
    PedestrianExit, // fixed, never allocatable
    DisabledFree,
    DisabledTaken,
    Free,
    Occupied        // general bay holding a vehicle tag
};

struct Bay {
    BayState state = BayState::Free;
    char     tag   = FREE_GLYPH; // only meaningful when Occupied
};

// How far the ring search keeps expanding once nothing has been found.
enum class RingTermination {
    AllExits, // until every exit has both candidates off the grid
    LastExit  // until the last registered exit has a candidate off the grid
};

bool isDisabledVehicle(char tag);
bool isReservedTag(char tag);

// Character used when drawing a bay ('=', '@', 'D', 'U' or the vehicle tag).
char bayGlyph(const Bay& bay);

// --------------------------------------------------------
// BayGrid: laneSize x laneSize bays stored row-major
// --------------------------------------------------------

class BayGrid {
public:
    // Throws ConfigurationError on a bad lane size or bad/overlapping indices.
    BayGrid(int laneSize,
            std::vector<int> pedestrianExits,
            std::vector<int> disabledSpaces,
            RingTermination termination = RingTermination::AllExits);

    int laneSize() const { return laneSize_; }
    int total() const { return total_; }
    int parkedCars() const { return parkedCars_; }
    RingTermination termination() const { return termination_; }

    const std::vector<int>& pedestrianExits() const { return pedestrianExits_; }
    const std::vector<int>& disabledSpaces() const { return disabledSpaces_; }

    bool inBounds(int index) const { return index >= 0 && index < total_; }
    bool isPedestrianExit(int index) const { return exitSet_.count(index) != 0; }
    bool isDisabledSpace(int index) const { return disabledSet_.count(index) != 0; }

    // Throws InvalidBayIndex when index is off the grid.
    const Bay& at(int index) const;

    // General capacity: disabled-only bays count as available for everyone.
    int availableBays() const;

    int freeGeneralBays() const;
    int freeDisabledBays() const;

    // Mutation primitives for the allocation engine. Both keep parkedCars in
    // step with the bay states and leave exit bays untouched.
    void occupy(int index, char tag);
    void vacate(int index);

private:
    int laneSize_ = 0;
    int total_    = 0;
    int parkedCars_ = 0;
    RingTermination termination_ = RingTermination::AllExits;

    std::vector<int> pedestrianExits_;
    std::vector<int> disabledSpaces_;
    std::unordered_set<int> exitSet_;
    std::unordered_set<int> disabledSet_;

    std::vector<Bay> bays_;
};
