#pragma once
#include "bay_grid.hpp"

#include <optional>
#include <string>
#include <vector>

// Lot description as read from a layout file or the setup form.
struct LotConfig {
    int laneSize = 0;
    std::vector<int> pedestrianExits;   // registration order matters
    std::vector<int> disabledSpaces;
    RingTermination termination = RingTermination::AllExits;
};

// Layout file (INI-ish, key = value, '#' or ';' comments):
//   lane_size       = 5
//   pedestrian_exit = 0, 12      (repeatable)
//   disabled_bay    = 6          (repeatable)
//   termination     = all_exits  (or last_exit)
// Unknown keys and bad values are reported on stderr and skipped.
// Returns std::nullopt if the file cannot be opened.
std::optional<LotConfig> loadLotConfig(const std::string& path);

// Same parser, reading from an in-memory string.
LotConfig parseLotConfig(const std::string& text);

// "3, 7,12" -> {3, 7, 12}. Returns false on anything that is not an integer.
bool parseIndexList(const std::string& text, std::vector<int>& out);

// Runs the description through GridBuilder (throws ConfigurationError).
BayGrid makeGrid(const LotConfig& cfg);
