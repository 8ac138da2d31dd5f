#pragma once
#include "bay_grid.hpp"

#include <iosfwd>
#include <string>

void printHelp(std::ostream& out);

// Run one command line ("park A", "unpark 3", "show", ...).
// Results go to out, "ERROR: ..." lines to err.
// Returns false when the user asked to quit.
bool runCommand(BayGrid& grid, const std::string& line, std::ostream& out, std::ostream& err);

// Feed every line of in to runCommand until "quit" or end of input.
// Bad tags and bay indices are reported and the loop carries on.
void runConsole(BayGrid& grid, std::istream& in, std::ostream& out, std::ostream& err);
