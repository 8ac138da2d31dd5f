#include "console.hpp"
#include "allocation.hpp"
#include "lane_renderer.hpp"

#include <istream>
#include <ostream>
#include <sstream>

void printHelp(std::ostream& out) {
    out << "Commands:\n"
        << "  park <tag>      park a vehicle ('D' = disabled)\n"
        << "  unpark <index>  free a bay\n"
        << "  show            draw the lot\n"
        << "  available       number of available bays\n"
        << "  quit\n";
}

bool runCommand(BayGrid& grid, const std::string& line, std::ostream& out, std::ostream& err) {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd)) return true;

    if (cmd == "quit" || cmd == "exit") {
        return false;
    }
    if (cmd == "help") {
        printHelp(out);
    }
    else if (cmd == "show") {
        out << renderLanes(grid);
    }
    else if (cmd == "available") {
        out << grid.availableBays() << " available ("
            << grid.freeGeneralBays() << " general, "
            << grid.freeDisabledBays() << " disabled)\n";
    }
    else if (cmd == "park") {
        std::string tag;
        if (!(in >> tag) || tag.size() != 1) {
            err << "ERROR: park needs a one-character vehicle tag\n";
            return true;
        }
        auto bay = parkVehicle(grid, tag[0]);
        if (bay) out << "parked '" << tag << "' at bay " << *bay << "\n";
        else     out << "no bay found for '" << tag << "'\n";
    }
    else if (cmd == "unpark") {
        int index = 0;
        if (!(in >> index)) {
            err << "ERROR: unpark needs a bay index\n";
            return true;
        }
        if (unparkVehicle(grid, index)) out << "bay " << index << " freed\n";
        else                            out << "nothing to remove at bay " << index << "\n";
    }
    else {
        err << "ERROR: unknown command '" << cmd << "' (try help)\n";
    }
    return true;
}

void runConsole(BayGrid& grid, std::istream& in, std::ostream& out, std::ostream& err) {
    std::string line;
    while (std::getline(in, line)) {
        try {
            if (!runCommand(grid, line, out, err)) break;
        } catch (const InvalidVehicleTag& e) {
            err << "ERROR: " << e.what() << "\n";
        } catch (const InvalidBayIndex& e) {
            err << "ERROR: " << e.what() << "\n";
        }
    }
}
