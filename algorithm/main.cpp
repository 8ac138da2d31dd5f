#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "console.hpp"
#include "lane_renderer.hpp"
#include "lot_config.hpp"

using std::cout;
using std::cerr;
using std::cin;

//Ask for the lot description on stdin
//returns nullopt if input ran out or was not understood
std::optional<LotConfig> promptLotConfig() {
    LotConfig cfg;
    std::string line;

    cout << "Enter lane size: ";
    if (!std::getline(cin, line)) return std::nullopt;
    std::vector<int> size;
    if (!parseIndexList(line, size) || size.size() != 1) {
        cerr << "ERROR: lane size must be a single number\n";
        return std::nullopt;
    }
    cfg.laneSize = size.front();

    cout << "Enter pedestrian exit indices (comma separated, blank for none): ";
    if (!std::getline(cin, line)) return std::nullopt;
    if (!parseIndexList(line, cfg.pedestrianExits)) {
        cerr << "ERROR: pedestrian exits must be numbers\n";
        return std::nullopt;
    }

    cout << "Enter disabled bay indices (comma separated, blank for none): ";
    if (!std::getline(cin, line)) return std::nullopt;
    if (!parseIndexList(line, cfg.disabledSpaces)) {
        cerr << "ERROR: disabled bays must be numbers\n";
        return std::nullopt;
    }

    return cfg;
}

//main program
int main(int argc, char** argv) {
    std::optional<LotConfig> cfg;

    if (argc > 1) {
        cfg = loadLotConfig(argv[1]);
        if (!cfg) {
            cerr << "ERROR: could not open layout file " << argv[1] << "\n";
            return 1;
        }
    } else {
        cfg = promptLotConfig();
        if (!cfg) return 1;
    }

    std::optional<BayGrid> grid;
    try {
        grid.emplace(makeGrid(*cfg));
    } catch (const ConfigurationError& e) {
        cerr << "ERROR: bad lot layout: " << e.what() << "\n";
        return 1;
    }

    cout << "Lot ready: " << grid->laneSize() << "x" << grid->laneSize()
         << ", " << grid->availableBays() << " bays available\n";
    cout << renderLanes(*grid);

    runConsole(*grid, cin, cout, cerr);

    return 0;
}
