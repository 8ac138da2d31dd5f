#include "lot_config.hpp"
#include "grid_builder.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

std::string trim(const std::string& s)
{
    auto b = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
    auto e = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (b < e) ? std::string(b, e) : std::string();
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseInt(const std::string& v, int& out)
{
    const std::string s = trim(v);
    if (s.empty()) return false;
    const char* b = s.data();
    const char* e = s.data() + s.size();
    auto res = std::from_chars(b, e, out);
    return res.ec == std::errc() && res.ptr == e;
}

} // namespace

bool parseIndexList(const std::string& text, std::vector<int>& out)
{
    std::vector<int> parsed;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (trim(item).empty()) continue;
        int v = 0;
        if (!parseInt(item, v)) return false;
        parsed.push_back(v);
    }
    out.insert(out.end(), parsed.begin(), parsed.end());
    return true;
}

LotConfig parseLotConfig(const std::string& text)
{
    LotConfig cfg;

    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;

        // Strip comments (# or ;)
        const auto cut = line.find_first_of("#;");
        if (cut != std::string::npos) line.erase(cut);

        line = trim(line);
        if (line.empty()) continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "WARNING: layout line " << lineNo << " has no '=', skipped\n";
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        if (key == "lane_size") {
            int v = 0;
            if (parseInt(val, v)) cfg.laneSize = v;
            else std::cerr << "WARNING: lane_size '" << val << "' is not a number\n";
        } else if (key == "pedestrian_exit") {
            if (!parseIndexList(val, cfg.pedestrianExits))
                std::cerr << "WARNING: pedestrian_exit '" << val << "' is not a list of numbers\n";
        } else if (key == "disabled_bay") {
            if (!parseIndexList(val, cfg.disabledSpaces))
                std::cerr << "WARNING: disabled_bay '" << val << "' is not a list of numbers\n";
        } else if (key == "termination") {
            const std::string v = toLower(val);
            if (v == "all_exits")      cfg.termination = RingTermination::AllExits;
            else if (v == "last_exit") cfg.termination = RingTermination::LastExit;
            else std::cerr << "WARNING: unknown termination '" << val << "'\n";
        } else {
            std::cerr << "WARNING: unknown layout key '" << key << "'\n";
        }
    }

    return cfg;
}

std::optional<LotConfig> loadLotConfig(const std::string& path)
{
    std::ifstream f(path);
    if (!f) return std::nullopt;

    std::ostringstream buf;
    buf << f.rdbuf();
    return parseLotConfig(buf.str());
}

BayGrid makeGrid(const LotConfig& cfg)
{
    GridBuilder b;
    b.withLaneSize(cfg.laneSize).withTermination(cfg.termination);
    for (int e : cfg.pedestrianExits) b.withPedestrianExit(e);
    for (int d : cfg.disabledSpaces)  b.withDisabledBay(d);
    return b.build();
}
