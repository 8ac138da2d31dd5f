#include <SFML/Graphics.hpp>
#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "allocation.hpp"
#include "lane_renderer.hpp"
#include "lot_config.hpp"
#include "ui.hpp"

using std::cout;
using std::cerr;

// --------------------------------------------------------
// Window constants
// --------------------------------------------------------

constexpr float MAX_GRID_PX  = 720.0f;
constexpr float MAX_CELL_PX  = 64.0f;
constexpr float MARGIN       = 40.0f;
constexpr float STATUS_H     = 40.0f;  // status line above the grid
constexpr float ARROW_W      = 40.0f;  // lane direction marker left of the grid

// --------------------------------------------------------
// Bay colours
// --------------------------------------------------------

sf::Color bayColor(const Bay& bay)
{
    switch (bay.state) {
        case BayState::PedestrianExit: return sf::Color(120, 170, 240);
        case BayState::DisabledFree:   return sf::Color(250, 225, 120);
        case BayState::DisabledTaken:  return sf::Color(230, 150, 40);
        case BayState::Free:           return sf::Color(245, 245, 245);
        case BayState::Occupied:       return sf::Color(150, 210, 150);
    }
    return sf::Color::White;
}

std::string statusLine(const BayGrid& grid)
{
    std::ostringstream s;
    s << "Available: " << grid.availableBays()
      << "    Parked: " << grid.parkedCars()
      << "    Free disabled: " << grid.freeDisabledBays()
      << "    (type a tag to park, click to unpark)";
    return s.str();
}

// --------------------------------------------------------
// Actions, echoed on the console
// --------------------------------------------------------

void parkFromKey(BayGrid& grid, char tag)
{
    try {
        auto bay = parkVehicle(grid, tag);
        if (bay) cout << "parked '" << tag << "' at bay " << *bay << "\n";
        else     cout << "no bay found for '" << tag << "'\n";
    } catch (const InvalidVehicleTag& e) {
        cerr << "ERROR: " << e.what() << "\n";
    }
}

void unparkFromClick(BayGrid& grid, int index)
{
    if (unparkVehicle(grid, index)) cout << "bay " << index << " freed\n";
    else                            cout << "nothing to remove at bay " << index << "\n";
}

int main(int argc, char** argv)
{
    // -------- 1) Lot description: layout file or setup window --------
    std::optional<LotConfig> cfg;
    if (argc > 1) {
        cfg = loadLotConfig(argv[1]);
        if (!cfg) {
            cerr << "ERROR: could not open layout file " << argv[1] << "\n";
            return 1;
        }
    } else {
        cfg = runUI();
        if (!cfg) {
            cout << "UI cancelled by user.\n";
            return 0;
        }
    }

    std::optional<BayGrid> grid;
    try {
        grid.emplace(makeGrid(*cfg));
    } catch (const ConfigurationError& e) {
        cerr << "ERROR: bad lot layout: " << e.what() << "\n";
        return 1;
    }

    const int n = grid->laneSize();
    cout << renderLanes(*grid);

    // ---------------- SFML window & scaling ----------------

    const float cell = std::min(MAX_CELL_PX, MAX_GRID_PX / static_cast<float>(n));
    const float gridX0 = MARGIN + ARROW_W;
    const float gridY0 = MARGIN + STATUS_H;

    unsigned int windowWidth  =
        static_cast<unsigned int>(std::max(gridX0 + n * cell + MARGIN, 760.0f));
    unsigned int windowHeight =
        static_cast<unsigned int>(gridY0 + n * cell + MARGIN);

    sf::RenderWindow window(
        sf::VideoMode(sf::Vector2u{windowWidth, windowHeight}),
        "Parking Lot"
    );
    window.setFramerateLimit(60);

    sf::Font font;
    loadSafeFont(font);

    const unsigned int glyphSize = static_cast<unsigned int>(cell * 0.55f);

    sf::Text statusText(font, statusLine(*grid), 16);
    statusText.setFillColor(sf::Color::Black);
    statusText.setPosition(sf::Vector2f{MARGIN, 10.f});

    // -------- 2) Render loop --------
    while (window.isOpen()) {
        while (const std::optional event = window.pollEvent()) {
            if (event->is<sf::Event::Closed>()) {
                window.close();
            }
            else if (const auto* key = event->getIf<sf::Event::KeyPressed>()) {
                if (key->code == sf::Keyboard::Key::Escape) window.close();
            }
            else if (const auto* te = event->getIf<sf::Event::TextEntered>()) {
                // printable ASCII only, Escape/Backspace also arrive here
                if (te->unicode > U' ' && te->unicode < 127) {
                    parkFromKey(*grid, static_cast<char>(te->unicode));
                    statusText.setString(statusLine(*grid));
                }
            }
            else if (const auto* mb = event->getIf<sf::Event::MouseButtonPressed>()) {
                if (mb->button != sf::Mouse::Button::Left) continue;
                const float mx = float(mb->position.x) - gridX0;
                const float my = float(mb->position.y) - gridY0;
                if (mx < 0.f || my < 0.f) continue;

                Cell c{ static_cast<int>(my / cell), static_cast<int>(mx / cell) };
                if (c.row >= n || c.col >= n) continue;

                unparkFromClick(*grid, snakeIndex(c, n));
                statusText.setString(statusLine(*grid));
            }
        }

        window.clear(sf::Color::White);
        window.draw(statusText);

        // lane direction markers
        for (int row = 0; row < n; ++row) {
            sf::Text arrow(font, (row % 2 == 0) ? ">" : "<", glyphSize);
            arrow.setFillColor(sf::Color(90, 90, 90));
            arrow.setPosition({MARGIN, gridY0 + row * cell + cell * 0.15f});
            window.draw(arrow);
        }

        for (int index = 0; index < grid->total(); ++index) {
            const Bay& bay = grid->at(index);
            const Cell c = snakeCell(index, n);
            const sf::Vector2f pos{ gridX0 + c.col * cell, gridY0 + c.row * cell };

            sf::RectangleShape r(sf::Vector2f{cell, cell});
            r.setPosition(pos);
            r.setFillColor(bayColor(bay));
            r.setOutlineThickness(1.0f);
            r.setOutlineColor(sf::Color(0, 0, 255)); // blueprint-style
            window.draw(r);

            sf::Text glyph(font, std::string(1, bayGlyph(bay)), glyphSize);
            glyph.setFillColor(sf::Color::Black);
            glyph.setPosition({pos.x + cell * 0.3f, pos.y + cell * 0.15f});
            window.draw(glyph);
        }

        window.display();
    }

    cout << renderLanes(*grid);
    return 0;
}
