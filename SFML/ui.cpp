#include "ui.hpp"
#include <SFML/Window/Event.hpp>
#include <iostream>
#include <vector>

// ---------------- Font loading (cross-platform) ----------------

bool loadSafeFont(sf::Font& font) {
    // monospace first so the bay glyphs line up
    if (font.openFromFile("assets/DejaVuSansMono.ttf")) return true;

#if defined(_WIN32)
    if (font.openFromFile("C:\\Windows\\Fonts\\consola.ttf")) return true;
    if (font.openFromFile("C:\\Windows\\Fonts\\arial.ttf")) return true;
#endif

#if defined(__APPLE__)
    if (font.openFromFile("/System/Library/Fonts/Menlo.ttc")) return true;
    if (font.openFromFile("/System/Library/Fonts/Supplemental/Arial.ttf")) return true;
#endif

#if defined(__linux__)
    if (font.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf")) return true;
    if (font.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf")) return true;
#endif

    std::cerr << "WARNING: no usable font found, text will not be drawn\n";
    return false;
}

// ---------------- Index list input box ----------------

class InputBox {
public:
    sf::RectangleShape box;
    sf::Text text;
    std::string value;
    bool active = false;

    InputBox(float x, float y, const sf::Font& font, const std::string& initial = "")
        : box({300.f, 40.f})
        , text(font, initial, 20)
        , value(initial)
    {
        box.setPosition({x, y});
        box.setFillColor(sf::Color(230, 230, 230));
        box.setOutlineThickness(2.f);
        box.setOutlineColor(sf::Color(120, 120, 120));

        text.setFillColor(sf::Color::Black);
        text.setPosition({x + 5.f, y + 7.f});
    }

    void setActive(bool on) {
        active = on;
        box.setOutlineColor(on ? sf::Color::Blue : sf::Color(120, 120, 120));
    }

    void handleText(char32_t code) {
        if (!active) return;

        // Backspace
        if (code == U'\b') {
            if (!value.empty()) {
                value.pop_back();
                text.setString(value);
            }
            return;
        }

        // Digits, commas and spaces ("0, 12")
        if ((code >= U'0' && code <= U'9') || code == U',' || code == U' ') {
            value += static_cast<char>(code);
            text.setString(value);
        }
    }

    bool clicked(float mx, float my) const {
        return box.getGlobalBounds().contains({mx, my});
    }

    void draw(sf::RenderWindow& window) const {
        window.draw(box);
        window.draw(text);
    }
};

// ---------------- Main UI window ----------------

std::optional<LotConfig> runUI() {
    sf::RenderWindow window(sf::VideoMode({720u, 460u}), "Parking Lot Setup");
    window.setFramerateLimit(60);

    sf::Font font;
    loadSafeFont(font);

    sf::Text title(font, "Parking Lot Setup", 32);
    title.setFillColor(sf::Color::White);
    title.setPosition({220.f, 15.f});

    sf::Text laneLabel(font, "Lane size (bays per lane)", 18);
    laneLabel.setFillColor(sf::Color::White);
    laneLabel.setPosition({40.f, 95.f});

    sf::Text exitLabel(font, "Pedestrian exits (0, 12, ...)", 18);
    exitLabel.setFillColor(sf::Color::White);
    exitLabel.setPosition({40.f, 165.f});

    sf::Text disabledLabel(font, "Disabled bays (6, ...)", 18);
    disabledLabel.setFillColor(sf::Color::White);
    disabledLabel.setPosition({40.f, 235.f});

    sf::Text errorText(font, "", 18);
    errorText.setFillColor(sf::Color(255, 110, 110));
    errorText.setPosition({40.f, 390.f});

    InputBox laneBox    (360.f, 90.f,  font, "5");
    InputBox exitBox    (360.f, 160.f, font, "0");
    InputBox disabledBox(360.f, 230.f, font, "");

    std::vector<InputBox*> boxes{ &laneBox, &exitBox, &disabledBox };

    // Start button
    sf::RectangleShape startBtn({180.f, 50.f});
    startBtn.setPosition({40.f, 310.f});
    startBtn.setFillColor(sf::Color(120, 200, 120));

    sf::Text startText(font, "Open Lot", 22);
    startText.setFillColor(sf::Color::Black);
    startText.setPosition({80.f, 320.f});

    // Initially focus lane size
    laneBox.setActive(true);

    while (window.isOpen()) {

        while (const std::optional<sf::Event> ev = window.pollEvent()) {

            if (ev->is<sf::Event::Closed>()) {
                window.close();
                return std::nullopt;
            }

            if (const auto* te = ev->getIf<sf::Event::TextEntered>()) {
                for (auto* b : boxes) b->handleText(te->unicode);
            }

            if (const auto* mb = ev->getIf<sf::Event::MouseButtonPressed>()) {
                float mx = float(mb->position.x);
                float my = float(mb->position.y);

                // focus follows the click, nothing focused when clicking outside
                for (auto* b : boxes) b->setActive(b->clicked(mx, my));

                if (startBtn.getGlobalBounds().contains({mx, my})) {
                    LotConfig cfg;
                    std::vector<int> lane;

                    if (!parseIndexList(laneBox.value, lane) || lane.size() != 1) {
                        errorText.setString("Lane size must be one number");
                    }
                    else if (!parseIndexList(exitBox.value, cfg.pedestrianExits) ||
                             !parseIndexList(disabledBox.value, cfg.disabledSpaces)) {
                        errorText.setString("Exits and disabled bays must be numbers");
                    }
                    else {
                        cfg.laneSize = lane.front();
                        try {
                            makeGrid(cfg); // validate before handing it over
                            window.close();
                            return cfg;
                        } catch (const ConfigurationError& e) {
                            std::cerr << "Invalid layout: " << e.what() << "\n";
                            errorText.setString(e.what());
                        }
                    }
                }
            }
        }

        // DRAW
        window.clear(sf::Color(40, 40, 40));

        window.draw(title);
        window.draw(laneLabel);
        window.draw(exitLabel);
        window.draw(disabledLabel);

        for (auto* b : boxes) b->draw(window);

        window.draw(startBtn);
        window.draw(startText);
        window.draw(errorText);

        window.display();
    }

    return std::nullopt;
}
