#pragma once
#include <SFML/Graphics.hpp>
#include <optional>
#include <string>

#include "lot_config.hpp"

// Try a bunch of font locations so it works on Windows/macOS/Linux.
// Returns false if none could be opened.
bool loadSafeFont(sf::Font& font);

// Setup window: lane size, pedestrian exits and disabled bays.
// Returns the lot description or std::nullopt if the window was closed.
std::optional<LotConfig> runUI();
