#pragma once
#include <SFML/Graphics.hpp>

/**
 * Returns the font used for all text rendered by the emulator. The font is
 * loaded from `GRIDSNAKE_FONT_PATH` on the first call, `sf::Exception` is
 * thrown if it cannot be opened.
 */
const sf::Font &get_emulator_font();
