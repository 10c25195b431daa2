#include "font_provider.hpp"
#include "gridsnake_config.h"

const sf::Font &get_emulator_font()
{
        static const sf::Font font(GRIDSNAKE_FONT_PATH);
        return font;
}
