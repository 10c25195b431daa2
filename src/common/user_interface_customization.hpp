#pragma once
#include "platform/interface/color.hpp"

/**
 * Look of the menus, shared by every screen of the human game.
 */
typedef struct UserInterfaceCustomization {
        // Selector dots, option bars, help frames and the board frame.
        Color accent_color;
        // Whether menus render the legend of the four buttons at the bottom.
        bool show_help_text;
} UserInterfaceCustomization;
