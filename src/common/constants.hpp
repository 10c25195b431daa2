/* Definitions of platform-specific constants that are commonly used by the
 * game screens.*/
#pragma once

#include "platform/interface/color.hpp"
#define FONT_SIZE 16
#define HEADING_FONT_SIZE 24

#define HEADING_FONT_WIDTH 15
#define FONT_WIDTH 10

#define SCREEN_BORDER_WIDTH 3

/* Constants below control time intervals between input polling */
#define INPUT_POLLING_DELAY 50
#define MOVE_REGISTERED_DELAY 100

/* The game loop ticks at 100 frames per second. */
#define GAME_LOOP_DELAY 10

constexpr int DISPLAY_HEIGHT = 680;
constexpr int DISPLAY_WIDTH = 640;
constexpr int DISPLAY_MARGIN = 40;

/* Colors of the game board, see `rgb_to_color` */
extern const Color SNAKE_HEAD_COLOR;
extern const Color SNAKE_TAIL_COLOR;
extern const Color FOOD_COLOR;
extern const Color BOARD_BACKGROUND_COLOR;
