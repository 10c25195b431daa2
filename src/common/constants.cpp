#include "constants.hpp"

const Color SNAKE_HEAD_COLOR = rgb_to_color(42, 42, 42);
const Color SNAKE_TAIL_COLOR = rgb_to_color(152, 152, 152);
const Color FOOD_COLOR = rgb_to_color(200, 0, 0);
const Color BOARD_BACKGROUND_COLOR = rgb_to_color(225, 225, 225);
