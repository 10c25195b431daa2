#pragma once
#include "../common/grid.hpp"
#include "../engine/game_engine.hpp"

#include <vector>

/**
 * Colors of the snake body from the head to the tail. The gradient needs to be
 * recomputed each time the snake grows.
 */
std::vector<Color> snake_body_gradient(int length);

/**
 * Redraws the entire board: background, the snake with its body colored by
 * `gradient` (head first) and the food.
 */
void render_board(Display *display, const SquareCellGridDimensions &dimensions,
                  const SnakeEngine::GameEngine &engine,
                  const std::vector<Color> &gradient);

void render_snake_segment(Display *display,
                          const SquareCellGridDimensions &dimensions,
                          const Point &location, Color color);

/**
 * Renders the head of the snake. It is a regular segment with an eye looking
 * in the direction of movement.
 */
void render_head(Display *display, const SquareCellGridDimensions &dimensions,
                 const Point &head, SnakeEngine::AbsoluteAction heading,
                 Color color);

void render_food(Display *display, const SquareCellGridDimensions &dimensions,
                 const Point &location);

/**
 * Re-renders the text location above the grid informing the user about the
 * current score in the game.
 */
void update_score(Platform *p, const SquareCellGridDimensions &dimensions,
                  int score_text_end_location, int score);
