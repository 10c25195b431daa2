#include "snake_rendering.hpp"
#include "../common/constants.hpp"
#include "../common/logging.hpp"

#include <algorithm>
#include <cstdio>

#define TAG "snake_rendering"

std::vector<Color> snake_body_gradient(int length)
{
        return color_gradient(SNAKE_HEAD_COLOR, SNAKE_TAIL_COLOR, length);
}

void render_board(Display *display, const SquareCellGridDimensions &dimensions,
                  const SnakeEngine::GameEngine &engine,
                  const std::vector<Color> &gradient)
{
        display->draw_rectangle({.x = dimensions.left_horizontal_margin,
                                 .y = dimensions.top_vertical_margin},
                                dimensions.actual_width,
                                dimensions.actual_height,
                                BOARD_BACKGROUND_COLOR, 0, true);

        // The food stays at the head position until the next step after it
        // was eaten, drawing it first lets the head cover it.
        render_food(display, dimensions, engine.food_position());

        const std::vector<Point> &body = engine.snake().body();
        // Segments are drawn tail first so that the head ends up on top.
        for (int i = body.size() - 1; i > 0; i--) {
                if (is_out_of_bounds(body[i], dimensions)) {
                        continue;
                }
                Color color = i < (int)gradient.size() ? gradient[i]
                                                       : SNAKE_TAIL_COLOR;
                render_snake_segment(display, dimensions, body[i], color);
        }
        if (!is_out_of_bounds(body[0], dimensions)) {
                render_head(display, dimensions, body[0], engine.heading(),
                            gradient.empty() ? SNAKE_HEAD_COLOR : gradient[0]);
        }
}

void render_snake_segment(Display *display,
                          const SquareCellGridDimensions &dimensions,
                          const Point &location, Color color)
{
        Point start = cell_origin(dimensions, location);
        display->draw_rectangle(start, dimensions.cell_width,
                                dimensions.cell_width, color, 0, true);
}

void render_head(Display *display, const SquareCellGridDimensions &dimensions,
                 const Point &head, SnakeEngine::AbsoluteAction heading,
                 Color color)
{
        using SnakeEngine::AbsoluteAction;

        render_snake_segment(display, dimensions, head, color);

        int width = dimensions.cell_width;
        // On very small cells the eye would cover the whole head.
        if (width < 6) {
                return;
        }

        Point start = cell_origin(dimensions, head);
        Point cell_center = {.x = start.x + width / 2,
                             .y = start.y + width / 2};

        // The eye sits halfway between the center and the front edge.
        Point eye_offset = {.x = 0, .y = 0};
        switch (heading) {
        case AbsoluteAction::Up:
                eye_offset = {.x = 0, .y = -width / 4};
                break;
        case AbsoluteAction::Down:
                eye_offset = {.x = 0, .y = width / 4};
                break;
        case AbsoluteAction::Left:
                eye_offset = {.x = -width / 4, .y = 0};
                break;
        case AbsoluteAction::Right:
        case AbsoluteAction::Idle:
                eye_offset = {.x = width / 4, .y = 0};
                break;
        }

        Point eye_center = {.x = cell_center.x + eye_offset.x,
                            .y = cell_center.y + eye_offset.y};
        display->draw_circle(eye_center, std::max(1, width / 8), White, 0,
                             true);
}

void render_food(Display *display, const SquareCellGridDimensions &dimensions,
                 const Point &location)
{
        Point start = cell_origin(dimensions, location);
        display->draw_rectangle(start, dimensions.cell_width,
                                dimensions.cell_width, FOOD_COLOR, 0, true);
}

void update_score(Platform *p, const SquareCellGridDimensions &dimensions,
                  int score_text_end_location, int score)
{
        char buffer[5];
        snprintf(buffer, sizeof(buffer), "%4d", score);
        // The 'Score:' text is rendered centered with exactly 4 trailing
        // spaces reserved for the digits, so we start rendering them 4
        // characters before the end of that text.
        int start_position = score_text_end_location - 4 * FONT_WIDTH;
        render_text_above_frame_starting_from(p, dimensions, buffer,
                                              start_position, true);
}
