#include "grid.hpp"
#include "constants.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cstring>

#define TAG "grid"

#define EXPLANATION_ABOVE_GRID_OFFSET 4

SquareCellGridDimensions calculate_grid_dimensions(int display_width,
                                                   int display_height,
                                                   int display_margin,
                                                   int board_size)
{
        // Bind input params to short names for improved readability.
        int w = display_width;
        int h = display_height;
        int m = display_margin;

        int usable_width = w - 2 * m;
        // We leave one additional margin at the top for the score text.
        int usable_height = h - 3 * m;

        int cell_width =
            std::max(1, std::min(usable_width, usable_height) / board_size);

        int actual_width = board_size * cell_width;
        int actual_height = board_size * cell_width;

        // Margins are required for centering.
        int left_horizontal_margin = (w - actual_width) / 2;
        int top_vertical_margin = (h - actual_height + m) / 2;

        LOG_DEBUG(TAG,
                  "Calculated grid dimensions: %d rows, %d cols, "
                  "cell width: %d, left margin: %d, top margin: %d, "
                  "actual width: %d, actual height: %d",
                  board_size, board_size, cell_width, left_horizontal_margin,
                  top_vertical_margin, actual_width, actual_height);

        return {.rows = board_size,
                .cols = board_size,
                .cell_width = cell_width,
                .top_vertical_margin = top_vertical_margin,
                .left_horizontal_margin = left_horizontal_margin,
                .actual_width = actual_width,
                .actual_height = actual_height};
}

void draw_grid_frame(Platform *p, UserInterfaceCustomization *customization,
                     const SquareCellGridDimensions &dimensions,
                     Color background)
{
        p->display->initialize();
        p->display->clear(Black);

        int x_margin = dimensions.left_horizontal_margin;
        int y_margin = dimensions.top_vertical_margin;

        int border_width = 1;
        // The border is drawn slightly outside of the game area, otherwise
        // redrawing the cells on the edge would erase parts of it.
        int border_offset = 2;

        p->display->draw_rectangle(
            {.x = x_margin - border_offset, .y = y_margin - border_offset},
            dimensions.actual_width + 2 * border_offset,
            dimensions.actual_height + 2 * border_offset,
            customization->accent_color, border_width, false);

        p->display->draw_rectangle({.x = x_margin, .y = y_margin},
                                   dimensions.actual_width,
                                   dimensions.actual_height, background, 0,
                                   true);
}

static int text_above_grid_y(const SquareCellGridDimensions &dimensions)
{
        int border_offset = 2;
        return dimensions.top_vertical_margin - border_offset - FONT_SIZE -
               EXPLANATION_ABOVE_GRID_OFFSET;
}

int render_centered_text_above_frame(Platform *p,
                                     const SquareCellGridDimensions &dimensions,
                                     const char *text)
{
        int x_margin = dimensions.left_horizontal_margin;
        int available_width = p->display->get_width() - 2 * x_margin;

        int text_pixel_len = strlen(text) * FONT_WIDTH;
        int centering_margin = (available_width - text_pixel_len) / 2;

        int text_x = x_margin + centering_margin;
        p->display->draw_string({.x = text_x, .y = text_above_grid_y(dimensions)},
                                text, FontSize::Size16, Black, White);

        return text_x + text_pixel_len;
}

int render_text_above_frame_starting_from(
    Platform *p, const SquareCellGridDimensions &dimensions, const char *text,
    int position, bool erase_previous)
{
        int y = text_above_grid_y(dimensions);
        int text_pixel_len = strlen(text) * FONT_WIDTH;
        if (erase_previous) {
                p->display->clear_region(
                    {.x = position, .y = y},
                    {.x = position + text_pixel_len, .y = y + FONT_SIZE},
                    Black);
        }
        p->display->draw_string({.x = position, .y = y}, text,
                                FontSize::Size16, Black, White);

        return position + text_pixel_len;
}

Point cell_origin(const SquareCellGridDimensions &dimensions,
                  const Point &location)
{
        return {.x = dimensions.left_horizontal_margin +
                     location.x * dimensions.cell_width,
                .y = dimensions.top_vertical_margin +
                     location.y * dimensions.cell_width};
}

bool is_out_of_bounds(const Point &p,
                      const SquareCellGridDimensions &dimensions)
{
        return p.x < 0 || p.y < 0 || p.x >= dimensions.cols ||
               p.y >= dimensions.rows;
}
