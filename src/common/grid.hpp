#pragma once
#include "platform/interface/platform.hpp"
#include "user_interface_customization.hpp"

/**
 * Stores all information required for rendering a square grid of cells on the
 * display: the number of rows and columns, the pixel width of a single cell
 * and the margins that center the grid on the screen.
 */
typedef struct SquareCellGridDimensions {
        int rows;
        int cols;
        int cell_width;
        int top_vertical_margin;
        int left_horizontal_margin;
        int actual_width;
        int actual_height;
} SquareCellGridDimensions;

/**
 * Lays out a `board_size` x `board_size` grid inside of the display leaving
 * `display_margin` pixels free on every side. The cells are as large as
 * possible while still being square.
 */
SquareCellGridDimensions calculate_grid_dimensions(int display_width,
                                                   int display_height,
                                                   int display_margin,
                                                   int board_size);

void draw_grid_frame(Platform *p, UserInterfaceCustomization *customization,
                     const SquareCellGridDimensions &dimensions,
                     Color background);

/**
 * Renders text above the grid frame.
 *
 * @return pixel location of the end of the text. Useful for rendering other
 * things behind the centered text (e.g. incrementable score count).
 */
int render_centered_text_above_frame(Platform *p,
                                     const SquareCellGridDimensions &dimensions,
                                     const char *text);
/**
 * Renders text above the grid frame starting from the supplied pixel position
 */
int render_text_above_frame_starting_from(
    Platform *p, const SquareCellGridDimensions &dimensions, const char *text,
    int position, bool erase_previous = false);

/**
 * Returns the pixel position of the top left corner of the cell at `location`.
 */
Point cell_origin(const SquareCellGridDimensions &dimensions,
                  const Point &location);

bool is_out_of_bounds(const Point &p,
                      const SquareCellGridDimensions &dimensions);
