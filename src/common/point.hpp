#pragma once
#include "platform/interface/input.hpp"
#include <vector>

/**
 * A cell on the board or a pixel on the display, depending on the context.
 */
typedef struct Point {
        int x;
        int y;

        bool operator==(const Point &other) const
        {
                return x == other.x && y == other.y;
        }
        bool operator!=(const Point &other) const { return !(*this == other); }
} Point;

/**
 * Returns the point one cell away from `p` in direction `dir`.
 */
Point translate_pure(const Point &p, Direction dir);
/**
 * The four cells sharing an edge with `point`, ordered left, right, up, down.
 * They are not clipped to the board.
 */
std::vector<Point> get_adjacent_neighbours(const Point &point);
// Inclusive bounds: valid coordinates are 0 to size - 1.
bool is_inside_square_grid(const Point &p, int size);
bool is_adjacent(const Point &p1, const Point &p2);
