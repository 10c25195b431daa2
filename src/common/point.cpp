#include "point.hpp"
#include <cstdlib>

Point translate_pure(const Point &p, Direction dir)
{
        // Indexed by `Direction`, the y axis grows downwards.
        static const Point offsets[] = {{.x = 0, .y = -1},
                                        {.x = 1, .y = 0},
                                        {.x = 0, .y = 1},
                                        {.x = -1, .y = 0}};
        const Point &offset = offsets[dir];
        return {.x = p.x + offset.x, .y = p.y + offset.y};
}

std::vector<Point> get_adjacent_neighbours(const Point &point)
{
        std::vector<Point> neighbours;
        for (Direction dir : {LEFT, RIGHT, UP, DOWN}) {
                neighbours.push_back(translate_pure(point, dir));
        }
        return neighbours;
}

bool is_inside_square_grid(const Point &p, int size)
{
        return 0 <= p.x && p.x < size && 0 <= p.y && p.y < size;
}

bool is_adjacent(const Point &p1, const Point &p2)
{
        int manhattan_distance = std::abs(p1.x - p2.x) + std::abs(p1.y - p2.y);
        return manhattan_distance == 1;
}
