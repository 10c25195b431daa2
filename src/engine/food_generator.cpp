#include "food_generator.hpp"
#include "../common/logging.hpp"

#include <algorithm>
#include <set>
#include <utility>

#define TAG "food_generator"

namespace SnakeEngine
{

FoodGenerator::FoodGenerator(int board_size, std::mt19937 &random_engine,
                             const std::vector<Point> &body)
    : board_size_(board_size), random_engine_(random_engine),
      position_({.x = 0, .y = 0}), is_food_on_screen_(false)
{
        generate_food(body);
}

/**
 * Counts distinct cells of the board covered by the body. Segments outside of
 * the board (the head right after a wall collision) are ignored.
 */
static int count_covered_cells(const std::vector<Point> &body, int board_size)
{
        std::set<std::pair<int, int>> covered;
        for (const Point &segment : body) {
                if (is_inside_square_grid(segment, board_size)) {
                        covered.insert({segment.x, segment.y});
                }
        }
        return covered.size();
}

Point FoodGenerator::generate_food(const std::vector<Point> &body)
{
        if (is_food_on_screen_) {
                return position_;
        }

        if (count_covered_cells(body, board_size_) >=
            board_size_ * board_size_) {
                LOG_WARN(TAG, "No free cell left on a %dx%d board",
                         board_size_, board_size_);
                throw BoardFullError("every cell of the board is occupied");
        }

        std::uniform_int_distribution<int> coordinate(0, board_size_ - 1);
        int attempts = 0;
        while (true) {
                Point candidate = {.x = coordinate(random_engine_),
                                   .y = coordinate(random_engine_)};
                attempts++;
                if (std::find(body.begin(), body.end(), candidate) ==
                    body.end()) {
                        position_ = candidate;
                        break;
                }
        }

        is_food_on_screen_ = true;
        LOG_DEBUG(TAG, "Food appeared at {x: %d, y: %d} after %d draw(s)",
                  position_.x, position_.y, attempts);
        return position_;
}

void FoodGenerator::consume() { is_food_on_screen_ = false; }

} // namespace SnakeEngine
