#pragma once
#include "engine_types.hpp"
#include <random>
#include <vector>

namespace SnakeEngine
{

/**
 * Keeps track of the single piece of food present on the board.
 *
 * Food is placed using rejection sampling: random cells are drawn until one
 * that is not covered by the snake is found. The number of draws is unbounded
 * and grows as the snake fills the board, which is acceptable for boards up to
 * roughly 50x50. A board that is completely covered is reported with
 * `BoardFullError` instead of looping forever.
 */
class FoodGenerator
{
      public:
        /**
         * Creates the generator and immediately places the first piece of
         * food outside of `body`. The random engine is owned by the caller and
         * needs to outlive the generator.
         */
        FoodGenerator(int board_size, std::mt19937 &random_engine,
                      const std::vector<Point> &body);

        /**
         * Returns the position of the food. If the food is still on the board
         * its position is returned unchanged, otherwise a new position outside
         * of `body` is drawn.
         *
         * @throws BoardFullError if `body` covers every cell of the board.
         */
        Point generate_food(const std::vector<Point> &body);

        /**
         * Marks the food as eaten, the next call to `generate_food` relocates
         * it.
         */
        void consume();

        bool is_food_on_screen() const { return is_food_on_screen_; }
        const Point &position() const { return position_; }

      private:
        int board_size_;
        std::mt19937 &random_engine_;
        Point position_;
        bool is_food_on_screen_;
};

} // namespace SnakeEngine
