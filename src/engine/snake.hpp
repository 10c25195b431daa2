#pragma once
#include "engine_types.hpp"
#include <vector>

namespace SnakeEngine
{

/**
 * The snake controlled by the player. The body is stored head first, i.e.
 * `body()[0]` is always the head and the last element is the tail.
 *
 * The snake knows nothing about the board: moving it off the board or into its
 * own body is allowed and it is up to the `GameEngine` to decide that the
 * match is over.
 */
class Snake
{
      public:
        /**
         * Creates a snake of length 3 pointing right, with its head placed at
         * (board_size / 4, board_size / 4) and the body extending to the left.
         * Both coordinates are at least 2 so that the tail starts at x >= 0.
         */
        explicit Snake(int board_size);

        /**
         * Returns true if the action cannot be applied given the current
         * heading: either it is `Idle` or it would make the snake turn back
         * onto itself.
         */
        bool is_move_invalid(AbsoluteAction action) const;

        /**
         * Moves the snake one cell. Invalid actions (see `is_move_invalid`) are
         * replaced by the current heading so that the snake keeps going
         * straight. If the new head lands on `food` the tail is kept and the
         * snake grows by one segment.
         *
         * @return true if the food was eaten during this move.
         */
        bool move(AbsoluteAction action, const Point &food);

        /**
         * Returns true if `point` is covered by the body. If `skip_head` is
         * set, the head segment is not considered.
         */
        bool occupies(const Point &point, bool skip_head = false) const;

        const Point &head() const { return body_.front(); }
        const Point &tail() const { return body_.back(); }
        const std::vector<Point> &body() const { return body_; }
        AbsoluteAction heading() const { return heading_; }
        int length() const { return length_; }

      private:
        std::vector<Point> body_;
        AbsoluteAction heading_;
        int length_;
};

} // namespace SnakeEngine
