#include "snake.hpp"
#include "../common/logging.hpp"

#include <algorithm>

#define TAG "snake"

namespace SnakeEngine
{

Snake::Snake(int board_size)
    : heading_(AbsoluteAction::Right), length_(INITIAL_SNAKE_LENGTH)
{
        // The tail has to start on the board too, small boards shift the
        // head away from the left edge.
        int start = std::max(board_size / 4, INITIAL_SNAKE_LENGTH - 1);
        Point head = {.x = start, .y = start};
        for (int i = 0; i < INITIAL_SNAKE_LENGTH; i++) {
                body_.push_back({.x = head.x - i, .y = head.y});
        }
}

bool Snake::is_move_invalid(AbsoluteAction action) const
{
        return action == AbsoluteAction::Idle ||
               is_forbidden_reversal(action, heading_);
}

bool Snake::move(AbsoluteAction action, const Point &food)
{
        if (is_move_invalid(action)) {
                LOG_TRACE(TAG, "Ignoring action %s, keeping heading %s",
                          absolute_action_to_str(action),
                          absolute_action_to_str(heading_));
        } else {
                heading_ = action;
        }

        Point new_head = translate_by(head(), heading_);
        body_.insert(body_.begin(), new_head);

        if (new_head == food) {
                length_ = body_.size();
                LOG_DEBUG(TAG, "Food eaten at {x: %d, y: %d}, length: %d",
                          food.x, food.y, length_);
                return true;
        }

        body_.pop_back();
        return false;
}

bool Snake::occupies(const Point &point, bool skip_head) const
{
        auto start = skip_head ? body_.begin() + 1 : body_.begin();
        return std::find(start, body_.end(), point) != body_.end();
}

} // namespace SnakeEngine
