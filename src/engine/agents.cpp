#include "agents.hpp"

#include <cstdlib>
#include <vector>

namespace SnakeEngine
{

int RandomAgent::select_action(const GameEngine &engine)
{
        std::uniform_int_distribution<int> action(0, engine.action_space() - 1);
        return action(random_engine);
}

/**
 * Returns true if moving the head of the snake one cell in `direction` would
 * end the match. The tail moves away during the same step unless food is
 * eaten, but the engine reports it as a collision anyway, so we treat it as
 * fatal too.
 */
static bool is_fatal(const GameEngine &engine, AbsoluteAction direction)
{
        const Snake &snake = engine.snake();
        Point next = translate_by(snake.head(), direction);
        return !is_inside_square_grid(next,
                                      engine.configuration().board_size) ||
               snake.occupies(next, true);
}

int GreedyAgent::select_action(const GameEngine &engine)
{
        const Point &head = engine.snake().head();
        const Point &food = engine.food_position();
        AbsoluteAction heading = engine.heading();

        int dx = food.x - head.x;
        int dy = food.y - head.y;

        AbsoluteAction horizontal =
            dx < 0 ? AbsoluteAction::Left : AbsoluteAction::Right;
        AbsoluteAction vertical =
            dy < 0 ? AbsoluteAction::Up : AbsoluteAction::Down;

        std::vector<AbsoluteAction> preferences;
        if (std::abs(dx) >= std::abs(dy)) {
                if (dx != 0)
                        preferences.push_back(horizontal);
                if (dy != 0)
                        preferences.push_back(vertical);
        } else {
                preferences.push_back(vertical);
                if (dx != 0)
                        preferences.push_back(horizontal);
        }
        // Fallbacks once the direct routes are blocked.
        preferences.insert(preferences.end(),
                           {heading, AbsoluteAction::Left,
                            AbsoluteAction::Right, AbsoluteAction::Up,
                            AbsoluteAction::Down});

        for (AbsoluteAction candidate : preferences) {
                if (is_forbidden_reversal(candidate, heading)) {
                        continue;
                }
                if (!is_fatal(engine, candidate)) {
                        return encode_action(engine, candidate);
                }
        }
        // Every move is fatal, keep going straight.
        return encode_action(engine, heading);
}

int encode_action(const GameEngine &engine, AbsoluteAction desired)
{
        if (!engine.configuration().relative_actions) {
                return static_cast<int>(desired);
        }

        AbsoluteAction heading = engine.heading();
        for (RelativeAction relative :
             {RelativeAction::Left, RelativeAction::Forward,
              RelativeAction::Right}) {
                if (relative_to_absolute(relative, heading) == desired) {
                        return static_cast<int>(relative);
                }
        }
        return static_cast<int>(RelativeAction::Forward);
}

} // namespace SnakeEngine
