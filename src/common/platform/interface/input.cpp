#include "input.hpp"

const char *direction_to_str(Direction direction)
{
        static const char *names[] = {"Up", "Right", "Down", "Left"};
        if (direction < UP || direction > LEFT) {
                return "Unknown";
        }
        return names[direction];
}

const char *action_to_str(Action action)
{
        static const char *names[] = {"Yellow", "Red", "Green", "Blue"};
        if (action < YELLOW || action > BLUE) {
                return "Unknown";
        }
        return names[action];
}
