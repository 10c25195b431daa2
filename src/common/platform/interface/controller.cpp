#include "controller.hpp"

std::optional<Direction>
poll_directional_input(std::vector<DirectionalController *> *controllers)
{
        std::optional<Direction> registered;
        for (DirectionalController *controller : *controllers) {
                Direction direction;
                if (controller->poll_for_input(&direction)) {
                        registered = direction;
                }
        }
        return registered;
}

std::optional<Action>
poll_action_input(std::vector<ActionController *> *controllers)
{
        std::optional<Action> registered;
        for (ActionController *controller : *controllers) {
                Action action;
                if (controller->poll_for_input(&action)) {
                        registered = action;
                }
        }
        return registered;
}
