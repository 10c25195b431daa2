#pragma once

#include "input.hpp"
#include <optional>
#include <vector>

/**
 * Source of the four directional inputs (joystick, arrow keys, ...).
 */
class DirectionalController
{
      public:
        /**
         * Checks the state of the controller at this instant, it does not wait
         * for input. Returns true and writes `input` if a direction is being
         * entered, otherwise `input` is left unchanged.
         */
        virtual bool poll_for_input(Direction *input) = 0;

        /**
         * Called once before the first menu is shown.
         */
        virtual void setup() = 0;

        virtual ~DirectionalController() = default;
};

/**
 * Source of the four coloured action buttons.
 */
class ActionController
{
      public:
        virtual bool poll_for_input(Action *input) = 0;

        virtual void setup() = 0;

        virtual ~ActionController() = default;
};

/**
 * Polls every controller once. If several of them register input, the one
 * polled last wins. Absence of input is `std::nullopt`.
 */
std::optional<Direction>
poll_directional_input(std::vector<DirectionalController *> *controllers);

std::optional<Action>
poll_action_input(std::vector<ActionController *> *controllers);
