#pragma once
#include "../common/configuration.hpp"
#include "../common/platform/interface/platform.hpp"
#include "../common/user_interface_customization.hpp"

/**
 * A screen that takes over the platform until the user leaves it. Returning
 * `UserAction::Exit` goes back to the main menu, `UserAction::CloseWindow`
 * needs to be propagated all the way up to `main`.
 */
class GameExecutor
{
      public:
        virtual std::optional<UserAction>
        game_loop(Platform *p, UserInterfaceCustomization *customization) = 0;

        virtual ~GameExecutor() = default;
};
