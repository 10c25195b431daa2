#pragma once
#include "../common/configuration.hpp"
#include "../common/platform/interface/controller.hpp"
#include "../common/platform/interface/platform.hpp"
#include "../common/user_interface_customization.hpp"

/**
 * Shows the game over screen. `details` is rendered below the heading (e.g.
 * the final score), it can be null.
 */
void display_game_over(Display *display,
                       UserInterfaceCustomization *customization,
                       const char *details);
void display_game_won(Display *display,
                      UserInterfaceCustomization *customization,
                      const char *details);

/**
 * Shows 'Game starts in' followed by a countdown from `seconds` down to 1,
 * one second per number.
 */
std::optional<UserAction> display_countdown(Platform *p, int seconds);

/**
 * Blocks until any input is registered. A pressed action button is written
 * into `*action`, after a directional input `*action` is left empty.
 */
std::optional<UserAction> pause_until_input(Platform *p,
                                            std::optional<Action> *action);
