#pragma once
#include "../common/configuration.hpp"
#include "../common/platform/interface/platform.hpp"
#include "snake_configuration.hpp"

#include <optional>

/**
 * Renders the main menu, lets the user pick the mode and the game settings
 * and runs the selected mode. Returns once the user leaves that mode; the
 * caller is expected to call it again in a loop until
 * `UserAction::CloseWindow` is returned.
 */
std::optional<UserAction> select_game(Platform *p);

/**
 * Builds the main menu options (mode, speed, board, matches) with the values
 * of `initial_config` preselected. The caller owns the returned configuration
 * and releases it with `free_configuration`.
 */
Configuration *
assemble_snake_configuration(const SnakeConfiguration &initial_config);
void extract_game_config(SnakeConfiguration *game_config,
                         Configuration *config);

/**
 * Similar to `collect_configuration` from `configuration.hpp`. The settings
 * stored by the previous session are used as the initial values and the
 * confirmed settings are saved back to the persistent storage. This is the
 * main menu so the blue button does not leave it.
 */
std::optional<UserAction>
collect_snake_config(Platform *p, SnakeConfiguration *game_config,
                     UserInterfaceCustomization *customization);
