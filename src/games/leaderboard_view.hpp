#pragma once
#include "../common/configuration.hpp"
#include "../common/platform/interface/platform.hpp"
#include "../engine/leaderboard.hpp"

#include <optional>
#include <string>

/**
 * Renders the leaderboard table and waits until the user dismisses it with the
 * green button. If `highlighted_rank` is set, that row is drawn in the accent
 * color.
 */
std::optional<UserAction>
display_leaderboard(Platform *p, UserInterfaceCustomization *customization,
                    const SnakeEngine::Leaderboard &leaderboard,
                    std::optional<int> highlighted_rank = std::nullopt);

/**
 * Lets the user pick three initials for a leaderboard entry using the option
 * menu. The initials are written into `name`.
 */
std::optional<UserAction>
collect_player_name(Platform *p, UserInterfaceCustomization *customization,
                    std::string *name);
