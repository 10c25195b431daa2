#include "leaderboard_view.hpp"
#include "../common/constants.hpp"
#include "../common/logging.hpp"
#include "../common/user_interface.hpp"

#include <cstdio>
#include <vector>

#define TAG "leaderboard_view"

#define PLAYER_INITIALS 3

static const std::vector<const char *> LETTERS = {
    "A", "B", "C", "D", "E", "F", "G", "H", "I", "J", "K", "L", "M",
    "N", "O", "P", "Q", "R", "S", "T", "U", "V", "W", "X", "Y", "Z"};

std::optional<UserAction>
display_leaderboard(Platform *p, UserInterfaceCustomization *customization,
                    const SnakeEngine::Leaderboard &leaderboard,
                    std::optional<int> highlighted_rank)
{
        Display *display = p->display;
        display->clear(Black);

        int y = 2 * FONT_SIZE;
        render_centered_text(display, y, "Leaderboard", White,
                             FontSize::Size24);
        y += 3 * FONT_SIZE;

        char line[64];
        snprintf(line, sizeof(line), "%-4s %-15s %6s %7s", "#", "Name",
                 "Score", "Steps");
        render_centered_text(display, y, line, customization->accent_color);
        y += 2 * FONT_SIZE;

        if (leaderboard.is_empty()) {
                render_centered_text(display, y, "No results yet.");
        }

        const auto &entries = leaderboard.entries();
        for (int i = 0; i < (int)entries.size(); i++) {
                const SnakeEngine::LeaderboardEntry &entry = entries[i];
                snprintf(line, sizeof(line), "%-4d %-15.15s %6d %7d", i + 1,
                         entry.name.c_str(), entry.ranking_data.score,
                         entry.ranking_data.step);
                bool highlighted =
                    highlighted_rank.has_value() && highlighted_rank.value() == i;
                render_centered_text(display, y, line,
                                     highlighted ? customization->accent_color
                                                 : White);
                y += 3 * FONT_SIZE / 2;
        }

        int ok_y = display->get_height() - 2 * FONT_SIZE;
        render_centered_text(display, ok_y, "Press green to continue.");
        LOG_DEBUG(TAG, "Rendered %d leaderboard entries.", (int)entries.size());

        return wait_until_green_pressed(p);
}

std::optional<UserAction>
collect_player_name(Platform *p, UserInterfaceCustomization *customization,
                    std::string *name)
{
        static const char *initial_names[PLAYER_INITIALS] = {"Initial 1",
                                                             "Initial 2",
                                                             "Initial 3"};
        std::vector<ConfigurationOption *> options;
        for (int i = 0; i < PLAYER_INITIALS; i++) {
                options.push_back(ConfigurationOption::of_strings(
                    initial_names[i], LETTERS, "A"));
        }
        Configuration *config = new Configuration("Your initials", options);

        auto maybe_interrupt = collect_configuration(p, config, customization);
        if (maybe_interrupt) {
                free_configuration(config);
                return maybe_interrupt;
        }

        name->clear();
        for (int i = 0; i < config->options_len(); i++) {
                name->append(config->options[i]->get_current_str_value());
        }
        free_configuration(config);
        LOG_INFO(TAG, "Player entered initials: %s", name->c_str());
        return std::nullopt;
}
