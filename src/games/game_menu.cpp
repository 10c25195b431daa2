#include "game_menu.hpp"
#include "game_executor.hpp"
#include "leaderboard_view.hpp"
#include "settings.hpp"
#include "snake.hpp"

#include "../common/logging.hpp"
#include "../common/user_interface.hpp"

#include <memory>

#define TAG "game_menu"

static const UserInterfaceCustomization DEFAULT_CUSTOMIZATION = {
    .accent_color = DarkBlue,
    .show_help_text = true,
};

Configuration *
assemble_snake_configuration(const SnakeConfiguration &initial_config)
{
        auto *mode = ConfigurationOption::of_strings(
            "Mode",
            {game_mode_to_string(GameMode::Play),
             game_mode_to_string(GameMode::Benchmark),
             game_mode_to_string(GameMode::Leaderboard)},
            game_mode_to_string(initial_config.mode));

        auto *speed = ConfigurationOption::of_strings(
            "Speed",
            {speed_level_to_string(SpeedLevel::Easy),
             speed_level_to_string(SpeedLevel::Medium),
             speed_level_to_string(SpeedLevel::Hard),
             speed_level_to_string(SpeedLevel::MegaHardcore)},
            speed_level_to_string(initial_config.speed));

        auto *board_size = ConfigurationOption::of_integers(
            "Board", AVAILABLE_BOARD_SIZES, initial_config.board_size);

        auto *matches = ConfigurationOption::of_integers(
            "Matches", AVAILABLE_MATCH_COUNTS, initial_config.matches);

        return new Configuration("Snake", {mode, speed, board_size, matches});
}

void extract_game_config(SnakeConfiguration *game_config,
                         Configuration *config)
{
        const ConfigurationOption &mode = *config->options[0];
        const ConfigurationOption &speed = *config->options[1];
        const ConfigurationOption &board_size = *config->options[2];
        const ConfigurationOption &matches = *config->options[3];

        game_config->mode = game_mode_from_string(mode.get_current_str_value());
        game_config->speed =
            speed_level_from_string(speed.get_current_str_value());
        game_config->board_size = board_size.get_curr_int_value();
        game_config->matches = matches.get_curr_int_value();
}

std::optional<UserAction>
collect_snake_config(Platform *p, SnakeConfiguration *game_config,
                     UserInterfaceCustomization *customization)
{
        SnakeConfiguration initial_config =
            load_snake_config(p->persistent_storage);
        Configuration *config = assemble_snake_configuration(initial_config);

        auto maybe_interrupt =
            collect_configuration(p, config, customization, false);
        if (maybe_interrupt) {
                free_configuration(config);
                return maybe_interrupt;
        }

        extract_game_config(game_config, config);
        free_configuration(config);
        save_snake_config(p->persistent_storage, *game_config);
        return std::nullopt;
}

std::optional<UserAction> select_game(Platform *p)
{
        UserInterfaceCustomization customization = DEFAULT_CUSTOMIZATION;
        p->display->set_title("gridsnake");

        const char *help_text =
            "Use up/down arrows to switch between menu options. Use "
            "left/right arrows or press space (green) to change the value of "
            "the current option. Press enter (red) to start. In the game steer "
            "the snake with the arrows, WASD or HJKL keys, eat the food and "
            "avoid the walls and your own body. Escape (blue) leaves the "
            "current screen.";

        SnakeConfiguration config;
        auto maybe_interrupt = collect_snake_config(p, &config, &customization);
        if (maybe_interrupt) {
                switch (maybe_interrupt.value()) {
                case UserAction::ShowHelp:
                        render_wrapped_help_text(p, &customization, help_text);
                        return wait_until_green_pressed(p);
                default:
                        return maybe_interrupt;
                }
        }

        LOG_INFO(TAG, "User selected mode: %s, speed: %s, board: %d",
                 game_mode_to_string(config.mode),
                 speed_level_to_string(config.speed), config.board_size);

        if (config.mode == GameMode::Leaderboard) {
                SnakeEngine::Leaderboard leaderboard =
                    load_leaderboard(p->persistent_storage);
                return display_leaderboard(p, &customization, leaderboard);
        }

        std::unique_ptr<GameExecutor> executor;
        switch (config.mode) {
        case GameMode::Play:
                executor = std::make_unique<SnakeGame>(config);
                break;
        case GameMode::Benchmark:
                executor = std::make_unique<SnakeBenchmark>(config);
                break;
        default:
                LOG_ERROR(TAG, "Selected mode %d is not supported.",
                          static_cast<int>(config.mode));
                return std::nullopt;
        }

        auto game_interrupt = executor->game_loop(p, &customization);
        if (game_interrupt && game_interrupt.value() == UserAction::CloseWindow) {
                return game_interrupt;
        }
        return std::nullopt;
}
