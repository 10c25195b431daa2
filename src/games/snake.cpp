#include "snake.hpp"
#include "common_transitions.hpp"
#include "leaderboard_view.hpp"
#include "settings.hpp"
#include "snake_rendering.hpp"

#include "../common/constants.hpp"
#include "../common/grid.hpp"
#include "../common/logging.hpp"
#include "../common/user_interface.hpp"
#include "../engine/game_engine.hpp"
#include "../engine/leaderboard.hpp"

#include <cstdio>

#define TAG "snake"

using SnakeEngine::AbsoluteAction;
using SnakeEngine::GameEngine;
using SnakeEngine::MatchResult;

static void update_window_title(Display *display, int score)
{
        char title[48];
        snprintf(title, sizeof(title), "gridsnake  |  Score: %d", score);
        display->set_title(title);
}

std::optional<UserAction>
play_human_match(Platform *p, UserInterfaceCustomization *customization,
                 const SnakeConfiguration &config, MatchResult *result,
                 bool *won)
{
        LOG_DEBUG(TAG, "Entering Snake game loop");

        auto countdown_interrupt = display_countdown(p, COUNTDOWN_SECONDS);
        if (countdown_interrupt) {
                return countdown_interrupt;
        }

        SnakeEngine::EngineConfiguration engine_config =
            SnakeEngine::DEFAULT_ENGINE_CONFIGURATION;
        engine_config.board_size = config.board_size;
        engine_config.player = SnakeEngine::PlayerMode::Human;
        GameEngine engine(engine_config);

        SquareCellGridDimensions gd = calculate_grid_dimensions(
            p->display->get_width(), p->display->get_height(),
            p->display->get_display_margin(), config.board_size);

        draw_grid_frame(p, customization, gd, BOARD_BACKGROUND_COLOR);

        // 'Score:' is rendered once with four trailing spaces reserved for
        // the digits so that the whole text stays centered.
        int score_end = render_centered_text_above_frame(p, gd, "Score:    ");
        update_score(p, gd, score_end, 0);
        update_window_title(p->display, 0);

        int previous_length = engine.snake_length();
        std::vector<Color> gradient = snake_body_gradient(previous_length);
        render_board(p->display, gd, engine, gradient);
        if (!p->display->refresh()) {
                return UserAction::CloseWindow;
        }

        // Key presses are recorded between the moves and the last valid one
        // is applied once it is time to move.
        AbsoluteAction last_key = engine.heading();
        int elapsed = 0;

        while (!engine.is_over()) {
                int move_wait = move_wait_ms(config.speed, engine.snake_length());

                AbsoluteAction key = SnakeEngine::to_absolute_action(
                    poll_directional_input(p->directional_controllers));
                if (!engine.snake().is_move_invalid(key)) {
                        last_key = key;
                }

                if (poll_action_input(p->action_controllers) == Action::BLUE) {
                        LOG_INFO(TAG, "Match abandoned by the user with score "
                                      "%d.",
                                 engine.score());
                        p->delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
                        return UserAction::Exit;
                }

                if (elapsed >= move_wait) {
                        elapsed = 0;
                        engine.play(static_cast<int>(last_key));

                        if (!engine.is_over()) {
                                int length = engine.snake_length();
                                if (length > previous_length) {
                                        gradient = snake_body_gradient(length);
                                        previous_length = length;
                                        update_score(p, gd, score_end,
                                                     engine.score());
                                        update_window_title(p->display,
                                                            engine.score());
                                }
                                render_board(p->display, gd, engine, gradient);
                        }
                }

                p->delay_provider->delay_ms(GAME_LOOP_DELAY);
                elapsed += GAME_LOOP_DELAY;
                if (!p->display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }

        *result = {.score = engine.score(), .steps = engine.steps()};
        *won = engine.won();
        return std::nullopt;
}

std::optional<UserAction>
SnakeGame::game_loop(Platform *p, UserInterfaceCustomization *customization)
{
        while (true) {
                MatchResult result;
                bool won = false;
                auto maybe_interrupt =
                    play_human_match(p, customization, config, &result, &won);
                if (maybe_interrupt) {
                        return maybe_interrupt;
                }

                char details[32];
                snprintf(details, sizeof(details), "Score: %d", result.score);
                if (won) {
                        display_game_won(p->display, customization, details);
                } else {
                        display_game_over(p->display, customization, details);
                }

                LOG_DEBUG(TAG, "Snake match finished. Pausing for input.");
                std::optional<Action> act;
                auto pause_interrupt = pause_until_input(p, &act);
                if (pause_interrupt) {
                        return pause_interrupt;
                }
                if (act == Action::BLUE) {
                        return UserAction::Exit;
                }
        }
}

static void display_benchmark_summary(Display *display,
                                      UserInterfaceCustomization *customization,
                                      const SnakeEngine::BenchmarkSummary &summary,
                                      bool qualifies)
{
        display->clear(Black);
        int y = (display->get_height() - HEADING_FONT_SIZE) / 2 - 2 * FONT_SIZE;
        render_centered_text(display, y, "Benchmark finished",
                             customization->accent_color, FontSize::Size24);
        y += 3 * FONT_SIZE;

        char line[48];
        snprintf(line, sizeof(line), "Matches: %d", summary.matches);
        render_centered_text(display, y, line);
        y += FONT_SIZE * 3 / 2;
        snprintf(line, sizeof(line), "Mean score: %.2f", summary.mean_score);
        render_centered_text(display, y, line);
        y += FONT_SIZE * 3 / 2;
        snprintf(line, sizeof(line), "Best: %d  Worst: %d", summary.best_score,
                 summary.worst_score);
        render_centered_text(display, y, line);
        y += 3 * FONT_SIZE;

        if (qualifies) {
                render_centered_text(display, y,
                                     "Press green to join the leaderboard.",
                                     Green);
                y += FONT_SIZE * 3 / 2;
        }
        render_centered_text(display, y, "Press blue to exit.");
}

std::optional<UserAction>
SnakeBenchmark::game_loop(Platform *p,
                          UserInterfaceCustomization *customization)
{
        std::vector<MatchResult> results;
        for (int i = 0; i < config.matches; i++) {
                LOG_INFO(TAG, "Benchmark match %d/%d", i + 1, config.matches);
                MatchResult result;
                bool won = false;
                auto maybe_interrupt =
                    play_human_match(p, customization, config, &result, &won);
                if (maybe_interrupt) {
                        // An abandoned benchmark is not recorded.
                        return maybe_interrupt;
                }
                results.push_back(result);
        }

        SnakeEngine::BenchmarkSummary summary = SnakeEngine::summarize(results);
        LOG_INFO(TAG, "Benchmark finished: mean score %.2f over %d matches",
                 summary.mean_score, summary.matches);

        SnakeEngine::Leaderboard leaderboard =
            load_leaderboard(p->persistent_storage);
        SnakeEngine::LeaderboardEntry entry =
            SnakeEngine::entry_from_results("", results);
        bool qualifies = leaderboard.qualifies(entry.ranking_data.score,
                                               entry.ranking_data.step);

        display_benchmark_summary(p->display, customization, summary,
                                  qualifies);

        while (true) {
                std::optional<Action> act;
                auto pause_interrupt = pause_until_input(p, &act);
                if (pause_interrupt) {
                        return pause_interrupt;
                }
                if (act == Action::BLUE) {
                        return UserAction::Exit;
                }
                if (act == Action::GREEN && qualifies) {
                        break;
                }
        }

        auto name_interrupt = collect_player_name(p, customization, &entry.name);
        if (name_interrupt) {
                return name_interrupt;
        }

        std::optional<int> rank = leaderboard.add(entry);
        if (rank.has_value() &&
            !save_leaderboard(p->persistent_storage, leaderboard)) {
                LOG_WARN(TAG, "The leaderboard entry will be lost on exit.");
        }

        auto view_interrupt =
            display_leaderboard(p, customization, leaderboard, rank);
        if (view_interrupt) {
                return view_interrupt;
        }
        return UserAction::Exit;
}
