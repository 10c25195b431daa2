#pragma once

#include "../common/configuration.hpp"
#include "../common/platform/interface/platform.hpp"
#include "../engine/benchmark.hpp"

#include "game_executor.hpp"
#include "snake_configuration.hpp"

#define COUNTDOWN_SECONDS 3

/**
 * Plays a single match controlled by the user. The snake moves once every
 * `move_wait_ms(config.speed, length)` milliseconds in the direction of the
 * last valid key pressed.
 *
 * Returns `UserAction::Exit` if the user pressed the blue button (the match is
 * abandoned and `result` is not written) or `UserAction::CloseWindow` if the
 * window was closed. Otherwise the match ran to completion, its result is
 * written into `result` and `won` tells if the snake filled the whole board.
 */
std::optional<UserAction>
play_human_match(Platform *p, UserInterfaceCustomization *customization,
                 const SnakeConfiguration &config,
                 SnakeEngine::MatchResult *result, bool *won);

/**
 * Classic game mode: one match after another until the user exits.
 */
class SnakeGame : public GameExecutor
{
      public:
        explicit SnakeGame(const SnakeConfiguration &config) : config(config)
        {
        }

        std::optional<UserAction>
        game_loop(Platform *p,
                  UserInterfaceCustomization *customization) override;

      private:
        SnakeConfiguration config;
};

/**
 * Plays `config.matches` consecutive matches and reports the mean score. A
 * qualifying result can be added to the leaderboard.
 */
class SnakeBenchmark : public GameExecutor
{
      public:
        explicit SnakeBenchmark(const SnakeConfiguration &config)
            : config(config)
        {
        }

        std::optional<UserAction>
        game_loop(Platform *p,
                  UserInterfaceCustomization *customization) override;

      private:
        SnakeConfiguration config;
};
