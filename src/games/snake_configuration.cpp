#include "snake_configuration.hpp"
#include "../engine/engine_types.hpp"

#include <algorithm>
#include <cstring>

const SnakeConfiguration DEFAULT_SNAKE_CONFIG = {.mode = GameMode::Play,
                                                 .speed = SpeedLevel::Easy,
                                                 .board_size = 30,
                                                 .matches = 10};

const std::vector<int> AVAILABLE_BOARD_SIZES = {10, 20, 30, 40, 50};
const std::vector<int> AVAILABLE_MATCH_COUNTS = {5, 10, 20};

const char *game_mode_to_string(GameMode mode)
{
        switch (mode) {
        case GameMode::Play:
                return "Play";
        case GameMode::Benchmark:
                return "Benchmark";
        case GameMode::Leaderboard:
                return "Leaderboard";
        default:
                return "Unknown";
        }
}

GameMode game_mode_from_string(const char *name)
{
        for (GameMode mode :
             {GameMode::Play, GameMode::Benchmark, GameMode::Leaderboard}) {
                if (strcmp(name, game_mode_to_string(mode)) == 0) {
                        return mode;
                }
        }
        return GameMode::Unknown;
}

const char *speed_level_to_string(SpeedLevel speed)
{
        switch (speed) {
        case SpeedLevel::Easy:
                return "Easy";
        case SpeedLevel::Medium:
                return "Medium";
        case SpeedLevel::Hard:
                return "Hard";
        case SpeedLevel::MegaHardcore:
                return "Mega hardcore";
        default:
                return "Unknown";
        }
}

SpeedLevel speed_level_from_string(const char *name)
{
        for (SpeedLevel speed : {SpeedLevel::Easy, SpeedLevel::Medium,
                                 SpeedLevel::Hard, SpeedLevel::MegaHardcore}) {
                if (strcmp(name, speed_level_to_string(speed)) == 0) {
                        return speed;
                }
        }
        return SpeedLevel::Unknown;
}

static bool contains(const std::vector<int> &values, int value)
{
        return std::find(values.begin(), values.end(), value) != values.end();
}

bool is_valid_snake_config(const SnakeConfiguration &config)
{
        return config.mode != GameMode::Unknown &&
               strcmp(game_mode_to_string(config.mode), "Unknown") != 0 &&
               config.speed != SpeedLevel::Unknown &&
               strcmp(speed_level_to_string(config.speed), "Unknown") != 0 &&
               contains(AVAILABLE_BOARD_SIZES, config.board_size) &&
               contains(AVAILABLE_MATCH_COUNTS, config.matches);
}

int speed_level_to_move_wait_ms(SpeedLevel speed)
{
        switch (speed) {
        case SpeedLevel::Easy:
                return 80;
        case SpeedLevel::Medium:
                return 60;
        case SpeedLevel::Hard:
                return 40;
        case SpeedLevel::MegaHardcore:
                return 65;
        default:
                return 80;
        }
}

int move_wait_ms(SpeedLevel speed, int snake_length)
{
        int base = speed_level_to_move_wait_ms(speed);
        if (speed != SpeedLevel::MegaHardcore) {
                return base;
        }
        int eaten = snake_length - SnakeEngine::INITIAL_SNAKE_LENGTH;
        return std::max(0, base - 2 * eaten);
}
