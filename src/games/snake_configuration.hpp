#pragma once
#include <cstdint>
#include <optional>
#include <vector>

enum class GameMode : int {
        Unknown = 0,
        Play = 1,
        Benchmark = 2,
        Leaderboard = 3,
};

/**
 * Speed levels of the human game. Each level maps to the number of
 * milliseconds the snake waits between two consecutive moves.
 */
enum class SpeedLevel : int {
        Unknown = 0,
        Easy = 1,
        Medium = 2,
        Hard = 3,
        // Starts slower than `Hard` but speeds up with every food eaten.
        MegaHardcore = 4,
};

typedef struct SnakeConfiguration {
        GameMode mode;
        SpeedLevel speed;
        int board_size;
        /**
         * Number of consecutive matches played in the benchmark mode.
         */
        int matches;
} SnakeConfiguration;

extern const SnakeConfiguration DEFAULT_SNAKE_CONFIG;

extern const std::vector<int> AVAILABLE_BOARD_SIZES;
extern const std::vector<int> AVAILABLE_MATCH_COUNTS;

const char *game_mode_to_string(GameMode mode);
GameMode game_mode_from_string(const char *name);
const char *speed_level_to_string(SpeedLevel speed);
SpeedLevel speed_level_from_string(const char *name);

/**
 * Returns true if every field of the configuration holds one of the values
 * offered by the menu. Used to detect uninitialized or corrupted records in
 * the persistent storage.
 */
bool is_valid_snake_config(const SnakeConfiguration &config);

/**
 * Base delay between moves of the snake for a given speed level.
 */
int speed_level_to_move_wait_ms(SpeedLevel speed);

/**
 * Delay between two moves of a snake of the given length. On the mega
 * hardcore level the delay shrinks by 2 ms for every food eaten, it never
 * drops below zero.
 */
int move_wait_ms(SpeedLevel speed, int snake_length);
