#pragma once
#include "../common/point.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace SnakeEngine
{

/**
 * Absolute actions submitted to the engine. The numeric values are the action
 * indices exposed to autonomous agents (action space of size 5).
 */
enum class AbsoluteAction : uint8_t {
        Left = 0,
        Right = 1,
        Up = 2,
        Down = 3,
        Idle = 4,
};

/**
 * Actions interpreted relative to the current heading of the snake (action
 * space of size 3).
 */
enum class RelativeAction : uint8_t {
        Left = 0,
        Forward = 1,
        Right = 2,
};

constexpr int ABSOLUTE_ACTION_SPACE = 5;
constexpr int RELATIVE_ACTION_SPACE = 3;

/**
 * Categorical values of the observation grid cells.
 */
enum class CellType : uint8_t {
        Empty = 0,
        Food = 1,
        Body = 2,
        Head = 3,
        // Cell next to the head that would be fatal to enter. Only reported
        // if local safety hints are enabled.
        Dangerous = 4,
};

enum class PlayerMode : uint8_t {
        // Match ends only on collision.
        Human,
        // Match additionally ends when the agent stalls (see `stall_factor`).
        Autonomous,
};

enum class EngineState : uint8_t {
        Ready,
        Running,
        Terminal,
};

typedef struct Rewards {
        // Given for every step that neither scored nor ended the game.
        float move;
        // Given for the step that ended the game.
        float game_over;
} Rewards;

constexpr int INITIAL_SNAKE_LENGTH = 3;
constexpr int MIN_BOARD_SIZE = 5;
// Boards larger than this still work but rendering and food placement slow
// down noticeably.
constexpr int RECOMMENDED_MAX_BOARD_SIZE = 50;

typedef struct EngineConfiguration {
        int board_size;
        /**
         * If true, observations mark cells adjacent to the head that would be
         * fatal to enter as `CellType::Dangerous`.
         */
        bool local_state;
        /**
         * If true, actions are `RelativeAction` indices instead of
         * `AbsoluteAction` ones.
         */
        bool relative_actions;
        PlayerMode player;
        Rewards rewards;
        /**
         * Autonomous matches end once the number of steps exceeds
         * `stall_factor * snake length`.
         */
        int stall_factor;
        /**
         * Seed of the food placement random engine. Zero means that the seed
         * is drawn from `std::random_device`.
         */
        uint32_t seed;
} EngineConfiguration;

extern const EngineConfiguration DEFAULT_ENGINE_CONFIGURATION;

/**
 * Observation of the board indexed as `grid[y][x]`.
 */
typedef std::vector<std::vector<CellType>> ObservationGrid;

ObservationGrid empty_observation(int board_size);
CellType cell_at(const ObservationGrid &grid, const Point &point);

/**
 * For each of the four cells next to the head, true if entering it would end
 * the game immediately (off the board or occupied by the body).
 */
typedef struct DangerHints {
        bool left;
        bool right;
        bool up;
        bool down;

        bool operator==(const DangerHints &other) const
        {
                return left == other.left && right == other.right &&
                       up == other.up && down == other.down;
        }
} DangerHints;

typedef struct StepResult {
        ObservationGrid observation;
        float reward;
        bool done;
} StepResult;

/**
 * Thrown when the engine is asked to simulate a step after the match ended.
 * The only valid operation on a terminal engine is `reset()`.
 */
class InvalidStateError : public std::logic_error
{
      public:
        explicit InvalidStateError(const std::string &what)
            : std::logic_error(what)
        {
        }
};

/**
 * Thrown when food is requested but every cell of the board is occupied by
 * the snake.
 */
class BoardFullError : public std::runtime_error
{
      public:
        explicit BoardFullError(const std::string &what)
            : std::runtime_error(what)
        {
        }
};

bool is_forbidden_reversal(AbsoluteAction action, AbsoluteAction heading);
AbsoluteAction relative_to_absolute(RelativeAction action,
                                    AbsoluteAction heading);
Point translate_by(const Point &p, AbsoluteAction action);

/**
 * Maps the controller input of a human player to an engine action. Absence of
 * input is an explicit `Idle` which the snake then ignores.
 */
AbsoluteAction to_absolute_action(std::optional<Direction> input);

const char *absolute_action_to_str(AbsoluteAction action);
const char *relative_action_to_str(RelativeAction action);
const char *engine_state_to_str(EngineState state);

} // namespace SnakeEngine
