#pragma once
#include "engine_types.hpp"
#include "food_generator.hpp"
#include "snake.hpp"

#include <memory>
#include <random>

namespace SnakeEngine
{

/**
 * Discrete-time simulation of a single Snake match.
 *
 * The engine goes through three phases: `Ready` right after `reset()`,
 * `Running` once the first step was applied and `Terminal` once the snake
 * collided (or, for autonomous players, stalled for too long). A terminal
 * engine refuses to simulate further steps until `reset()` is called.
 *
 * The engine is not thread-safe, every call needs to complete before the next
 * one is issued.
 */
class GameEngine
{
      public:
        /**
         * @throws std::invalid_argument if the board is smaller than
         * `MIN_BOARD_SIZE`.
         */
        explicit GameEngine(
            const EngineConfiguration &configuration =
                DEFAULT_ENGINE_CONFIGURATION);

        GameEngine(const GameEngine &) = delete;
        GameEngine &operator=(const GameEngine &) = delete;

        /**
         * Starts a new match with a fresh snake and food generator and returns
         * the initial observation.
         */
        ObservationGrid reset();

        /**
         * Advances the match by one tick. `action` is an `AbsoluteAction`
         * index, or a `RelativeAction` index if the engine was configured with
         * relative actions. Out-of-range indices are treated the same way as
         * invalid moves: the snake keeps going straight.
         *
         * @throws InvalidStateError if the match is already over.
         */
        void play(int action);

        /**
         * Convenience wrapper around `play` returning the observation, reward
         * and termination flag after the step.
         *
         * @throws InvalidStateError if the match is already over.
         */
        StepResult step(int action);

        /**
         * Returns the observation of the board. After the match is over the
         * observation is all `CellType::Empty`, callers need to use
         * `is_over()` to detect termination.
         */
        ObservationGrid state() const;

        /**
         * Returns the reward for the last step: the game over penalty if the
         * match ended, the length of the snake if food was eaten and the small
         * move penalty otherwise.
         */
        float reward() const;

        /**
         * Returns which of the cells next to the head would be fatal to enter.
         * All hints are false if local safety hints are disabled or the match
         * is over.
         */
        DangerHints danger_hints() const;

        int action_space() const;
        const Point &food_position() const { return food_position_; }
        int steps() const { return steps_; }
        int snake_length() const { return snake_->length(); }
        /**
         * Number of food pieces eaten during the current match.
         */
        int score() const { return snake_->length() - INITIAL_SNAKE_LENGTH; }
        AbsoluteAction heading() const { return snake_->heading(); }
        const Snake &snake() const { return *snake_; }
        bool is_over() const { return state_ == EngineState::Terminal; }
        /**
         * True if the match ended because the snake filled the entire board.
         */
        bool won() const { return won_; }
        bool scored() const { return scored_; }
        EngineState phase() const { return state_; }
        const EngineConfiguration &configuration() const
        {
                return configuration_;
        }

      private:
        AbsoluteAction decode_action(int action) const;
        bool check_collision() const;
        bool is_stalling() const;
        bool is_dangerous(const Point &point) const;
        void end_match(const char *reason);

        EngineConfiguration configuration_;
        std::mt19937 random_engine_;
        std::unique_ptr<Snake> snake_;
        std::unique_ptr<FoodGenerator> food_generator_;
        Point food_position_;
        int steps_;
        bool scored_;
        bool won_;
        EngineState state_;
};

} // namespace SnakeEngine
