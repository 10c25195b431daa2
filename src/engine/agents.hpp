#pragma once
#include "game_engine.hpp"

#include <random>

namespace SnakeEngine
{

/**
 * Autonomous player. Given the current engine it picks the next action index
 * (within `engine.action_space()`).
 */
class Agent
{
      public:
        virtual int select_action(const GameEngine &engine) = 0;
        virtual const char *name() const = 0;
        virtual ~Agent() = default;
};

/**
 * Picks actions uniformly at random from the action space. Useful as a
 * baseline for benchmarks.
 */
class RandomAgent : public Agent
{
      public:
        explicit RandomAgent(uint32_t seed) : random_engine(seed) {}

        int select_action(const GameEngine &engine) override;
        const char *name() const override { return "random"; }

      private:
        std::mt19937 random_engine;
};

/**
 * Moves towards the food along the axis with the larger distance, falling back
 * to any move that is not immediately fatal. It does not plan ahead so it
 * eventually traps itself, but it scores well above the random baseline.
 */
class GreedyAgent : public Agent
{
      public:
        int select_action(const GameEngine &engine) override;
        const char *name() const override { return "greedy"; }
};

/**
 * Returns the action index that makes the snake of `engine` go in the
 * `desired` absolute direction on the next step, taking the relative action
 * mode into account. If the direction cannot be expressed (a reversal in
 * relative mode) the index of going straight is returned.
 */
int encode_action(const GameEngine &engine, AbsoluteAction desired);

} // namespace SnakeEngine
