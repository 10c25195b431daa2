#include "src/engine/agents.hpp"
#include "src/engine/benchmark.hpp"

#include <gtest/gtest.h>

using namespace SnakeEngine;

static EngineConfiguration make_configuration(int board_size,
                                              bool relative_actions)
{
        EngineConfiguration configuration = DEFAULT_ENGINE_CONFIGURATION;
        configuration.board_size = board_size;
        configuration.relative_actions = relative_actions;
        configuration.seed = 2024;
        return configuration;
}

TEST(AgentTest, RandomAgentStaysInActionSpace)
{
        for (bool relative : {false, true}) {
                GameEngine engine(make_configuration(10, relative));
                RandomAgent agent(5);
                for (int i = 0; i < 500; i++) {
                        int action = agent.select_action(engine);
                        EXPECT_GE(action, 0);
                        EXPECT_LT(action, engine.action_space());
                }
        }
}

TEST(AgentTest, EncodeAbsoluteAction)
{
        GameEngine engine(make_configuration(10, false));
        EXPECT_EQ(encode_action(engine, AbsoluteAction::Up),
                  static_cast<int>(AbsoluteAction::Up));
        EXPECT_EQ(encode_action(engine, AbsoluteAction::Idle),
                  static_cast<int>(AbsoluteAction::Idle));
}

TEST(AgentTest, EncodeRelativeAction)
{
        // Freshly reset snakes head right.
        GameEngine engine(make_configuration(10, true));
        EXPECT_EQ(encode_action(engine, AbsoluteAction::Up),
                  static_cast<int>(RelativeAction::Left));
        EXPECT_EQ(encode_action(engine, AbsoluteAction::Down),
                  static_cast<int>(RelativeAction::Right));
        EXPECT_EQ(encode_action(engine, AbsoluteAction::Right),
                  static_cast<int>(RelativeAction::Forward));
        // A reversal cannot be expressed.
        EXPECT_EQ(encode_action(engine, AbsoluteAction::Left),
                  static_cast<int>(RelativeAction::Forward));
}

TEST(AgentTest, GreedyAgentAvoidsTheWall)
{
        GameEngine engine(make_configuration(10, false));
        GreedyAgent agent;
        // Take the head to the top row, heading up.
        engine.step(static_cast<int>(AbsoluteAction::Up));
        engine.step(static_cast<int>(AbsoluteAction::Up));
        ASSERT_EQ(engine.snake().head().y, 0);

        int action = agent.select_action(engine);
        EXPECT_NE(action, static_cast<int>(AbsoluteAction::Up));
        engine.step(action);
        EXPECT_FALSE(engine.is_over());
}

TEST(AgentTest, GreedyAgentScoresInBothActionModes)
{
        for (bool relative : {false, true}) {
                GameEngine engine(make_configuration(10, relative));
                GreedyAgent agent;
                MatchResult result = play_match(engine, agent);
                EXPECT_GE(result.score, 1) << "relative: " << relative;
                EXPECT_EQ(result.score, engine.snake_length() - 3);
                EXPECT_EQ(result.steps, engine.steps());
                EXPECT_TRUE(engine.is_over());
        }
}

TEST(BenchmarkTest, OneResultPerMatch)
{
        GameEngine engine(make_configuration(10, false));
        RandomAgent agent(11);

        std::vector<MatchResult> results = run_benchmark(engine, agent, 7);
        ASSERT_EQ(results.size(), 7u);
        for (const MatchResult &result : results) {
                EXPECT_GE(result.score, 0);
                EXPECT_GT(result.steps, 0);
        }
        // The last match is left in its terminal state.
        EXPECT_EQ(results.back().score, engine.score());
        EXPECT_EQ(results.back().steps, engine.steps());
}

TEST(BenchmarkTest, NoMatches)
{
        GameEngine engine(make_configuration(10, false));
        GreedyAgent agent;
        EXPECT_TRUE(run_benchmark(engine, agent, 0).empty());
}

TEST(BenchmarkTest, GreedyBeatsRandom)
{
        GameEngine engine(make_configuration(15, false));
        GreedyAgent greedy;
        RandomAgent random(3);

        BenchmarkSummary greedy_summary =
            summarize(run_benchmark(engine, greedy, 10));
        BenchmarkSummary random_summary =
            summarize(run_benchmark(engine, random, 10));
        EXPECT_GT(greedy_summary.mean_score, random_summary.mean_score);
}

TEST(SummaryTest, EmptyResults)
{
        BenchmarkSummary summary = summarize({});
        EXPECT_EQ(summary.matches, 0);
        EXPECT_DOUBLE_EQ(summary.mean_score, 0.0);
        EXPECT_DOUBLE_EQ(summary.mean_steps, 0.0);
        EXPECT_EQ(summary.best_score, 0);
        EXPECT_EQ(summary.worst_score, 0);
}

TEST(SummaryTest, Aggregates)
{
        std::vector<MatchResult> results = {
            {.score = 2, .steps = 10},
            {.score = 4, .steps = 30},
            {.score = 0, .steps = 5},
        };
        BenchmarkSummary summary = summarize(results);
        EXPECT_EQ(summary.matches, 3);
        EXPECT_DOUBLE_EQ(summary.mean_score, 2.0);
        EXPECT_DOUBLE_EQ(summary.mean_steps, 15.0);
        EXPECT_EQ(summary.best_score, 4);
        EXPECT_EQ(summary.worst_score, 0);
}
