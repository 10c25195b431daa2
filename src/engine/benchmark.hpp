#pragma once
#include "agents.hpp"
#include "game_engine.hpp"

#include <vector>

namespace SnakeEngine
{

typedef struct MatchResult {
        // Number of food pieces eaten (final length minus the initial 3).
        int score;
        int steps;
} MatchResult;

typedef struct BenchmarkSummary {
        int matches;
        double mean_score;
        double mean_steps;
        int best_score;
        int worst_score;
} BenchmarkSummary;

/**
 * Plays `matches` independent matches on `engine`, each one starting with a
 * full `reset()` and stepping with actions chosen by `agent` until the match
 * is over. The results are returned in the order the matches were played.
 */
std::vector<MatchResult> run_benchmark(GameEngine &engine, Agent &agent,
                                       int matches);

/**
 * Plays a single match from a fresh `reset()` until it is over.
 */
MatchResult play_match(GameEngine &engine, Agent &agent);

/**
 * Aggregates benchmark results. The mean score is the metric used to rank
 * players on the leaderboard. An empty list of results yields all zeros.
 */
BenchmarkSummary summarize(const std::vector<MatchResult> &results);

} // namespace SnakeEngine
