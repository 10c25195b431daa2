#include "benchmark.hpp"
#include "../common/logging.hpp"

#include <algorithm>

#define TAG "benchmark"

namespace SnakeEngine
{

MatchResult play_match(GameEngine &engine, Agent &agent)
{
        engine.reset();
        while (!engine.is_over()) {
                engine.step(agent.select_action(engine));
        }
        return {.score = engine.score(), .steps = engine.steps()};
}

std::vector<MatchResult> run_benchmark(GameEngine &engine, Agent &agent,
                                       int matches)
{
        std::vector<MatchResult> results;
        results.reserve(std::max(matches, 0));
        for (int i = 0; i < matches; i++) {
                MatchResult result = play_match(engine, agent);
                LOG_DEBUG(TAG, "Match %d/%d (%s): score=%d, steps=%d", i + 1,
                          matches, agent.name(), result.score, result.steps);
                results.push_back(result);
        }
        return results;
}

BenchmarkSummary summarize(const std::vector<MatchResult> &results)
{
        BenchmarkSummary summary = {.matches = 0,
                                    .mean_score = 0.0,
                                    .mean_steps = 0.0,
                                    .best_score = 0,
                                    .worst_score = 0};
        if (results.empty()) {
                return summary;
        }

        long total_score = 0;
        long total_steps = 0;
        summary.best_score = results.front().score;
        summary.worst_score = results.front().score;
        for (const MatchResult &result : results) {
                total_score += result.score;
                total_steps += result.steps;
                summary.best_score = std::max(summary.best_score, result.score);
                summary.worst_score =
                    std::min(summary.worst_score, result.score);
        }

        summary.matches = static_cast<int>(results.size());
        summary.mean_score = static_cast<double>(total_score) / results.size();
        summary.mean_steps = static_cast<double>(total_steps) / results.size();
        return summary;
}

} // namespace SnakeEngine
