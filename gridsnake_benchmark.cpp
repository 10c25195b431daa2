#include "gridsnake_config.h"

#include "src/common/logging.hpp"
#include "src/engine/agents.hpp"
#include "src/engine/benchmark.hpp"
#include "src/engine/game_engine.hpp"

#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#define TAG "benchmark_entrypoint"

typedef struct BenchmarkOptions {
        int matches;
        std::string agent;
        bool verbose;
        SnakeEngine::EngineConfiguration engine;
} BenchmarkOptions;

static void print_usage(const char *program)
{
        fprintf(stderr,
                "Usage: %s [--matches N] [--board-size N] "
                "[--agent random|greedy] [--relative] [--local-state] "
                "[--seed N] [--verbose]\n",
                program);
}

static std::optional<int> parse_int(const char *value)
{
        try {
                size_t parsed = 0;
                int result = std::stoi(value, &parsed);
                if (parsed != strlen(value)) {
                        return std::nullopt;
                }
                return result;
        } catch (const std::logic_error &e) {
                return std::nullopt;
        }
}

/**
 * Returns `std::nullopt` and logs the reason if the arguments are invalid.
 */
static std::optional<BenchmarkOptions> parse_options(int argc, char *argv[])
{
        BenchmarkOptions options = {.matches = 10,
                                    .agent = "greedy",
                                    .verbose = false,
                                    .engine =
                                        SnakeEngine::DEFAULT_ENGINE_CONFIGURATION};

        for (int i = 1; i < argc; i++) {
                std::string arg = argv[i];
                bool has_value = i + 1 < argc;

                if (arg == "--relative") {
                        options.engine.relative_actions = true;
                } else if (arg == "--local-state") {
                        options.engine.local_state = true;
                } else if (arg == "--verbose") {
                        options.verbose = true;
                } else if (arg == "--agent" && has_value) {
                        options.agent = argv[++i];
                        if (options.agent != "random" &&
                            options.agent != "greedy") {
                                LOG_ERROR(TAG, "Unknown agent '%s'",
                                          options.agent.c_str());
                                return std::nullopt;
                        }
                } else if ((arg == "--matches" || arg == "--board-size" ||
                            arg == "--seed") &&
                           has_value) {
                        std::optional<int> value = parse_int(argv[++i]);
                        if (!value.has_value() || value.value() < 0) {
                                LOG_ERROR(TAG, "Invalid value '%s' for %s",
                                          argv[i], arg.c_str());
                                return std::nullopt;
                        }
                        if (arg == "--matches") {
                                options.matches = value.value();
                        } else if (arg == "--board-size") {
                                options.engine.board_size = value.value();
                        } else {
                                options.engine.seed = value.value();
                        }
                } else {
                        LOG_ERROR(TAG, "Unrecognized argument '%s'",
                                  arg.c_str());
                        return std::nullopt;
                }
        }

        if (options.engine.board_size < SnakeEngine::MIN_BOARD_SIZE) {
                LOG_ERROR(TAG, "Board size needs to be at least %d",
                          SnakeEngine::MIN_BOARD_SIZE);
                return std::nullopt;
        }
        return options;
}

int main(int argc, char *argv[])
{
        std::optional<BenchmarkOptions> maybe_options = parse_options(argc, argv);
        if (!maybe_options.has_value()) {
                print_usage(argv[0]);
                return 1;
        }
        BenchmarkOptions options = maybe_options.value();
        if (options.verbose) {
                set_log_level(LogLevel::Debug);
        }

        LOG_INFO(TAG,
                 "gridsnake %d.%d benchmark: %d matches, board %d, agent %s",
                 GRIDSNAKE_VERSION_MAJOR, GRIDSNAKE_VERSION_MINOR,
                 options.matches, options.engine.board_size,
                 options.agent.c_str());

        SnakeEngine::GameEngine engine(options.engine);

        std::unique_ptr<SnakeEngine::Agent> agent;
        if (options.agent == "random") {
                // The agent needs a different stream than the food placement.
                agent = std::make_unique<SnakeEngine::RandomAgent>(
                    options.engine.seed + 1);
        } else {
                agent = std::make_unique<SnakeEngine::GreedyAgent>();
        }

        std::vector<SnakeEngine::MatchResult> results =
            SnakeEngine::run_benchmark(engine, *agent, options.matches);

        for (size_t i = 0; i < results.size(); i++) {
                printf("match %zu: score=%d steps=%d\n", i + 1,
                       results[i].score, results[i].steps);
        }

        SnakeEngine::BenchmarkSummary summary = SnakeEngine::summarize(results);
        printf("matches=%d mean_score=%.3f mean_steps=%.1f best=%d worst=%d\n",
               summary.matches, summary.mean_score, summary.mean_steps,
               summary.best_score, summary.worst_score);
        return 0;
}
