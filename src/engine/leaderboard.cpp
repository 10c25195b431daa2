#include "leaderboard.hpp"
#include "../common/logging.hpp"

#include <cmath>
#include <stdexcept>

#define TAG "leaderboard"

namespace SnakeEngine
{

Leaderboard::Leaderboard(int capacity) : capacity_(capacity)
{
        if (capacity <= 0) {
                throw std::invalid_argument(
                    "Leaderboard capacity needs to be positive");
        }
        entries_.reserve(capacity);
}

bool ranks_above(const RankingData &lhs, const RankingData &rhs)
{
        if (lhs.score != rhs.score) {
                return lhs.score > rhs.score;
        }
        return lhs.step < rhs.step;
}

int Leaderboard::insertion_index(const RankingData &data) const
{
        // New entries go after existing ones with identical ranking data.
        int index = 0;
        while (index < static_cast<int>(entries_.size()) &&
               !ranks_above(data, entries_[index].ranking_data)) {
                index++;
        }
        return index;
}

bool Leaderboard::qualifies(int score, int step) const
{
        return insertion_index({.score = score, .step = step}) < capacity_;
}

std::optional<int> Leaderboard::add(const LeaderboardEntry &entry)
{
        int index = insertion_index(entry.ranking_data);
        if (index >= capacity_) {
                LOG_DEBUG(TAG, "Entry '%s' with score %d does not qualify.",
                          entry.name.c_str(), entry.ranking_data.score);
                return std::nullopt;
        }

        entries_.insert(entries_.begin() + index, entry);
        if (static_cast<int>(entries_.size()) > capacity_) {
                entries_.pop_back();
        }
        LOG_INFO(TAG, "Entry '%s' (score: %d, steps: %d) added at rank %d.",
                 entry.name.c_str(), entry.ranking_data.score,
                 entry.ranking_data.step, index + 1);
        return index;
}

void Leaderboard::clear() { entries_.clear(); }

LeaderboardEntry entry_from_results(const std::string &name,
                                    const std::vector<MatchResult> &results)
{
        BenchmarkSummary summary = summarize(results);
        int total_steps = 0;
        for (const MatchResult &result : results) {
                total_steps += result.steps;
        }
        return {.name = name,
                .ranking_data = {.score = static_cast<int>(
                                     std::floor(summary.mean_score)),
                                 .step = total_steps}};
}

} // namespace SnakeEngine
