#pragma once
#include "benchmark.hpp"

#include <optional>
#include <string>
#include <vector>

namespace SnakeEngine
{

constexpr int DEFAULT_LEADERBOARD_CAPACITY = 10;

typedef struct RankingData {
        int score;
        int step;
} RankingData;

typedef struct LeaderboardEntry {
        std::string name;
        RankingData ranking_data;
} LeaderboardEntry;

/**
 * Bounded list of the best results. Entries are kept sorted by score
 * (descending); equal scores are ordered by the number of steps (ascending)
 * and then by the order in which they were added.
 */
class Leaderboard
{
      public:
        explicit Leaderboard(int capacity = DEFAULT_LEADERBOARD_CAPACITY);

        /**
         * Inserts the entry at its rank and drops the last entry if the
         * capacity is exceeded. Returns the 0-based rank of the new entry or
         * `std::nullopt` if the entry did not make it onto the board.
         */
        std::optional<int> add(const LeaderboardEntry &entry);
        /**
         * Returns true if an entry with the given ranking data would be
         * placed on the board by `add`.
         */
        bool qualifies(int score, int step) const;
        void clear();

        const std::vector<LeaderboardEntry> &entries() const { return entries_; }
        int capacity() const { return capacity_; }
        bool is_empty() const { return entries_.empty(); }

      private:
        int insertion_index(const RankingData &data) const;

        int capacity_;
        std::vector<LeaderboardEntry> entries_;
};

/**
 * Returns true if `lhs` ranks strictly above `rhs`.
 */
bool ranks_above(const RankingData &lhs, const RankingData &rhs);

/**
 * Builds the leaderboard entry for a completed benchmark: the score is the
 * mean score rounded down and the step count is the total number of steps
 * played across all matches.
 */
LeaderboardEntry entry_from_results(const std::string &name,
                                    const std::vector<MatchResult> &results);

} // namespace SnakeEngine
