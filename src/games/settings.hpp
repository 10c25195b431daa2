#pragma once
#include "../common/platform/interface/persistent_storage.hpp"
#include "../engine/leaderboard.hpp"
#include "snake_configuration.hpp"

#include <cstdint>

/**
 * Records kept in the persistent storage. Each one lives at a fixed offset,
 * see `get_storage_offset`.
 */
enum class StorageRecord : int {
        SnakeSettings = 0,
        Leaderboard = 1,
};

#define LEADERBOARD_RECORD_MAGIC 0x4c4b4e53
#define LEADERBOARD_NAME_LENGTH 16

typedef struct StoredLeaderboardEntry {
        // Null-terminated, longer names are truncated when saving.
        char name[LEADERBOARD_NAME_LENGTH];
        int score;
        int step;
} StoredLeaderboardEntry;

typedef struct StoredLeaderboard {
        uint32_t magic;
        int count;
        StoredLeaderboardEntry entries[SnakeEngine::DEFAULT_LEADERBOARD_CAPACITY];
} StoredLeaderboard;

int get_storage_offset(StorageRecord record);

/**
 * Loads the menu settings saved during the previous session. If the storage
 * does not contain a valid record, the defaults are written back and
 * returned.
 */
SnakeConfiguration load_snake_config(PersistentStorage *storage);
bool save_snake_config(PersistentStorage *storage,
                       const SnakeConfiguration &config);

/**
 * Loads the leaderboard record. A missing or corrupted record results in an
 * empty leaderboard.
 */
SnakeEngine::Leaderboard load_leaderboard(PersistentStorage *storage);
bool save_leaderboard(PersistentStorage *storage,
                      const SnakeEngine::Leaderboard &leaderboard);
