#include "settings.hpp"
#include "../common/logging.hpp"

#include <cstring>

#define TAG "settings"

int get_storage_offset(StorageRecord record)
{
        switch (record) {
        case StorageRecord::SnakeSettings:
                return 0;
        case StorageRecord::Leaderboard:
                return get_storage_offset(StorageRecord::SnakeSettings) +
                       sizeof(SnakeConfiguration);
        }
        return 0;
}

SnakeConfiguration load_snake_config(PersistentStorage *storage)
{
        int storage_offset = get_storage_offset(StorageRecord::SnakeSettings);
        LOG_DEBUG(TAG, "Loading snake settings from offset %d",
                  storage_offset);

        // Sentinel values that fail validation if nothing gets read.
        SnakeConfiguration config = {.mode = GameMode::Unknown,
                                     .speed = SpeedLevel::Unknown,
                                     .board_size = 0,
                                     .matches = 0};
        storage->get(storage_offset, config);

        if (!is_valid_snake_config(config)) {
                LOG_DEBUG(TAG, "The storage does not contain a valid "
                               "snake configuration, using default values.");
                save_snake_config(storage, DEFAULT_SNAKE_CONFIG);
                return DEFAULT_SNAKE_CONFIG;
        }

        LOG_DEBUG(TAG,
                  "Loaded snake configuration: mode=%s, speed=%s, "
                  "board_size=%d, matches=%d",
                  game_mode_to_string(config.mode),
                  speed_level_to_string(config.speed), config.board_size,
                  config.matches);
        return config;
}

bool save_snake_config(PersistentStorage *storage,
                       const SnakeConfiguration &config)
{
        int storage_offset = get_storage_offset(StorageRecord::SnakeSettings);
        if (!storage->write_bytes(storage_offset, &config, sizeof(config))) {
                LOG_ERROR(TAG, "Failed to save the snake configuration.");
                return false;
        }
        return true;
}

SnakeEngine::Leaderboard load_leaderboard(PersistentStorage *storage)
{
        int storage_offset = get_storage_offset(StorageRecord::Leaderboard);
        SnakeEngine::Leaderboard leaderboard;

        StoredLeaderboard record;
        memset(&record, 0, sizeof(record));
        storage->get(storage_offset, record);

        if (record.magic != LEADERBOARD_RECORD_MAGIC || record.count < 0 ||
            record.count > SnakeEngine::DEFAULT_LEADERBOARD_CAPACITY) {
                LOG_DEBUG(TAG, "No valid leaderboard record found at offset "
                               "%d, starting with an empty leaderboard.",
                          storage_offset);
                return leaderboard;
        }

        for (int i = 0; i < record.count; i++) {
                StoredLeaderboardEntry &stored = record.entries[i];
                stored.name[LEADERBOARD_NAME_LENGTH - 1] = '\0';
                leaderboard.add({.name = stored.name,
                                 .ranking_data = {.score = stored.score,
                                                  .step = stored.step}});
        }
        LOG_DEBUG(TAG, "Loaded %d leaderboard entries.", record.count);
        return leaderboard;
}

bool save_leaderboard(PersistentStorage *storage,
                      const SnakeEngine::Leaderboard &leaderboard)
{
        StoredLeaderboard record;
        memset(&record, 0, sizeof(record));
        record.magic = LEADERBOARD_RECORD_MAGIC;

        for (const SnakeEngine::LeaderboardEntry &entry :
             leaderboard.entries()) {
                if (record.count == SnakeEngine::DEFAULT_LEADERBOARD_CAPACITY) {
                        break;
                }
                StoredLeaderboardEntry &stored = record.entries[record.count];
                strncpy(stored.name, entry.name.c_str(),
                        LEADERBOARD_NAME_LENGTH - 1);
                stored.score = entry.ranking_data.score;
                stored.step = entry.ranking_data.step;
                record.count++;
        }

        int storage_offset = get_storage_offset(StorageRecord::Leaderboard);
        if (!storage->write_bytes(storage_offset, &record, sizeof(record))) {
                LOG_ERROR(TAG, "Failed to save the leaderboard.");
                return false;
        }
        LOG_DEBUG(TAG, "Saved %d leaderboard entries.", record.count);
        return true;
}
