#pragma once
#include <cstddef>

/**
 * Byte-addressed storage that survives restarts of the console. Records are
 * plain structs written at fixed offsets (see `get_storage_offset`),
 * the same way values are stored in an EEPROM.
 *
 * Reading an offset that was never written leaves the destination untouched,
 * so callers initialize the record with sentinel values before calling `get`
 * and fall back to defaults if the sentinel survives.
 */
class PersistentStorage
{
      public:
        template <typename T> T &get(int offset, T &t)
        {
                read_bytes(offset, &t, sizeof(T));
                return t;
        }

        /**
         * Copies `size` bytes starting at `offset` into `buffer`. Returns false
         * if the storage does not contain that many bytes at the offset, in
         * which case `buffer` is not modified.
         */
        virtual bool read_bytes(int offset, void *buffer, size_t size) = 0;
        /**
         * Writes `size` bytes from `buffer` at `offset`, growing the storage
         * if needed. Returns false if the write could not be persisted.
         */
        virtual bool write_bytes(int offset, const void *buffer,
                                 size_t size) = 0;

        virtual ~PersistentStorage() = default;
};
