#pragma once
#include "../interface/persistent_storage.hpp"
#include <string>
#include <utility>

/**
 * Persistent storage kept in a single binary file on the host machine. The
 * file is created on the first write and grows as records at higher offsets
 * are written, gaps are filled with zeros.
 */
class FilePersistentStorage : public PersistentStorage
{
      public:
        explicit FilePersistentStorage(std::string file_path)
            : file_path(std::move(file_path))
        {
        }

        bool read_bytes(int offset, void *buffer, size_t size) override;
        bool write_bytes(int offset, const void *buffer, size_t size) override;

        const std::string &get_file_path() const { return file_path; }

      private:
        std::string file_path;
};
