#include "file_persistent_storage.hpp"
#include "../../logging.hpp"

#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

#define TAG "file_persistent_storage"

bool FilePersistentStorage::read_bytes(int offset, void *buffer, size_t size)
{
        if (offset < 0) {
                LOG_ERROR(TAG, "Invalid storage offset %d", offset);
                return false;
        }

        std::ifstream file(file_path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
                LOG_DEBUG(TAG, "Storage file %s does not exist yet.",
                          file_path.c_str());
                return false;
        }

        std::streamoff file_size = file.tellg();
        if (offset + static_cast<std::streamoff>(size) > file_size) {
                LOG_DEBUG(TAG,
                          "Storage file %s has %lld bytes, cannot read %zu "
                          "bytes at offset %d.",
                          file_path.c_str(), (long long)file_size, size,
                          offset);
                return false;
        }

        // Read into a temporary buffer so that a failed read leaves the
        // destination untouched.
        std::vector<char> contents(size);
        file.seekg(offset);
        file.read(contents.data(), size);
        if (static_cast<size_t>(file.gcount()) != size) {
                LOG_ERROR(TAG, "Failed to read %zu bytes from %s.", size,
                          file_path.c_str());
                return false;
        }
        memcpy(buffer, contents.data(), size);
        return true;
}

bool FilePersistentStorage::write_bytes(int offset, const void *buffer,
                                        size_t size)
{
        if (offset < 0) {
                LOG_ERROR(TAG, "Invalid storage offset %d", offset);
                return false;
        }

        std::vector<char> contents;
        {
                std::ifstream existing(file_path, std::ios::binary);
                if (existing.is_open()) {
                        contents.assign(std::istreambuf_iterator<char>(existing),
                                        std::istreambuf_iterator<char>());
                }
        }

        if (contents.size() < offset + size) {
                contents.resize(offset + size, 0);
        }
        memcpy(contents.data() + offset, buffer, size);

        std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
                LOG_ERROR(TAG, "Unable to open storage file %s for writing.",
                          file_path.c_str());
                return false;
        }
        file.write(contents.data(), contents.size());
        file.flush();
        if (!file.good()) {
                LOG_ERROR(TAG, "Failed to write %zu bytes to %s.", size,
                          file_path.c_str());
                return false;
        }
        LOG_TRACE(TAG, "Wrote %zu bytes at offset %d to %s.", size, offset,
                  file_path.c_str());
        return true;
}
