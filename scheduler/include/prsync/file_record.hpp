#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace prsync {

struct FileRecord {
    std::int64_t size;
    std::string path;
};

inline bool operator==(const FileRecord &lhs, const FileRecord &rhs) {
    return lhs.size == rhs.size && lhs.path == rhs.path;
}

inline bool operator!=(const FileRecord &lhs, const FileRecord &rhs) { return !(lhs == rhs); }

// Statically pre-assigned work for worker `id`. total_size is the sum of the file sizes.
struct Chunk {
    std::size_t id;
    std::int64_t total_size;
    std::vector<FileRecord> files;
};

// A slice claimed from the shared WorkQueue by one worker.
struct Batch {
    std::size_t worker_id;
    std::vector<FileRecord> files;

    std::size_t size() const noexcept { return files.size(); }
};

} // namespace prsync
