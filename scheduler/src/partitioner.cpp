#include "prsync/partitioner.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <stdexcept>
#include <utility>

namespace prsync {

StaticPartitioner::StaticPartitioner(std::size_t workers) : workers_(workers) {
    if (workers_ == 0) {
        throw std::invalid_argument("worker count must be > 0");
    }
}

std::vector<Chunk> StaticPartitioner::partition(const std::vector<FileRecord> &sorted_files) const {
    std::vector<Chunk> chunks;
    chunks.reserve(workers_);
    for (std::size_t i = 0; i < workers_; ++i) {
        chunks.push_back(Chunk{i, 0, {}});
    }

    // (total, index): the smallest total wins, the lowest index breaks ties.
    using Load = std::pair<std::int64_t, std::size_t>;
    std::priority_queue<Load, std::vector<Load>, std::greater<Load>> loads;
    for (std::size_t i = 0; i < workers_; ++i) {
        loads.emplace(0, i);
    }

    for (const auto &file : sorted_files) {
        auto [total, index] = loads.top();
        loads.pop();
        chunks[index].files.push_back(file);
        chunks[index].total_size = total + file.size;
        loads.emplace(chunks[index].total_size, index);
    }

    for (auto &chunk : chunks) {
        if (chunk.id % 2 == 1) {
            std::reverse(chunk.files.begin(), chunk.files.end());
        }
    }
    return chunks;
}

std::size_t StaticPartitioner::workers() const noexcept { return workers_; }

} // namespace prsync
