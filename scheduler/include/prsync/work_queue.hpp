#pragma once

#include "prsync/file_record.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace prsync {

// The shared remaining work of a dynamic run. Filled once, only ever drained.
class WorkQueue {
  public:
    explicit WorkQueue(std::vector<FileRecord> files);

    WorkQueue(const WorkQueue &) = delete;
    WorkQueue &operator=(const WorkQueue &) = delete;

    // Atomically removes up to `max_count` records from the front. Returns nullopt once the
    // queue is empty. Concurrent callers never receive overlapping records.
    std::optional<Batch> claim_batch(std::size_t max_count, std::size_t worker_id);

    std::size_t size() const;
    bool empty() const;
    std::size_t initial_size() const noexcept;
    std::size_t claimed() const;

  private:
    mutable std::mutex mutex_;
    std::deque<FileRecord> files_;
    const std::size_t initial_size_;
};

} // namespace prsync
