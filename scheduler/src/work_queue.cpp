#include "prsync/work_queue.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace prsync {

WorkQueue::WorkQueue(std::vector<FileRecord> files)
    : files_(std::make_move_iterator(files.begin()), std::make_move_iterator(files.end())),
      initial_size_(files_.size()) {}

std::optional<Batch> WorkQueue::claim_batch(std::size_t max_count, std::size_t worker_id) {
    if (max_count == 0) {
        throw std::invalid_argument("batch size must be > 0");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (files_.empty()) {
        return std::nullopt;
    }
    const auto count = std::min(max_count, files_.size());
    const auto end = files_.begin() + static_cast<std::ptrdiff_t>(count);
    Batch batch{worker_id, {}};
    batch.files.reserve(count);
    std::move(files_.begin(), end, std::back_inserter(batch.files));
    files_.erase(files_.begin(), end);
    return batch;
}

std::size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

bool WorkQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.empty();
}

std::size_t WorkQueue::initial_size() const noexcept { return initial_size_; }

std::size_t WorkQueue::claimed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initial_size_ - files_.size();
}

} // namespace prsync
