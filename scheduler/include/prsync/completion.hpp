#pragma once

#include "prsync/worker_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace prsync {

enum class CompletionStatus { Success, NothingToTransfer, IncompleteTransfer, BatchFailures };

struct CompletionReport {
    CompletionStatus status = CompletionStatus::Success;
    std::size_t residual = 0;
    std::size_t transferred_files = 0;
    std::int64_t transferred_bytes = 0;
    std::size_t failed_batches = 0;
    std::size_t failed_files = 0;
    std::vector<std::size_t> failed_workers;

    bool ok() const noexcept;
    int exit_code() const noexcept;
    std::string describe() const;
};

class CompletionTracker {
  public:
    static CompletionReport nothing_to_transfer();

    // Call only after every worker has been joined. `residual` is what is left in the
    // work queue (always 0 for a static run).
    static CompletionReport evaluate(std::size_t residual, const std::vector<WorkerReport> &reports);
};

} // namespace prsync
