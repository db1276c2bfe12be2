#pragma once

#include "prsync/completion.hpp"
#include "prsync/file_enumerator.hpp"
#include "prsync/logger.hpp"
#include "prsync/options.hpp"
#include "prsync/transfer_executor.hpp"

#include <vector>

namespace prsync {

class Scheduler {
  public:
    Scheduler(Options options, ListingProvider &lister, TransferExecutor &executor, Logger &logger);

    // Loads the workload, runs the workers to completion and evaluates the result.
    // Configuration and enumeration errors propagate before any worker starts.
    CompletionReport run();

    std::vector<FileRecord> load_workload() const;

  private:
    WorkerContext make_context() const;
    CompletionReport run_static(const std::vector<FileRecord> &files);
    CompletionReport run_dynamic(std::vector<FileRecord> files);

    const Options options_;
    ListingProvider &lister_;
    TransferExecutor &executor_;
    Logger &logger_;
};

} // namespace prsync
