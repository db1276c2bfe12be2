#include "prsync/completion.hpp"

#include <sstream>

namespace prsync {

bool CompletionReport::ok() const noexcept {
    return status == CompletionStatus::Success || status == CompletionStatus::NothingToTransfer;
}

int CompletionReport::exit_code() const noexcept { return ok() ? 0 : 1; }

std::string CompletionReport::describe() const {
    std::ostringstream oss;
    switch (status) {
    case CompletionStatus::NothingToTransfer:
        oss << "nothing to transfer";
        break;
    case CompletionStatus::Success:
        oss << "transfer complete: " << transferred_files << " files, " << transferred_bytes << " bytes";
        break;
    case CompletionStatus::IncompleteTransfer:
        oss << "incomplete transfer: " << residual << " files left untransferred";
        if (failed_batches > 0) {
            oss << ", " << failed_files << " files in " << failed_batches << " failed batches";
        }
        break;
    case CompletionStatus::BatchFailures:
        oss << "transfer finished with " << failed_batches << " failed batches (" << failed_files << " files)";
        break;
    }
    if (!failed_workers.empty()) {
        oss << "; failing workers:";
        for (auto id : failed_workers) {
            oss << ' ' << id;
        }
    }
    return oss.str();
}

CompletionReport CompletionTracker::nothing_to_transfer() {
    CompletionReport report;
    report.status = CompletionStatus::NothingToTransfer;
    return report;
}

CompletionReport CompletionTracker::evaluate(std::size_t residual, const std::vector<WorkerReport> &reports) {
    CompletionReport report;
    report.residual = residual;
    for (const auto &worker : reports) {
        report.transferred_files += worker.files_transferred;
        report.transferred_bytes += worker.bytes_transferred;
        report.failed_batches += worker.failed_batches;
        report.failed_files += worker.failed_files;
        if (worker.failed_batches > 0) {
            report.failed_workers.push_back(worker.worker_id);
        }
    }
    if (residual > 0) {
        report.status = CompletionStatus::IncompleteTransfer;
    } else if (report.failed_batches > 0) {
        report.status = CompletionStatus::BatchFailures;
    } else {
        report.status = CompletionStatus::Success;
    }
    return report;
}

} // namespace prsync
