#include "prsync/scheduler.hpp"

#include "prsync/bandwidth.hpp"
#include "prsync/partitioner.hpp"
#include "prsync/work_queue.hpp"
#include "prsync/worker_pool.hpp"

#include <optional>
#include <utility>

namespace prsync {

Scheduler::Scheduler(Options options, ListingProvider &lister, TransferExecutor &executor, Logger &logger)
    : options_(std::move(options)), lister_(lister), executor_(executor), logger_(logger) {}

std::vector<FileRecord> Scheduler::load_workload() const {
    if (options_.files_from) {
        std::optional<std::filesystem::path> local_root;
        if (options_.direction == Direction::Upload) {
            local_root = std::filesystem::path(options_.local_path);
        }
        logger_.info("reading file list from " + options_.files_from->string());
        return FileEnumerator::load_files_from(*options_.files_from, local_root);
    }
    logger_.info("listing " + options_.source + " -> " + options_.destination);
    FileEnumerator enumerator(lister_);
    return enumerator.enumerate(EnumerationRequest{options_.transfer_options, options_.source, options_.destination});
}

WorkerContext Scheduler::make_context() const {
    WorkerContext context;
    context.direction = options_.direction;
    context.remote = options_.remote;
    context.host_start_index = options_.host_start_index;
    context.local_path = options_.local_path;
    context.bandwidth_limit_kbs = worker_bandwidth_kbs(options_.total_bw_mbps, options_.parallel);
    context.extra_args = options_.transfer_options;
    return context;
}

CompletionReport Scheduler::run() {
    auto files = load_workload();
    if (files.empty()) {
        logger_.info("nothing to transfer");
        return CompletionTracker::nothing_to_transfer();
    }
    std::int64_t total_bytes = 0;
    for (const auto &file : files) {
        total_bytes += file.size;
    }
    logger_.info(std::to_string(files.size()) + " files, " + std::to_string(total_bytes) + " bytes to " +
                 direction_name(options_.direction) + " with " + std::to_string(options_.parallel) + " workers");

    const auto limit = worker_bandwidth_kbs(options_.total_bw_mbps, options_.parallel);
    if (limit > 0) {
        logger_.info("bandwidth limit per worker: " + std::to_string(limit) + " KB/s");
    }

    CompletionReport report = options_.static_mode ? run_static(files) : run_dynamic(std::move(files));
    if (report.ok()) {
        logger_.info(report.describe());
    } else {
        logger_.error(report.describe());
    }
    return report;
}

CompletionReport Scheduler::run_static(const std::vector<FileRecord> &files) {
    StaticPartitioner partitioner(options_.parallel);
    auto chunks = partitioner.partition(files);
    for (const auto &chunk : chunks) {
        logger_.info("chunk " + std::to_string(chunk.id) + ": " + std::to_string(chunk.files.size()) + " files, " +
                     std::to_string(chunk.total_size) + " bytes");
    }
    WorkerPool pool(options_.parallel, executor_, make_context(), logger_);
    const auto reports = pool.run_static(std::move(chunks));
    return CompletionTracker::evaluate(0, reports);
}

CompletionReport Scheduler::run_dynamic(std::vector<FileRecord> files) {
    WorkQueue queue(std::move(files));
    WorkerPool pool(options_.parallel, executor_, make_context(), logger_);
    const auto reports = pool.run_dynamic(queue, options_.batch_size);
    return CompletionTracker::evaluate(queue.size(), reports);
}

} // namespace prsync
