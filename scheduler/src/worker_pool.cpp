#include "prsync/worker_pool.hpp"

#include "prsync/errors.hpp"

#include <functional>
#include <stdexcept>
#include <utility>

namespace prsync {

namespace {

std::string worker_tag(const WorkerReport &report) {
    return "worker " + std::to_string(report.worker_id) + " (" + report.host + ")";
}

} // namespace

WorkerPool::WorkerPool(std::size_t workers, TransferExecutor &executor, WorkerContext context, Logger &logger)
    : workers_(workers), executor_(executor), context_(std::move(context)), logger_(logger) {
    if (workers_ == 0) {
        throw std::invalid_argument("worker count must be > 0");
    }
}

WorkerPool::~WorkerPool() { join_all(); }

std::size_t WorkerPool::workers() const noexcept { return workers_; }

TransferTask WorkerPool::make_task(std::size_t worker_id, const std::vector<FileRecord> &files) const {
    TransferTask task;
    task.direction = context_.direction;
    task.remote_user = context_.remote.user;
    task.remote_host = mapped_host(context_.remote.host, context_.host_start_index, worker_id);
    task.remote_path = context_.remote.path;
    task.local_path = context_.local_path;
    task.bandwidth_limit_kbs = context_.bandwidth_limit_kbs;
    task.extra_args = context_.extra_args;
    task.files.reserve(files.size());
    for (const auto &file : files) {
        task.files.push_back(file.path);
    }
    return task;
}

std::vector<WorkerReport> WorkerPool::make_reports() const {
    std::vector<WorkerReport> reports(workers_);
    for (std::size_t i = 0; i < workers_; ++i) {
        reports[i].worker_id = i;
        reports[i].host = mapped_host(context_.remote.host, context_.host_start_index, i);
    }
    return reports;
}

std::vector<WorkerReport> WorkerPool::run_static(std::vector<Chunk> chunks) {
    if (chunks.size() != workers_) {
        throw std::invalid_argument("expected one chunk per worker");
    }
    auto reports = make_reports();
    threads_.reserve(workers_);
    try {
        for (std::size_t i = 0; i < workers_; ++i) {
            threads_.emplace_back(&WorkerPool::static_worker, this, std::move(chunks[i]), std::ref(reports[i]));
        }
    } catch (...) {
        // Started workers hold references into reports.
        join_all();
        throw;
    }
    join_all();
    return reports;
}

std::vector<WorkerReport> WorkerPool::run_dynamic(WorkQueue &queue, std::size_t batch_size) {
    if (batch_size == 0) {
        throw std::invalid_argument("batch size must be > 0");
    }
    auto reports = make_reports();
    threads_.reserve(workers_);
    try {
        for (std::size_t i = 0; i < workers_; ++i) {
            threads_.emplace_back(&WorkerPool::dynamic_worker, this, std::ref(queue), batch_size,
                                  std::ref(reports[i]));
        }
    } catch (...) {
        join_all();
        throw;
    }
    join_all();
    return reports;
}

void WorkerPool::static_worker(Chunk chunk, WorkerReport &report) {
    if (chunk.files.empty()) {
        logger_.info(worker_tag(report) + ": empty chunk, nothing to do");
        report.state = WorkerState::Done;
        return;
    }
    logger_.info(worker_tag(report) + ": " + std::to_string(chunk.files.size()) + " files, " +
                 std::to_string(chunk.total_size) + " bytes");
    transfer(chunk.files, report);
    report.state = WorkerState::Done;
}

void WorkerPool::dynamic_worker(WorkQueue &queue, std::size_t batch_size, WorkerReport &report) {
    while (true) {
        report.state = WorkerState::Claiming;
        auto batch = queue.claim_batch(batch_size, report.worker_id);
        if (!batch) {
            break;
        }
        if (!transfer(batch->files, report)) {
            logger_.warn(worker_tag(report) + ": stopping after failed batch");
            break;
        }
        report.state = WorkerState::Idle;
    }
    report.state = WorkerState::Done;
    logger_.info(worker_tag(report) + ": done, " + std::to_string(report.files_transferred) + " files in " +
                 std::to_string(report.batches) + " batches");
}

bool WorkerPool::transfer(const std::vector<FileRecord> &files, WorkerReport &report) {
    report.state = WorkerState::Transferring;
    std::int64_t bytes = 0;
    for (const auto &file : files) {
        bytes += file.size;
    }
    try {
        const TransferOutcome outcome = executor_.execute(make_task(report.worker_id, files));
        if (outcome.ok()) {
            ++report.batches;
            report.files_transferred += files.size();
            report.bytes_transferred += bytes;
            return true;
        }
        logger_.error(worker_tag(report) + ": transfer of " + std::to_string(files.size()) +
                      " files exited with code " + std::to_string(outcome.exit_code));
    } catch (const std::exception &err) {
        logger_.error(worker_tag(report) + ": transfer of " + std::to_string(files.size()) +
                      " files failed: " + err.what());
    }
    ++report.failed_batches;
    report.failed_files += files.size();
    return false;
}

void WorkerPool::join_all() {
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

} // namespace prsync
