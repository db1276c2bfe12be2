#pragma once

#include "prsync/file_record.hpp"
#include "prsync/logger.hpp"
#include "prsync/remote_spec.hpp"
#include "prsync/transfer_executor.hpp"
#include "prsync/work_queue.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace prsync {

// Everything a worker needs to build its transfer tasks. Built once, shared read-only.
struct WorkerContext {
    Direction direction;
    RemoteSpec remote;
    std::optional<std::size_t> host_start_index;
    std::string local_path;
    std::uint64_t bandwidth_limit_kbs;
    std::vector<std::string> extra_args;
};

enum class WorkerState { Idle, Claiming, Transferring, Done };

struct WorkerReport {
    std::size_t worker_id = 0;
    std::string host;
    WorkerState state = WorkerState::Idle;
    std::size_t batches = 0;
    std::size_t files_transferred = 0;
    std::int64_t bytes_transferred = 0;
    std::size_t failed_batches = 0;
    std::size_t failed_files = 0;
};

class WorkerPool {
  public:
    WorkerPool(std::size_t workers, TransferExecutor &executor, WorkerContext context, Logger &logger);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // One worker per chunk; `chunks.size()` must equal the worker count. Each worker
    // transfers its chunk once. Returns after every worker has finished.
    std::vector<WorkerReport> run_static(std::vector<Chunk> chunks);

    // Workers claim up to `batch_size` files at a time until the queue is empty or their
    // own transfer fails. Returns after every worker has finished.
    std::vector<WorkerReport> run_dynamic(WorkQueue &queue, std::size_t batch_size);

    std::size_t workers() const noexcept;

    TransferTask make_task(std::size_t worker_id, const std::vector<FileRecord> &files) const;

  private:
    void static_worker(Chunk chunk, WorkerReport &report);
    void dynamic_worker(WorkQueue &queue, std::size_t batch_size, WorkerReport &report);
    bool transfer(const std::vector<FileRecord> &files, WorkerReport &report);
    std::vector<WorkerReport> make_reports() const;
    void join_all();

    std::size_t workers_;
    TransferExecutor &executor_;
    const WorkerContext context_;
    Logger &logger_;
    std::vector<std::thread> threads_;
};

} // namespace prsync
