#include "prsync/errors.hpp"
#include "prsync/file_enumerator.hpp"
#include "prsync/scheduler.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace {

class CannedListing : public prsync::ListingProvider {
  public:
    explicit CannedListing(std::string text) : text_(std::move(text)) {}

    std::string list(const prsync::EnumerationRequest &request) override {
        ++calls_;
        last_source_ = request.source;
        return text_;
    }

    int calls() const { return calls_; }
    const std::string &last_source() const { return last_source_; }

  private:
    std::string text_;
    std::string last_source_;
    int calls_{0};
};

class RecordingExecutor : public prsync::TransferExecutor {
  public:
    explicit RecordingExecutor(int exit_code = 0) : exit_code_(exit_code) {}

    prsync::TransferOutcome execute(const prsync::TransferTask &task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(task);
        return prsync::TransferOutcome{exit_code_, task.files.size()};
    }

    std::vector<prsync::TransferTask> tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_;
    }

  private:
    int exit_code_;
    mutable std::mutex mutex_;
    std::vector<prsync::TransferTask> tasks_;
};

void test_empty_workload() {
    std::ostringstream log;
    prsync::Logger logger(log);
    CannedListing lister("sending incremental file list\n4096 ./\n\nsent 50 bytes  received 20 bytes\n");
    RecordingExecutor executor;
    prsync::Scheduler scheduler(prsync::parse_options({"--parallel=3", "src/", "node:/dst/"}), lister, executor,
                                logger);
    auto report = scheduler.run();
    assert(report.status == prsync::CompletionStatus::NothingToTransfer);
    assert(report.exit_code() == 0);
    assert(executor.tasks().empty());
    assert(log.str().find("nothing to transfer") != std::string::npos);
}

void test_dynamic_drains_queue() {
    std::ostringstream log;
    prsync::Logger logger(log);
    CannedListing lister("1 e\n5 a\n4 b\n3 c\n2 d\n");
    RecordingExecutor executor;
    prsync::Scheduler scheduler(prsync::parse_options({"--parallel=2", "--batch_size=2", "--hosts=1",
                                                       "--total_bw=16", "-a", "src/", "u@node:/dst/"}),
                                lister, executor, logger);
    auto report = scheduler.run();
    assert(report.status == prsync::CompletionStatus::Success);
    assert(report.exit_code() == 0);
    assert(report.residual == 0);
    assert(report.transferred_files == 5);
    assert(report.transferred_bytes == 15);
    assert(lister.calls() == 1);

    auto tasks = executor.tasks();
    assert(tasks.size() == 3);
    std::set<std::string> seen;
    for (const auto &task : tasks) {
        assert(task.remote_host == "node1" || task.remote_host == "node2");
        assert(task.remote_user == "u");
        assert(task.bandwidth_limit_kbs == 1000);
        assert(task.direction == prsync::Direction::Upload);
        assert(task.extra_args.size() == 1 && task.extra_args[0] == "-a");
        for (const auto &file : task.files) {
            assert(seen.insert(file).second);
        }
    }
    assert(seen.size() == 5);
    // The largest files are offered first.
    const bool a_first = std::any_of(tasks.begin(), tasks.end(), [](const prsync::TransferTask &task) {
        return task.files.size() == 2 && task.files[0] == "a" && task.files[1] == "b";
    });
    assert(a_first);
}

void test_static_partition() {
    std::ostringstream log;
    prsync::Logger logger(log);
    CannedListing lister("100 b\n300 a\n100 c\n100 d\n");
    RecordingExecutor executor;
    prsync::Scheduler scheduler(prsync::parse_options({"--parallel=2", "--static", "node:/src/", "/local/"}), lister,
                                executor, logger);
    auto report = scheduler.run();
    assert(report.ok());
    assert(report.transferred_files == 4);

    auto tasks = executor.tasks();
    assert(tasks.size() == 2);
    for (const auto &task : tasks) {
        assert(task.direction == prsync::Direction::Download);
        assert(task.source() == "node:/src/");
        assert(task.destination() == "/local/");
        assert(task.bandwidth_limit_kbs == 0);
        if (task.files.size() == 1) {
            assert(task.files[0] == "a");
        } else {
            assert(task.files.size() == 3);
            assert(task.files[0] == "d" && task.files[1] == "c" && task.files[2] == "b");
        }
    }
}

void test_failed_batches_fail_the_run() {
    std::ostringstream log;
    prsync::Logger logger(log);
    CannedListing lister("5 a\n4 b\n3 c\n2 d\n1 e\n");
    RecordingExecutor executor(12);
    prsync::Scheduler scheduler(prsync::parse_options({"--parallel=1", "--batch_size=2", "src/", "node:/dst/"}),
                                lister, executor, logger);
    auto report = scheduler.run();
    assert(report.status == prsync::CompletionStatus::IncompleteTransfer);
    assert(report.residual == 3);
    assert(report.exit_code() == 1);
    assert(executor.tasks().size() == 1);
    assert(log.str().find("[ERROR]") != std::string::npos);
}

void test_malformed_listing_aborts_before_workers() {
    std::ostringstream log;
    prsync::Logger logger(log);
    CannedListing lister("5 a\ngarbage\n");
    RecordingExecutor executor;
    prsync::Scheduler scheduler(prsync::parse_options({"--parallel=2", "src/", "node:/dst/"}), lister, executor,
                                logger);
    bool threw = false;
    try {
        scheduler.run();
    } catch (const prsync::MalformedListing &) {
        threw = true;
    }
    assert(threw);
    assert(executor.tasks().empty());
}

void test_files_from_skips_listing() {
    namespace fs = std::filesystem;
    auto temp_dir = fs::temp_directory_path() / "prsync_scheduler_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);
    auto list_path = temp_dir / "list.txt";
    {
        std::ofstream list(list_path);
        list << prsync::sized_list_header << "\n30 x\n20 y\n10 z\n";
    }
    std::ostringstream log;
    prsync::Logger logger(log);
    CannedListing lister("");
    RecordingExecutor executor;
    prsync::Scheduler scheduler(
        prsync::parse_options({"--parallel=2", "--files-from=" + list_path.string(), "node:/src/", "/local/"}),
        lister, executor, logger);
    auto report = scheduler.run();
    assert(report.ok());
    assert(report.transferred_files == 3);
    assert(report.transferred_bytes == 60);
    assert(lister.calls() == 0);

    {
        std::ofstream list(list_path);
        list << "2024 report.txt\nnotes.txt\n";
    }
    RecordingExecutor bare_executor;
    prsync::Scheduler bare(
        prsync::parse_options({"--parallel=1", "--files-from=" + list_path.string(), "node:/src", "/local/"}),
        lister, bare_executor, logger);
    assert(bare.run().ok());
    auto tasks = bare_executor.tasks();
    assert(tasks.size() == 1);
    assert(tasks[0].source() == "node:/src");
    assert(tasks[0].files.size() == 2);
    assert(tasks[0].files[0] == "2024 report.txt" && tasks[0].files[1] == "notes.txt");
    fs::remove_all(temp_dir);
}

void test_source_without_trailing_slash() {
    std::ostringstream log;
    prsync::Logger logger(log);
    // rsync names the entries of "mydir" relative to its parent.
    CannedListing lister("sending incremental file list\n4096 mydir/\n5 mydir/a\n3 mydir/sub/b\n");
    RecordingExecutor executor;
    prsync::Scheduler scheduler(prsync::parse_options({"--parallel=1", "mydir", "node:/dst/"}), lister, executor,
                                logger);
    assert(scheduler.run().ok());
    assert(lister.last_source() == "mydir");
    auto tasks = executor.tasks();
    assert(tasks.size() == 1);
    assert(tasks[0].source() == "./");
    assert(tasks[0].destination() == "node:/dst/");
    assert(tasks[0].files.size() == 2);
    assert(tasks[0].files[0] == "mydir/a" && tasks[0].files[1] == "mydir/sub/b");

    CannedListing remote_lister("7 data/x\n");
    RecordingExecutor download_executor;
    prsync::Scheduler download(prsync::parse_options({"--parallel=1", "node:/srv/data", "/local"}), remote_lister,
                               download_executor, logger);
    assert(download.run().ok());
    assert(remote_lister.last_source() == "node:/srv/data");
    auto download_tasks = download_executor.tasks();
    assert(download_tasks.size() == 1);
    assert(download_tasks[0].source() == "node:/srv/");
    assert(download_tasks[0].destination() == "/local");
    assert(download_tasks[0].files.size() == 1 && download_tasks[0].files[0] == "data/x");
}

} // namespace

int main() {
    test_empty_workload();
    test_dynamic_drains_queue();
    test_static_partition();
    test_failed_batches_fail_the_run();
    test_malformed_listing_aborts_before_workers();
    test_files_from_skips_listing();
    test_source_without_trailing_slash();
    return 0;
}
