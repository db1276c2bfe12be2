#include "prsync/transfer_executor.hpp"

#include "prsync/errors.hpp"
#include "prsync/process.hpp"

#include <utility>

namespace prsync {

const char *direction_name(Direction direction) noexcept {
    return direction == Direction::Upload ? "upload" : "download";
}

std::string TransferTask::remote_endpoint() const {
    std::string login = remote_user.empty() ? remote_host : remote_user + "@" + remote_host;
    return login + ":" + remote_path;
}

std::string TransferTask::source() const {
    return direction == Direction::Upload ? local_path : remote_endpoint();
}

std::string TransferTask::destination() const {
    return direction == Direction::Upload ? remote_endpoint() : local_path;
}

RsyncExecutor::RsyncExecutor(std::string rsync_binary) : rsync_binary_(std::move(rsync_binary)) {}

std::vector<std::string> RsyncExecutor::build_command(const TransferTask &task) const {
    std::vector<std::string> argv{rsync_binary_};
    argv.insert(argv.end(), task.extra_args.begin(), task.extra_args.end());
    if (task.bandwidth_limit_kbs > 0) {
        argv.push_back("--bwlimit=" + std::to_string(task.bandwidth_limit_kbs));
    }
    argv.push_back("--files-from=-");
    argv.push_back(task.source());
    argv.push_back(task.destination());
    return argv;
}

TransferOutcome RsyncExecutor::execute(const TransferTask &task) {
    std::string file_list;
    for (const auto &file : task.files) {
        file_list += file;
        file_list += '\n';
    }
    try {
        ProcessResult result = run_process(build_command(task), file_list, false);
        return TransferOutcome{result.exit_code, task.files.size()};
    } catch (const ProcessError &err) {
        throw TransferError(std::string("cannot run transfer: ") + err.what());
    }
}

} // namespace prsync
