#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace prsync {

enum class Direction { Upload, Download };

const char *direction_name(Direction direction) noexcept;

struct TransferTask {
    Direction direction;
    std::string remote_user;
    std::string remote_host;
    std::string remote_path;
    std::string local_path;
    std::uint64_t bandwidth_limit_kbs; // 0 = unlimited
    std::vector<std::string> files;
    std::vector<std::string> extra_args;

    std::string remote_endpoint() const;
    std::string source() const;
    std::string destination() const;
};

struct TransferOutcome {
    int exit_code;
    std::size_t files;

    bool ok() const noexcept { return exit_code == 0; }
};

// Copies the files of one task and blocks until done. A transfer that ran but failed is
// reported through a non-zero exit code; TransferError means it could not run at all.
class TransferExecutor {
  public:
    virtual ~TransferExecutor() = default;

    virtual TransferOutcome execute(const TransferTask &task) = 0;
};

class RsyncExecutor : public TransferExecutor {
  public:
    explicit RsyncExecutor(std::string rsync_binary);

    TransferOutcome execute(const TransferTask &task) override;

    std::vector<std::string> build_command(const TransferTask &task) const;

  private:
    std::string rsync_binary_;
};

} // namespace prsync
