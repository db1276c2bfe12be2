#pragma once

#include "prsync/remote_spec.hpp"
#include "prsync/transfer_executor.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace prsync {

constexpr std::size_t default_batch_size = 10;
constexpr std::size_t max_parallel = 1024;

struct Options {
    std::size_t parallel = 0;
    std::optional<std::size_t> host_start_index;
    std::optional<std::uint64_t> total_bw_mbps;
    std::size_t batch_size = default_batch_size;
    std::optional<std::filesystem::path> files_from;
    bool static_mode = false;
    std::optional<std::string> log_file;
    std::string rsync_binary = "rsync";
    bool help = false;

    // Pass-through arguments, split into rsync options and the two endpoints.
    std::vector<std::string> transfer_options;
    std::string source;
    std::string destination;

    Direction direction = Direction::Upload;
    // The transfer side of the endpoints. Without --files-from the source is reduced to the
    // directory its listed names are relative to: "data" becomes "./", "host:/srv/data"
    // becomes "host:/srv/". A --files-from list is relative to the source as written.
    RemoteSpec remote;
    std::string local_path;
};

// Parses the arguments after the program name. Scheduler flags must come first; the first
// argument that is not one of them starts the pass-through arguments, whose last two entries
// are the source and destination. Throws ConfigurationError on invalid input.
Options parse_options(const std::vector<std::string> &args);

std::string usage(const std::string &program);

} // namespace prsync
