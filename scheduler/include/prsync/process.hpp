#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace prsync {

struct ProcessResult {
    int exit_code;
    std::string stdout_data;
};

// Resolves `name` the way execvp would: names containing '/' are checked directly,
// bare names are searched on PATH. Returns nullopt when nothing executable is found.
std::optional<std::filesystem::path> find_executable(const std::string &name);

// Runs argv[0] with the given arguments and waits for it. When `stdin_data` is set it is
// written to the child's stdin, which is then closed; otherwise the child inherits stdin.
// Stdout is captured only when `capture_stdout` is true. Throws ProcessError if the child
// cannot be started or waited on. A child killed by a signal reports 128 + signal.
// Stdin is written in full before stdout is read; don't combine large amounts of both.
ProcessResult run_process(const std::vector<std::string> &argv,
                          const std::optional<std::string> &stdin_data, bool capture_stdout);

} // namespace prsync
