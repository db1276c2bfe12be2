#include "prsync/process.hpp"

#include <cassert>
#include <optional>
#include <string>

int main() {
    auto sh = prsync::find_executable("sh");
    assert(sh);
    assert(prsync::find_executable(sh->string()));
    assert(!prsync::find_executable("prsync-no-such-program-4711"));
    assert(!prsync::find_executable("/nonexistent/dir/rsync"));
    assert(!prsync::find_executable(""));

    auto echoed = prsync::run_process({"sh", "-c", "cat"}, std::string("one\ntwo\n"), true);
    assert(echoed.exit_code == 0);
    assert(echoed.stdout_data == "one\ntwo\n");

    auto status = prsync::run_process({"sh", "-c", "exit 3"}, std::nullopt, true);
    assert(status.exit_code == 3);
    assert(status.stdout_data.empty());

    // The child ignores its input; feeding it must not fail.
    auto ignored = prsync::run_process({"sh", "-c", "exit 0"}, std::string(1 << 20, 'x'), false);
    assert(ignored.exit_code == 0);

    auto missing = prsync::run_process({"prsync-no-such-program-4711"}, std::nullopt, false);
    assert(missing.exit_code == 127);
    return 0;
}
