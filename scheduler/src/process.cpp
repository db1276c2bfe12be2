#include "prsync/process.hpp"

#include "prsync/errors.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>

namespace prsync {

namespace {

class Pipe {
  public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            std::ostringstream oss;
            oss << "pipe failed: " << std::strerror(errno);
            throw ProcessError(oss.str());
        }
    }

    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

  private:
    int fds_[2] = {-1, -1};
};

bool is_executable_file(const std::filesystem::path &path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

// Stops quietly when the reader went away (EPIPE); the child's exit code reports that case.
void write_all(int fd, const std::string &data) {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t rc = ::write(fd, data.data() + written, data.size() - written);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                return;
            }
            std::ostringstream oss;
            oss << "write to child stdin failed: " << std::strerror(errno);
            throw ProcessError(oss.str());
        }
        written += static_cast<std::size_t>(rc);
    }
}

std::string read_all(int fd) {
    std::string out;
    char buffer[4096];
    while (true) {
        ssize_t rc = ::read(fd, buffer, sizeof(buffer));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::ostringstream oss;
            oss << "read from child stdout failed: " << std::strerror(errno);
            throw ProcessError(oss.str());
        }
        if (rc == 0) {
            break;
        }
        out.append(buffer, static_cast<std::size_t>(rc));
    }
    return out;
}

int wait_for(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            std::ostringstream oss;
            oss << "waitpid failed: " << std::strerror(errno);
            throw ProcessError(oss.str());
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::optional<std::filesystem::path> find_executable(const std::string &name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }
    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = std::filesystem::path(dir) / name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

ProcessResult run_process(const std::vector<std::string> &argv,
                          const std::optional<std::string> &stdin_data, bool capture_stdout) {
    if (argv.empty()) {
        throw std::invalid_argument("argv must not be empty");
    }

    // The child may exit without draining stdin; that must not kill the scheduler.
    static std::once_flag ignore_sigpipe;
    std::call_once(ignore_sigpipe, [] { ::signal(SIGPIPE, SIG_IGN); });

    std::optional<Pipe> in_pipe;
    std::optional<Pipe> out_pipe;
    if (stdin_data) {
        in_pipe.emplace();
    }
    if (capture_stdout) {
        out_pipe.emplace();
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        std::ostringstream oss;
        oss << "fork failed: " << std::strerror(errno);
        throw ProcessError(oss.str());
    }
    if (pid == 0) {
        if (in_pipe && ::dup2(in_pipe->read_end(), STDIN_FILENO) < 0) {
            std::_Exit(127);
        }
        if (out_pipe && ::dup2(out_pipe->write_end(), STDOUT_FILENO) < 0) {
            std::_Exit(127);
        }
        ::execvp(args[0], args.data());
        const char *prefix = "exec failed: ";
        (void)!::write(STDERR_FILENO, prefix, std::strlen(prefix));
        (void)!::write(STDERR_FILENO, args[0], std::strlen(args[0]));
        (void)!::write(STDERR_FILENO, "\n", 1);
        std::_Exit(127);
    }

    ProcessResult result{0, {}};
    try {
        if (in_pipe) {
            in_pipe->close_read();
            write_all(in_pipe->write_end(), *stdin_data);
            in_pipe->close_write();
        }
        if (out_pipe) {
            out_pipe->close_write();
            result.stdout_data = read_all(out_pipe->read_end());
        }
    } catch (const ProcessError &) {
        in_pipe.reset();
        out_pipe.reset();
        wait_for(pid);
        throw;
    }
    result.exit_code = wait_for(pid);
    return result;
}

} // namespace prsync
