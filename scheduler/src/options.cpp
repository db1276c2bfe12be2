#include "prsync/options.hpp"

#include "prsync/bandwidth.hpp"
#include "prsync/errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace prsync {

namespace {

std::uint64_t parse_number(const std::string &flag, const std::string &value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); })) {
        throw ConfigurationError(flag + " expects a non-negative integer, got '" + value + "'");
    }
    std::uint64_t result = 0;
    for (char ch : value) {
        const auto digit = static_cast<std::uint64_t>(ch - '0');
        if (result > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw ConfigurationError(flag + " value is out of range: " + value);
        }
        result = result * 10 + digit;
    }
    return result;
}

std::size_t parse_positive(const std::string &flag, const std::string &value) {
    const auto number = parse_number(flag, value);
    if (number == 0 || number > std::numeric_limits<std::size_t>::max()) {
        throw ConfigurationError(flag + " must be at least 1");
    }
    return static_cast<std::size_t>(number);
}

std::size_t parse_bounded(const std::string &flag, const std::string &value, std::size_t limit) {
    const auto number = parse_positive(flag, value);
    if (number > limit) {
        throw ConfigurationError(flag + " must be at most " + std::to_string(limit));
    }
    return number;
}

// Directory the listed names are relative to. rsync names the entries of a source
// without a trailing slash after its last component ("dir" lists "dir/a"), so the
// transfer has to run from the parent.
std::string transfer_root(const std::string &path) {
    if (path.empty() || path.back() == '/') {
        return path;
    }
    const auto slash = path.rfind('/');
    const std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
    if (base == "." || base == "..") {
        return path + "/";
    }
    if (slash == std::string::npos) {
        return "./";
    }
    return path.substr(0, slash + 1);
}

// Matches `--name=value` and stores the value.
bool flag_value(const std::string &arg, const std::string &name, std::string &value) {
    const std::string prefix = name + "=";
    if (arg.rfind(prefix, 0) != 0) {
        return false;
    }
    value = arg.substr(prefix.size());
    return true;
}

void resolve_endpoints(Options &opts) {
    std::size_t remote_count = 0;
    for (const auto &arg : opts.transfer_options) {
        if (!arg.empty() && arg.front() != '-' && looks_remote(arg)) {
            ++remote_count;
        }
    }
    const bool source_remote = looks_remote(opts.source);
    const bool destination_remote = looks_remote(opts.destination);
    remote_count += (source_remote ? 1 : 0) + (destination_remote ? 1 : 0);
    if (remote_count != 1 || (!source_remote && !destination_remote)) {
        std::ostringstream oss;
        oss << "exactly one remote path ([user@]host:/path) is required as source or destination, found "
            << remote_count;
        throw ConfigurationError(oss.str());
    }
    if (source_remote) {
        opts.direction = Direction::Download;
        opts.remote = parse_remote_spec(opts.source);
        if (!opts.files_from) {
            opts.remote.path = transfer_root(opts.remote.path);
        }
        opts.local_path = opts.destination;
    } else {
        opts.direction = Direction::Upload;
        opts.remote = parse_remote_spec(opts.destination);
        opts.local_path = opts.files_from ? opts.source : transfer_root(opts.source);
    }
}

} // namespace

Options parse_options(const std::vector<std::string> &args) {
    Options opts;
    std::size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string &arg = args[i];
        std::string value;
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        }
        if (flag_value(arg, "--parallel", value)) {
            opts.parallel = parse_bounded("--parallel", value, max_parallel);
        } else if (flag_value(arg, "--hosts", value)) {
            opts.host_start_index = static_cast<std::size_t>(parse_number("--hosts", value));
        } else if (flag_value(arg, "--total_bw", value)) {
            opts.total_bw_mbps = parse_number("--total_bw", value);
            if (*opts.total_bw_mbps > max_total_bw_mbps) {
                throw ConfigurationError("--total_bw must be at most " + std::to_string(max_total_bw_mbps));
            }
        } else if (flag_value(arg, "--batch_size", value)) {
            opts.batch_size = parse_positive("--batch_size", value);
        } else if (flag_value(arg, "--files-from", value)) {
            if (value.empty()) {
                throw ConfigurationError("--files-from needs a file name");
            }
            opts.files_from = std::filesystem::path(value);
        } else if (flag_value(arg, "--log-file", value)) {
            if (value.empty()) {
                throw ConfigurationError("--log-file needs a file name");
            }
            opts.log_file = value;
        } else if (flag_value(arg, "--rsync", value)) {
            if (value.empty()) {
                throw ConfigurationError("--rsync needs a program name");
            }
            opts.rsync_binary = value;
        } else if (arg == "--static") {
            opts.static_mode = true;
        } else if (arg == "--") {
            ++i;
            break;
        } else {
            break;
        }
    }

    if (opts.parallel == 0) {
        throw ConfigurationError("--parallel=N is required");
    }
    const std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    if (rest.size() < 2) {
        throw ConfigurationError("a source and a destination are required");
    }
    opts.transfer_options.assign(rest.begin(), rest.end() - 2);
    opts.source = rest[rest.size() - 2];
    opts.destination = rest.back();
    resolve_endpoints(opts);
    return opts;
}

std::string usage(const std::string &program) {
    return "Usage:\n"
           "  " + program + " --parallel=N [options] [rsync options] SOURCE DESTINATION\n"
           "\n"
           "Exactly one of SOURCE and DESTINATION must be [user@]host:/path.\n"
           "\n"
           "Options (must precede rsync options):\n"
           "  --parallel=N        number of parallel workers, 1 to " + std::to_string(max_parallel) + " (required)\n"
           "  --hosts=START       worker i talks to <host><START+i>\n"
           "  --total_bw=MBPS     total bandwidth budget shared evenly by the workers\n"
           "  --batch_size=SIZE   files claimed per batch in dynamic mode (default 10)\n"
           "  --files-from=FILE   transfer the files listed in FILE instead of a dry-run listing\n"
           "  --static            pre-assign size-balanced chunks instead of a shared queue\n"
           "  --log-file=PATH     also append log lines to PATH\n"
           "  --rsync=PATH        rsync binary to run (default: rsync from PATH)\n"
           "  -h, --help          show this help\n";
}

} // namespace prsync
