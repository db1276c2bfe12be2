#include "prsync/file_enumerator.hpp"

#include "prsync/errors.hpp"
#include "prsync/process.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace prsync {

namespace {

constexpr std::array<const char *, 10> informational_prefixes = {
    "sending incremental file list",
    "receiving incremental file list",
    "receiving file list",
    "building file list",
    "created directory ",
    "sent ",
    "total size is ",
    "(DRY RUN)",
    "skipping ",
    "deleting ",
};

bool starts_with(const std::string &text, const char *prefix) {
    return text.rfind(prefix, 0) == 0;
}

void trim_line_end(std::string &line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
}

bool is_blank(const std::string &line) {
    return std::all_of(line.begin(), line.end(), [](char ch) { return std::isspace(static_cast<unsigned char>(ch)); });
}

bool is_informational(const std::string &line) {
    if (is_blank(line)) {
        return true;
    }
    return std::any_of(informational_prefixes.begin(), informational_prefixes.end(),
                       [&](const char *prefix) { return starts_with(line, prefix); });
}

bool is_directory_entry(const std::string &path) { return path == "." || path == "./" || path.back() == '/'; }

// Accepts plain digits and rsync's thousands separators ("1,234,567").
std::optional<std::int64_t> parse_size(const std::string &text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    for (char ch : text) {
        if (ch == ',') {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        const int digit = ch - '0';
        if (value > (std::numeric_limits<std::int64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

// Splits `<size> <path>`. The path keeps any inner or trailing spaces.
std::optional<FileRecord> parse_entry(const std::string &line) {
    std::size_t start = 0;
    while (start < line.size() && line[start] == ' ') {
        ++start;
    }
    const auto space = line.find(' ', start);
    if (space == std::string::npos) {
        return std::nullopt;
    }
    auto size = parse_size(line.substr(start, space - start));
    if (!size) {
        return std::nullopt;
    }
    std::string path = line.substr(space + 1);
    if (path.empty()) {
        return std::nullopt;
    }
    return FileRecord{*size, std::move(path)};
}

std::optional<std::int64_t> local_file_size(const std::optional<std::filesystem::path> &local_root,
                                            const std::string &relative) {
    if (!local_root) {
        return std::nullopt;
    }
    std::error_code ec;
    const auto local = *local_root / relative;
    if (!std::filesystem::is_regular_file(local, ec)) {
        return std::nullopt;
    }
    const auto bytes = std::filesystem::file_size(local, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(bytes);
}

// Long options that add lines to, or reformat, the dry-run output.
constexpr std::array<const char *, 6> listing_noise_flags = {
    "--stats", "--itemize-changes", "--verbose", "--progress", "--human-readable", "--quiet",
};

constexpr std::array<const char *, 4> listing_noise_prefixes = {
    "--info=", "--debug=", "--out-format=", "--log-format=",
};

// Short options with the same effect: -v -i -h -q -P.
constexpr const char *listing_noise_letters = "vihqP";

// Short options that take an argument. The rest of the bundle, or the next word, is the value.
constexpr const char *short_options_with_value = "eBfTM@";

bool is_listing_noise(const std::string &arg) {
    return std::any_of(listing_noise_flags.begin(), listing_noise_flags.end(),
                       [&](const char *flag) { return arg == flag; }) ||
           std::any_of(listing_noise_prefixes.begin(), listing_noise_prefixes.end(),
                       [&](const char *prefix) { return starts_with(arg, prefix); });
}

} // namespace

std::vector<std::string> listing_options(const std::vector<std::string> &options) {
    std::vector<std::string> kept;
    for (std::size_t i = 0; i < options.size(); ++i) {
        const std::string &arg = options[i];
        if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
            if (!is_listing_noise(arg)) {
                kept.push_back(arg);
            }
            continue;
        }
        // A bundle of short options such as -avi.
        std::string bundle = "-";
        bool takes_next = false;
        for (std::size_t pos = 1; pos < arg.size(); ++pos) {
            const char letter = arg[pos];
            if (std::strchr(short_options_with_value, letter) != nullptr) {
                bundle += arg.substr(pos);
                takes_next = pos + 1 == arg.size();
                break;
            }
            if (std::strchr(listing_noise_letters, letter) == nullptr) {
                bundle += letter;
            }
        }
        if (bundle.size() > 1) {
            kept.push_back(bundle);
        }
        if (takes_next && i + 1 < options.size()) {
            kept.push_back(options[++i]);
        }
    }
    return kept;
}

RsyncListingProvider::RsyncListingProvider(std::string rsync_binary) : rsync_binary_(std::move(rsync_binary)) {}

std::string RsyncListingProvider::list(const EnumerationRequest &request) {
    std::vector<std::string> argv{rsync_binary_, "--dry-run", "--recursive", "--out-format=%l %n"};
    const auto options = listing_options(request.options);
    argv.insert(argv.end(), options.begin(), options.end());
    argv.push_back(request.source);
    argv.push_back(request.destination);

    ProcessResult result = run_process(argv, std::nullopt, true);
    if (result.exit_code != 0) {
        throw EnumerationError("dry-run listing failed with exit code " + std::to_string(result.exit_code));
    }
    return std::move(result.stdout_data);
}

FileEnumerator::FileEnumerator(ListingProvider &provider) : provider_(provider) {}

std::vector<FileRecord> FileEnumerator::enumerate(const EnumerationRequest &request) const {
    std::istringstream listing(provider_.list(request));
    return parse_listing(listing);
}

std::vector<FileRecord> FileEnumerator::parse_listing(std::istream &in) {
    std::vector<FileRecord> files;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        trim_line_end(line);
        if (is_informational(line)) {
            continue;
        }
        auto entry = parse_entry(line);
        if (!entry) {
            throw MalformedListing(line_number, line);
        }
        if (is_directory_entry(entry->path)) {
            continue;
        }
        files.push_back(std::move(*entry));
    }
    sort_by_size(files);
    return files;
}

std::vector<FileRecord> FileEnumerator::load_files_from(const std::filesystem::path &list_file,
                                                        const std::optional<std::filesystem::path> &local_root) {
    std::ifstream in(list_file);
    if (!in) {
        throw ConfigurationError("cannot read files-from list: " + list_file.string());
    }
    std::vector<FileRecord> files;
    std::string line;
    std::size_t line_number = 0;
    bool sized = false;
    while (std::getline(in, line)) {
        ++line_number;
        trim_line_end(line);
        if (line_number == 1 && line == sized_list_header) {
            sized = true;
            continue;
        }
        // Same comment rules as rsync's own --files-from.
        if (is_blank(line) || line.front() == '#' || line.front() == ';') {
            continue;
        }
        if (sized) {
            auto entry = parse_entry(line);
            if (!entry) {
                throw MalformedListing(line_number, line);
            }
            if (!is_directory_entry(entry->path)) {
                files.push_back(std::move(*entry));
            }
            continue;
        }
        if (is_directory_entry(line)) {
            continue;
        }
        files.push_back(FileRecord{local_file_size(local_root, line).value_or(0), line});
    }
    sort_by_size(files);
    return files;
}

void FileEnumerator::sort_by_size(std::vector<FileRecord> &files) {
    std::stable_sort(files.begin(), files.end(),
                     [](const FileRecord &lhs, const FileRecord &rhs) { return lhs.size > rhs.size; });
}

} // namespace prsync
