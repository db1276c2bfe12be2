#pragma once

#include "prsync/file_record.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace prsync {

// First line of a --files-from list that carries sizes.
constexpr const char *sized_list_header = "# prsync-listing";

struct EnumerationRequest {
    std::vector<std::string> options;
    std::string source;
    std::string destination;
};

// Produces the dry-run listing text for a request: one `<size> <path>` line per entry,
// possibly mixed with informational lines.
class ListingProvider {
  public:
    virtual ~ListingProvider() = default;

    virtual std::string list(const EnumerationRequest &request) = 0;
};

// The pass-through rsync options with those that change the dry-run output removed: --stats,
// -i/--itemize-changes, -v, -h, -q, --progress/-P, --info=, --debug=, --out-format= and
// --log-format=. Letters are dropped from short bundles, so -avi becomes -a.
std::vector<std::string> listing_options(const std::vector<std::string> &options);

class RsyncListingProvider : public ListingProvider {
  public:
    explicit RsyncListingProvider(std::string rsync_binary);

    std::string list(const EnumerationRequest &request) override;

  private:
    std::string rsync_binary_;
};

class FileEnumerator {
  public:
    explicit FileEnumerator(ListingProvider &provider);

    // Sorted by size, largest first. An empty result means there is nothing to transfer.
    std::vector<FileRecord> enumerate(const EnumerationRequest &request) const;

    // Throws MalformedListing on the first line that is neither informational nor `<size> <path>`.
    static std::vector<FileRecord> parse_listing(std::istream &in);

    // Reads a --files-from list. By default every line is a path, exactly as rsync reads it; a
    // file found under `local_root` takes its size from disk, anything else gets size 0. A list
    // whose first line is `sized_list_header` holds `<size> <path>` lines instead and throws
    // MalformedListing on any other line.
    static std::vector<FileRecord> load_files_from(const std::filesystem::path &list_file,
                                                   const std::optional<std::filesystem::path> &local_root);

    static void sort_by_size(std::vector<FileRecord> &files);

  private:
    ListingProvider &provider_;
};

} // namespace prsync
