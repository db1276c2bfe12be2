#pragma once

#include "prsync/file_record.hpp"

#include <cstddef>
#include <vector>

namespace prsync {

// Greedy largest-first, least-loaded bin packing over a size-descending file list.
class StaticPartitioner {
  public:
    explicit StaticPartitioner(std::size_t workers);

    // Returns exactly workers() chunks; some may be empty. Chunks with an odd id are
    // reversed so they run smallest-first while even ids run largest-first.
    std::vector<Chunk> partition(const std::vector<FileRecord> &sorted_files) const;

    std::size_t workers() const noexcept;

  private:
    std::size_t workers_;
};

} // namespace prsync
