#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace prsync {

// floor(total / workers). A total of 0 means unlimited and yields 0. A non-zero total never
// rounds down to 0, which would read as unlimited; the floor is 1.
std::uint64_t per_worker_limit(std::uint64_t total, std::size_t workers);

// Largest --total_bw accepted, 1 Pbps. Keeps the KB/s conversion far from overflow.
constexpr std::uint64_t max_total_bw_mbps = 1000000000;

// Decimal megabits per second to kilobytes per second (1 Mbps = 125 KB/s).
// Throws std::overflow_error when the result does not fit in 64 bits.
std::uint64_t mbps_to_kbytes_per_sec(std::uint64_t mbps);

// The --bwlimit value each worker gets for a --total_bw budget in Mbps. 0 = no limit.
std::uint64_t worker_bandwidth_kbs(std::optional<std::uint64_t> total_mbps, std::size_t workers);

} // namespace prsync
