#include "prsync/bandwidth.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace prsync {

std::uint64_t per_worker_limit(std::uint64_t total, std::size_t workers) {
    if (workers == 0) {
        throw std::invalid_argument("worker count must be > 0");
    }
    if (total == 0) {
        return 0;
    }
    const auto share = total / workers;
    return share == 0 ? 1 : share;
}

std::uint64_t mbps_to_kbytes_per_sec(std::uint64_t mbps) {
    if (mbps > std::numeric_limits<std::uint64_t>::max() / 125) {
        throw std::overflow_error("bandwidth of " + std::to_string(mbps) + " Mbps is out of range");
    }
    return mbps * 125;
}

std::uint64_t worker_bandwidth_kbs(std::optional<std::uint64_t> total_mbps, std::size_t workers) {
    if (!total_mbps) {
        return 0;
    }
    return per_worker_limit(mbps_to_kbytes_per_sec(*total_mbps), workers);
}

} // namespace prsync
