/// @file cache_stats.cpp
/// @brief CacheStats rendering.

#include "lra/resilience/response_cache.hpp"

#include <sstream>

namespace lra::resilience {

std::string toString(const CacheStats& stats) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << "hits=" << stats.hits
        << " misses=" << stats.misses
        << " hit_rate=" << stats.hitRate() << '%'
        << " evictions=" << stats.evictions
        << " size=" << stats.size << '/' << stats.maxEntries
        << " ttl_s=" << std::chrono::duration_cast<std::chrono::seconds>(stats.ttl).count();
    return oss.str();
}

}  // namespace lra::resilience
