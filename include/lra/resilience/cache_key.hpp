#pragma once

/// @file cache_key.hpp
/// @brief Fixed-length cache keys derived from request payloads.

#include <string>
#include <string_view>

namespace lra::resilience {

/// Lowercase hex SHA-256 of the content (64 characters).
///
/// Used only to bound key size; collisions are not a security concern here.
///
/// @return The digest, or an empty string if OpenSSL failed to compute it.
[[nodiscard]] std::string cacheKey(std::string_view content);

}  // namespace lra::resilience
