/// @file cache_key.cpp
/// @brief SHA-256 cache key derivation using the OpenSSL EVP API.

#include "lra/resilience/cache_key.hpp"

#include <openssl/evp.h>

#include <array>

namespace lra::resilience {

std::string cacheKey(std::string_view content) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_Digest(content.data(), content.size(), digest.data(), &digestLen,
                   EVP_sha256(), nullptr) != 1) {
        return {};
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(static_cast<std::size_t>(digestLen) * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0F]);
    }
    return hex;
}

}  // namespace lra::resilience
