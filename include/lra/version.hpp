#pragma once

/// @file version.hpp
/// @brief lra release number, exposed to the preprocessor and to C++.

#include <string_view>

#define LRA_VERSION_MAJOR 0
#define LRA_VERSION_MINOR 1
#define LRA_VERSION_PATCH 0
#define LRA_VERSION_STRING "0.1.0"

/// Single integer for preprocessor comparisons, e.g. 0.1.0 -> 100.
#define LRA_VERSION_NUMBER \
    (LRA_VERSION_MAJOR * 10000 + LRA_VERSION_MINOR * 100 + LRA_VERSION_PATCH)

namespace lra {

struct Version {
    static constexpr int major = LRA_VERSION_MAJOR;
    static constexpr int minor = LRA_VERSION_MINOR;
    static constexpr int patch = LRA_VERSION_PATCH;
    static constexpr const char* string = LRA_VERSION_STRING;

    /// Name reported by the probe tool and in stack logs.
    static constexpr std::string_view product = "lra";

    [[nodiscard]] static constexpr bool atLeast(int maj, int min, int pat = 0) noexcept {
        if (major != maj) { return major > maj; }
        if (minor != min) { return minor > min; }
        return patch >= pat;
    }
};

} // namespace lra
