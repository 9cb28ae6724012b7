#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace clustermap {

// ============================================================================
// Color types
// ============================================================================

struct RGBcolor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

// Color plus 8-bit alpha, as used by draw commands
struct RGBAcolor {
    RGBcolor rgb{};
    uint8_t alpha = 0xFF;
};

// ============================================================================
// Vector types
// ============================================================================

struct XYvec {
    double x = 0.0;
    double y = 0.0;
};

// ============================================================================
// Enumerations
// ============================================================================

enum class ClusterLevel {
    L2 = 0,   // outermost category
    L1,
    L0        // innermost, carries topics
};

// ============================================================================
// Math constants
// ============================================================================

inline constexpr double PI      = 3.14159265358979323846;
inline constexpr double EPSILON = 1.0e-6;

// Id given to the node that wraps several top-level clusters
inline constexpr const char* SYNTHETIC_ROOT_ID = "__root__";

// ============================================================================
// Math helpers
// ============================================================================

inline double sqr(double x) {
    return x * x;
}

inline double interpolate(double a, double b, double t) {
    return a + t * (b - a);
}

inline double xyDist(const XYvec& a, const XYvec& b) {
    return std::sqrt(sqr(a.x - b.x) + sqr(a.y - b.y));
}

// ============================================================================
// Level names
// ============================================================================

inline const char* const clusterLevelNames[] = {
    "l2",   // ClusterLevel::L2
    "l1",   // ClusterLevel::L1
    "l0"    // ClusterLevel::L0
};

inline const char* levelName(ClusterLevel level) {
    return clusterLevelNames[static_cast<int>(level)];
}

} // namespace clustermap
