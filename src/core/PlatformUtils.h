#pragma once

#include "Types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace clustermap {
namespace PlatformUtils {

    // Get current time as double seconds (high-resolution monotonic clock).
    double getTime();

    // Format an int64 with comma separators (e.g., 1,234,567).
    std::string formatNumber(int64_t number);

    // "1 trace" / "1,234 traces"
    std::string formatTraceCount(int64_t count);

    // Convert RGBcolor to hex string "#RRGGBB".
    std::string rgb2hex(const RGBcolor& color);

    // Convert "#RRGGBB", "RRGGBB" or "#RGB" to RGBcolor. Unparseable input gives black.
    RGBcolor hex2rgb(const std::string& hexColor);

    // True for "#RGB" and "#RRGGBB" (the leading '#' is required).
    bool isHexColor(const std::string& str);

    // Whole string as a non-negative decimal int. Nullopt on any other
    // character or when the value does not fit.
    std::optional<int> parseId(const std::string& digits);

    // 32-bit FNV-1a hash, stable across platforms and runs.
    uint32_t fnv1a(const std::string& str);

} // namespace PlatformUtils
} // namespace clustermap
