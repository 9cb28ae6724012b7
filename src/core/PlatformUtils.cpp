#include "PlatformUtils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>

namespace clustermap {
namespace PlatformUtils {

// ============================================================================
// getTime - high-resolution monotonic clock, returns seconds as double
// ============================================================================
double getTime() {
    using Clock = std::chrono::steady_clock;
    static const auto startTime = Clock::now();
    auto now = Clock::now();
    std::chrono::duration<double> elapsed = now - startTime;
    return elapsed.count();
}

// ============================================================================
// formatNumber - format int64 with comma separators
// ============================================================================
std::string formatNumber(int64_t number) {
    if (number == 0) {
        return "0";
    }

    bool negative = (number < 0);
    // Use unsigned to handle INT64_MIN correctly.
    uint64_t n = negative ? static_cast<uint64_t>(-(number + 1)) + 1u
                          : static_cast<uint64_t>(number);

    std::string result;
    int digitCount = 0;
    while (n > 0) {
        if (digitCount > 0 && digitCount % 3 == 0) {
            result += ',';
        }
        result += static_cast<char>('0' + static_cast<int>(n % 10));
        n /= 10;
        digitCount++;
    }

    if (negative) {
        result += '-';
    }

    std::reverse(result.begin(), result.end());
    return result;
}

std::string formatTraceCount(int64_t count) {
    return formatNumber(count) + (count == 1 ? " trace" : " traces");
}

// ============================================================================
// rgb2hex / hex2rgb
// ============================================================================
std::string rgb2hex(const RGBcolor& color) {
    int r = static_cast<int>(std::round(std::clamp(color.r, 0.0f, 1.0f) * 255.0f));
    int g = static_cast<int>(std::round(std::clamp(color.g, 0.0f, 1.0f) * 255.0f));
    int b = static_cast<int>(std::round(std::clamp(color.b, 0.0f, 1.0f) * 255.0f));
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", r, g, b);
    return std::string(buf);
}

RGBcolor hex2rgb(const std::string& hexColor) {
    RGBcolor color{};
    std::string digits = hexColor;
    if (!digits.empty() && digits[0] == '#') {
        digits.erase(0, 1);
    }

    // Expand short form "RGB" to "RRGGBB"
    if (digits.size() == 3) {
        digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
    }

    unsigned int r = 0, g = 0, b = 0;
    if (digits.size() == 6 &&
        std::sscanf(digits.c_str(), "%02x%02x%02x", &r, &g, &b) == 3) {
        color.r = static_cast<float>(r) / 255.0f;
        color.g = static_cast<float>(g) / 255.0f;
        color.b = static_cast<float>(b) / 255.0f;
    }
    return color;
}

bool isHexColor(const std::string& str) {
    if (str.size() != 4 && str.size() != 7) return false;
    if (str[0] != '#') return false;
    for (size_t i = 1; i < str.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(str[i]))) return false;
    }
    return true;
}

// ============================================================================
// fnv1a
// ============================================================================
uint32_t fnv1a(const std::string& str) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : str) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

std::optional<int> parseId(const std::string& digits) {
    if (digits.empty() || !std::isdigit(static_cast<unsigned char>(digits.front()))) {
        return std::nullopt;
    }
    int value = 0;
    const char* end = digits.data() + digits.size();
    auto result = std::from_chars(digits.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace PlatformUtils
} // namespace clustermap
