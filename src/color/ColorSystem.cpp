#include "color/ColorSystem.h"
#include "core/PlatformUtils.h"

#include <algorithm>
#include <cmath>

namespace clustermap {

// ----------------------------------------------------------------------------
// Built-in category palette
// ----------------------------------------------------------------------------
namespace {

struct PaletteEntry {
    const char* id;
    const char* hex;
};

const PaletteEntry defaultPalette[] = {
    {"l2-1", "#F9F0C7"},   // pale yellow
    {"l2-2", "#BD8BA0"},   // muted rose
    {"l2-3", "#E8A7B9"},   // soft pink
};

bool isL2Category(const ClusterNode* node) {
    return node->level == ClusterLevel::L2 && node->id.rfind("l2-", 0) == 0;
}

double clampPercent(double v, double lo, double hi) {
    return std::min(hi, std::max(lo, v));
}

} // namespace

// #D1D5DB
const RGBcolor ColorSystem::FALLBACK_GRAY{209.0f / 255.0f, 213.0f / 255.0f, 219.0f / 255.0f};

ColorSystem& ColorSystem::instance() {
    static ColorSystem inst;
    return inst;
}

ColorSystem::ColorSystem() {
    init();
}

void ColorSystem::init() {
    palette_.clear();
    for (const auto& entry : defaultPalette) {
        palette_[entry.id] = PlatformUtils::hex2rgb(entry.hex);
    }
}

void ColorSystem::setPaletteEntry(const std::string& l2Id, const RGBcolor& color) {
    palette_[l2Id] = color;
}

RGBcolor ColorSystem::categoryColor(const std::string& l2Id) const {
    auto it = palette_.find(l2Id);
    if (it != palette_.end()) {
        return it->second;
    }
    // Unlisted category: pastel with a hue picked by the id
    double hue = static_cast<double>(PlatformUtils::fnv1a(l2Id) % 360u);
    return hslToRgb(hue, 55.0, 78.0);
}

// ----------------------------------------------------------------------------
// Ancestor lookup
// ----------------------------------------------------------------------------

const ClusterNode* ColorSystem::l2Ancestor(const ClusterNode* node) {
    for (const ClusterNode* cur = node; cur != nullptr; cur = cur->parent) {
        if (isL2Category(cur)) {
            return cur;
        }
    }
    return nullptr;
}

const ClusterNode* ColorSystem::l2Ancestor(const PackedLayout& layout, int index) {
    if (index < 0 || index >= static_cast<int>(layout.nodes.size())) {
        return nullptr;
    }
    int cur = index;
    while (cur >= 0) {
        const ClusterNode* node = layout.nodes[cur].node;
        if (node && isL2Category(node)) {
            return node;
        }
        cur = layout.nodes[cur].parent;
    }
    // The view root may be below the category; continue in the full tree
    return l2Ancestor(layout.nodes[index].node);
}

RGBcolor ColorSystem::baseColorFor(const ClusterNode* node) const {
    if (!node) {
        return FALLBACK_GRAY;
    }
    if (const ClusterNode* l2 = l2Ancestor(node)) {
        return categoryColor(l2->id);
    }
    if (node->l2ClusterId >= 0) {
        return categoryColor("l2-" + std::to_string(node->l2ClusterId));
    }
    return FALLBACK_GRAY;
}

RGBcolor ColorSystem::baseColorFor(const PackedLayout& layout, int index) const {
    if (const ClusterNode* l2 = l2Ancestor(layout, index)) {
        return categoryColor(l2->id);
    }
    if (index >= 0 && index < static_cast<int>(layout.nodes.size())) {
        return baseColorFor(layout.nodes[index].node);
    }
    return FALLBACK_GRAY;
}

// ----------------------------------------------------------------------------
// HSL conversion
// ----------------------------------------------------------------------------

HSLcolor ColorSystem::rgbToHsl(const RGBcolor& color) {
    // Work from the 8-bit channel values
    double r = std::round(std::clamp(color.r, 0.0f, 1.0f) * 255.0) / 255.0;
    double g = std::round(std::clamp(color.g, 0.0f, 1.0f) * 255.0) / 255.0;
    double b = std::round(std::clamp(color.b, 0.0f, 1.0f) * 255.0) / 255.0;

    double maxc = std::max({r, g, b});
    double minc = std::min({r, g, b});
    double h = 0.0;
    double s = 0.0;
    double l = (maxc + minc) / 2.0;

    if (maxc != minc) {
        double d = maxc - minc;
        s = l > 0.5 ? d / (2.0 - maxc - minc) : d / (maxc + minc);
        if (maxc == r) {
            h = (g - b) / d + (g < b ? 6.0 : 0.0);
        } else if (maxc == g) {
            h = (b - r) / d + 2.0;
        } else {
            h = (r - g) / d + 4.0;
        }
        h /= 6.0;
    }

    return HSLcolor{h * 360.0, s * 100.0, l * 100.0};
}

RGBcolor ColorSystem::hslToRgb(double h, double s, double l) {
    l /= 100.0;
    double a = s * std::min(l, 1.0 - l) / 100.0;
    auto channel = [&](double n) {
        double k = std::fmod(n + h / 30.0, 12.0);
        double c = l - a * std::max(std::min({k - 3.0, 9.0 - k, 1.0}), -1.0);
        double byte = std::clamp(std::round(255.0 * c), 0.0, 255.0);
        return static_cast<float>(byte / 255.0);
    };
    return RGBcolor{channel(0.0), channel(8.0), channel(4.0)};
}

// ----------------------------------------------------------------------------
// Shades
// ----------------------------------------------------------------------------

RGBcolor ColorSystem::adjust(const RGBcolor& base, double dl, double ds) {
    HSLcolor hsl = rgbToHsl(base);
    double l = clampPercent(hsl.l + dl, 5.0, 95.0);
    double s = clampPercent(hsl.s + ds, 0.0, 100.0);
    return hslToRgb(hsl.h, s, l);
}

RGBcolor ColorSystem::glowierShade(const RGBcolor& base) {
    return adjust(base, 12.0, 10.0);
}

RGBcolor ColorSystem::darkerShade(const RGBcolor& base, double lightnessDelta) {
    return adjust(base, lightnessDelta, -5.0);
}

RGBcolor ColorSystem::textColor(const RGBcolor& base) {
    HSLcolor hsl = rgbToHsl(base);
    double l = clampPercent(hsl.l - 45.0, 15.0, 35.0);
    double s = clampPercent(hsl.s - 10.0, 20.0, 100.0);
    return hslToRgb(hsl.h, s, l);
}

RGBcolor ColorSystem::borderColor(const RGBcolor& base) {
    HSLcolor hsl = rgbToHsl(base);
    double l = clampPercent(hsl.l - 22.0, 20.0, 50.0);
    double s = clampPercent(hsl.s - 5.0, 25.0, 100.0);
    return hslToRgb(hsl.h, s, l);
}

RGBcolor ColorSystem::shadeForLevel(const RGBcolor& base, ClusterLevel level) {
    switch (level) {
        case ClusterLevel::L2:
            return base;
        case ClusterLevel::L1:
            return adjust(base, -15.0, -5.0);
        case ClusterLevel::L0:
            return adjust(base, -25.0, -10.0);
    }
    return base;
}

} // namespace clustermap
