#pragma once

#include "core/ClusterNode.h"
#include "core/Types.h"
#include "geometry/CirclePackLayout.h"

#include <map>
#include <string>

namespace clustermap {

// Hue in degrees [0,360), saturation and lightness in percent [0,100]
struct HSLcolor {
    double h = 0.0;
    double s = 0.0;
    double l = 0.0;
};

// ============================================================================
// ColorSystem - L2 category palette and the shades derived from it
// ============================================================================
//
// Every colour in the map and the outline comes from the base colour of the
// node's L2 ancestor. Derived shades are quantized to 8 bits per channel.

class ColorSystem {
public:
    static ColorSystem& instance();

    // Restore the built-in palette
    void init();

    // Override or add a category colour
    void setPaletteEntry(const std::string& l2Id, const RGBcolor& color);
    const std::map<std::string, RGBcolor>& palette() const { return palette_; }

    // Colour for an L2 id. Ids missing from the palette get a stable
    // hash-derived hue.
    RGBcolor categoryColor(const std::string& l2Id) const;

    // Base colour of a node: its L2 ancestor's category colour, or the
    // fallback gray when it has none
    RGBcolor baseColorFor(const ClusterNode* node) const;

    // Same, resolving the ancestor through the packed parent chain first
    RGBcolor baseColorFor(const PackedLayout& layout, int index) const;

    // Nearest L2 ancestor (or self) whose id starts with "l2-"
    static const ClusterNode* l2Ancestor(const ClusterNode* node);
    static const ClusterNode* l2Ancestor(const PackedLayout& layout, int index);

    // --- Colour math ---

    static HSLcolor rgbToHsl(const RGBcolor& color);
    static RGBcolor hslToRgb(double h, double s, double l);

    static RGBcolor glowierShade(const RGBcolor& base);
    static RGBcolor darkerShade(const RGBcolor& base, double lightnessDelta = -15.0);
    static RGBcolor textColor(const RGBcolor& base);
    static RGBcolor borderColor(const RGBcolor& base);

    // Outline orb shade: L2 = base, L1 and L0 progressively darker
    static RGBcolor shadeForLevel(const RGBcolor& base, ClusterLevel level);

    static const RGBcolor FALLBACK_GRAY;

private:
    ColorSystem();

    static RGBcolor adjust(const RGBcolor& base, double dl, double ds);

    std::map<std::string, RGBcolor> palette_;
};

} // namespace clustermap
