#pragma once

#include <imgui.h>

#include "core/Types.h"
#include "renderer/SceneRenderer.h"

namespace clustermap {

inline ImU32 toImColor(const RGBcolor& c, uint8_t alpha = 0xFF) {
    return IM_COL32(static_cast<int>(c.r * 255.0f + 0.5f),
                    static_cast<int>(c.g * 255.0f + 0.5f),
                    static_cast<int>(c.b * 255.0f + 0.5f),
                    alpha);
}

inline ImU32 toImColor(const RGBAcolor& c) {
    return toImColor(c.rgb, c.alpha);
}

// ============================================================================
// ScenePainter - replays a Scene into an ImGui draw list
// ============================================================================

class ScenePainter {
public:
    // origin is the screen position of the scene's (0, 0)
    static void paint(ImDrawList* drawList, const Scene& scene, ImVec2 origin);

    // Width of text in the current ImGui font, for SceneInputs::measureText
    static double measureText(const std::string& text, double fontSize);

    static void addRadialGradient(ImDrawList* drawList, ImVec2 center, float innerRadius,
                                  float outerRadius, const std::vector<GradientStop>& stops);
    static void addDashedCircle(ImDrawList* drawList, ImVec2 center, float radius, ImU32 color,
                                float thickness, const std::vector<double>& dash);

private:
    static int segmentsFor(float radius);
};

} // namespace clustermap
