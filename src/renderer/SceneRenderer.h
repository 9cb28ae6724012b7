#pragma once

#include "camera/ZoomCamera.h"
#include "core/Types.h"
#include "geometry/CirclePackLayout.h"

#include <functional>
#include <string>
#include <vector>

namespace clustermap {

enum class DrawCommandType {
    FillRect,
    RadialGradientCircle,
    StrokeCircle,
    Text
};

struct GradientStop {
    double offset = 0.0;    // 0 at innerRadius, 1 at outerRadius
    RGBAcolor color;
};

// One screen-space drawing primitive. Only the fields relevant to the
// command type are meaningful.
struct DrawCommand {
    DrawCommandType type = DrawCommandType::FillRect;

    XYvec position;                 // rect origin, circle centre, text centre
    XYvec size;                     // FillRect
    double innerRadius = 0.0;       // RadialGradientCircle paints innerRadius..radius
    double radius = 0.0;            // outer radius for circles
    std::vector<GradientStop> stops;

    RGBAcolor color;                // FillRect, StrokeCircle, Text
    double lineWidth = 0.0;
    std::vector<double> dash;       // empty = solid

    double fontSize = 0.0;
    bool bold = false;
    std::string text;

    std::string nodeId;             // source node, empty for the background
};

struct Scene {
    std::vector<DrawCommand> commands;

    bool empty() const { return commands.empty(); }
};

// Width of text at a font size, in the same units as the size
using TextMeasurer = std::function<double(const std::string& text, double fontSize)>;

struct SceneInputs {
    const PackedLayout* layout = nullptr;
    ZoomState zoom;
    double width = 0.0;
    double height = 0.0;
    std::string hoveredId;
    std::string selectedId;
    double time = 0.0;              // wall clock, drives the selection pulse
    TextMeasurer measureText;       // optional; a glyph-width estimate otherwise
};

// ============================================================================
// SceneRenderer - packed layout + camera to a display list
// ============================================================================

class SceneRenderer {
public:
    static constexpr const char* BACKGROUND_HEX = "#f0f0eb";
    static constexpr double LABEL_MIN_RADIUS = 20.0;

    // Empty scene when the viewport has no area or the layout is empty
    static Scene build(const SceneInputs& in);

    // Word-wrap into at most two lines no wider than maxWidth
    static std::vector<std::string> wrapLabel(const std::string& label, double maxWidth,
                                              double fontSize, const TextMeasurer& measure);

    static double labelFontSize(double radius);
};

} // namespace clustermap
