#include "renderer/SceneRenderer.h"
#include "animation/PulseEffect.h"
#include "color/ColorSystem.h"
#include "core/PlatformUtils.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace clustermap {

namespace {

RGBAcolor withAlpha(const RGBcolor& c, uint8_t alpha) {
    return RGBAcolor{c, alpha};
}

double estimateTextWidth(const std::string& text, double fontSize) {
    return 0.55 * fontSize * static_cast<double>(text.size());
}

} // namespace

double SceneRenderer::labelFontSize(double radius) {
    return std::min(20.0, std::max(14.0, radius / 2.5));
}

std::vector<std::string> SceneRenderer::wrapLabel(const std::string& label, double maxWidth,
                                                  double fontSize, const TextMeasurer& measure) {
    std::vector<std::string> lines;
    std::string current;

    std::istringstream words(label);
    std::string word;
    while (words >> word) {
        std::string candidate = current.empty() ? word : current + " " + word;
        double w = measure ? measure(candidate, fontSize) : estimateTextWidth(candidate, fontSize);
        if (w > maxWidth && !current.empty()) {
            lines.push_back(current);
            current = word;
            if (lines.size() >= 2) {
                break;
            }
        } else {
            current = candidate;
        }
    }
    if (!current.empty() && lines.size() < 2) {
        lines.push_back(current);
    }
    return lines;
}

Scene SceneRenderer::build(const SceneInputs& in) {
    Scene scene;
    if (!in.layout || in.layout->empty() || in.width <= 0.0 || in.height <= 0.0) {
        return scene;
    }

    const PackedLayout& layout = *in.layout;
    const ColorSystem& colors = ColorSystem::instance();
    const double k = in.zoom.k;
    const glm::dmat3 view = ZoomCamera::viewMatrix(in.zoom, in.width, in.height);

    auto toScreen = [&view](double x, double y) {
        glm::dvec3 s = view * glm::dvec3(x, y, 1.0);
        return XYvec{s.x, s.y};
    };

    // Background
    DrawCommand bg;
    bg.type = DrawCommandType::FillRect;
    bg.position = XYvec{0.0, 0.0};
    bg.size = XYvec{in.width, in.height};
    bg.color = withAlpha(PlatformUtils::hex2rgb(BACKGROUND_HEX), 0xFF);
    scene.commands.push_back(std::move(bg));

    // Deepest first so outer circles paint over their contents' glow
    std::vector<int> order;
    for (size_t i = 0; i < layout.nodes.size(); ++i) {
        if (layout.nodes[i].depth > 0) {
            order.push_back(static_cast<int>(i));
        }
    }
    std::stable_sort(order.begin(), order.end(), [&layout](int a, int b) {
        return layout.nodes[a].depth > layout.nodes[b].depth;
    });

    for (int idx : order) {
        const PackedNode& pn = layout.nodes[idx];
        const ClusterNode* node = pn.node;
        const bool isCurrentLevel = pn.depth == 1;
        const bool isHovered = !in.hoveredId.empty() && node->id == in.hoveredId;
        const bool isSelected = !in.selectedId.empty() && node->id == in.selectedId;

        const bool categorized = ColorSystem::l2Ancestor(layout, idx) != nullptr ||
                                 node->l2ClusterId >= 0;
        RGBcolor display;
        if (!categorized) {
            display = ColorSystem::FALLBACK_GRAY;
        } else {
            RGBcolor base = colors.baseColorFor(layout, idx);
            if (!isCurrentLevel) {
                display = ColorSystem::darkerShade(base);
            } else if (node->level == ClusterLevel::L2) {
                display = base;
            } else {
                display = ColorSystem::glowierShade(base);
            }
        }

        const XYvec center = toScreen(pn.x, pn.y);
        const double r = pn.r * k;

        // Outer glow for nested levels
        if (!isCurrentLevel) {
            DrawCommand glow;
            glow.type = DrawCommandType::RadialGradientCircle;
            glow.position = center;
            glow.innerRadius = r * 0.7;
            glow.radius = r * 1.3;
            glow.stops = {{0.0, withAlpha(display, 0x30)}, {1.0, withAlpha(display, 0x00)}};
            glow.nodeId = node->id;
            scene.commands.push_back(std::move(glow));
        }

        // Body
        DrawCommand fill;
        fill.type = DrawCommandType::RadialGradientCircle;
        fill.position = center;
        fill.innerRadius = 0.0;
        fill.radius = r;
        if (isCurrentLevel) {
            fill.stops = {{0.0, withAlpha(display, 0x80)}, {1.0, withAlpha(display, 0x50)}};
        } else {
            fill.stops = {{0.0, withAlpha(display, 0x50)},
                          {0.5, withAlpha(display, 0x25)},
                          {1.0, withAlpha(display, 0x10)}};
        }
        fill.nodeId = node->id;
        scene.commands.push_back(std::move(fill));

        // Selection pulse
        if (isSelected) {
            double scale = PulseEffect::scaleAt(in.time);
            double alpha = std::clamp(PulseEffect::alphaAt(in.time), 0.0, 1.0);
            RGBcolor ring = ColorSystem::borderColor(display);

            DrawCommand halo;
            halo.type = DrawCommandType::RadialGradientCircle;
            halo.position = center;
            halo.innerRadius = r;
            halo.radius = r * scale;
            halo.stops = {{0.0, withAlpha(ring, static_cast<uint8_t>(std::lround(alpha * 255.0)))},
                          {1.0, withAlpha(ring, 0x00)}};
            halo.nodeId = node->id;
            scene.commands.push_back(std::move(halo));
        }

        // Border
        DrawCommand border;
        border.type = DrawCommandType::StrokeCircle;
        border.position = center;
        border.radius = r;
        border.nodeId = node->id;
        if (isSelected) {
            border.color = withAlpha(ColorSystem::borderColor(display), 0xFF);
            border.lineWidth = 4.0 * k;
        } else if (isHovered) {
            border.color = withAlpha(display, 0xFF);
            border.lineWidth = 3.0 * k;
        } else if (isCurrentLevel) {
            border.color = withAlpha(ColorSystem::borderColor(display), 0x70);
            border.lineWidth = 2.0 * k;
        } else {
            border.color = withAlpha(display, 0x80);
            border.lineWidth = 2.0 * k;
            border.dash = {4.0 * k, 4.0 * k};
        }
        scene.commands.push_back(std::move(border));

        // Label
        if (isCurrentLevel && pn.r > LABEL_MIN_RADIUS) {
            double fontSize = labelFontSize(pn.r);
            double lineHeight = fontSize * 1.3;
            std::vector<std::string> lines =
                wrapLabel(node->name, pn.r * 1.6, fontSize, in.measureText);

            double totalHeight = (static_cast<double>(lines.size()) - 1.0) * lineHeight;
            double startY = pn.y - totalHeight / 2.0;
            RGBcolor textColor = ColorSystem::textColor(display);

            for (size_t i = 0; i < lines.size(); ++i) {
                DrawCommand text;
                text.type = DrawCommandType::Text;
                text.position = toScreen(pn.x, startY + static_cast<double>(i) * lineHeight);
                text.fontSize = fontSize * k;
                text.bold = true;
                text.color = withAlpha(textColor, 0xFF);
                text.text = lines[i];
                text.nodeId = node->id;
                scene.commands.push_back(std::move(text));
            }
        }
    }

    return scene;
}

} // namespace clustermap
