#include "ui/ScenePainter.h"

#include <algorithm>
#include <cfloat>
#include <cmath>

namespace clustermap {

namespace {

ImU32 lerpColor(const RGBAcolor& a, const RGBAcolor& b, double t) {
    RGBcolor rgb{
        static_cast<float>(interpolate(a.rgb.r, b.rgb.r, t)),
        static_cast<float>(interpolate(a.rgb.g, b.rgb.g, t)),
        static_cast<float>(interpolate(a.rgb.b, b.rgb.b, t)),
    };
    double alpha = interpolate(static_cast<double>(a.alpha), static_cast<double>(b.alpha), t);
    return toImColor(rgb, static_cast<uint8_t>(std::lround(std::clamp(alpha, 0.0, 255.0))));
}

// Colour of the gradient at offset t, clamped to the end stops
ImU32 colorAt(const std::vector<GradientStop>& stops, double t) {
    if (t <= stops.front().offset) return toImColor(stops.front().color);
    for (size_t i = 1; i < stops.size(); ++i) {
        if (t <= stops[i].offset) {
            double span = stops[i].offset - stops[i - 1].offset;
            double local = span > 0.0 ? (t - stops[i - 1].offset) / span : 1.0;
            return lerpColor(stops[i - 1].color, stops[i].color, local);
        }
    }
    return toImColor(stops.back().color);
}

} // namespace

int ScenePainter::segmentsFor(float radius) {
    return std::clamp(static_cast<int>(radius * 0.5f), 24, 128);
}

double ScenePainter::measureText(const std::string& text, double fontSize) {
    ImFont* font = ImGui::GetFont();
    return font->CalcTextSizeA(static_cast<float>(fontSize), FLT_MAX, 0.0f, text.c_str()).x;
}

// ============================================================================
// Radial gradient: concentric quad strips, one band per stop interval
// ============================================================================
void ScenePainter::addRadialGradient(ImDrawList* drawList, ImVec2 center, float innerRadius,
                                     float outerRadius, const std::vector<GradientStop>& stops) {
    if (stops.empty() || outerRadius <= innerRadius || outerRadius <= 0.5f) return;

    // Ring radii: the annulus ends plus every interior stop
    std::vector<double> offsets{0.0};
    for (const GradientStop& s : stops) {
        if (s.offset > 0.0 && s.offset < 1.0) offsets.push_back(s.offset);
    }
    offsets.push_back(1.0);

    const int segments = segmentsFor(outerRadius);
    const ImVec2 uv = drawList->_Data->TexUvWhitePixel;

    for (size_t band = 0; band + 1 < offsets.size(); ++band) {
        const double t0 = offsets[band];
        const double t1 = offsets[band + 1];
        const float r0 = static_cast<float>(interpolate(innerRadius, outerRadius, t0));
        const float r1 = static_cast<float>(interpolate(innerRadius, outerRadius, t1));
        const ImU32 c0 = colorAt(stops, t0);
        const ImU32 c1 = colorAt(stops, t1);

        if (r0 <= 0.0f) {
            // Centre disc: triangle fan
            drawList->PrimReserve(segments * 3, segments + 1);
            ImDrawIdx base = static_cast<ImDrawIdx>(drawList->_VtxCurrentIdx);
            drawList->PrimWriteVtx(center, uv, c0);
            for (int i = 0; i < segments; ++i) {
                float a = static_cast<float>(2.0 * PI * i / segments);
                drawList->PrimWriteVtx(ImVec2(center.x + std::cos(a) * r1, center.y + std::sin(a) * r1),
                                       uv, c1);
            }
            for (int i = 0; i < segments; ++i) {
                drawList->PrimWriteIdx(base);
                drawList->PrimWriteIdx(static_cast<ImDrawIdx>(base + 1 + i));
                drawList->PrimWriteIdx(static_cast<ImDrawIdx>(base + 1 + (i + 1) % segments));
            }
            continue;
        }

        drawList->PrimReserve(segments * 6, segments * 2);
        ImDrawIdx base = static_cast<ImDrawIdx>(drawList->_VtxCurrentIdx);
        for (int i = 0; i < segments; ++i) {
            float a = static_cast<float>(2.0 * PI * i / segments);
            float ca = std::cos(a);
            float sa = std::sin(a);
            drawList->PrimWriteVtx(ImVec2(center.x + ca * r0, center.y + sa * r0), uv, c0);
            drawList->PrimWriteVtx(ImVec2(center.x + ca * r1, center.y + sa * r1), uv, c1);
        }
        for (int i = 0; i < segments; ++i) {
            ImDrawIdx in0 = static_cast<ImDrawIdx>(base + i * 2);
            ImDrawIdx out0 = static_cast<ImDrawIdx>(in0 + 1);
            ImDrawIdx in1 = static_cast<ImDrawIdx>(base + ((i + 1) % segments) * 2);
            ImDrawIdx out1 = static_cast<ImDrawIdx>(in1 + 1);
            drawList->PrimWriteIdx(in0);
            drawList->PrimWriteIdx(out0);
            drawList->PrimWriteIdx(out1);
            drawList->PrimWriteIdx(in0);
            drawList->PrimWriteIdx(out1);
            drawList->PrimWriteIdx(in1);
        }
    }
}

void ScenePainter::addDashedCircle(ImDrawList* drawList, ImVec2 center, float radius, ImU32 color,
                                   float thickness, const std::vector<double>& dash) {
    double pattern = 0.0;
    for (double d : dash) pattern += d;
    if (pattern <= 0.0 || radius <= 0.0f) {
        drawList->AddCircle(center, radius, color, segmentsFor(radius), thickness);
        return;
    }

    // Walk the circumference, stroking the even entries of the pattern
    const double circumference = 2.0 * PI * radius;
    double pos = 0.0;
    size_t entry = 0;
    while (pos < circumference) {
        double len = std::max(dash[entry % dash.size()], 0.5);
        if (entry % 2 == 0) {
            double end = std::min(pos + len, circumference);
            float a0 = static_cast<float>(pos / radius);
            float a1 = static_cast<float>(end / radius);
            int arcSegments = std::max(2, static_cast<int>((end - pos) / 3.0));
            drawList->PathArcTo(center, radius, a0, a1, arcSegments);
            drawList->PathStroke(color, 0, thickness);
        }
        pos += len;
        ++entry;
    }
}

// ============================================================================
// paint
// ============================================================================
void ScenePainter::paint(ImDrawList* drawList, const Scene& scene, ImVec2 origin) {
    ImFont* font = ImGui::GetFont();

    auto at = [&origin](const XYvec& p) {
        return ImVec2(origin.x + static_cast<float>(p.x), origin.y + static_cast<float>(p.y));
    };

    for (const DrawCommand& cmd : scene.commands) {
        switch (cmd.type) {
        case DrawCommandType::FillRect: {
            ImVec2 p0 = at(cmd.position);
            ImVec2 p1(p0.x + static_cast<float>(cmd.size.x), p0.y + static_cast<float>(cmd.size.y));
            drawList->AddRectFilled(p0, p1, toImColor(cmd.color));
            break;
        }
        case DrawCommandType::RadialGradientCircle:
            addRadialGradient(drawList, at(cmd.position), static_cast<float>(cmd.innerRadius),
                              static_cast<float>(cmd.radius), cmd.stops);
            break;
        case DrawCommandType::StrokeCircle: {
            float thickness = std::max(static_cast<float>(cmd.lineWidth), 1.0f);
            if (cmd.dash.empty()) {
                float r = static_cast<float>(cmd.radius);
                drawList->AddCircle(at(cmd.position), r, toImColor(cmd.color), segmentsFor(r), thickness);
            } else {
                addDashedCircle(drawList, at(cmd.position), static_cast<float>(cmd.radius),
                                toImColor(cmd.color), thickness, cmd.dash);
            }
            break;
        }
        case DrawCommandType::Text: {
            float size = static_cast<float>(cmd.fontSize);
            if (size < 1.0f) break;
            ImVec2 extent = font->CalcTextSizeA(size, FLT_MAX, 0.0f, cmd.text.c_str());
            ImVec2 c = at(cmd.position);
            ImVec2 pos(c.x - extent.x * 0.5f, c.y - extent.y * 0.5f);
            ImU32 col = toImColor(cmd.color);
            drawList->AddText(font, size, pos, col, cmd.text.c_str());
            if (cmd.bold) {
                // Single-weight font: overstrike for bold
                drawList->AddText(font, size, ImVec2(pos.x + 0.6f, pos.y), col, cmd.text.c_str());
            }
            break;
        }
        }
    }
}

} // namespace clustermap
