#pragma once

#include "animation/Scheduler.h"
#include "core/Types.h"
#include "geometry/CirclePackLayout.h"

#include <glm/glm.hpp>

#include <functional>

namespace clustermap {

// Scale k and translation (x, y), applied about the viewport centre
struct ZoomState {
    double k = 1.0;
    double x = 0.0;
    double y = 0.0;

    bool operator==(const ZoomState& o) const { return k == o.k && x == o.x && y == o.y; }
    bool operator!=(const ZoomState& o) const { return !(*this == o); }
};

// ============================================================================
// ZoomCamera - 2D zoom/pan over the packed layout
// ============================================================================
//
//   screen = W/2 + k * (p - W/2 + x)     (likewise for y with H)

class ZoomCamera {
public:
    static constexpr double ZOOM_DURATION = 0.9;   // seconds
    static constexpr double FIT_PADDING = 0.1;     // fraction of the viewport, per side

    explicit ZoomCamera(Scheduler& scheduler);
    ~ZoomCamera();

    ZoomCamera(const ZoomCamera&) = delete;
    ZoomCamera& operator=(const ZoomCamera&) = delete;

    const ZoomState& state() const { return state_; }

    // View -> screen affine for a state and viewport
    static glm::dmat3 viewMatrix(const ZoomState& zs, double width, double height);
    glm::dmat3 viewMatrix(double width, double height) const;

    XYvec toScreen(const XYvec& p, double width, double height) const;
    XYvec toView(const XYvec& p, double width, double height) const;

    // Zoom that frames every depth>0 circle with FIT_PADDING margin, never
    // zooming past 1. Identity for a layout with nothing below the root.
    static ZoomState computeFitZoom(const PackedLayout& layout, double width, double height);

    // Ease-out cubic transition from the current state, replacing any
    // transition in flight. now is the scheduler clock.
    void animateTo(const ZoomState& target, double now);

    // Set state immediately, cancelling any transition
    void jumpTo(const ZoomState& target);

    bool isAnimating() const;
    const ZoomState& target() const { return target_; }

    // Invoked on every animation step and on jumpTo
    void setStepCallback(std::function<void()> cb) { stepCb_ = std::move(cb); }

private:
    void cancelAnimation();

    Scheduler& scheduler_;
    TaskHandle task_ = 0;

    ZoomState state_;
    ZoomState from_;
    ZoomState target_;
    double tStart_ = 0.0;

    std::function<void()> stepCb_;
};

} // namespace clustermap
