#include "camera/ZoomCamera.h"
#include "animation/Easing.h"

#include <algorithm>
#include <limits>

namespace clustermap {

ZoomCamera::ZoomCamera(Scheduler& scheduler)
    : scheduler_(scheduler) {}

ZoomCamera::~ZoomCamera() {
    cancelAnimation();
}

// ============================================================================
// Transform
// ============================================================================

glm::dmat3 ZoomCamera::viewMatrix(const ZoomState& zs, double width, double height) {
    // Column-major: third column holds the translation
    glm::dmat3 m(1.0);
    m[0][0] = zs.k;
    m[1][1] = zs.k;
    m[2][0] = width / 2.0 + zs.k * (zs.x - width / 2.0);
    m[2][1] = height / 2.0 + zs.k * (zs.y - height / 2.0);
    return m;
}

glm::dmat3 ZoomCamera::viewMatrix(double width, double height) const {
    return viewMatrix(state_, width, height);
}

XYvec ZoomCamera::toScreen(const XYvec& p, double width, double height) const {
    glm::dvec3 s = viewMatrix(width, height) * glm::dvec3(p.x, p.y, 1.0);
    return XYvec{s.x, s.y};
}

XYvec ZoomCamera::toView(const XYvec& p, double width, double height) const {
    glm::dvec3 v = glm::inverse(viewMatrix(width, height)) * glm::dvec3(p.x, p.y, 1.0);
    return XYvec{v.x, v.y};
}

// ============================================================================
// Fit
// ============================================================================

ZoomState ZoomCamera::computeFitZoom(const PackedLayout& layout, double width, double height) {
    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();
    bool any = false;

    for (const PackedNode& pn : layout.nodes) {
        if (pn.depth == 0) {
            continue;
        }
        minX = std::min(minX, pn.x - pn.r);
        minY = std::min(minY, pn.y - pn.r);
        maxX = std::max(maxX, pn.x + pn.r);
        maxY = std::max(maxY, pn.y + pn.r);
        any = true;
    }

    if (!any) {
        return ZoomState{};
    }

    double boxW = maxX - minX;
    double boxH = maxY - minY;
    double cx = (minX + maxX) / 2.0;
    double cy = (minY + maxY) / 2.0;

    ZoomState fit;
    fit.k = 1.0;
    if (boxW > EPSILON && boxH > EPSILON && width > 0.0 && height > 0.0) {
        double usable = 1.0 - 2.0 * FIT_PADDING;
        fit.k = std::min({width * usable / boxW, height * usable / boxH, 1.0});
    }

    // Box centre lands on the viewport centre
    fit.x = width / 2.0 - cx;
    fit.y = height / 2.0 - cy;
    return fit;
}

// ============================================================================
// Animation
// ============================================================================

void ZoomCamera::cancelAnimation() {
    if (task_ != 0) {
        scheduler_.cancel(task_);
        task_ = 0;
    }
}

bool ZoomCamera::isAnimating() const {
    return task_ != 0 && scheduler_.isScheduled(task_);
}

void ZoomCamera::jumpTo(const ZoomState& target) {
    cancelAnimation();
    state_ = target;
    target_ = target;
    if (stepCb_) {
        stepCb_();
    }
}

void ZoomCamera::animateTo(const ZoomState& target, double now) {
    cancelAnimation();

    from_ = state_;
    target_ = target;
    tStart_ = now;

    task_ = scheduler_.schedule([this](double t) {
        double p = (t - tStart_) / ZOOM_DURATION;
        if (p >= 1.0) {
            // Land exactly on the target
            state_ = target_;
            task_ = 0;
            if (stepCb_) {
                stepCb_();
            }
            return false;
        }

        double e = ease(MorphType::EaseOutCubic, p);
        state_.k = interpolate(from_.k, target_.k, e);
        state_.x = interpolate(from_.x, target_.x, e);
        state_.y = interpolate(from_.y, target_.y, e);
        if (stepCb_) {
            stepCb_();
        }
        return true;
    });
}

} // namespace clustermap
