#include "navigation/MapViewController.h"
#include "core/Errors.h"
#include "core/PlatformUtils.h"
#include "renderer/NodePicker.h"

#include <iostream>

namespace clustermap {

MapViewController::MapViewController(const Hierarchy& hierarchy, NavigationStore& store,
                                     Scheduler& scheduler)
    : hierarchy_(hierarchy),
      store_(store),
      camera_(scheduler),
      pulse_(scheduler),
      clock_(&PlatformUtils::getTime) {
    camera_.setStepCallback([this]() { requestRedraw(); });
    subscription_ = store_.subscribe([this](const NavigationState& state) { onStateChanged(state); });
}

MapViewController::~MapViewController() {
    store_.unsubscribe(subscription_);
}

void MapViewController::setRedrawCallback(std::function<void()> cb) {
    redrawCb_ = std::move(cb);
    pulse_.setRedrawCallback(redrawCb_);
}

void MapViewController::requestRedraw() {
    if (redrawCb_) {
        redrawCb_();
    }
}

// ============================================================================
// Layout
// ============================================================================

void MapViewController::relayout() {
    const NavigationState& state = store_.state();
    ClusterNode* root = state.currentRootNode ? state.currentRootNode : hierarchy_.root();

    layoutRootId_ = root ? root->id : std::string();
    try {
        layout_ = CirclePackLayout::compute(root, width_, height_);
    } catch (const LayoutError& e) {
        std::cerr << "MapViewController: layout of '" << layoutRootId_ << "' failed: "
                  << e.what() << std::endl;
        layout_ = PackedLayout{};
    }

    // The hovered circle may no longer be on screen
    if (!hoveredId_.empty() && layout_.indexOf(hoveredId_) < 0) {
        hoveredId_.clear();
    }
}

void MapViewController::setViewportSize(double width, double height) {
    if (width == width_ && height == height_) {
        return;
    }
    width_ = width;
    height_ = height;
    relayout();
    camera_.jumpTo(ZoomCamera::computeFitZoom(layout_, width_, height_));
}

void MapViewController::hierarchyChanged() {
    hoveredId_.clear();
    relayout();
    camera_.jumpTo(ZoomCamera::computeFitZoom(layout_, width_, height_));
    pulse_.setRunning(store_.state().selectedNodeId.has_value());
}

void MapViewController::onStateChanged(const NavigationState& state) {
    const std::string rootId = state.currentRootNode ? state.currentRootNode->id : std::string();
    if (rootId != layoutRootId_) {
        bool hadLayout = !layout_.empty();
        relayout();
        ZoomState fit = ZoomCamera::computeFitZoom(layout_, width_, height_);
        if (hadLayout) {
            camera_.animateTo(fit, clock_());
        } else {
            camera_.jumpTo(fit);
        }
    }

    // Pulse only while something is selected
    pulse_.setRunning(state.selectedNodeId.has_value());
    requestRedraw();
}

void MapViewController::fitToView() {
    camera_.animateTo(ZoomCamera::computeFitZoom(layout_, width_, height_), clock_());
}

// ============================================================================
// Input
// ============================================================================

const PackedNode* MapViewController::hoveredNode() const {
    return hoveredId_.empty() ? nullptr : layout_.find(hoveredId_);
}

void MapViewController::pointerMove(const XYvec& screenPoint) {
    const PackedNode* hit = NodePicker::pick(layout_, camera_, width_, height_, screenPoint);
    std::string id = hit ? hit->node->id : std::string();
    if (id != hoveredId_) {
        hoveredId_ = id;
        requestRedraw();
    }
}

void MapViewController::pointerLeave() {
    if (!hoveredId_.empty()) {
        hoveredId_.clear();
        requestRedraw();
    }
}

void MapViewController::click(const XYvec& screenPoint) {
    const PackedNode* hit = NodePicker::pick(layout_, camera_, width_, height_, screenPoint);
    if (!hit) {
        return;
    }

    ClusterNode* node = hit->node;
    if (node->hasChildren()) {
        store_.selectAndDrill(node);
    } else if (store_.state().syncModeEnabled) {
        store_.navigateToNodeById(node->id);
    } else {
        store_.selectNode(node->id);
    }
}

// ============================================================================
// Output
// ============================================================================

Scene MapViewController::buildScene(double time, const TextMeasurer& measure) const {
    SceneInputs in;
    in.layout = &layout_;
    in.zoom = camera_.state();
    in.width = width_;
    in.height = height_;
    in.hoveredId = hoveredId_;
    in.selectedId = store_.state().selectedNodeId.value_or(std::string());
    in.time = time;
    in.measureText = measure;
    return SceneRenderer::build(in);
}

} // namespace clustermap
