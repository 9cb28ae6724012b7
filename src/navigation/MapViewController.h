#pragma once

#include "animation/PulseEffect.h"
#include "animation/Scheduler.h"
#include "camera/ZoomCamera.h"
#include "core/Hierarchy.h"
#include "geometry/CirclePackLayout.h"
#include "navigation/NavigationStore.h"
#include "renderer/SceneRenderer.h"

#include <functional>
#include <string>

namespace clustermap {

// ============================================================================
// MapViewController - the packed-circle view of the navigation state
// ============================================================================
//
// Owns the layout of the current view root, the camera over it and the hover
// state. Pointer input is turned into store actions; store changes relayout
// and refit the camera.

class MapViewController {
public:
    MapViewController(const Hierarchy& hierarchy, NavigationStore& store, Scheduler& scheduler);
    ~MapViewController();

    MapViewController(const MapViewController&) = delete;
    MapViewController& operator=(const MapViewController&) = delete;

    // Viewport size in pixels. A change relays out and refits without
    // animating.
    void setViewportSize(double width, double height);
    double width() const { return width_; }
    double height() const { return height_; }

    // A new hierarchy was installed; rebuild from the store's root
    void hierarchyChanged();

    // --- Input ---

    void pointerMove(const XYvec& screenPoint);
    void pointerLeave();
    void click(const XYvec& screenPoint);

    // Animate back to the fit of the current view
    void fitToView();

    // --- Output ---

    Scene buildScene(double time, const TextMeasurer& measure) const;

    const PackedLayout& layout() const { return layout_; }
    const ZoomCamera& camera() const { return camera_; }
    ZoomCamera& camera() { return camera_; }

    const std::string& hoveredId() const { return hoveredId_; }
    const PackedNode* hoveredNode() const;

    // Scheduler clock used to start animations
    void setClock(std::function<double()> clock) { clock_ = std::move(clock); }

    // Invoked whenever the view needs repainting
    void setRedrawCallback(std::function<void()> cb);

private:
    void onStateChanged(const NavigationState& state);
    void relayout();
    void requestRedraw();

    const Hierarchy& hierarchy_;
    NavigationStore& store_;
    NavigationStore::ListenerId subscription_ = 0;

    ZoomCamera camera_;
    PulseEffect pulse_;
    PackedLayout layout_;

    double width_ = 0.0;
    double height_ = 0.0;
    std::string layoutRootId_;
    std::string hoveredId_;

    std::function<double()> clock_;
    std::function<void()> redrawCb_;
};

} // namespace clustermap
