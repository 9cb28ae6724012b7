#pragma once

#include <imgui.h>

namespace clustermap {

class MapViewController;
class NavigationStore;

// ============================================================================
// ViewportPanel - "Cluster Map" window: breadcrumb bar over the packed map
// ============================================================================

class ViewportPanel {
public:
    static ViewportPanel& instance();

    void draw();

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }

private:
    ViewportPanel() = default;
    void drawBreadcrumbBar(NavigationStore& store);
    void handleInput(MapViewController& map, ImVec2 origin);
    void handleKeyboard(MapViewController& map, NavigationStore& store);
    void drawTooltip(const MapViewController& map);
    void drawHint(ImVec2 origin);

    int width_ = 0;
    int height_ = 0;
    bool pointerInside_ = false;
};

} // namespace clustermap
