#pragma once

namespace clustermap {

class MapViewController;
class NavigationStore;

// Strip under the menu bar: map navigation buttons and the sync toggle.
class Toolbar {
public:
    static Toolbar& instance();
    void draw();

private:
    Toolbar() = default;

    void drawNavigationButtons(NavigationStore* store, MapViewController* map);
    void drawSyncToggle(NavigationStore* store);
};

} // namespace clustermap
