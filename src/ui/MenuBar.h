#pragma once

namespace clustermap {

// Main menu: file loading, map navigation, view dialogs and themes.
class MenuBar {
public:
    static MenuBar& instance();
    void draw();

private:
    MenuBar() = default;
    void drawFileMenu();
    void drawNavigateMenu();
    void drawViewMenu();
    void drawThemesMenu();
    void drawHelpMenu();
};

} // namespace clustermap
