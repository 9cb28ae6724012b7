#include "ui/MenuBar.h"

#include <imgui.h>
#include <SDL.h>

#include "app/Config.h"
#include "navigation/MapViewController.h"
#include "navigation/NavigationStore.h"
#include "navigation/OutlineModel.h"
#include "ui/Dialogs.h"
#include "ui/MainWindow.h"
#include "ui/ThemeManager.h"

namespace clustermap {

MenuBar& MenuBar::instance() {
    static MenuBar s;
    return s;
}

void MenuBar::draw() {
    if (ImGui::BeginMainMenuBar()) {
        drawFileMenu();
        drawNavigateMenu();
        drawViewMenu();
        drawThemesMenu();
        drawHelpMenu();
        ImGui::EndMainMenuBar();
    }
}

void MenuBar::drawFileMenu() {
    MainWindow& mw = MainWindow::instance();
    bool idle = !mw.isLoading();

    if (ImGui::BeginMenu("File")) {
        if (ImGui::MenuItem("Open Hierarchy...", nullptr, false, idle)) {
            Dialogs::instance().showOpenHierarchy();
        }
        if (ImGui::MenuItem("Open Topics...")) {
            Dialogs::instance().showOpenTopics();
        }
        bool hasFile = !mw.hierarchyPath().empty();
        if (ImGui::MenuItem("Reload", "Ctrl+R", false, idle && hasFile)) {
            mw.requestLoad(mw.hierarchyPath());
        }
        if (ImGui::MenuItem("Load Sample Data", nullptr, false, idle)) {
            Config::instance().hierarchyPath.clear();
            mw.loadSample();
        }
        ImGui::Separator();
        if (ImGui::MenuItem("Exit", "Alt+F4")) {
            SDL_Event quitEvent;
            quitEvent.type = SDL_QUIT;
            SDL_PushEvent(&quitEvent);
        }
        ImGui::EndMenu();
    }
}

void MenuBar::drawNavigateMenu() {
    MainWindow& mw = MainWindow::instance();
    NavigationStore* store = mw.store();
    MapViewController* map = mw.mapController();
    OutlineModel* outline = mw.outline();

    if (ImGui::BeginMenu("Navigate", store && map && outline)) {
        bool atRoot = store->state().isRoot();
        if (ImGui::MenuItem("Root", "Home", false, !atRoot)) {
            store->navigateBreadcrumb(-1);
        }
        if (ImGui::MenuItem("Up One Level", "Esc", false, !atRoot)) {
            store->navigateUp();
        }
        if (ImGui::MenuItem("Fit to View", "F")) {
            map->fitToView();
        }
        ImGui::Separator();
        bool sync = store->state().syncModeEnabled;
        if (ImGui::MenuItem("Sync Tree and Map", nullptr, sync)) {
            store->setSyncMode(!sync);
        }
        if (ImGui::MenuItem("Collapse Tree")) {
            outline->collapseAll();
        }
        ImGui::EndMenu();
    }
}

void MenuBar::drawViewMenu() {
    bool loaded = MainWindow::instance().store() != nullptr;

    if (ImGui::BeginMenu("View")) {
        if (ImGui::MenuItem("Category Colours...")) {
            Dialogs::instance().showPaletteEditor();
        }
        if (ImGui::MenuItem("Navigation Context...", nullptr, false, loaded)) {
            Dialogs::instance().showContextSummary();
        }
        ImGui::EndMenu();
    }
}

void MenuBar::drawThemesMenu() {
    if (ImGui::BeginMenu("Themes")) {
        ThemeManager& tm = ThemeManager::instance();
        int current = tm.currentIndex();
        const auto& themes = tm.themes();
        for (int i = 0; i < static_cast<int>(themes.size()); ++i) {
            if (ImGui::RadioButton(themes[i].displayName.c_str(), current == i)) {
                tm.setThemeByIndex(i);
            }
        }
        ImGui::EndMenu();
    }
}

void MenuBar::drawHelpMenu() {
    if (ImGui::BeginMenu("Help")) {
        if (ImGui::MenuItem("About...")) {
            Dialogs::instance().showAbout();
        }
        ImGui::EndMenu();
    }
}

} // namespace clustermap
