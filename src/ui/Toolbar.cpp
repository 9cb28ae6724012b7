#include "ui/Toolbar.h"

#include <imgui.h>
#include <imgui_internal.h>

#include "navigation/MapViewController.h"
#include "navigation/NavigationStore.h"
#include "ui/MainWindow.h"

namespace clustermap {

Toolbar& Toolbar::instance() {
    static Toolbar s;
    return s;
}

void Toolbar::draw() {
    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoScrollbar |
        ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_NoDecoration |
        ImGuiWindowFlags_NoMove;

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    float height = ImGui::GetFrameHeightWithSpacing();

    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x, viewport->WorkPos.y));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, height));
    ImGui::SetNextWindowViewport(viewport->ID);

    if (ImGui::Begin("##Toolbar", nullptr, flags)) {
        MainWindow& mw = MainWindow::instance();
        NavigationStore* store = mw.store();
        MapViewController* map = mw.mapController();
        bool ready = store && map && !mw.isLoading();

        ImGui::BeginDisabled(!ready);
        drawNavigationButtons(store, map);

        ImGui::SameLine();
        ImGui::SeparatorEx(ImGuiSeparatorFlags_Vertical);
        ImGui::SameLine();

        drawSyncToggle(store);
        ImGui::EndDisabled();
    }
    ImGui::End();
}

void Toolbar::drawNavigationButtons(NavigationStore* store, MapViewController* map) {
    bool atRoot = !store || store->state().isRoot();
    ImGui::BeginDisabled(atRoot);
    if (ImGui::Button("Root")) {
        store->navigateBreadcrumb(-1);
    }
    ImGui::SameLine();
    if (ImGui::Button("Up")) {
        store->navigateUp();
    }
    ImGui::EndDisabled();

    ImGui::SameLine();
    if (ImGui::Button("Fit") && map) {
        map->fitToView();
    }
}

// Sync: outline selections drive the map
void Toolbar::drawSyncToggle(NavigationStore* store) {
    bool sync = store && store->state().syncModeEnabled;
    if (ImGui::Checkbox("Sync", &sync) && store) {
        store->setSyncMode(sync);
    }
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip(sync ? "Synced: tree selections navigate the map"
                               : "Independent: tree and map navigate separately");
    }
}

} // namespace clustermap
