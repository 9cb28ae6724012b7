#include "ui/ViewportPanel.h"

#include <imgui.h>

#include <algorithm>
#include <string>

#include "core/PlatformUtils.h"
#include "navigation/MapViewController.h"
#include "navigation/NavigationStore.h"
#include "ui/MainWindow.h"
#include "ui/ScenePainter.h"
#include "ui/ThemeManager.h"

namespace clustermap {

static const char* HINT_TEXT = "Click any circle with child items to zoom in";

ViewportPanel& ViewportPanel::instance() {
    static ViewportPanel s;
    return s;
}

// ============================================================================
// Breadcrumb bar: Root / crumb / crumb ... / current
// ============================================================================

void ViewportPanel::drawBreadcrumbBar(NavigationStore& store) {
    const NavigationState& state = store.state();
    const Hierarchy& hierarchy = store.hierarchy();

    if (ImGui::SmallButton("Root")) {
        store.navigateBreadcrumb(-1);
        return;
    }

    // Breadcrumb indices refer to the unfiltered path; synthetic entries are hidden
    const std::vector<ClusterNode*> path = state.breadcrumbPath;
    for (size_t i = 0; i < path.size(); ++i) {
        const ClusterNode* crumb = path[i];
        if (hierarchy.isSyntheticRoot(crumb)) continue;

        ImGui::SameLine();
        ImGui::TextDisabled("/");
        ImGui::SameLine();
        ImGui::PushID(static_cast<int>(i));
        bool isLast = i + 1 == path.size();
        if (isLast) {
            ImGui::TextUnformatted(crumb->name.c_str());
        } else if (ImGui::SmallButton(crumb->name.c_str())) {
            ImGui::PopID();
            store.navigateBreadcrumb(static_cast<int>(i));
            return;
        }
        ImGui::PopID();
    }
}

// ============================================================================
// Pointer input
// ============================================================================

void ViewportPanel::handleInput(MapViewController& map, ImVec2 origin) {
    bool hovered = ImGui::IsItemHovered();
    ImVec2 mouse = ImGui::GetMousePos();
    XYvec local{mouse.x - origin.x, mouse.y - origin.y};

    if (hovered) {
        ImGuiIO& io = ImGui::GetIO();
        if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f || !pointerInside_) {
            map.pointerMove(local);
        }
        pointerInside_ = true;

        if (ImGui::IsItemClicked(ImGuiMouseButton_Left)) {
            map.click(local);
        }
    } else if (pointerInside_) {
        pointerInside_ = false;
        map.pointerLeave();
    }
}

void ViewportPanel::handleKeyboard(MapViewController& map, NavigationStore& store) {
    if (!ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows)) return;

    // Escape / Backspace: one level up
    if (ImGui::IsKeyPressed(ImGuiKey_Escape) || ImGui::IsKeyPressed(ImGuiKey_Backspace)) {
        store.navigateUp();
    }
    if (ImGui::IsKeyPressed(ImGuiKey_Home)) {
        store.navigateBreadcrumb(-1);
    }
    if (ImGui::IsKeyPressed(ImGuiKey_F)) {
        map.fitToView();
    }
}

// ============================================================================
// Overlays
// ============================================================================

void ViewportPanel::drawTooltip(const MapViewController& map) {
    const PackedNode* hovered = map.hoveredNode();
    if (!hovered || !pointerInside_) return;

    ImGui::BeginTooltip();
    ImGui::TextUnformatted(hovered->node->name.c_str());
    ImGui::TextDisabled("%s", PlatformUtils::formatTraceCount(hovered->node->weight).c_str());
    ImGui::EndTooltip();
}

void ViewportPanel::drawHint(ImVec2 origin) {
    const Theme& theme = ThemeManager::instance().currentTheme();
    ImDrawList* drawList = ImGui::GetWindowDrawList();
    ImVec2 textSize = ImGui::CalcTextSize(HINT_TEXT);
    ImVec2 pos(origin.x + (width_ - textSize.x) * 0.5f, origin.y + height_ - textSize.y - 12.0f);
    drawList->AddText(pos, theme.hintColor, HINT_TEXT);
}

// ============================================================================
// draw
// ============================================================================

void ViewportPanel::draw() {
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
    bool open = ImGui::Begin("Cluster Map");
    ImGui::PopStyleVar();

    if (!open) {
        ImGui::End();
        return;
    }

    MainWindow& mw = MainWindow::instance();
    MapViewController* map = mw.mapController();
    NavigationStore* store = mw.store();
    if (!map || !store) {
        ImGui::TextDisabled("No hierarchy loaded");
        ImGui::End();
        return;
    }

    ImGui::SetCursorPos(ImVec2(8.0f, ImGui::GetCursorPosY() + 4.0f));
    drawBreadcrumbBar(*store);
    ImGui::Spacing();

    ImVec2 origin = ImGui::GetCursorScreenPos();
    ImVec2 avail = ImGui::GetContentRegionAvail();
    int w = std::max(1, static_cast<int>(avail.x));
    int h = std::max(1, static_cast<int>(avail.y));
    if (w != width_ || h != height_) {
        width_ = w;
        height_ = h;
        map->setViewportSize(width_, height_);
    }

    // Input capture over the whole canvas
    ImGui::InvisibleButton("##map", ImVec2(static_cast<float>(width_), static_cast<float>(height_)));
    handleInput(*map, origin);
    handleKeyboard(*map, *store);

    ImDrawList* drawList = ImGui::GetWindowDrawList();
    drawList->PushClipRect(origin, ImVec2(origin.x + width_, origin.y + height_), true);
    Scene scene = map->buildScene(PlatformUtils::getTime(), &ScenePainter::measureText);
    ScenePainter::paint(drawList, scene, origin);
    if (!store->state().isRoot()) {
        drawHint(origin);
    }
    drawList->PopClipRect();

    drawTooltip(*map);

    ImGui::End();
}

} // namespace clustermap
