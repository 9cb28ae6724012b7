#include "ui/StatusBar.h"

#include <imgui.h>

#include <cstdio>

#include "animation/Animation.h"
#include "navigation/NavigationStore.h"
#include "ui/MainWindow.h"

namespace clustermap {

StatusBar& StatusBar::instance() {
    static StatusBar s;
    return s;
}

void StatusBar::setMessage(const std::string& left, const std::string& right) {
    leftMessage_ = left;
    rightMessage_ = right;
}

std::string StatusBar::viewText() const {
    NavigationStore* store = MainWindow::instance().store();
    if (!store) return std::string();

    const NavigationState& state = store->state();
    std::string text = state.isRoot() || !state.currentRootNode
                           ? std::string("Root level")
                           : "Viewing " + state.currentRootNode->name;
    if (state.selectedNodeId) {
        if (const ClusterNode* sel = store->hierarchy().findById(*state.selectedNodeId)) {
            text += "  |  Selected " + sel->name;
        }
    }
    text += state.syncModeEnabled ? "  |  Synced" : "  |  Independent";
    return text;
}

void StatusBar::draw() {
    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoScrollbar |
        ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_NoDecoration |
        ImGuiWindowFlags_NoMove;

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    float height = ImGui::GetFrameHeightWithSpacing();

    float yPos = viewport->WorkPos.y + viewport->WorkSize.y - height;
    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x, yPos));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, height));
    ImGui::SetNextWindowViewport(viewport->ID);

    if (ImGui::Begin("##StatusBar", nullptr, flags)) {
        ImGui::TextUnformatted(leftMessage_.c_str());

        std::string view = viewText();
        if (!view.empty()) {
            ImGui::SameLine();
            ImGui::TextDisabled("  %s", view.c_str());
        }

        // Totals, plus the frame rate while something animates
        std::string right = rightMessage_;
        const Animation& animation = Animation::instance();
        if (animation.isActive() && animation.getFramerate() > 0.0f) {
            char fps[32];
            snprintf(fps, sizeof(fps), "  %.0f fps", animation.getFramerate());
            right += fps;
        }
        if (!right.empty()) {
            float rightWidth = ImGui::CalcTextSize(right.c_str()).x;
            float availWidth = ImGui::GetContentRegionAvail().x;
            if (rightWidth < availWidth) {
                ImGui::SameLine(ImGui::GetWindowContentRegionMax().x - rightWidth);
            }
            ImGui::TextUnformatted(right.c_str());
        }
    }
    ImGui::End();
}

} // namespace clustermap
