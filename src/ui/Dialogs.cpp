#include "ui/Dialogs.h"

#include <imgui.h>
#include <cstring>

#include "app/Config.h"
#include "color/ColorSystem.h"
#include "core/PlatformUtils.h"
#include "navigation/NavigationStore.h"
#include "ui/MainWindow.h"

namespace clustermap {

static void copyToBuffer(const std::string& text, char* buf, size_t bufSize) {
    std::memset(buf, 0, bufSize);
    size_t len = text.size();
    if (len >= bufSize) len = bufSize - 1;
    std::memcpy(buf, text.c_str(), len);
}

Dialogs& Dialogs::instance() {
    static Dialogs s;
    return s;
}

void Dialogs::showOpenHierarchy() {
    showOpenHierarchy_ = true;
    copyToBuffer(MainWindow::instance().hierarchyPath(), hierarchyPathBuf_, sizeof(hierarchyPathBuf_));
}

void Dialogs::showOpenTopics() {
    showOpenTopics_ = true;
    copyToBuffer(MainWindow::instance().topicsPath(), topicsPathBuf_, sizeof(topicsPathBuf_));
}

void Dialogs::showPaletteEditor() {
    showPaletteEditor_ = true;

    // Snapshot the colours of the clusters on screen
    paletteEdit_.clear();
    const ColorSystem& colors = ColorSystem::instance();
    for (const ClusterNode* node : MainWindow::instance().hierarchy().topLevel()) {
        const ClusterNode* l2 = ColorSystem::l2Ancestor(node);
        if (!l2) continue;
        RGBcolor c = colors.categoryColor(l2->id);
        paletteEdit_[l2->id] = {c.r, c.g, c.b};
    }
}

void Dialogs::showContextSummary() {
    showContextSummary_ = true;
}

void Dialogs::showAbout() {
    showAbout_ = true;
}

void Dialogs::draw() {
    drawOpenHierarchy();
    drawOpenTopics();
    drawPaletteEditor();
    drawContextSummary();
    drawAbout();
}

bool Dialogs::drawPathPrompt(const char* title, const char* prompt, bool& open, char* buf,
                             size_t bufSize) {
    if (!open) return false;

    ImGui::OpenPopup(title);

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(450.0f, 0.0f), ImGuiCond_Appearing);

    bool accepted = false;
    if (ImGui::BeginPopupModal(title, &open, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::TextUnformatted(prompt);
        ImGui::Separator();

        ImGui::SetNextItemWidth(420.0f);
        bool enter = ImGui::InputText("##Path", buf, bufSize, ImGuiInputTextFlags_EnterReturnsTrue);

        ImGui::Spacing();

        if (ImGui::Button("OK", ImVec2(120.0f, 0.0f)) || enter) {
            accepted = true;
            open = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(120.0f, 0.0f))) {
            open = false;
            ImGui::CloseCurrentPopup();
        }

        ImGui::EndPopup();
    }
    return accepted;
}

void Dialogs::drawOpenHierarchy() {
    if (drawPathPrompt("Open Hierarchy", "Cluster hierarchy JSON file (empty = sample data):",
                       showOpenHierarchy_, hierarchyPathBuf_, sizeof(hierarchyPathBuf_))) {
        std::string path(hierarchyPathBuf_);
        Config::instance().hierarchyPath = path;
        if (path.empty()) {
            MainWindow::instance().loadSample();
        } else {
            MainWindow::instance().requestLoad(path);
        }
    }
}

void Dialogs::drawOpenTopics() {
    if (drawPathPrompt("Open Topics", "Topics JSON file (empty = sample topics):",
                       showOpenTopics_, topicsPathBuf_, sizeof(topicsPathBuf_))) {
        std::string path(topicsPathBuf_);
        Config::instance().topicsPath = path;
        MainWindow::instance().setTopicsPath(path);
    }
}

void Dialogs::drawPaletteEditor() {
    if (!showPaletteEditor_) return;

    ImGui::SetNextWindowSize(ImVec2(380.0f, 420.0f), ImGuiCond_FirstUseEver);

    if (ImGui::Begin("Category Colours", &showPaletteEditor_)) {
        ImGui::TextUnformatted("Top-level cluster colours");
        ImGui::Separator();

        if (paletteEdit_.empty()) {
            ImGui::TextDisabled("No L2 clusters loaded");
        }

        const Hierarchy& hierarchy = MainWindow::instance().hierarchy();
        for (auto& entry : paletteEdit_) {
            const ClusterNode* node = hierarchy.findById(entry.first);
            std::string label = (node ? node->name : entry.first) + "##" + entry.first;
            ImGui::ColorEdit3(label.c_str(), entry.second.data());
        }

        ImGui::Spacing();
        ImGui::Separator();

        if (ImGui::Button("Apply", ImVec2(100.0f, 0.0f))) {
            Config& config = Config::instance();
            for (const auto& entry : paletteEdit_) {
                RGBcolor c{entry.second[0], entry.second[1], entry.second[2]};
                ColorSystem::instance().setPaletteEntry(entry.first, c);
                config.palette[entry.first] = PlatformUtils::rgb2hex(c);
            }
            config.save();
        }
        ImGui::SameLine();
        if (ImGui::Button("Defaults", ImVec2(100.0f, 0.0f))) {
            Config& config = Config::instance();
            config.palette.clear();
            config.applyPalette();
            config.save();
            showPaletteEditor();
        }
        ImGui::SameLine();
        if (ImGui::Button("Close", ImVec2(100.0f, 0.0f))) {
            showPaletteEditor_ = false;
        }
    }
    ImGui::End();
}

void Dialogs::drawContextSummary() {
    if (!showContextSummary_) return;

    ImGui::SetNextWindowSize(ImVec2(420.0f, 240.0f), ImGuiCond_FirstUseEver);

    if (ImGui::Begin("Navigation Context", &showContextSummary_)) {
        NavigationStore* store = MainWindow::instance().store();
        if (store) {
            std::string summary = store->getContextSummary();
            ImGui::TextWrapped("%s", summary.c_str());
            ImGui::Spacing();
            if (ImGui::Button("Copy")) {
                ImGui::SetClipboardText(summary.c_str());
            }
        } else {
            ImGui::TextDisabled("No hierarchy loaded");
        }
    }
    ImGui::End();
}

void Dialogs::drawAbout() {
    if (!showAbout_) return;

    ImGui::OpenPopup("About clustermap");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));

    if (ImGui::BeginPopupModal("About clustermap", &showAbout_,
                                ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("clustermap - Cluster Explorer");
        ImGui::Spacing();
        ImGui::Text("Browse L2 > L1 > L0 trace clusters as nested circles");
        ImGui::Text("alongside a collapsible outline of the same hierarchy.");
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::TextDisabled("Click a circle to zoom in, Esc to go up, F to fit.");
        ImGui::Spacing();

        if (ImGui::Button("OK", ImVec2(120.0f, 0.0f))) {
            showAbout_ = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

} // namespace clustermap
