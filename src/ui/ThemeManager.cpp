#include "ui/ThemeManager.h"

#include <algorithm>
#include <iostream>

namespace clustermap {

ThemeManager& ThemeManager::instance() {
    static ThemeManager s;
    return s;
}

void ThemeManager::init() {
    buildThemes();
    applyImGuiStyle();
}

void ThemeManager::buildThemes() {
    themes_.clear();

    // ---------------------------------------------------------------
    // 0: Light (paper background, matches the map canvas)
    // ---------------------------------------------------------------
    {
        Theme t;
        t.id = "light";
        t.displayName = "Light";
        themes_.push_back(t);
    }

    // ---------------------------------------------------------------
    // 1: Dark (chrome only; the map keeps its light canvas)
    // ---------------------------------------------------------------
    {
        Theme t;
        t.id = "dark";
        t.displayName = "Dark";
        t.dark = true;
        t.windowBg = {0.10f, 0.10f, 0.12f};
        t.accentPrimary = {0.36f, 0.58f, 0.95f};
        t.textColor = {0.92f, 0.92f, 0.90f};
        t.hintColor = IM_COL32(70, 70, 80, 220);
        t.overlayBg = IM_COL32(30, 30, 36, 230);
        t.overlayBorder = IM_COL32(255, 255, 255, 40);
        t.errorText = IM_COL32(255, 110, 110, 255);
        t.mutedText = IM_COL32(150, 150, 160, 255);
        t.rowSelected = IM_COL32(92, 148, 242, 70);
        t.rowHovered = IM_COL32(255, 255, 255, 20);
        themes_.push_back(t);
    }
}

void ThemeManager::setThemeByIndex(int index) {
    if (index < 0 || index >= static_cast<int>(themes_.size())) return;
    currentIndex_ = index;
    applyImGuiStyle();
}

void ThemeManager::setThemeById(const std::string& id) {
    for (int i = 0; i < static_cast<int>(themes_.size()); ++i) {
        if (themes_[i].id == id) {
            setThemeByIndex(i);
            return;
        }
    }
    std::cerr << "ThemeManager: unknown theme '" << id << "', keeping "
              << currentTheme().id << std::endl;
}

void ThemeManager::applyImGuiStyle() const {
    const Theme& t = themes_[currentIndex_];

    if (t.dark) {
        ImGui::StyleColorsDark();
    } else {
        ImGui::StyleColorsLight();
    }

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 4.0f;
    style.GrabRounding = 4.0f;
    ImVec4* colors = style.Colors;

    ImVec4 accent(t.accentPrimary.x, t.accentPrimary.y, t.accentPrimary.z, 1.0f);
    ImVec4 accentHover(
        std::min(t.accentPrimary.x * 1.2f, 1.0f),
        std::min(t.accentPrimary.y * 1.2f, 1.0f),
        std::min(t.accentPrimary.z * 1.2f, 1.0f), 1.0f);
    ImVec4 text(t.textColor.x, t.textColor.y, t.textColor.z, 1.0f);
    ImVec4 bg(t.windowBg.x, t.windowBg.y, t.windowBg.z, 1.0f);
    float shade = t.dark ? 1.25f : 0.97f;
    ImVec4 bgChild(std::min(bg.x * shade, 1.0f), std::min(bg.y * shade, 1.0f),
                   std::min(bg.z * shade, 1.0f), 1.0f);

    colors[ImGuiCol_Text] = text;
    colors[ImGuiCol_TextDisabled] = ImVec4(text.x * 0.5f + bg.x * 0.5f, text.y * 0.5f + bg.y * 0.5f,
                                           text.z * 0.5f + bg.z * 0.5f, 1.0f);
    colors[ImGuiCol_WindowBg] = bg;
    colors[ImGuiCol_ChildBg] = bgChild;
    colors[ImGuiCol_MenuBarBg] = bgChild;
    colors[ImGuiCol_Header] = ImVec4(accent.x, accent.y, accent.z, 0.25f);
    colors[ImGuiCol_HeaderHovered] = ImVec4(accent.x, accent.y, accent.z, 0.40f);
    colors[ImGuiCol_HeaderActive] = ImVec4(accent.x, accent.y, accent.z, 0.55f);
    colors[ImGuiCol_Button] = ImVec4(accent.x, accent.y, accent.z, 0.20f);
    colors[ImGuiCol_ButtonHovered] = ImVec4(accent.x, accent.y, accent.z, 0.45f);
    colors[ImGuiCol_ButtonActive] = accent;
    colors[ImGuiCol_TabHovered] = accentHover;
    colors[ImGuiCol_CheckMark] = accent;
    colors[ImGuiCol_SliderGrab] = accent;
    colors[ImGuiCol_DockingPreview] = ImVec4(accent.x, accent.y, accent.z, 0.6f);
}

} // namespace clustermap
