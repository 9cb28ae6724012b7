#pragma once

#include <glm/glm.hpp>
#include <imgui.h>
#include <string>
#include <vector>

namespace clustermap {

struct Theme {
    std::string id;
    std::string displayName;
    bool dark = false;

    // Window chrome
    glm::vec3 windowBg{0.96f, 0.96f, 0.94f};
    glm::vec3 accentPrimary{0.26f, 0.45f, 0.75f};
    glm::vec3 textColor{0.12f, 0.12f, 0.14f};

    // Overlays drawn on top of the map
    ImU32 hintColor = IM_COL32(80, 80, 90, 200);
    ImU32 overlayBg = IM_COL32(255, 255, 255, 220);
    ImU32 overlayBorder = IM_COL32(0, 0, 0, 40);

    // Outline panel
    ImU32 errorText = IM_COL32(200, 40, 40, 255);
    ImU32 mutedText = IM_COL32(110, 110, 120, 255);
    ImU32 rowSelected = IM_COL32(66, 115, 190, 50);
    ImU32 rowHovered = IM_COL32(0, 0, 0, 18);
};

class ThemeManager {
public:
    static ThemeManager& instance();

    void init();

    const Theme& currentTheme() const { return themes_[currentIndex_]; }
    int currentIndex() const { return currentIndex_; }
    const std::vector<Theme>& themes() const { return themes_; }

    void setThemeByIndex(int index);
    void setThemeById(const std::string& id);

    void applyImGuiStyle() const;

private:
    ThemeManager() = default;
    void buildThemes();

    std::vector<Theme> themes_;
    int currentIndex_ = 0;
};

} // namespace clustermap
