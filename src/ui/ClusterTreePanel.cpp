#include "ui/ClusterTreePanel.h"

#include <imgui.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

#include "color/ColorSystem.h"
#include "core/PlatformUtils.h"
#include "data/TopicCache.h"
#include "navigation/NavigationStore.h"
#include "navigation/OutlineModel.h"
#include "ui/MainWindow.h"
#include "ui/ScenePainter.h"
#include "ui/ThemeManager.h"

namespace clustermap {

ClusterTreePanel& ClusterTreePanel::instance() {
    static ClusterTreePanel s;
    return s;
}

// ============================================================================
// Orb: display colour at the centre fading to the base colour, with a soft
// glow behind it
// ============================================================================

void ClusterTreePanel::drawOrb(ImDrawList* drawList, ImVec2 center, const ClusterNode* node,
                               bool ringed, bool hovered) {
    const RGBcolor base = ColorSystem::instance().baseColorFor(node);
    const RGBcolor display = ColorSystem::shadeForLevel(base, node->level);
    const float radius = OutlineModel::orbSize(node->level, node->weight) * 0.5f;

    float glowScale = hovered ? 1.3f : ringed ? 1.2f : 1.0f;
    uint8_t glowAlpha = hovered ? 0x99 : ringed ? 0x80 : 0x66;
    ScenePainter::addRadialGradient(drawList, center, radius * 0.6f, radius * (1.0f + 0.8f * glowScale),
                                    {{0.0, RGBAcolor{display, glowAlpha}}, {1.0, RGBAcolor{display, 0x00}}});

    ScenePainter::addRadialGradient(drawList, center, 0.0f, radius,
                                    {{0.0, RGBAcolor{display, 0xFF}}, {1.0, RGBAcolor{base, 0xFF}}});

    if (ringed) {
        drawList->AddCircle(center, radius + 1.0f, toImColor(base), 0, 2.0f);
    }
}

// ============================================================================
// Row
// ============================================================================

void ClusterTreePanel::drawRow(OutlineModel& outline, ClusterNode* node, int depth, bool selected) {
    const Theme& theme = ThemeManager::instance().currentTheme();
    const bool expanded = outline.isExpanded(node->id);
    const bool focused = outline.focusedId() == node->id;
    // L0 rows expand into their topic list
    const bool expandable = node->hasChildren() || node->isL0();

    ImGui::PushID(node->id.c_str());

    ImVec2 rowMin = ImGui::GetCursorScreenPos();
    float rowWidth = ImGui::GetContentRegionAvail().x;
    ImGui::InvisibleButton("##row", ImVec2(std::max(rowWidth, 1.0f), ROW_HEIGHT));
    bool hovered = ImGui::IsItemHovered();
    if (hovered) {
        outline.setHoveredId(node->id);
    } else if (outline.hoveredId() == node->id) {
        outline.setHoveredId("");
    }
    bool clicked = ImGui::IsItemClicked(ImGuiMouseButton_Left);

    ImDrawList* drawList = ImGui::GetWindowDrawList();
    ImVec2 rowMax(rowMin.x + rowWidth, rowMin.y + ROW_HEIGHT);
    if (selected || focused) {
        drawList->AddRectFilled(rowMin, rowMax, theme.rowSelected, 4.0f);
    } else if (hovered) {
        drawList->AddRectFilled(rowMin, rowMax, theme.rowHovered, 4.0f);
    }

    float x = rowMin.x + INDENT_BASE + INDENT_PER_LEVEL * static_cast<float>(depth);
    const float midY = rowMin.y + ROW_HEIGHT * 0.5f;
    const ImU32 textCol = ImGui::GetColorU32(ImGuiCol_Text);

    // Chevron
    if (expandable) {
        const float s = 4.0f;
        ImVec2 c(x + 5.0f, midY);
        if (expanded) {
            drawList->AddTriangleFilled(ImVec2(c.x - s, c.y - s * 0.5f), ImVec2(c.x + s, c.y - s * 0.5f),
                                        ImVec2(c.x, c.y + s * 0.7f), theme.mutedText);
        } else {
            drawList->AddTriangleFilled(ImVec2(c.x - s * 0.5f, c.y - s), ImVec2(c.x + s * 0.7f, c.y),
                                        ImVec2(c.x - s * 0.5f, c.y + s), theme.mutedText);
        }
    }
    x += 14.0f;

    // Orb
    const float orbSlot = 18.0f;
    drawOrb(drawList, ImVec2(x + orbSlot * 0.5f, midY), node, expanded || selected, hovered);
    x += orbSlot + 6.0f;

    // Name, then the trace count for non-L0 rows
    float textY = midY - ImGui::GetTextLineHeight() * 0.5f;
    std::string count;
    float countWidth = 0.0f;
    if (!node->isL0()) {
        count = "(" + PlatformUtils::formatNumber(node->leafWeightSum()) + ")";
        countWidth = ImGui::CalcTextSize(count.c_str()).x + 8.0f;
    }
    float nameRight = rowMax.x - countWidth - 4.0f;
    drawList->PushClipRect(ImVec2(x, rowMin.y), ImVec2(std::max(nameRight, x), rowMax.y), true);
    drawList->AddText(ImVec2(x, textY), textCol, node->name.c_str());
    drawList->PopClipRect();
    if (!count.empty()) {
        drawList->AddText(ImVec2(rowMax.x - countWidth, textY), theme.mutedText, count.c_str());
    }

    if (hovered && !node->isL0()) {
        ImGui::SetTooltip("%s\n%s", node->name.c_str(),
                          PlatformUtils::formatTraceCount(node->leafWeightSum()).c_str());
    }

    // Bring the sync target into view once per request
    if (outline.scrollTarget() == node->id && outline.scrollSerial() != lastScrollSerial_) {
        ImGui::SetScrollHereY(0.5f);
        lastScrollSerial_ = outline.scrollSerial();
    }

    ImGui::PopID();

    if (clicked) {
        outline.click(node);
    }
}

// ============================================================================
// Topic list under an expanded L0 row
// ============================================================================

void ClusterTreePanel::drawTopics(TopicCache& topics, const ClusterNode* node, int depth) {
    const Theme& theme = ThemeManager::instance().currentTheme();
    float indent = INDENT_BASE + INDENT_PER_LEVEL * static_cast<float>(depth + 1) + 14.0f;

    ImGui::PushID(node->id.c_str());
    ImGui::Indent(indent);

    const TopicCacheEntry* entry = topics.entry(node->id);
    if (!entry || entry->status == TopicStatus::Loading) {
        int dots = static_cast<int>(std::fmod(ImGui::GetTime() * 3.0, 4.0));
        std::string text = "Loading topics" + std::string(static_cast<size_t>(dots), '.');
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.mutedText), "%s", text.c_str());
    } else if (entry->status == TopicStatus::Error) {
        ImGui::PushStyleColor(ImGuiCol_Text, theme.errorText);
        ImGui::TextWrapped("%s", entry->error.c_str());
        ImGui::PopStyleColor();
        if (ImGui::SmallButton("Retry")) {
            topics.retry(node->id);
        }
    } else if (entry->topics.empty()) {
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.mutedText), "No topics found");
    } else {
        for (const Topic& topic : entry->topics) {
            ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.mutedText), "%s", topic.id.c_str());
            ImGui::SameLine();
            ImGui::TextWrapped("%s", topic.text.c_str());
        }
    }

    ImGui::Unindent(indent);
    ImGui::PopID();
}

// ============================================================================
// Footer and keyboard
// ============================================================================

void ClusterTreePanel::drawFooter(OutlineModel& outline) {
    NavigationStore* store = MainWindow::instance().store();

    ImGui::Separator();
    if (ImGui::Button("Home")) {
        outline.goHome();
    }
    ImGui::SameLine();
    bool sync = store && store->state().syncModeEnabled;
    if (ImGui::Checkbox(sync ? "Synced" : "Independent", &sync) && store) {
        store->setSyncMode(sync);
    }
}

void ClusterTreePanel::handleKeyboard(OutlineModel& outline) {
    if (!ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows)) return;
    if (ImGui::GetIO().WantTextInput) return;

    if (outline.focusedId().empty() &&
        (ImGui::IsKeyPressed(ImGuiKey_DownArrow) || ImGui::IsKeyPressed(ImGuiKey_UpArrow))) {
        outline.focusFirst();
        return;
    }
    if (ImGui::IsKeyPressed(ImGuiKey_DownArrow)) outline.handleKey(OutlineKey::Down);
    if (ImGui::IsKeyPressed(ImGuiKey_UpArrow)) outline.handleKey(OutlineKey::Up);
    if (ImGui::IsKeyPressed(ImGuiKey_RightArrow)) outline.handleKey(OutlineKey::Right);
    if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow)) outline.handleKey(OutlineKey::Left);
    if (ImGui::IsKeyPressed(ImGuiKey_Enter) || ImGui::IsKeyPressed(ImGuiKey_KeypadEnter)) {
        outline.handleKey(OutlineKey::Enter);
    }
}

// ============================================================================
// draw
// ============================================================================

void ClusterTreePanel::draw() {
    if (!ImGui::Begin("Cluster Tree")) {
        ImGui::End();
        return;
    }

    MainWindow& mw = MainWindow::instance();
    OutlineModel* outline = mw.outline();
    NavigationStore* store = mw.store();
    TopicCache* topics = mw.topicCache();
    if (!outline || !store || !topics || mw.hierarchy().empty()) {
        ImGui::TextDisabled("No hierarchy loaded");
        ImGui::End();
        return;
    }

    const std::optional<std::string>& selectedId = store->state().selectedNodeId;
    float footerHeight = ImGui::GetFrameHeightWithSpacing() + ImGui::GetStyle().ItemSpacing.y * 2.0f;

    ImGui::BeginChild("##rows", ImVec2(0.0f, -footerHeight), false);
    handleKeyboard(*outline);

    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(4.0f, 1.0f));
    for (const OutlineRow& row : outline->flatten()) {
        bool selected = selectedId && *selectedId == row.node->id;
        drawRow(*outline, row.node, row.depth, selected);
        if (row.node->isL0() && outline->isExpanded(row.node->id)) {
            drawTopics(*topics, row.node, row.depth);
        }
    }
    ImGui::PopStyleVar();
    ImGui::EndChild();

    drawFooter(*outline);

    ImGui::End();
}

} // namespace clustermap
