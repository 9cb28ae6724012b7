#pragma once

#include <cstdint>

#include <imgui.h>

namespace clustermap {

class ClusterNode;
class OutlineModel;
class TopicCache;

// ============================================================================
// ClusterTreePanel - "Cluster Tree" window drawing an OutlineModel
// ============================================================================

class ClusterTreePanel {
public:
    static ClusterTreePanel& instance();

    void draw();

private:
    ClusterTreePanel() = default;
    void handleKeyboard(OutlineModel& outline);
    void drawRow(OutlineModel& outline, ClusterNode* node, int depth, bool selected);
    void drawOrb(ImDrawList* drawList, ImVec2 center, const ClusterNode* node, bool ringed,
                 bool hovered);
    void drawTopics(TopicCache& topics, const ClusterNode* node, int depth);
    void drawFooter(OutlineModel& outline);

    uint64_t lastScrollSerial_ = 0;

    static constexpr float ROW_HEIGHT = 22.0f;
    static constexpr float INDENT_PER_LEVEL = 16.0f;
    static constexpr float INDENT_BASE = 8.0f;
};

} // namespace clustermap
