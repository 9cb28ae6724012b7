#pragma once

#include "core/ClusterNode.h"
#include "core/Hierarchy.h"
#include "data/TopicCache.h"
#include "navigation/NavigationStore.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace clustermap {

struct OutlineRow {
    ClusterNode* node = nullptr;
    int depth = 0;
};

enum class OutlineKey {
    Up,
    Down,
    Left,
    Right,
    Enter
};

// ============================================================================
// OutlineModel - state behind the collapsible cluster tree
// ============================================================================
//
// Keeps its own expansion set. With sync mode on, navigation changes are
// merged into it (never collapsing anything the user opened).

class OutlineModel {
public:
    OutlineModel(const Hierarchy& hierarchy, NavigationStore& store, TopicCache& topics);
    ~OutlineModel();

    OutlineModel(const OutlineModel&) = delete;
    OutlineModel& operator=(const OutlineModel&) = delete;

    // Visible rows of the whole outline, in display order
    std::vector<OutlineRow> flatten() const;

    // Pre-order over roots, descending only into expanded nodes
    static std::vector<OutlineRow> flatten(const std::vector<ClusterNode*>& roots,
                                           const std::set<std::string>& expanded);

    // Row activation: toggle, fetch topics for L0, select or mirror
    void click(ClusterNode* node);

    void handleKey(OutlineKey key);

    bool isExpanded(const std::string& id) const { return expandedIds_.count(id) != 0; }
    void setExpanded(const std::string& id, bool expanded);
    void collapseAll();
    const std::set<std::string>& expandedIds() const { return expandedIds_; }

    // Focus the first visible row
    void focusFirst();
    const std::string& focusedId() const { return focusedId_; }
    void setFocusedId(const std::string& id) { focusedId_ = id; }

    const std::string& hoveredId() const { return hoveredId_; }
    void setHoveredId(const std::string& id) { hoveredId_ = id; }

    // Row the panel should bring into view. The serial changes with every
    // new request so the panel scrolls once per change.
    const std::string& scrollTarget() const { return scrollTarget_; }
    uint64_t scrollSerial() const { return scrollSerial_; }

    // Footer Home: collapse everything and return the map to the Root view
    void goHome();

    // Forget all per-tree state (new hierarchy)
    void resetState();

    // Orb diameter in pixels: base + range * clamp01(log10(1 + count) / 2)
    static float orbSize(ClusterLevel level, int64_t traceCount);

private:
    void onStateChanged(const NavigationState& state);
    void requestTopics(const std::string& id);

    const Hierarchy& hierarchy_;
    NavigationStore& store_;
    TopicCache& topics_;
    NavigationStore::ListenerId subscription_ = 0;

    std::set<std::string> expandedIds_;
    std::string focusedId_;
    std::string hoveredId_;
    std::string scrollTarget_;
    uint64_t scrollSerial_ = 0;
};

} // namespace clustermap
