#include "navigation/OutlineModel.h"

#include <algorithm>
#include <cmath>

namespace clustermap {

OutlineModel::OutlineModel(const Hierarchy& hierarchy, NavigationStore& store, TopicCache& topics)
    : hierarchy_(hierarchy),
      store_(store),
      topics_(topics) {
    subscription_ = store_.subscribe([this](const NavigationState& state) { onStateChanged(state); });
}

OutlineModel::~OutlineModel() {
    store_.unsubscribe(subscription_);
}

// ============================================================================
// Flattening
// ============================================================================

std::vector<OutlineRow> OutlineModel::flatten(const std::vector<ClusterNode*>& roots,
                                              const std::set<std::string>& expanded) {
    std::vector<OutlineRow> rows;

    struct Walker {
        const std::set<std::string>& expanded;
        std::vector<OutlineRow>& rows;

        void visit(ClusterNode* node, int depth) {
            rows.push_back(OutlineRow{node, depth});
            if (expanded.count(node->id) == 0) {
                return;
            }
            for (auto& child : node->children) {
                visit(child.get(), depth + 1);
            }
        }
    };

    Walker walker{expanded, rows};
    for (ClusterNode* root : roots) {
        walker.visit(root, 0);
    }
    return rows;
}

std::vector<OutlineRow> OutlineModel::flatten() const {
    return flatten(hierarchy_.topLevel(), expandedIds_);
}

// ============================================================================
// Expansion
// ============================================================================

void OutlineModel::setExpanded(const std::string& id, bool expanded) {
    if (expanded) {
        expandedIds_.insert(id);
    } else {
        expandedIds_.erase(id);
    }
}

void OutlineModel::collapseAll() {
    expandedIds_.clear();
}

void OutlineModel::requestTopics(const std::string& id) {
    ClusterNode* node = hierarchy_.findById(id);
    if (node && node->isL0()) {
        topics_.request(*node);
    }
}

// ============================================================================
// Interaction
// ============================================================================

void OutlineModel::click(ClusterNode* node) {
    if (!node) {
        return;
    }
    focusedId_ = node->id;

    if (node->isL0()) {
        topics_.request(*node);
    }
    setExpanded(node->id, !isExpanded(node->id));

    if (store_.state().syncModeEnabled) {
        store_.navigateToNodeById(node->id);
    } else {
        store_.selectNode(node->id);
    }
}

void OutlineModel::focusFirst() {
    std::vector<OutlineRow> rows = flatten();
    focusedId_ = rows.empty() ? std::string() : rows.front().node->id;
}

void OutlineModel::handleKey(OutlineKey key) {
    std::vector<OutlineRow> rows = flatten();
    if (rows.empty()) {
        return;
    }

    auto it = std::find_if(rows.begin(), rows.end(),
                           [this](const OutlineRow& r) { return r.node->id == focusedId_; });
    if (it == rows.end()) {
        // Nothing focused yet: the first key lands on the first row
        if (key == OutlineKey::Down || key == OutlineKey::Up) {
            focusedId_ = rows.front().node->id;
        }
        return;
    }
    size_t index = static_cast<size_t>(it - rows.begin());
    ClusterNode* focused = it->node;

    switch (key) {
        case OutlineKey::Down:
            if (index + 1 < rows.size()) {
                focusedId_ = rows[index + 1].node->id;
            }
            break;

        case OutlineKey::Up:
            if (index > 0) {
                focusedId_ = rows[index - 1].node->id;
            }
            break;

        case OutlineKey::Right:
            if (!isExpanded(focused->id)) {
                click(focused);
            }
            break;

        case OutlineKey::Left:
            if (isExpanded(focused->id)) {
                setExpanded(focused->id, false);
            }
            break;

        case OutlineKey::Enter:
            click(focused);
            break;
    }
}

void OutlineModel::goHome() {
    collapseAll();
    store_.navigateBreadcrumb(-1);
}

void OutlineModel::resetState() {
    expandedIds_.clear();
    focusedId_.clear();
    hoveredId_.clear();
    scrollTarget_.clear();
    ++scrollSerial_;
}

// ============================================================================
// Sync consumer
// ============================================================================

void OutlineModel::onStateChanged(const NavigationState& state) {
    if (!state.syncModeEnabled) {
        return;
    }

    // Additive: the user's own expansions stay open
    for (const ClusterNode* node : state.breadcrumbPath) {
        expandedIds_.insert(node->id);
    }
    if (state.currentRootNode && !hierarchy_.isSyntheticRoot(state.currentRootNode)) {
        expandedIds_.insert(state.currentRootNode->id);
    }

    for (const std::string& id : state.expandedL0NodeIds) {
        expandedIds_.insert(id);
        requestTopics(id);
    }

    if (state.selectedNodeId && *state.selectedNodeId != scrollTarget_) {
        scrollTarget_ = *state.selectedNodeId;
        ++scrollSerial_;
    }
}

// ============================================================================
// Orb sizing
// ============================================================================

float OutlineModel::orbSize(ClusterLevel level, int64_t traceCount) {
    float base = 8.0f;
    float maxSize = 12.0f;
    switch (level) {
        case ClusterLevel::L2: base = 12.0f; maxSize = 16.0f; break;
        case ClusterLevel::L1: base = 10.0f; maxSize = 14.0f; break;
        case ClusterLevel::L0: base = 8.0f;  maxSize = 12.0f; break;
    }
    double count = static_cast<double>(std::max<int64_t>(0, traceCount));
    double normalized = std::clamp(std::log10(1.0 + count) / 2.0, 0.0, 1.0);
    return base + (maxSize - base) * static_cast<float>(normalized);
}

} // namespace clustermap
