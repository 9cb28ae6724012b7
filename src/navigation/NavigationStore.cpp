#include "navigation/NavigationStore.h"
#include "core/PlatformUtils.h"

#include <cmath>
#include <iostream>
#include <sstream>

namespace clustermap {

bool NavigationState::sameAs(const NavigationState& o) const {
    return selectedNodeId == o.selectedNodeId &&
           currentRootId == o.currentRootId &&
           currentRootNode == o.currentRootNode &&
           breadcrumbPath == o.breadcrumbPath &&
           expandedL0NodeIds == o.expandedL0NodeIds &&
           syncModeEnabled == o.syncModeEnabled;
}

NavigationStore::NavigationStore(const Hierarchy& hierarchy)
    : hierarchy_(hierarchy) {
    state_ = rootState(state_);
}

// ============================================================================
// Subscriptions
// ============================================================================

NavigationStore::ListenerId NavigationStore::subscribe(Listener listener) {
    ListenerId id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void NavigationStore::unsubscribe(ListenerId id) {
    listeners_.erase(id);
}

void NavigationStore::commit(NavigationState next) {
    if (next.sameAs(state_)) {
        return;
    }

    next.lastUpdated = static_cast<int64_t>(std::llround(PlatformUtils::getTime() * 1000.0));
    state_ = std::move(next);

    // Listeners may subscribe, unsubscribe or dispatch further actions
    auto listeners = listeners_;
    for (auto& entry : listeners) {
        if (listeners_.count(entry.first) != 0) {
            entry.second(state_);
        }
    }
}

// Root view: hierarchy root, empty breadcrumb. Other fields carried over.
NavigationState NavigationStore::rootState(const NavigationState& from) const {
    NavigationState next = from;
    ClusterNode* root = hierarchy_.root();
    next.currentRootNode = root;
    next.currentRootId = root ? root->id : std::string();
    next.breadcrumbPath.clear();
    return next;
}

// ============================================================================
// Low-level actions
// ============================================================================

void NavigationStore::selectNode(const std::optional<std::string>& nodeId) {
    NavigationState next = state_;
    next.selectedNodeId = nodeId;
    commit(std::move(next));
}

void NavigationStore::navigateToRoot(ClusterNode* rootNode, std::vector<ClusterNode*> breadcrumbPath) {
    if (!rootNode) {
        std::cerr << "NavigationStore: navigateToRoot called without a node" << std::endl;
        return;
    }
    NavigationState next = state_;
    next.currentRootNode = rootNode;
    next.currentRootId = rootNode->id;
    next.breadcrumbPath = std::move(breadcrumbPath);
    commit(std::move(next));
}

void NavigationStore::toggleL0Expansion(const std::string& nodeId) {
    NavigationState next = state_;
    if (next.expandedL0NodeIds.erase(nodeId) == 0) {
        next.expandedL0NodeIds.insert(nodeId);
    }
    commit(std::move(next));
}

void NavigationStore::reset() {
    NavigationState next = rootState(state_);
    next.selectedNodeId.reset();
    next.expandedL0NodeIds.clear();
    commit(std::move(next));
}

// ============================================================================
// Navigation
// ============================================================================

void NavigationStore::selectAndDrill(ClusterNode* node) {
    if (!node) {
        return;
    }
    if (!node->hasChildren()) {
        std::cout << "NavigationStore: '" << node->id << "' has no children, not drilling" << std::endl;
        return;
    }

    NavigationState next = state_;
    if (hierarchy_.isSyntheticRoot(node) || node == hierarchy_.root()) {
        next = rootState(state_);
    } else {
        next.currentRootNode = node;
        next.currentRootId = node->id;
        next.breadcrumbPath = hierarchy_.pathTo(node->id);
    }
    next.selectedNodeId = node->id;
    commit(std::move(next));
}

void NavigationStore::navigateBreadcrumb(int index) {
    if (index == -1) {
        NavigationState next = rootState(state_);
        next.selectedNodeId.reset();
        commit(std::move(next));
        return;
    }

    if (index < 0 || index >= static_cast<int>(state_.breadcrumbPath.size())) {
        std::cerr << "NavigationStore: breadcrumb index " << index
                  << " out of range (" << state_.breadcrumbPath.size() << " entries)" << std::endl;
        return;
    }

    NavigationState next = state_;
    next.breadcrumbPath.resize(static_cast<size_t>(index) + 1);
    next.currentRootNode = next.breadcrumbPath.back();
    next.currentRootId = next.currentRootNode->id;
    commit(std::move(next));
}

void NavigationStore::navigateUp() {
    int depth = static_cast<int>(state_.breadcrumbPath.size());
    if (depth == 0) {
        return;
    }
    navigateBreadcrumb(depth - 2);
}

void NavigationStore::navigateToNodeById(const std::string& nodeId) {
    ClusterNode* node = hierarchy_.findById(nodeId);
    if (!node) {
        std::cerr << "NavigationStore: node '" << nodeId << "' not found" << std::endl;
        return;
    }

    NavigationState next = state_;

    if (node->hasChildren()) {
        if (node == hierarchy_.root()) {
            next = rootState(state_);
        } else {
            next.currentRootNode = node;
            next.currentRootId = node->id;
            next.breadcrumbPath = hierarchy_.pathTo(node->id);
        }
    } else {
        ClusterNode* parent = node->parent;
        if (parent == nullptr || parent == hierarchy_.root()) {
            // Shown at the top level already
            next = rootState(state_);
        } else {
            next.currentRootNode = parent;
            next.currentRootId = parent->id;
            next.breadcrumbPath = hierarchy_.pathTo(parent->id);
        }
    }
    next.selectedNodeId = node->id;

    if (next.syncModeEnabled && node->isL0()) {
        next.expandedL0NodeIds.insert(node->id);
    }

    commit(std::move(next));
}

void NavigationStore::toggleSyncMode() {
    setSyncMode(!state_.syncModeEnabled);
}

void NavigationStore::setSyncMode(bool enabled) {
    NavigationState next = state_;
    next.syncModeEnabled = enabled;
    commit(std::move(next));
}

// ============================================================================
// Summary
// ============================================================================

std::string NavigationStore::getContextSummary() const {
    std::ostringstream out;

    const ClusterNode* root = state_.currentRootNode;
    if (root && !hierarchy_.isSyntheticRoot(root)) {
        out << "Currently viewing: " << root->name << " (" << levelName(root->level) << ")";
        if (root->weight > 0) {
            out << "\nTrace count: " << root->weight;
        }
    } else {
        out << "Currently viewing: Root level";
    }

    if (!state_.breadcrumbPath.empty()) {
        out << "\nNavigation path: ";
        for (size_t i = 0; i < state_.breadcrumbPath.size(); ++i) {
            if (i > 0) {
                out << " > ";
            }
            out << state_.breadcrumbPath[i]->name;
        }
    }

    if (state_.selectedNodeId) {
        out << "\nSelected node: " << *state_.selectedNodeId;
    }

    if (!state_.expandedL0NodeIds.empty()) {
        out << "\nExpanded clusters: " << state_.expandedL0NodeIds.size();
    }

    return out.str();
}

} // namespace clustermap
