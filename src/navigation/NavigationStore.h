#pragma once

#include "core/ClusterNode.h"
#include "core/Hierarchy.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace clustermap {

struct NavigationState {
    std::optional<std::string> selectedNodeId;

    // View root shown by the map. Hierarchy root (possibly synthetic) in the
    // Root state, null only before a hierarchy is installed.
    std::string currentRootId;
    ClusterNode* currentRootNode = nullptr;

    // Ancestor chain from just below the hierarchy root down to currentRoot
    std::vector<ClusterNode*> breadcrumbPath;

    // L0 clusters opened in the outline
    std::set<std::string> expandedL0NodeIds;

    bool syncModeEnabled = false;

    // Milliseconds on the monotonic clock
    int64_t lastUpdated = 0;

    bool isRoot() const { return breadcrumbPath.empty(); }

    // Equality ignores lastUpdated
    bool sameAs(const NavigationState& o) const;
};

// ============================================================================
// NavigationStore - shared map/outline navigation state with subscriptions
// ============================================================================
//
// The only place navigation state is written. Views dispatch actions and
// observe changes through subscribe(); listeners run synchronously after
// each change, never for an action that left the state as it was.

class NavigationStore {
public:
    using Listener = std::function<void(const NavigationState&)>;
    using ListenerId = int;

    explicit NavigationStore(const Hierarchy& hierarchy);

    NavigationStore(const NavigationStore&) = delete;
    NavigationStore& operator=(const NavigationStore&) = delete;

    const NavigationState& state() const { return state_; }
    const Hierarchy& hierarchy() const { return hierarchy_; }

    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

    // --- Low-level actions ---

    void selectNode(const std::optional<std::string>& nodeId);
    void navigateToRoot(ClusterNode* rootNode, std::vector<ClusterNode*> breadcrumbPath);
    void toggleL0Expansion(const std::string& nodeId);

    // Root view, nothing selected or expanded. Sync mode is kept.
    void reset();

    // --- Navigation ---

    // Drill into a node with children and select it. Leaves are ignored.
    void selectAndDrill(ClusterNode* node);

    // Truncate the breadcrumb after index and show that entry. -1 returns
    // to the Root state and clears the selection.
    void navigateBreadcrumb(int index);

    // One breadcrumb level up
    void navigateUp();

    // Mirror a selection from the other view. Nodes with children are
    // drilled into; leaves are selected and their parent is shown.
    // Unknown ids are logged and ignored.
    void navigateToNodeById(const std::string& nodeId);

    void toggleSyncMode();
    void setSyncMode(bool enabled);

    // Multi-line description of the current view
    std::string getContextSummary() const;

private:
    void commit(NavigationState next);
    NavigationState rootState(const NavigationState& from) const;

    const Hierarchy& hierarchy_;
    NavigationState state_;

    std::map<ListenerId, Listener> listeners_;
    ListenerId nextListenerId_ = 1;
};

} // namespace clustermap
