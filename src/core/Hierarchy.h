#pragma once

#include "ClusterNode.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace clustermap {

// ============================================================================
// Hierarchy - owns the cluster tree for a session, O(1) lookup by id
// ============================================================================

class Hierarchy {
public:
    Hierarchy() = default;
    Hierarchy(const Hierarchy&) = delete;
    Hierarchy& operator=(const Hierarchy&) = delete;

    // Install the top-level clusters. A single top-level node becomes the
    // root; several are wrapped in a synthetic root.
    void setTopLevel(std::vector<std::unique_ptr<ClusterNode>> nodes);

    // Drop the tree and the lookup table.
    void clear();

    bool empty() const { return !root_; }

    // Layout root (possibly synthetic). Null before setTopLevel.
    ClusterNode* root() const { return root_.get(); }

    // The visible top-level clusters (children of the synthetic root, or
    // the single root itself).
    std::vector<ClusterNode*> topLevel() const;

    bool isSyntheticRoot(const ClusterNode* node) const;

    ClusterNode* findById(const std::string& id) const;

    // Ancestor chain from just below the root down to the node, inclusive.
    // Empty for the root itself or an unknown id.
    std::vector<ClusterNode*> pathTo(const std::string& id) const;

    // Depth below the root; -1 for unknown ids.
    int depthOf(const std::string& id) const;

    // Nearest L2 ancestor (or the node itself) whose id starts with "l2-".
    ClusterNode* findL2Ancestor(const std::string& id) const;

    size_t nodeCount() const { return nodeTable_.size(); }

private:
    void buildNodeTable();

    std::unique_ptr<ClusterNode> root_;
    std::unordered_map<std::string, ClusterNode*> nodeTable_;
};

} // namespace clustermap
