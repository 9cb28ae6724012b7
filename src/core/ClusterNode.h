#pragma once

#include "Types.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace clustermap {

// ============================================================================
// ClusterNode - one cluster in the L2 > L1 > L0 hierarchy
// ============================================================================

class ClusterNode {
public:
    std::string id;
    std::string name;
    ClusterLevel level = ClusterLevel::L0;

    // Trace count. Zero or absent packs as 1.
    int64_t weight = 0;
    bool hasWeight = false;

    // Numeric ids from the upstream pipeline, -1 when unknown
    int l2ClusterId = -1;
    int l1ClusterId = -1;
    int l0ClusterId = -1;

    // Tree structure
    ClusterNode* parent = nullptr;
    std::vector<std::unique_ptr<ClusterNode>> children;

    // --- Inline helpers ---

    bool hasChildren() const { return !children.empty(); }
    bool isLeaf() const { return children.empty(); }
    bool isL0() const { return level == ClusterLevel::L0; }
    bool isSyntheticRoot() const { return id == SYNTHETIC_ROOT_ID; }

    size_t childCount() const { return children.size(); }

    // Packing value of this node alone
    int64_t packWeight() const { return weight > 0 ? weight : 1; }

    // --- Methods implemented in .cpp ---

    // Add a child node; sets child's parent pointer. Returns raw pointer.
    ClusterNode* addChild(std::unique_ptr<ClusterNode> child);

    // Number of edges up to the tree root
    int depth() const;

    // Sum of the weights of all leaves below this node (own weight for leaves)
    int64_t leafWeightSum() const;
};

} // namespace clustermap
