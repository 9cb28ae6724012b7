#include "ClusterNode.h"

namespace clustermap {

ClusterNode* ClusterNode::addChild(std::unique_ptr<ClusterNode> child) {
    child->parent = this;
    ClusterNode* raw = child.get();
    children.push_back(std::move(child));
    return raw;
}

int ClusterNode::depth() const {
    int d = 0;
    for (const ClusterNode* cur = parent; cur != nullptr; cur = cur->parent) {
        ++d;
    }
    return d;
}

int64_t ClusterNode::leafWeightSum() const {
    if (children.empty()) {
        return weight;
    }
    int64_t sum = 0;
    for (const auto& child : children) {
        sum += child->leafWeightSum();
    }
    return sum;
}

} // namespace clustermap
