#include "Hierarchy.h"
#include "Errors.h"

#include <iostream>

namespace clustermap {

void Hierarchy::setTopLevel(std::vector<std::unique_ptr<ClusterNode>> nodes) {
    clear();

    if (nodes.size() == 1) {
        root_ = std::move(nodes.front());
        root_->parent = nullptr;
    } else {
        // Several (or no) top-level clusters: wrap them for layout.
        root_ = std::make_unique<ClusterNode>();
        root_->id = SYNTHETIC_ROOT_ID;
        root_->name = "Root";
        root_->level = ClusterLevel::L2;
        for (auto& node : nodes) {
            root_->addChild(std::move(node));
        }
    }

    buildNodeTable();
}

void Hierarchy::clear() {
    root_.reset();
    nodeTable_.clear();
}

std::vector<ClusterNode*> Hierarchy::topLevel() const {
    std::vector<ClusterNode*> result;
    if (!root_) {
        return result;
    }
    if (root_->isSyntheticRoot()) {
        for (auto& child : root_->children) {
            result.push_back(child.get());
        }
    } else {
        result.push_back(root_.get());
    }
    return result;
}

bool Hierarchy::isSyntheticRoot(const ClusterNode* node) const {
    return node != nullptr && node == root_.get() && node->isSyntheticRoot();
}

ClusterNode* Hierarchy::findById(const std::string& id) const {
    auto it = nodeTable_.find(id);
    if (it != nodeTable_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<ClusterNode*> Hierarchy::pathTo(const std::string& id) const {
    std::vector<ClusterNode*> path;
    ClusterNode* node = findById(id);
    if (!node) {
        return path;
    }

    // Walk up to (but not including) the root, then reverse.
    for (ClusterNode* cur = node; cur != nullptr && cur != root_.get(); cur = cur->parent) {
        path.push_back(cur);
    }
    std::vector<ClusterNode*> ordered(path.rbegin(), path.rend());
    return ordered;
}

int Hierarchy::depthOf(const std::string& id) const {
    ClusterNode* node = findById(id);
    if (!node) {
        return -1;
    }
    return node->depth();
}

ClusterNode* Hierarchy::findL2Ancestor(const std::string& id) const {
    for (ClusterNode* cur = findById(id); cur != nullptr; cur = cur->parent) {
        if (cur->level == ClusterLevel::L2 && cur->id.rfind("l2-", 0) == 0) {
            return cur;
        }
    }
    return nullptr;
}

void Hierarchy::buildNodeTable() {
    nodeTable_.clear();
    if (!root_) {
        return;
    }

    struct Populator {
        std::unordered_map<std::string, ClusterNode*>& table;

        void visit(ClusterNode* node, int depth) {
            if (depth > MAX_HIERARCHY_DEPTH) {
                throw HierarchyError("Hierarchy deeper than " +
                                     std::to_string(MAX_HIERARCHY_DEPTH) + " levels");
            }
            auto inserted = table.emplace(node->id, node);
            if (!inserted.second) {
                std::cerr << "Hierarchy: duplicate node id '" << node->id
                          << "', keeping the first occurrence" << std::endl;
            }
            for (auto& child : node->children) {
                visit(child.get(), depth + 1);
            }
        }
    };

    Populator pop{nodeTable_};
    pop.visit(root_.get(), 0);
}

} // namespace clustermap
