#pragma once

#include "core/ClusterNode.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace clustermap {

// Callback invoked as nodes are materialized.
using LoadProgressCallback = std::function<void(int nodesLoaded)>;

// ============================================================================
// HierarchyLoader - builds the cluster tree from hierarchy JSON
// ============================================================================
//
// Accepted documents:
//   [ {id, name, level|type, weight|trace_count, children}, ... ]
//   {"success": true, "clusters": [ ...nested nodes... ]}
//   {"clusters": [ {id, metadata: {type: "l2_cluster", ...}}, ... ]}   (flat vectors)
//
// All failures are reported by throwing HierarchyError.

class HierarchyLoader {
public:
    // Read and parse a file.
    std::vector<std::unique_ptr<ClusterNode>> loadFile(const std::string& path,
                                                       LoadProgressCallback progressCb = nullptr);

    // Parse a JSON document held in memory.
    std::vector<std::unique_ptr<ClusterNode>> parse(const std::string& text);

    std::vector<std::unique_ptr<ClusterNode>> fromJson(const nlohmann::json& doc);

    // Assemble L2 > L1 > L0 from flat cluster vectors.
    std::vector<std::unique_ptr<ClusterNode>> buildFromClusterVectors(const nlohmann::json& vectors);

    // Set to true from another thread to abandon a running load
    std::atomic<bool> cancelRequested{false};

private:
    std::unique_ptr<ClusterNode> parseNode(const nlohmann::json& j, int depth);
    void reportProgress();

    LoadProgressCallback progressCb_;
    int nodesLoaded_ = 0;
};

} // namespace clustermap
