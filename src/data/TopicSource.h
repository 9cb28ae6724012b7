#pragma once

#include "core/ClusterNode.h"

#include <functional>
#include <string>
#include <vector>

namespace clustermap {

// Summary of one trace attached to an L0 cluster
struct Topic {
    std::string id;
    std::string text;
    std::vector<std::string> chunkIds;
};

// Identity of the L0 cluster whose topics are wanted
struct TopicQuery {
    std::string nodeId;
    std::string nodeName;
    int l2ClusterId = -1;
    int l1ClusterId = -1;
    int l0ClusterId = -1;

    // Cluster ids from the node's fields, or parsed from generated
    // "l0-{l2}-{l1}-{index}" and numeric ids when the fields are unset
    static TopicQuery fromNode(const ClusterNode& node);
};

struct TopicResult {
    bool ok = false;
    std::vector<Topic> topics;
    std::string error;

    static TopicResult success(std::vector<Topic> topics);
    static TopicResult failure(std::string message);
};

// May be invoked on any thread
using TopicCallback = std::function<void(TopicResult)>;

// ============================================================================
// TopicSource - asynchronous topic provider
// ============================================================================

class TopicSource {
public:
    virtual ~TopicSource() = default;

    // Start a fetch. The callback fires exactly once. Fetches are
    // idempotent, so a failed one may simply be issued again.
    virtual void fetchTopics(const TopicQuery& query, TopicCallback callback) = 0;
};

// Merge chunked records ("topic_109_0", "topic_109_1", ...) into one topic
// per base id, joining texts in chunk order. Others pass through.
std::vector<Topic> mergeTopicChunks(const std::vector<Topic>& records);

} // namespace clustermap
