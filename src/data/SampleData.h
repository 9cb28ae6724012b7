#pragma once

#include "core/ClusterNode.h"
#include "data/TopicSource.h"

#include <memory>
#include <vector>

namespace clustermap {

// Built-in demo hierarchy: three categories with two levels beneath each.
// Used when no hierarchy file is configured.
std::vector<std::unique_ptr<ClusterNode>> buildSampleHierarchy();

// ============================================================================
// SampleTopicSource - canned topics for the demo hierarchy
// ============================================================================
//
// Answers synchronously. Output depends only on the query.

class SampleTopicSource : public TopicSource {
public:
    void fetchTopics(const TopicQuery& query, TopicCallback callback) override;

    static std::vector<Topic> sampleTopics(const TopicQuery& query);
};

} // namespace clustermap
