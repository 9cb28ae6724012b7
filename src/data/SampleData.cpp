#include "data/SampleData.h"
#include "core/PlatformUtils.h"

#include <string>

namespace clustermap {

namespace {

struct SampleL0 {
    const char* name;
    int64_t traces;
};

struct SampleL1 {
    const char* name;
    int64_t traces;
    std::vector<SampleL0> leaves;
};

struct SampleL2 {
    const char* name;
    int64_t traces;
    std::vector<SampleL1> groups;
};

const std::vector<SampleL2>& sampleTable() {
    static const std::vector<SampleL2> table = {
        {"Software Development Tutorials", 45, {
            {"Full-Stack Web Development", 22, {
                {"React & Frontend", 8},
                {"Node.js & Backend", 7},
                {"Database Design", 7}}},
            {"Mobile Development", 15, {
                {"Android Development", 8},
                {"Flutter & Cross-Platform", 7}}},
            {"API Integration", 8, {
                {"REST APIs", 4},
                {"Authentication", 4}}}}},
        {"Data Science & Analytics", 30, {
            {"Machine Learning", 18, {
                {"Deep Learning", 9},
                {"Classical ML", 9}}},
            {"Data Processing", 12, {
                {"ETL Pipelines", 6},
                {"Data Visualization", 6}}}}},
        {"DevOps & Infrastructure", 25, {
            {"Containerization", 15, {
                {"Docker", 8},
                {"Kubernetes", 7}}},
            {"CI/CD", 10, {
                {"GitHub Actions", 5},
                {"Deployment Strategies", 5}}}}},
    };
    return table;
}

std::unique_ptr<ClusterNode> makeNode(std::string id, const char* name, ClusterLevel level,
                                      int64_t traces) {
    auto node = std::make_unique<ClusterNode>();
    node->id = std::move(id);
    node->name = name;
    node->level = level;
    node->weight = traces;
    node->hasWeight = true;
    return node;
}

} // namespace

std::vector<std::unique_ptr<ClusterNode>> buildSampleHierarchy() {
    std::vector<std::unique_ptr<ClusterNode>> roots;

    int l2Index = 0;
    for (const SampleL2& l2 : sampleTable()) {
        ++l2Index;
        std::string l2Key = std::to_string(l2Index);
        auto l2Node = makeNode("l2-" + l2Key, l2.name, ClusterLevel::L2, l2.traces);
        l2Node->l2ClusterId = l2Index;

        int l1Index = 0;
        for (const SampleL1& l1 : l2.groups) {
            ++l1Index;
            std::string l1Key = l2Key + "-" + std::to_string(l1Index);
            auto l1Node = makeNode("l1-" + l1Key, l1.name, ClusterLevel::L1, l1.traces);
            l1Node->l2ClusterId = l2Index;
            l1Node->l1ClusterId = l1Index;

            int l0Index = 0;
            for (const SampleL0& l0 : l1.leaves) {
                ++l0Index;
                auto l0Node = makeNode("l0-" + l1Key + "-" + std::to_string(l0Index),
                                       l0.name, ClusterLevel::L0, l0.traces);
                l0Node->l2ClusterId = l2Index;
                l0Node->l1ClusterId = l1Index;
                l1Node->addChild(std::move(l0Node));
            }
            l2Node->addChild(std::move(l1Node));
        }
        roots.push_back(std::move(l2Node));
    }
    return roots;
}

// ============================================================================
// SampleTopicSource
// ============================================================================

std::vector<Topic> SampleTopicSource::sampleTopics(const TopicQuery& query) {
    static const char* const templates[] = {
        "User asked for a step-by-step introduction to %s.",
        "Conversation about debugging a failing setup involving %s.",
        "Request to compare tools and trade-offs in %s.",
        "Follow-up questions on best practices for %s in production.",
    };
    static const size_t numTemplates = sizeof(templates) / sizeof(templates[0]);

    uint32_t hash = PlatformUtils::fnv1a(query.nodeId);
    size_t count = 2 + hash % 3;
    std::string subject = query.nodeName.empty() ? query.nodeId : query.nodeName;

    std::vector<Topic> topics;
    for (size_t i = 0; i < count; ++i) {
        const std::string pattern = templates[(hash + i) % numTemplates];
        std::string text = pattern;
        size_t pos = text.find("%s");
        text.replace(pos, 2, subject);

        Topic topic;
        topic.id = "topic_" + std::to_string((hash % 900u) + 100u + i);
        topic.text = text;
        topic.chunkIds.push_back(topic.id + "_0");
        topics.push_back(std::move(topic));
    }
    return topics;
}

void SampleTopicSource::fetchTopics(const TopicQuery& query, TopicCallback callback) {
    if (callback) {
        callback(TopicResult::success(sampleTopics(query)));
    }
}

} // namespace clustermap
