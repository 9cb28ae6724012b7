#include "data/TopicSource.h"
#include "core/PlatformUtils.h"

#include <map>
#include <optional>
#include <regex>

namespace clustermap {

TopicQuery TopicQuery::fromNode(const ClusterNode& node) {
    TopicQuery q;
    q.nodeId = node.id;
    q.nodeName = node.name;
    q.l2ClusterId = node.l2ClusterId;
    q.l1ClusterId = node.l1ClusterId;
    q.l0ClusterId = node.l0ClusterId;

    static const std::regex generatedId(R"(^l0-(\d+)-(\d+)-(\d+)$)");
    static const std::regex numericId(R"(^\d+$)");
    static const std::regex trailingNumber(R"((\d+)$)");

    std::smatch m;
    if (std::regex_match(node.id, m, generatedId)) {
        if (q.l2ClusterId < 0) q.l2ClusterId = PlatformUtils::parseId(m[1].str()).value_or(-1);
        if (q.l1ClusterId < 0) q.l1ClusterId = PlatformUtils::parseId(m[2].str()).value_or(-1);
    } else if (q.l0ClusterId < 0 && std::regex_match(node.id, numericId)) {
        q.l0ClusterId = PlatformUtils::parseId(node.id).value_or(-1);
    } else if (q.l0ClusterId < 0 && std::regex_search(node.id, m, trailingNumber)) {
        // "l0_cluster_12", "l0-12"; too large to be a cluster index stays -1
        q.l0ClusterId = PlatformUtils::parseId(m[1].str()).value_or(-1);
    }

    // Fall back to the ancestors' numeric ids
    for (const ClusterNode* p = node.parent; p != nullptr; p = p->parent) {
        if (q.l1ClusterId < 0 && p->level == ClusterLevel::L1) {
            q.l1ClusterId = p->l1ClusterId;
        }
        if (q.l2ClusterId < 0 && p->level == ClusterLevel::L2) {
            q.l2ClusterId = p->l2ClusterId;
        }
    }
    return q;
}

TopicResult TopicResult::success(std::vector<Topic> topics) {
    TopicResult r;
    r.ok = true;
    r.topics = std::move(topics);
    return r;
}

TopicResult TopicResult::failure(std::string message) {
    TopicResult r;
    r.ok = false;
    r.error = std::move(message);
    return r;
}

std::vector<Topic> mergeTopicChunks(const std::vector<Topic>& records) {
    static const std::regex chunkId(R"(^(topic_\d+)_(\d+)$)");

    struct Group {
        std::map<int, const Topic*> chunks;
    };

    std::vector<Topic> result;
    std::map<std::string, Group> groups;
    std::vector<std::pair<size_t, std::string>> order;  // result slot -> group

    for (const Topic& rec : records) {
        std::smatch m;
        std::optional<int> chunk;
        if (std::regex_match(rec.id, m, chunkId)) {
            chunk = PlatformUtils::parseId(m[2].str());
        }
        if (!chunk) {
            result.push_back(rec);
            continue;
        }
        std::string base = m[1].str();
        auto it = groups.find(base);
        if (it == groups.end()) {
            it = groups.emplace(base, Group{}).first;
            order.emplace_back(result.size(), base);
            result.push_back(Topic{base, "", {}});
        }
        it->second.chunks[*chunk] = &rec;
    }

    for (const auto& slot : order) {
        Topic& merged = result[slot.first];
        for (const auto& chunk : groups[slot.second].chunks) {
            const Topic* rec = chunk.second;
            merged.chunkIds.push_back(rec->id);
            if (!rec->text.empty()) {
                if (!merged.text.empty()) {
                    merged.text += " ";
                }
                merged.text += rec->text;
            }
        }
    }
    return result;
}

} // namespace clustermap
