#include "data/TopicCache.h"

#include <exception>
#include <iostream>

namespace clustermap {

TopicCache::TopicCache(TopicSource* source)
    : source_(source),
      completions_(std::make_shared<CompletionQueue>()) {}

bool TopicCache::request(const ClusterNode& node) {
    if (!node.isL0()) {
        return false;
    }
    if (entries_.count(node.id) != 0 || inFlight_.count(node.id) != 0) {
        return false;
    }

    TopicQuery query = TopicQuery::fromNode(node);
    entries_[node.id] = TopicCacheEntry{};
    queries_[node.id] = query;
    issue(query);
    return true;
}

bool TopicCache::retry(const std::string& nodeId) {
    auto it = entries_.find(nodeId);
    if (it == entries_.end() || it->second.status != TopicStatus::Error) {
        return false;
    }
    if (inFlight_.count(nodeId) != 0) {
        return false;
    }

    it->second = TopicCacheEntry{};
    issue(queries_[nodeId]);
    return true;
}

void TopicCache::issue(const TopicQuery& query) {
    inFlight_.insert(query.nodeId);

    std::shared_ptr<CompletionQueue> queue = completions_;
    uint64_t generation = generation_;
    std::string nodeId = query.nodeId;

    auto deliver = [queue, generation, nodeId](TopicResult result) {
        std::lock_guard<std::mutex> lock(queue->mutex);
        queue->items.push_back(Completion{generation, nodeId, std::move(result)});
    };

    if (!source_) {
        deliver(TopicResult::failure("No topic source configured"));
        return;
    }

    try {
        source_->fetchTopics(query, deliver);
    } catch (const std::exception& e) {
        std::cerr << "TopicCache: fetch for '" << nodeId << "' failed to start: "
                  << e.what() << std::endl;
        deliver(TopicResult::failure(e.what()));
    }
}

size_t TopicCache::pump() {
    std::vector<Completion> ready;
    {
        std::lock_guard<std::mutex> lock(completions_->mutex);
        ready.swap(completions_->items);
    }

    size_t applied = 0;
    for (Completion& c : ready) {
        if (c.generation != generation_) {
            continue;  // Issued before clear()
        }

        TopicCacheEntry& entry = entries_[c.nodeId];
        if (c.result.ok) {
            entry.status = TopicStatus::Ready;
            entry.topics = std::move(c.result.topics);
            entry.error.clear();
        } else {
            entry.status = TopicStatus::Error;
            entry.topics.clear();
            entry.error = c.result.error.empty() ? "Failed to load topics" : c.result.error;
            std::cerr << "TopicCache: '" << c.nodeId << "': " << entry.error << std::endl;
        }
        inFlight_.erase(c.nodeId);
        ++applied;
    }

    if (applied > 0 && changeCb_) {
        changeCb_();
    }
    return applied;
}

void TopicCache::clear() {
    ++generation_;
    entries_.clear();
    queries_.clear();
    inFlight_.clear();
}

const TopicCacheEntry* TopicCache::entry(const std::string& nodeId) const {
    auto it = entries_.find(nodeId);
    return it == entries_.end() ? nullptr : &it->second;
}

} // namespace clustermap
