#pragma once

#include "core/ClusterNode.h"
#include "data/TopicSource.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace clustermap {

enum class TopicStatus {
    Loading,
    Ready,
    Error
};

struct TopicCacheEntry {
    TopicStatus status = TopicStatus::Loading;
    std::vector<Topic> topics;
    std::string error;
};

// ============================================================================
// TopicCache - per-L0 topic lists, at most one fetch in flight per id
// ============================================================================
//
// Fetch completions may arrive on any thread. They are queued and applied
// by pump(), which the main loop calls once per frame; entries are only
// ever touched on the main thread.

class TopicCache {
public:
    explicit TopicCache(TopicSource* source = nullptr);

    TopicCache(const TopicCache&) = delete;
    TopicCache& operator=(const TopicCache&) = delete;

    // The source must outlive the fetches issued through it
    void setSource(TopicSource* source) { source_ = source; }

    // Start a fetch for an L0 node that has no entry yet. Returns true if a
    // fetch was issued.
    bool request(const ClusterNode& node);

    // Re-issue a failed fetch. Returns true if a fetch was issued.
    bool retry(const std::string& nodeId);

    // Apply queued completions. Returns the number applied.
    size_t pump();

    // Drop every entry; completions of earlier fetches are discarded
    void clear();

    const TopicCacheEntry* entry(const std::string& nodeId) const;
    bool contains(const std::string& nodeId) const { return entries_.count(nodeId) != 0; }
    size_t size() const { return entries_.size(); }
    size_t inFlightCount() const { return inFlight_.size(); }

    // Called from pump() after entries changed
    void setChangeListener(std::function<void()> cb) { changeCb_ = std::move(cb); }

private:
    struct Completion {
        uint64_t generation;
        std::string nodeId;
        TopicResult result;
    };

    // Shared with the callbacks so late completions never touch a dead cache
    struct CompletionQueue {
        std::mutex mutex;
        std::vector<Completion> items;
    };

    void issue(const TopicQuery& query);

    TopicSource* source_ = nullptr;
    std::shared_ptr<CompletionQueue> completions_;
    uint64_t generation_ = 0;

    std::map<std::string, TopicCacheEntry> entries_;
    std::map<std::string, TopicQuery> queries_;
    std::set<std::string> inFlight_;

    std::function<void()> changeCb_;
};

} // namespace clustermap
