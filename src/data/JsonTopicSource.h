#pragma once

#include "data/TopicSource.h"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace clustermap {

// ============================================================================
// JsonTopicSource - topics from a JSON file, served by a worker thread
// ============================================================================
//
// File layout:
//   { "<l0 node id>": [ {"id": "...", "text": "...", "chunkIds": [...]}, ... ] }
//
// "description" is accepted in place of "text". Chunked records are merged
// with mergeTopicChunks(). Ids missing from the file have no topics.

class JsonTopicSource : public TopicSource {
public:
    explicit JsonTopicSource(std::string path);
    ~JsonTopicSource() override;

    JsonTopicSource(const JsonTopicSource&) = delete;
    JsonTopicSource& operator=(const JsonTopicSource&) = delete;

    void fetchTopics(const TopicQuery& query, TopicCallback callback) override;

    const std::string& path() const { return path_; }

    // Topics for one id from an already parsed document. Throws
    // std::runtime_error on a malformed entry.
    static std::vector<Topic> topicsFor(const nlohmann::json& doc, const std::string& nodeId);

private:
    struct Job {
        TopicQuery query;
        TopicCallback callback;
    };

    void workerLoop();
    TopicResult serve(const TopicQuery& query);

    std::string path_;

    // Parsed lazily on the worker; a failed load is retried on the next job
    nlohmann::json doc_;
    bool loaded_ = false;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool stop_ = false;
    std::thread worker_;
};

} // namespace clustermap
