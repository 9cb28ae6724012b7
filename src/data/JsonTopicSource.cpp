#include "data/JsonTopicSource.h"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace clustermap {

JsonTopicSource::JsonTopicSource(std::string path)
    : path_(std::move(path)) {
    worker_ = std::thread(&JsonTopicSource::workerLoop, this);
}

JsonTopicSource::~JsonTopicSource() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void JsonTopicSource::fetchTopics(const TopicQuery& query, TopicCallback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(Job{query, std::move(callback)});
    }
    cv_.notify_one();
}

void JsonTopicSource::workerLoop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !jobs_.empty(); });
            if (stop_) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        TopicResult result;
        try {
            result = serve(job.query);
        } catch (const std::exception& e) {
            result = TopicResult::failure(e.what());
        }

        if (job.callback) {
            job.callback(std::move(result));
        }
    }
}

TopicResult JsonTopicSource::serve(const TopicQuery& query) {
    if (!loaded_) {
        std::ifstream file(path_);
        if (!file.is_open()) {
            return TopicResult::failure("Cannot open topics file: " + path_);
        }
        try {
            doc_ = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            return TopicResult::failure("Malformed topics file " + path_ + ": " + e.what());
        }
        if (!doc_.is_object()) {
            return TopicResult::failure("Topics file " + path_ + " is not a JSON object");
        }
        loaded_ = true;
        std::cout << "JsonTopicSource: Loaded " << doc_.size() << " clusters from "
                  << path_ << std::endl;
    }
    return TopicResult::success(topicsFor(doc_, query.nodeId));
}

std::vector<Topic> JsonTopicSource::topicsFor(const nlohmann::json& doc, const std::string& nodeId) {
    std::vector<Topic> records;
    auto it = doc.find(nodeId);
    if (it == doc.end()) {
        return records;
    }
    if (!it->is_array()) {
        throw std::runtime_error("Topics for '" + nodeId + "' are not an array");
    }

    for (const auto& item : *it) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
            throw std::runtime_error("Topic entry for '" + nodeId + "' has no string id");
        }
        Topic topic;
        topic.id = item["id"].get<std::string>();
        if (item.contains("text") && item["text"].is_string()) {
            topic.text = item["text"].get<std::string>();
        } else if (item.contains("description") && item["description"].is_string()) {
            topic.text = item["description"].get<std::string>();
        }
        if (item.contains("chunkIds") && item["chunkIds"].is_array()) {
            for (const auto& chunk : item["chunkIds"]) {
                if (chunk.is_string()) {
                    topic.chunkIds.push_back(chunk.get<std::string>());
                }
            }
        }
        records.push_back(std::move(topic));
    }
    return mergeTopicChunks(records);
}

} // namespace clustermap
