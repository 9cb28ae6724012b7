#include "data/HierarchyLoader.h"
#include "core/Errors.h"
#include "core/PlatformUtils.h"

#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <regex>
#include <sstream>

namespace clustermap {

using nlohmann::json;

namespace {

// Non-negative integer field; accepts integral floats ("3.0") as written by
// some exporters. Absent or null gives nullopt.
std::optional<int64_t> readCount(const json& obj, const char* key, const std::string& context) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        throw HierarchyError(context + ": '" + key + "' is not a number");
    }
    double value = it->get<double>();
    if (value < 0.0 || std::floor(value) != value) {
        throw HierarchyError(context + ": '" + key + "' must be a non-negative integer");
    }
    return static_cast<int64_t>(value);
}

// Numeric cluster id, -1 when absent
int readClusterId(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return -1;
    }
    return static_cast<int>(it->get<double>());
}

std::string readRequiredString(const json& obj, const char* key, const std::string& context) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw HierarchyError(context + ": missing '" + key + "'");
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<int64_t>());
    }
    throw HierarchyError(context + ": '" + key + "' is not a string");
}

ClusterLevel parseLevel(const std::string& text, const std::string& context) {
    if (text == "l2") return ClusterLevel::L2;
    if (text == "l1") return ClusterLevel::L1;
    if (text == "l0") return ClusterLevel::L0;
    throw HierarchyError(context + ": invalid level '" + text + "'");
}

// Flat vectors carry "metadata"; nested nodes do not
bool looksLikeClusterVectors(const json& arr) {
    return arr.is_array() && !arr.empty() && arr.front().is_object() &&
           arr.front().contains("metadata");
}

std::optional<int> matchId(const std::string& id, const std::regex& pattern) {
    std::smatch m;
    if (std::regex_search(id, m, pattern)) {
        std::optional<int> value = PlatformUtils::parseId(m[1].str());
        if (!value) {
            throw HierarchyError("Cluster ID out of range in vector id '" + id + "'");
        }
        return value;
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Entry points
// ============================================================================

std::vector<std::unique_ptr<ClusterNode>> HierarchyLoader::loadFile(const std::string& path,
                                                                    LoadProgressCallback progressCb) {
    progressCb_ = std::move(progressCb);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw HierarchyError("Cannot open hierarchy file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto roots = parse(buffer.str());

    std::cout << "HierarchyLoader: Loaded " << nodesLoaded_ << " clusters from " << path << std::endl;
    return roots;
}

std::vector<std::unique_ptr<ClusterNode>> HierarchyLoader::parse(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw HierarchyError(std::string("Malformed hierarchy JSON: ") + e.what());
    }
    return fromJson(doc);
}

std::vector<std::unique_ptr<ClusterNode>> HierarchyLoader::fromJson(const json& doc) {
    nodesLoaded_ = 0;

    const json* list = &doc;
    if (doc.is_object()) {
        auto success = doc.find("success");
        if (success != doc.end() && success->is_boolean() && !success->get<bool>()) {
            std::string message = "Hierarchy source reported failure";
            auto error = doc.find("error");
            if (error != doc.end() && error->is_string()) {
                message += ": " + error->get<std::string>();
            }
            throw HierarchyError(message);
        }

        auto clusters = doc.find("clusters");
        if (clusters != doc.end()) {
            if (!clusters->is_array()) {
                throw HierarchyError("'clusters' is not an array");
            }
            list = &*clusters;
        } else if (doc.contains("id")) {
            // A single nested node
            std::vector<std::unique_ptr<ClusterNode>> roots;
            roots.push_back(parseNode(doc, 0));
            return roots;
        } else {
            throw HierarchyError("Invalid response format: expected a 'clusters' array");
        }
    }

    if (!list->is_array()) {
        throw HierarchyError("Hierarchy document must be an array or an object");
    }

    if (looksLikeClusterVectors(*list)) {
        return buildFromClusterVectors(*list);
    }

    std::vector<std::unique_ptr<ClusterNode>> roots;
    roots.reserve(list->size());
    for (const auto& item : *list) {
        roots.push_back(parseNode(item, 0));
    }
    return roots;
}

void HierarchyLoader::reportProgress() {
    ++nodesLoaded_;
    if (cancelRequested.load()) {
        throw HierarchyError("Load cancelled");
    }
    if (progressCb_ && nodesLoaded_ % 256 == 0) {
        progressCb_(nodesLoaded_);
    }
}

// ============================================================================
// Nested format
// ============================================================================

std::unique_ptr<ClusterNode> HierarchyLoader::parseNode(const json& j, int depth) {
    if (depth > MAX_HIERARCHY_DEPTH) {
        throw HierarchyError("Hierarchy deeper than " + std::to_string(MAX_HIERARCHY_DEPTH) +
                             " levels");
    }
    if (!j.is_object()) {
        throw HierarchyError("Cluster node at depth " + std::to_string(depth) +
                             " is not an object");
    }

    auto node = std::make_unique<ClusterNode>();
    node->id = readRequiredString(j, "id", "Cluster node");
    const std::string context = "Cluster '" + node->id + "'";
    node->name = readRequiredString(j, "name", context);

    if (j.contains("level")) {
        node->level = parseLevel(readRequiredString(j, "level", context), context);
    } else if (j.contains("type")) {
        node->level = parseLevel(readRequiredString(j, "type", context), context);
    } else {
        throw HierarchyError(context + ": missing 'level'");
    }

    std::optional<int64_t> weight = readCount(j, "weight", context);
    if (!weight) {
        weight = readCount(j, "trace_count", context);
    }
    if (weight) {
        node->weight = *weight;
        node->hasWeight = true;
    }

    node->l2ClusterId = readClusterId(j, "l2_cluster_id");
    node->l1ClusterId = readClusterId(j, "l1_cluster_id");
    node->l0ClusterId = readClusterId(j, "l0_cluster_id");

    reportProgress();

    auto children = j.find("children");
    if (children != j.end() && !children->is_null()) {
        if (!children->is_array()) {
            throw HierarchyError(context + ": 'children' is not an array");
        }
        for (const auto& child : *children) {
            node->addChild(parseNode(child, depth + 1));
        }
    }
    return node;
}

// ============================================================================
// Flat cluster vectors
// ============================================================================

std::vector<std::unique_ptr<ClusterNode>> HierarchyLoader::buildFromClusterVectors(const json& vectors) {
    static const std::regex l2Pattern(R"((?:l2[_-]?cluster[_-]?|l2[_-])(\d+))", std::regex::icase);
    static const std::regex l1Pattern(R"((?:l1[_-]?cluster[_-]?|l1[_-])(\d+))", std::regex::icase);
    static const std::regex numericPattern(R"(^\d+$)");
    static const std::regex trailingNumber(R"((\d+)$)");

    struct Vector {
        std::string id;
        std::string type;
        std::string name;
        std::optional<int64_t> traceCount;
        std::optional<int> l1ClusterId;
        std::optional<int> l2ClusterId;
    };

    std::vector<Vector> l2s, l1s, l0s;
    for (const auto& item : vectors) {
        if (!item.is_object()) {
            throw HierarchyError("Cluster vector is not an object");
        }
        Vector v;
        v.id = readRequiredString(item, "id", "Cluster vector");
        const std::string context = "Cluster vector '" + v.id + "'";
        auto meta = item.find("metadata");
        if (meta == item.end() || !meta->is_object()) {
            throw HierarchyError(context + ": missing 'metadata'");
        }
        v.type = readRequiredString(*meta, "type", context);
        v.name = readRequiredString(*meta, "name", context);
        v.traceCount = readCount(*meta, "trace_count", context);
        int l1 = readClusterId(*meta, "L1_cluster_id");
        int l2 = readClusterId(*meta, "L2_cluster_id");
        if (l1 >= 0) v.l1ClusterId = l1;
        if (l2 >= 0) v.l2ClusterId = l2;

        if (v.type == "l2_cluster") {
            l2s.push_back(std::move(v));
        } else if (v.type == "l1_cluster") {
            l1s.push_back(std::move(v));
        } else if (v.type == "l0_cluster") {
            l0s.push_back(std::move(v));
        }
        // Other record types (topics, traces) share the index; skip them
    }

    std::vector<std::unique_ptr<ClusterNode>> roots;

    for (const Vector& l2 : l2s) {
        std::optional<int> l2ClusterId = l2.l2ClusterId;
        if (!l2ClusterId) {
            l2ClusterId = matchId(l2.id, l2Pattern);
        }
        if (!l2ClusterId) {
            throw HierarchyError("Could not extract L2 cluster ID from vector " + l2.id);
        }

        auto l2Node = std::make_unique<ClusterNode>();
        l2Node->id = "l2-" + std::to_string(*l2ClusterId);
        l2Node->name = l2.name;
        l2Node->level = ClusterLevel::L2;
        l2Node->l2ClusterId = *l2ClusterId;
        reportProgress();

        int64_t l2ChildSum = 0;
        int l1Index = 0;
        for (const Vector& l1 : l1s) {
            if (l1.l2ClusterId != l2ClusterId) {
                continue;
            }
            int l1ClusterId = l1Index;
            if (l1.l1ClusterId) {
                l1ClusterId = *l1.l1ClusterId;
            } else if (auto parsed = matchId(l1.id, l1Pattern)) {
                l1ClusterId = *parsed;
            }
            ++l1Index;

            auto l1Node = std::make_unique<ClusterNode>();
            l1Node->id = "l1-" + std::to_string(*l2ClusterId) + "-" + std::to_string(l1ClusterId);
            l1Node->name = l1.name;
            l1Node->level = ClusterLevel::L1;
            l1Node->l1ClusterId = l1ClusterId;
            l1Node->l2ClusterId = *l2ClusterId;
            reportProgress();

            int64_t l1ChildSum = 0;
            int l0Index = 0;
            for (const Vector& l0 : l0s) {
                if (l0.l2ClusterId != l2ClusterId || l0.l1ClusterId != l1ClusterId) {
                    continue;
                }

                auto l0Node = std::make_unique<ClusterNode>();
                const bool keepId = std::regex_match(l0.id, numericPattern) ||
                                    l0.id.rfind("l0_", 0) == 0 ||
                                    l0.id.rfind("l0-", 0) == 0;
                l0Node->id = keepId ? l0.id
                                    : "l0-" + std::to_string(*l2ClusterId) + "-" +
                                          std::to_string(l1ClusterId) + "-" +
                                          std::to_string(l0Index);
                l0Node->name = l0.name;
                l0Node->level = ClusterLevel::L0;
                l0Node->l2ClusterId = *l2ClusterId;
                l0Node->l1ClusterId = l1ClusterId;
                // Oversized trailing digits are not a cluster index
                std::smatch digits;
                if (std::regex_search(l0.id, digits, trailingNumber)) {
                    l0Node->l0ClusterId = PlatformUtils::parseId(digits[1].str()).value_or(-1);
                }
                if (l0.traceCount) {
                    l0Node->weight = *l0.traceCount;
                    l0Node->hasWeight = true;
                    l1ChildSum += *l0.traceCount;
                }
                reportProgress();

                l1Node->addChild(std::move(l0Node));
                ++l0Index;
            }

            l1Node->weight = l1.traceCount ? *l1.traceCount : l1ChildSum;
            l1Node->hasWeight = true;
            l2ChildSum += l1Node->weight;

            l2Node->addChild(std::move(l1Node));
        }

        l2Node->weight = l2.traceCount ? *l2.traceCount : l2ChildSum;
        l2Node->hasWeight = true;

        roots.push_back(std::move(l2Node));
    }

    return roots;
}

} // namespace clustermap
