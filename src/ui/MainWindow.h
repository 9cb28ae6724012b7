#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/ClusterNode.h"
#include "core/Hierarchy.h"

namespace clustermap {

class HierarchyLoader;
class MapViewController;
class NavigationStore;
class OutlineModel;
class TopicCache;
class TopicSource;

// ============================================================================
// MainWindow - owns the session (hierarchy, navigation, views) and the
// dockspace the panels live in
// ============================================================================

class MainWindow {
public:
    static MainWindow& instance();
    ~MainWindow();

    // Create the engine objects and queue the first load. An empty
    // hierarchyPath shows the built-in sample clusters.
    void init(const std::string& hierarchyPath, const std::string& topicsPath, bool syncMode);
    void shutdown();

    void draw();

    // Between-frame work: loader completion, topic completions
    void pump();

    // Load a hierarchy file on a background thread
    void requestLoad(const std::string& path);
    void cancelLoad();
    void loadSample();

    // Replace the topic source: empty path = sample topics
    void setTopicsPath(const std::string& path);

    bool isLoading() const { return loading_.load(); }
    // Loading or waiting on topic fetches; the main loop keeps polling
    bool isBusy() const;

    const std::string& hierarchyPath() const { return hierarchyPath_; }
    const std::string& topicsPath() const { return topicsPath_; }

    // Session objects; null before init()
    Hierarchy& hierarchy() { return hierarchy_; }
    NavigationStore* store() { return store_.get(); }
    MapViewController* mapController() { return mapController_.get(); }
    OutlineModel* outline() { return outline_.get(); }
    TopicCache* topicCache() { return topicCache_.get(); }

    bool syncModeEnabled() const;

private:
    MainWindow() = default;
    void setupDockspace();
    void drawProgressOverlay();
    void finishLoad();
    void installHierarchy(std::vector<std::unique_ptr<ClusterNode>> topLevel,
                          const std::string& sourceName);
    void joinLoadThread();

    // Runs on the background thread
    void loadThreadFunc(const std::string& path);

    bool firstFrame_ = true;
    std::string hierarchyPath_;
    std::string topicsPath_;
    std::string pendingLoadPath_;

    // Session
    Hierarchy hierarchy_;
    std::unique_ptr<TopicSource> topicSource_;
    std::unique_ptr<TopicCache> topicCache_;
    std::unique_ptr<NavigationStore> store_;
    std::unique_ptr<MapViewController> mapController_;
    std::unique_ptr<OutlineModel> outline_;

    // Background load state
    std::atomic<bool> loading_{false};
    std::atomic<bool> loadDone_{false};
    std::thread loadThread_;
    std::vector<std::unique_ptr<ClusterNode>> loadResult_;
    std::shared_ptr<HierarchyLoader> activeLoader_;

    // Thread-safe progress info
    mutable std::mutex progressMutex_;
    std::string progressPath_;
    int progressNodes_ = 0;
    std::string loadError_;
};

} // namespace clustermap
