#include "ui/MainWindow.h"

#include <imgui.h>
#include <imgui_internal.h>
#include <iostream>
#include <stdexcept>

#include "animation/Animation.h"
#include "animation/Scheduler.h"
#include "core/PlatformUtils.h"
#include "data/HierarchyLoader.h"
#include "data/JsonTopicSource.h"
#include "data/SampleData.h"
#include "data/TopicCache.h"
#include "navigation/MapViewController.h"
#include "navigation/NavigationStore.h"
#include "navigation/OutlineModel.h"
#include "ui/ClusterTreePanel.h"
#include "ui/Dialogs.h"
#include "ui/MenuBar.h"
#include "ui/StatusBar.h"
#include "ui/Toolbar.h"
#include "ui/ViewportPanel.h"

namespace clustermap {

MainWindow& MainWindow::instance() {
    static MainWindow s;
    return s;
}

MainWindow::~MainWindow() {
    if (loadThread_.joinable()) {
        if (activeLoader_) {
            activeLoader_->cancelRequested.store(true);
        }
        loadThread_.join();
    }
}

// ============================================================================
// Session setup / teardown
// ============================================================================

void MainWindow::init(const std::string& hierarchyPath, const std::string& topicsPath,
                      bool syncMode) {
    topicCache_ = std::make_unique<TopicCache>();
    setTopicsPath(topicsPath);
    topicCache_->setChangeListener([] { Animation::instance().requestRedraw(); });

    store_ = std::make_unique<NavigationStore>(hierarchy_);
    store_->setSyncMode(syncMode);

    mapController_ = std::make_unique<MapViewController>(hierarchy_, *store_, Scheduler::instance());
    mapController_->setRedrawCallback([] { Animation::instance().requestRedraw(); });

    outline_ = std::make_unique<OutlineModel>(hierarchy_, *store_, *topicCache_);

    // Anything the store changes needs a repaint of both views
    store_->subscribe([](const NavigationState&) { Animation::instance().requestRedraw(); });

    if (hierarchyPath.empty()) {
        loadSample();
    } else {
        requestLoad(hierarchyPath);
    }
}

void MainWindow::shutdown() {
    cancelLoad();
    joinLoadThread();
    loading_.store(false);
    loadDone_.store(false);

    outline_.reset();
    mapController_.reset();
    store_.reset();
    topicCache_.reset();
    topicSource_.reset();
    hierarchy_.clear();
    Scheduler::instance().clear();
}

void MainWindow::setTopicsPath(const std::string& path) {
    std::unique_ptr<TopicSource> next;
    if (path.empty()) {
        next = std::make_unique<SampleTopicSource>();
    } else {
        next = std::make_unique<JsonTopicSource>(path);
    }

    // Swap before the old source is destroyed; its late completions are
    // discarded by clear()
    topicCache_->clear();
    topicCache_->setSource(next.get());
    topicSource_ = std::move(next);
    topicsPath_ = path;

    std::cout << "MainWindow: topics from "
              << (path.empty() ? std::string("built-in samples") : path) << std::endl;
}

bool MainWindow::syncModeEnabled() const {
    return store_ ? store_->state().syncModeEnabled : true;
}

bool MainWindow::isBusy() const {
    return loading_.load() || (topicCache_ && topicCache_->inFlightCount() > 0);
}

void MainWindow::installHierarchy(std::vector<std::unique_ptr<ClusterNode>> topLevel,
                                  const std::string& sourceName) {
    hierarchy_.setTopLevel(std::move(topLevel));

    // Dependents drop everything that pointed into the old tree
    topicCache_->clear();
    store_->reset();
    mapController_->hierarchyChanged();
    outline_->resetState();
    outline_->focusFirst();

    int64_t traces = 0;
    for (const ClusterNode* node : hierarchy_.topLevel()) {
        traces += node->leafWeightSum();
    }
    StatusBar::instance().setMessage(
        sourceName,
        PlatformUtils::formatNumber(static_cast<int64_t>(hierarchy_.nodeCount())) + " clusters, " +
            PlatformUtils::formatTraceCount(traces));

    std::cout << "MainWindow: installed " << hierarchy_.nodeCount() << " clusters from "
              << sourceName << std::endl;
}

void MainWindow::loadSample() {
    if (loading_.load()) return;
    hierarchyPath_.clear();
    installHierarchy(buildSampleHierarchy(), "Sample clusters");
}

// ============================================================================
// Background loading
// ============================================================================

void MainWindow::requestLoad(const std::string& path) {
    if (loading_.load()) return;
    pendingLoadPath_ = path;
}

void MainWindow::cancelLoad() {
    if (activeLoader_) {
        activeLoader_->cancelRequested.store(true);
    }
}

void MainWindow::joinLoadThread() {
    if (loadThread_.joinable()) {
        loadThread_.join();
    }
}

void MainWindow::loadThreadFunc(const std::string& path) {
    try {
        auto roots = activeLoader_->loadFile(path, [this](int nodesLoaded) {
            std::lock_guard<std::mutex> lock(progressMutex_);
            progressNodes_ = nodesLoaded;
        });

        if (activeLoader_->cancelRequested.load()) {
            loadResult_.clear();
        } else {
            loadResult_ = std::move(roots);
        }
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(progressMutex_);
        loadError_ = e.what();
    }

    loadDone_.store(true);
}

void MainWindow::finishLoad() {
    joinLoadThread();

    bool cancelled = activeLoader_ && activeLoader_->cancelRequested.load();
    loading_.store(false);
    loadDone_.store(false);
    activeLoader_.reset();

    std::string error;
    std::string path;
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        error = std::move(loadError_);
        loadError_.clear();
        path = progressPath_;
    }

    if (cancelled) {
        StatusBar::instance().setMessage("Load cancelled", "");
        loadResult_.clear();
        return;
    }

    if (!error.empty()) {
        std::cerr << "MainWindow: " << error << std::endl;
        StatusBar::instance().setMessage("Load error: " + error, "");
        loadResult_.clear();
        return;
    }

    if (loadResult_.empty()) {
        StatusBar::instance().setMessage("No clusters found in " + path, "");
        return;
    }

    hierarchyPath_ = path;
    installHierarchy(std::move(loadResult_), path);
    loadResult_.clear();
}

void MainWindow::pump() {
    if (loadDone_.load()) {
        finishLoad();
    }

    // Start a deferred load on the background thread
    if (!pendingLoadPath_.empty() && !loading_.load()) {
        std::string path = std::move(pendingLoadPath_);
        pendingLoadPath_.clear();

        {
            std::lock_guard<std::mutex> lock(progressMutex_);
            progressPath_ = path;
            progressNodes_ = 0;
            loadError_.clear();
        }

        loading_.store(true);
        loadDone_.store(false);

        joinLoadThread();
        activeLoader_ = std::make_shared<HierarchyLoader>();
        loadThread_ = std::thread(&MainWindow::loadThreadFunc, this, path);
    }

    if (topicCache_) {
        topicCache_->pump();
    }
}

// ============================================================================
// Drawing
// ============================================================================

void MainWindow::drawProgressOverlay() {
    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImVec2 center = viewport->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(450.0f, 0.0f));

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoDecoration |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_AlwaysAutoResize;

    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 8.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(20.0f, 16.0f));

    if (ImGui::Begin("##LoadProgress", nullptr, flags)) {
        ImGui::Text("Loading clusters...");
        ImGui::Spacing();

        float time = static_cast<float>(ImGui::GetTime());
        float progress = time - static_cast<float>(static_cast<int>(time));
        ImGui::ProgressBar(progress, ImVec2(-1.0f, 0.0f), "");

        ImGui::Spacing();

        std::string path;
        int nodes;
        {
            std::lock_guard<std::mutex> lock(progressMutex_);
            path = progressPath_;
            nodes = progressNodes_;
        }

        if (path.size() > 55) {
            path = "..." + path.substr(path.size() - 52);
        }

        ImGui::Text("Clusters: %s", PlatformUtils::formatNumber(nodes).c_str());
        ImGui::TextDisabled("%s", path.c_str());

        ImGui::Spacing();
        float buttonWidth = 120.0f;
        float avail = ImGui::GetContentRegionAvail().x;
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + (avail - buttonWidth) * 0.5f);
        if (ImGui::Button("Cancel", ImVec2(buttonWidth, 0.0f))) {
            cancelLoad();
        }
    }
    ImGui::End();

    ImGui::PopStyleVar(2);
}

void MainWindow::draw() {
    // Create a fullscreen dockspace
    ImGuiWindowFlags windowFlags =
        ImGuiWindowFlags_NoDocking |
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoNavFocus;

    const ImGuiViewport* viewport = ImGui::GetMainViewport();

    float toolbarHeight = ImGui::GetFrameHeightWithSpacing() + 4.0f;
    float statusHeight = ImGui::GetFrameHeightWithSpacing();

    ImVec2 dockPos(viewport->WorkPos.x, viewport->WorkPos.y + toolbarHeight);
    ImVec2 dockSize(viewport->WorkSize.x, viewport->WorkSize.y - toolbarHeight - statusHeight);

    ImGui::SetNextWindowPos(dockPos);
    ImGui::SetNextWindowSize(dockSize);
    ImGui::SetNextWindowViewport(viewport->ID);

    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));

    ImGui::Begin("DockSpace", nullptr, windowFlags);
    ImGui::PopStyleVar(3);

    ImGuiID dockspaceId = ImGui::GetID("MainDockSpace");
    ImGui::DockSpace(dockspaceId, ImVec2(0.0f, 0.0f), ImGuiDockNodeFlags_None);

    if (firstFrame_) {
        setupDockspace();
        firstFrame_ = false;
    }

    ImGui::End();

    MenuBar::instance().draw();
    Toolbar::instance().draw();
    ClusterTreePanel::instance().draw();
    ViewportPanel::instance().draw();
    StatusBar::instance().draw();
    Dialogs::instance().draw();

    if (loading_.load()) {
        drawProgressOverlay();
    }
}

void MainWindow::setupDockspace() {
    ImGuiID dockspaceId = ImGui::GetID("MainDockSpace");

    ImGui::DockBuilderRemoveNode(dockspaceId);
    ImGui::DockBuilderAddNode(dockspaceId, ImGuiDockNodeFlags_DockSpace);

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::DockBuilderSetNodeSize(dockspaceId, viewport->WorkSize);

    ImGuiID leftId, rightId;
    ImGui::DockBuilderSplitNode(dockspaceId, ImGuiDir_Left, 0.28f, &leftId, &rightId);

    ImGui::DockBuilderDockWindow("Cluster Tree", leftId);
    ImGui::DockBuilderDockWindow("Cluster Map", rightId);

    ImGui::DockBuilderFinish(dockspaceId);
}

} // namespace clustermap
