#include <gtest/gtest.h>
#include "navigation/MapViewController.h"
#include "renderer/NodePicker.h"

#include <cmath>
#include <set>

using namespace clustermap;

namespace {

std::unique_ptr<ClusterNode> makeNode(const std::string& id, ClusterLevel level,
                                      int64_t weight = 0) {
    auto node = std::make_unique<ClusterNode>();
    node->id = id;
    node->name = "Name " + id;
    node->level = level;
    node->weight = weight;
    return node;
}

//   l2-1 > l1-1-0 > {l0-1-0-0, l0-1-0-1}
//   l2-2 > l1-2-0 > l0-2-0-0
//   l2-3
std::vector<std::unique_ptr<ClusterNode>> threeCategories() {
    std::vector<std::unique_ptr<ClusterNode>> top;

    auto a = makeNode("l2-1", ClusterLevel::L2);
    ClusterNode* a1 = a->addChild(makeNode("l1-1-0", ClusterLevel::L1));
    a1->addChild(makeNode("l0-1-0-0", ClusterLevel::L0, 40));
    a1->addChild(makeNode("l0-1-0-1", ClusterLevel::L0, 60));
    top.push_back(std::move(a));

    auto b = makeNode("l2-2", ClusterLevel::L2);
    ClusterNode* b1 = b->addChild(makeNode("l1-2-0", ClusterLevel::L1));
    b1->addChild(makeNode("l0-2-0-0", ClusterLevel::L0, 80));
    top.push_back(std::move(b));

    top.push_back(makeNode("l2-3", ClusterLevel::L2, 30));
    return top;
}

class MapViewControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        hierarchy_.setTopLevel(threeCategories());
        store_ = std::make_unique<NavigationStore>(hierarchy_);
        map_ = std::make_unique<MapViewController>(hierarchy_, *store_, scheduler_);
        map_->setClock([this] { return now_; });
        map_->setRedrawCallback([this] { ++redraws_; });
        map_->setViewportSize(800, 600);
    }

    void TearDown() override {
        map_.reset();
        store_.reset();
    }

    // A screen point that picks exactly the given circle
    bool screenPointOn(const std::string& id, XYvec& out) const {
        const PackedLayout& layout = map_->layout();
        int idx = layout.indexOf(id);
        if (idx < 0) {
            return false;
        }
        const PackedNode& pn = layout.nodes[idx];
        for (double f : {0.0, 0.5, 0.8, 0.9, 0.95, 0.98}) {
            for (int a = 0; a < 72; ++a) {
                double angle = a * 2.0 * PI / 72.0;
                XYvec view{pn.x + f * pn.r * std::cos(angle), pn.y + f * pn.r * std::sin(angle)};
                XYvec screen = map_->camera().toScreen(view, map_->width(), map_->height());
                if (NodePicker::pickIndex(layout, map_->camera(), map_->width(), map_->height(),
                                          screen) == idx) {
                    out = screen;
                    return true;
                }
            }
        }
        return false;
    }

    void finishAnimation() {
        now_ += ZoomCamera::ZOOM_DURATION + 0.1;
        scheduler_.iteration(now_);
    }

    Scheduler scheduler_;
    Hierarchy hierarchy_;
    std::unique_ptr<NavigationStore> store_;
    std::unique_ptr<MapViewController> map_;
    double now_ = 100.0;
    int redraws_ = 0;
};

} // namespace

TEST_F(MapViewControllerTest, ViewportSizeLaysOutRootAndFits) {
    const PackedLayout& layout = map_->layout();
    ASSERT_FALSE(layout.empty());
    EXPECT_EQ(layout.nodes[0].node, hierarchy_.root());
    EXPECT_EQ(layout.size(), 9u);

    EXPECT_EQ(map_->camera().state(), ZoomCamera::computeFitZoom(layout, 800, 600));
    EXPECT_FALSE(map_->camera().isAnimating());
}

TEST_F(MapViewControllerTest, ResizeRelaysOut) {
    double before = map_->layout().nodes[0].r;
    map_->setViewportSize(400, 400);
    EXPECT_DOUBLE_EQ(map_->layout().width, 400);
    EXPECT_LT(map_->layout().nodes[0].r, before);
}

TEST_F(MapViewControllerTest, ClickCategoryDrillsAndAnimates) {
    XYvec p;
    ASSERT_TRUE(screenPointOn("l2-1", p));
    map_->click(p);

    EXPECT_EQ(store_->state().currentRootId, "l2-1");
    EXPECT_EQ(map_->layout().nodes[0].node->id, "l2-1");
    EXPECT_TRUE(map_->camera().isAnimating());
    EXPECT_GT(redraws_, 0);

    finishAnimation();
    EXPECT_EQ(map_->camera().state(), ZoomCamera::computeFitZoom(map_->layout(), 800, 600));
}

TEST_F(MapViewControllerTest, ClickLeafSelectsWithoutSync) {
    XYvec p;
    ASSERT_TRUE(screenPointOn("l2-3", p));
    map_->click(p);

    EXPECT_TRUE(store_->state().isRoot());
    EXPECT_EQ(store_->state().selectedNodeId, std::optional<std::string>("l2-3"));
}

TEST_F(MapViewControllerTest, ClickLeafWithSyncMirrors) {
    store_->setSyncMode(true);
    store_->selectAndDrill(hierarchy_.findById("l2-1"));
    finishAnimation();

    XYvec p;
    ASSERT_TRUE(screenPointOn("l0-1-0-1", p));
    map_->click(p);

    EXPECT_EQ(store_->state().currentRootId, "l1-1-0");
    EXPECT_EQ(store_->state().selectedNodeId, std::optional<std::string>("l0-1-0-1"));
    EXPECT_EQ(store_->state().expandedL0NodeIds.count("l0-1-0-1"), 1u);
}

TEST_F(MapViewControllerTest, ClickEmptySpaceDoesNothing) {
    map_->click(XYvec{1.0, 1.0});
    EXPECT_TRUE(store_->state().isRoot());
    EXPECT_FALSE(store_->state().selectedNodeId.has_value());
}

TEST_F(MapViewControllerTest, HoverTracksPointer) {
    XYvec p;
    ASSERT_TRUE(screenPointOn("l2-2", p));

    int before = redraws_;
    map_->pointerMove(p);
    EXPECT_EQ(map_->hoveredId(), "l2-2");
    ASSERT_NE(map_->hoveredNode(), nullptr);
    EXPECT_EQ(map_->hoveredNode()->node->id, "l2-2");
    EXPECT_EQ(redraws_, before + 1);

    // Same circle: no repaint
    map_->pointerMove(p);
    EXPECT_EQ(redraws_, before + 1);

    map_->pointerLeave();
    EXPECT_TRUE(map_->hoveredId().empty());
    EXPECT_EQ(map_->hoveredNode(), nullptr);
    EXPECT_EQ(redraws_, before + 2);
}

TEST_F(MapViewControllerTest, HoverDroppedWhenCircleLeavesView) {
    XYvec p;
    ASSERT_TRUE(screenPointOn("l2-2", p));
    map_->pointerMove(p);

    store_->selectAndDrill(hierarchy_.findById("l2-1"));
    EXPECT_TRUE(map_->hoveredId().empty());
}

TEST_F(MapViewControllerTest, PulseRunsWhileSelected) {
    EXPECT_FALSE(scheduler_.hasPending());
    store_->selectNode(std::string("l2-3"));
    EXPECT_TRUE(scheduler_.hasPending());

    store_->selectNode(std::nullopt);
    EXPECT_FALSE(scheduler_.hasPending());
}

TEST_F(MapViewControllerTest, SceneReflectsHoverAndSelection) {
    store_->selectNode(std::string("l2-3"));
    Scene scene = map_->buildScene(0.0, TextMeasurer{});
    ASSERT_FALSE(scene.empty());

    bool halo = false;
    for (const DrawCommand& cmd : scene.commands) {
        if (cmd.nodeId == "l2-3" && cmd.type == DrawCommandType::RadialGradientCircle &&
            cmd.innerRadius > 0.0) {
            halo = true;
        }
    }
    EXPECT_TRUE(halo);
}

TEST_F(MapViewControllerTest, FitToViewAnimatesBack) {
    ZoomState fit = map_->camera().state();
    map_->camera().jumpTo(ZoomState{4.0, -100.0, 30.0});

    map_->fitToView();
    EXPECT_TRUE(map_->camera().isAnimating());
    finishAnimation();
    EXPECT_EQ(map_->camera().state(), fit);
}

TEST_F(MapViewControllerTest, HierarchyChangeRebuilds) {
    std::vector<std::unique_ptr<ClusterNode>> single;
    single.push_back(makeNode("l2-9", ClusterLevel::L2));
    single.back()->addChild(makeNode("l1-9-0", ClusterLevel::L1, 5));
    hierarchy_.setTopLevel(std::move(single));
    store_->reset();
    map_->hierarchyChanged();

    const PackedLayout& layout = map_->layout();
    ASSERT_EQ(layout.size(), 2u);
    EXPECT_EQ(layout.nodes[0].node->id, "l2-9");
    EXPECT_FALSE(map_->camera().isAnimating());
}

TEST_F(MapViewControllerTest, BreadcrumbRootRefitsFullHierarchy) {
    store_->selectAndDrill(hierarchy_.findById("l2-1"));
    finishAnimation();
    ASSERT_FALSE(store_->state().isRoot());

    store_->navigateBreadcrumb(-1);
    finishAnimation();

    EXPECT_TRUE(store_->state().breadcrumbPath.empty());
    EXPECT_FALSE(store_->state().selectedNodeId.has_value());
    EXPECT_EQ(map_->layout().nodes[0].node, hierarchy_.root());

    PackedLayout full = CirclePackLayout::compute(hierarchy_.root(), 800, 600);
    EXPECT_EQ(map_->camera().state(), ZoomCamera::computeFitZoom(full, 800, 600));
    EXPECT_FALSE(map_->camera().isAnimating());
}

namespace {

// Two categories, each with two subclusters of two unit-weight leaves
std::vector<std::unique_ptr<ClusterNode>> twoByTwoByTwo() {
    std::vector<std::unique_ptr<ClusterNode>> top;
    for (int c = 1; c <= 2; ++c) {
        auto l2 = makeNode("l2-" + std::to_string(c), ClusterLevel::L2);
        for (int s = 0; s < 2; ++s) {
            std::string sub = std::to_string(c) + "-" + std::to_string(s);
            ClusterNode* l1 = l2->addChild(makeNode("l1-" + sub, ClusterLevel::L1));
            l1->addChild(makeNode("l0-" + sub + "-0", ClusterLevel::L0, 1));
            l1->addChild(makeNode("l0-" + sub + "-1", ClusterLevel::L0, 1));
        }
        top.push_back(std::move(l2));
    }
    return top;
}

std::set<std::string> currentLevelIds(const PackedLayout& layout) {
    std::set<std::string> ids;
    for (const PackedNode& pn : layout.nodes) {
        if (pn.depth == 1) {
            ids.insert(pn.node->id);
        }
    }
    return ids;
}

} // namespace

TEST(MapViewControllerScenarioTest, DrillCategoryThenReturnToRoot) {
    Scheduler scheduler;
    Hierarchy hierarchy;
    hierarchy.setTopLevel(twoByTwoByTwo());
    NavigationStore store(hierarchy);
    MapViewController map(hierarchy, store, scheduler);
    double now = 10.0;
    map.setClock([&now] { return now; });
    map.setViewportSize(800, 600);

    // Selecting the first category drills into it and frames its two subclusters
    store.selectAndDrill(hierarchy.findById("l2-1"));
    now += ZoomCamera::ZOOM_DURATION + 0.1;
    scheduler.iteration(now);

    EXPECT_EQ(store.state().currentRootId, "l2-1");
    ASSERT_EQ(store.state().breadcrumbPath.size(), 1u);
    EXPECT_EQ(store.state().breadcrumbPath[0]->id, "l2-1");
    EXPECT_EQ(currentLevelIds(map.layout()), (std::set<std::string>{"l1-1-0", "l1-1-1"}));
    EXPECT_EQ(map.camera().state(), ZoomCamera::computeFitZoom(map.layout(), 800, 600));

    // Root reset frames both categories again
    store.navigateBreadcrumb(-1);
    now += ZoomCamera::ZOOM_DURATION + 0.1;
    scheduler.iteration(now);

    EXPECT_TRUE(store.state().breadcrumbPath.empty());
    EXPECT_EQ(store.state().currentRootNode, hierarchy.root());
    EXPECT_EQ(currentLevelIds(map.layout()), (std::set<std::string>{"l2-1", "l2-2"}));
    PackedLayout full = CirclePackLayout::compute(hierarchy.root(), 800, 600);
    EXPECT_EQ(map.camera().state(), ZoomCamera::computeFitZoom(full, 800, 600));
}
