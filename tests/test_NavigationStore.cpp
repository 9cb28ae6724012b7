#include <gtest/gtest.h>
#include "navigation/NavigationStore.h"

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
//   l2-2 (weight 9) > l1-2-0 > l0-2-0-0
//   l2-3 (no children)
std::vector<std::unique_ptr<ClusterNode>> threeCategories() {
    std::vector<std::unique_ptr<ClusterNode>> top;

    auto a = makeNode("l2-1", ClusterLevel::L2);
    ClusterNode* a1 = a->addChild(makeNode("l1-1-0", ClusterLevel::L1));
    a1->addChild(makeNode("l0-1-0-0", ClusterLevel::L0, 4));
    a1->addChild(makeNode("l0-1-0-1", ClusterLevel::L0, 6));
    top.push_back(std::move(a));

    auto b = makeNode("l2-2", ClusterLevel::L2, 9);
    ClusterNode* b1 = b->addChild(makeNode("l1-2-0", ClusterLevel::L1));
    b1->addChild(makeNode("l0-2-0-0", ClusterLevel::L0, 9));
    top.push_back(std::move(b));

    top.push_back(makeNode("l2-3", ClusterLevel::L2, 2));
    return top;
}

class NavigationStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        hierarchy_.setTopLevel(threeCategories());
        store_ = std::make_unique<NavigationStore>(hierarchy_);
        store_->subscribe([this](const NavigationState&) { ++notifications_; });
    }

    ClusterNode* node(const std::string& id) { return hierarchy_.findById(id); }

    std::vector<std::string> crumbIds() const {
        std::vector<std::string> ids;
        for (ClusterNode* n : store_->state().breadcrumbPath) {
            ids.push_back(n->id);
        }
        return ids;
    }

    Hierarchy hierarchy_;
    std::unique_ptr<NavigationStore> store_;
    int notifications_ = 0;
};

} // namespace

TEST_F(NavigationStoreTest, StartsAtRoot) {
    const NavigationState& s = store_->state();
    EXPECT_TRUE(s.isRoot());
    EXPECT_EQ(s.currentRootId, SYNTHETIC_ROOT_ID);
    EXPECT_EQ(s.currentRootNode, hierarchy_.root());
    EXPECT_FALSE(s.selectedNodeId.has_value());
    EXPECT_TRUE(s.expandedL0NodeIds.empty());
    EXPECT_FALSE(s.syncModeEnabled);
    EXPECT_EQ(notifications_, 0);
}

TEST_F(NavigationStoreTest, DrillSetsRootBreadcrumbAndSelection) {
    store_->selectAndDrill(node("l2-1"));
    EXPECT_EQ(store_->state().currentRootId, "l2-1");
    EXPECT_EQ(crumbIds(), (std::vector<std::string>{"l2-1"}));
    EXPECT_EQ(store_->state().selectedNodeId, std::optional<std::string>("l2-1"));
    EXPECT_EQ(notifications_, 1);

    store_->selectAndDrill(node("l1-1-0"));
    EXPECT_EQ(store_->state().currentRootNode, node("l1-1-0"));
    EXPECT_EQ(crumbIds(), (std::vector<std::string>{"l2-1", "l1-1-0"}));
    EXPECT_EQ(notifications_, 2);
}

TEST_F(NavigationStoreTest, DrillIntoLeafIsIgnored) {
    store_->selectAndDrill(node("l0-1-0-0"));
    store_->selectAndDrill(nullptr);
    EXPECT_TRUE(store_->state().isRoot());
    EXPECT_FALSE(store_->state().selectedNodeId.has_value());
    EXPECT_EQ(notifications_, 0);
}

TEST_F(NavigationStoreTest, DrillIntoRootReturnsToRootState) {
    store_->selectAndDrill(node("l2-1"));
    store_->selectAndDrill(hierarchy_.root());
    EXPECT_TRUE(store_->state().isRoot());
    EXPECT_EQ(store_->state().currentRootId, SYNTHETIC_ROOT_ID);
}

TEST_F(NavigationStoreTest, BreadcrumbTruncates) {
    store_->selectAndDrill(node("l2-1"));
    store_->selectAndDrill(node("l1-1-0"));

    store_->navigateBreadcrumb(0);
    EXPECT_EQ(crumbIds(), (std::vector<std::string>{"l2-1"}));
    EXPECT_EQ(store_->state().currentRootId, "l2-1");
    // Selection survives a breadcrumb step
    EXPECT_EQ(store_->state().selectedNodeId, std::optional<std::string>("l1-1-0"));
}

TEST_F(NavigationStoreTest, BreadcrumbMinusOneIsRoot) {
    store_->selectAndDrill(node("l2-1"));
    store_->navigateBreadcrumb(-1);
    EXPECT_TRUE(store_->state().isRoot());
    EXPECT_EQ(store_->state().currentRootNode, hierarchy_.root());
    EXPECT_FALSE(store_->state().selectedNodeId.has_value());
}

TEST_F(NavigationStoreTest, BreadcrumbOutOfRangeIgnored) {
    store_->selectAndDrill(node("l2-1"));
    int before = notifications_;
    store_->navigateBreadcrumb(1);
    store_->navigateBreadcrumb(-2);
    EXPECT_EQ(crumbIds(), (std::vector<std::string>{"l2-1"}));
    EXPECT_EQ(notifications_, before);
}

TEST_F(NavigationStoreTest, NavigateUp) {
    store_->selectAndDrill(node("l2-1"));
    store_->selectAndDrill(node("l1-1-0"));

    store_->navigateUp();
    EXPECT_EQ(crumbIds(), (std::vector<std::string>{"l2-1"}));

    store_->navigateUp();
    EXPECT_TRUE(store_->state().isRoot());

    int before = notifications_;
    store_->navigateUp();
    EXPECT_EQ(notifications_, before);
}

TEST_F(NavigationStoreTest, MirrorNodeWithChildrenDrills) {
    store_->navigateToNodeById("l1-2-0");
    EXPECT_EQ(store_->state().currentRootId, "l1-2-0");
    EXPECT_EQ(crumbIds(), (std::vector<std::string>{"l2-2", "l1-2-0"}));
    EXPECT_EQ(store_->state().selectedNodeId, std::optional<std::string>("l1-2-0"));
}

TEST_F(NavigationStoreTest, MirrorLeafShowsParent) {
    store_->navigateToNodeById("l0-1-0-1");
    EXPECT_EQ(store_->state().currentRootId, "l1-1-0");
    EXPECT_EQ(crumbIds(), (std::vector<std::string>{"l2-1", "l1-1-0"}));
    EXPECT_EQ(store_->state().selectedNodeId, std::optional<std::string>("l0-1-0-1"));
    // Not synced: the outline is left alone
    EXPECT_TRUE(store_->state().expandedL0NodeIds.empty());
}

TEST_F(NavigationStoreTest, MirrorLeafWithSyncExpandsIt) {
    store_->setSyncMode(true);
    store_->navigateToNodeById("l0-1-0-1");
    EXPECT_EQ(store_->state().expandedL0NodeIds.count("l0-1-0-1"), 1u);
}

TEST_F(NavigationStoreTest, MirrorTopLevelLeafStaysAtRoot) {
    store_->selectAndDrill(node("l2-1"));
    store_->navigateToNodeById("l2-3");
    EXPECT_TRUE(store_->state().isRoot());
    EXPECT_EQ(store_->state().selectedNodeId, std::optional<std::string>("l2-3"));
}

TEST_F(NavigationStoreTest, MirrorUnknownIdIgnored) {
    store_->navigateToNodeById("nope");
    EXPECT_TRUE(store_->state().isRoot());
    EXPECT_EQ(notifications_, 0);
}

TEST_F(NavigationStoreTest, ToggleL0Expansion) {
    store_->toggleL0Expansion("l0-1-0-0");
    EXPECT_EQ(store_->state().expandedL0NodeIds.count("l0-1-0-0"), 1u);
    store_->toggleL0Expansion("l0-1-0-0");
    EXPECT_TRUE(store_->state().expandedL0NodeIds.empty());
    EXPECT_EQ(notifications_, 2);
}

TEST_F(NavigationStoreTest, UnchangedStateDoesNotNotify) {
    store_->selectNode(std::string("l2-2"));
    store_->selectNode(std::string("l2-2"));
    EXPECT_EQ(notifications_, 1);

    store_->setSyncMode(false);
    EXPECT_EQ(notifications_, 1);
}

TEST_F(NavigationStoreTest, SyncToggle) {
    store_->toggleSyncMode();
    EXPECT_TRUE(store_->state().syncModeEnabled);
    store_->toggleSyncMode();
    EXPECT_FALSE(store_->state().syncModeEnabled);
}

TEST_F(NavigationStoreTest, ResetKeepsSyncMode) {
    store_->setSyncMode(true);
    store_->navigateToNodeById("l0-2-0-0");
    store_->reset();

    const NavigationState& s = store_->state();
    EXPECT_TRUE(s.isRoot());
    EXPECT_FALSE(s.selectedNodeId.has_value());
    EXPECT_TRUE(s.expandedL0NodeIds.empty());
    EXPECT_TRUE(s.syncModeEnabled);
}

TEST_F(NavigationStoreTest, ResetPicksUpNewHierarchy) {
    std::vector<std::unique_ptr<ClusterNode>> single;
    single.push_back(makeNode("l2-9", ClusterLevel::L2));
    single.back()->addChild(makeNode("l1-9-0", ClusterLevel::L1));
    hierarchy_.setTopLevel(std::move(single));

    store_->reset();
    EXPECT_EQ(store_->state().currentRootId, "l2-9");
    EXPECT_TRUE(store_->state().isRoot());
}

TEST_F(NavigationStoreTest, UnsubscribeStopsNotifications) {
    int other = 0;
    NavigationStore::ListenerId id = store_->subscribe([&other](const NavigationState&) { ++other; });
    store_->toggleSyncMode();
    store_->unsubscribe(id);
    store_->toggleSyncMode();
    EXPECT_EQ(other, 1);
    EXPECT_EQ(notifications_, 2);
}

TEST_F(NavigationStoreTest, ListenerCanUnsubscribeAnother) {
    int second = 0;
    NavigationStore::ListenerId secondId = 0;
    store_->subscribe([&](const NavigationState&) { store_->unsubscribe(secondId); });
    secondId = store_->subscribe([&second](const NavigationState&) { ++second; });

    store_->toggleSyncMode();
    EXPECT_EQ(second, 0);
}

TEST_F(NavigationStoreTest, ListenerSeesNewState) {
    std::string seenRoot;
    store_->subscribe([&seenRoot](const NavigationState& s) { seenRoot = s.currentRootId; });
    store_->selectAndDrill(node("l2-2"));
    EXPECT_EQ(seenRoot, "l2-2");
}

TEST_F(NavigationStoreTest, ContextSummaryAtRoot) {
    EXPECT_EQ(store_->getContextSummary(), "Currently viewing: Root level");
}

TEST_F(NavigationStoreTest, ContextSummaryDrilled) {
    store_->selectAndDrill(node("l2-2"));
    store_->toggleL0Expansion("l0-2-0-0");
    EXPECT_EQ(store_->getContextSummary(),
              "Currently viewing: Name l2-2 (l2)\n"
              "Trace count: 9\n"
              "Navigation path: Name l2-2\n"
              "Selected node: l2-2\n"
              "Expanded clusters: 1");

    store_->selectAndDrill(node("l1-2-0"));
    std::string summary = store_->getContextSummary();
    EXPECT_NE(summary.find("Navigation path: Name l2-2 > Name l1-2-0"), std::string::npos);
    EXPECT_EQ(summary.find("Trace count"), std::string::npos);
}
