#include <gtest/gtest.h>
#include "data/SampleData.h"
#include "navigation/OutlineModel.h"

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
std::vector<std::unique_ptr<ClusterNode>> twoCategories() {
    std::vector<std::unique_ptr<ClusterNode>> top;

    auto a = makeNode("l2-1", ClusterLevel::L2);
    ClusterNode* a1 = a->addChild(makeNode("l1-1-0", ClusterLevel::L1));
    a1->addChild(makeNode("l0-1-0-0", ClusterLevel::L0, 4));
    a1->addChild(makeNode("l0-1-0-1", ClusterLevel::L0, 6));
    top.push_back(std::move(a));

    auto b = makeNode("l2-2", ClusterLevel::L2);
    ClusterNode* b1 = b->addChild(makeNode("l1-2-0", ClusterLevel::L1));
    b1->addChild(makeNode("l0-2-0-0", ClusterLevel::L0, 3));
    top.push_back(std::move(b));

    return top;
}

class OutlineModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        hierarchy_.setTopLevel(twoCategories());
        store_ = std::make_unique<NavigationStore>(hierarchy_);
        cache_ = std::make_unique<TopicCache>(&source_);
        outline_ = std::make_unique<OutlineModel>(hierarchy_, *store_, *cache_);
    }

    void TearDown() override {
        outline_.reset();
        store_.reset();
    }

    ClusterNode* node(const std::string& id) { return hierarchy_.findById(id); }

    std::vector<std::string> rowIds() const {
        std::vector<std::string> ids;
        for (const OutlineRow& row : outline_->flatten()) {
            ids.push_back(row.node->id);
        }
        return ids;
    }

    SampleTopicSource source_;
    Hierarchy hierarchy_;
    std::unique_ptr<NavigationStore> store_;
    std::unique_ptr<TopicCache> cache_;
    std::unique_ptr<OutlineModel> outline_;
};

} // namespace

TEST_F(OutlineModelTest, CollapsedShowsTopLevel) {
    std::vector<OutlineRow> rows = outline_->flatten();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].node->id, "l2-1");
    EXPECT_EQ(rows[0].depth, 0);
    EXPECT_EQ(rows[1].node->id, "l2-2");
}

TEST_F(OutlineModelTest, ExpansionRevealsChildren) {
    outline_->setExpanded("l2-1", true);
    outline_->setExpanded("l1-1-0", true);

    std::vector<OutlineRow> rows = outline_->flatten();
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(rows[1].node->id, "l1-1-0");
    EXPECT_EQ(rows[1].depth, 1);
    EXPECT_EQ(rows[2].node->id, "l0-1-0-0");
    EXPECT_EQ(rows[2].depth, 2);
    EXPECT_EQ(rows[4].node->id, "l2-2");

    // Expanded but hidden under a collapsed parent
    outline_->setExpanded("l2-1", false);
    EXPECT_EQ(rowIds(), (std::vector<std::string>{"l2-1", "l2-2"}));
    EXPECT_TRUE(outline_->isExpanded("l1-1-0"));
}

TEST_F(OutlineModelTest, StaticFlatten) {
    std::vector<OutlineRow> rows =
        OutlineModel::flatten({node("l2-2")}, std::set<std::string>{"l2-2", "l1-2-0"});
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[2].node->id, "l0-2-0-0");
    EXPECT_EQ(rows[2].depth, 2);

    EXPECT_TRUE(OutlineModel::flatten({}, {}).empty());
}

TEST_F(OutlineModelTest, ClickTogglesAndSelects) {
    outline_->click(node("l2-1"));
    EXPECT_TRUE(outline_->isExpanded("l2-1"));
    EXPECT_EQ(outline_->focusedId(), "l2-1");
    EXPECT_EQ(store_->state().selectedNodeId, std::optional<std::string>("l2-1"));
    // Independent mode: the map view root is untouched
    EXPECT_TRUE(store_->state().isRoot());

    outline_->click(node("l2-1"));
    EXPECT_FALSE(outline_->isExpanded("l2-1"));
}

TEST_F(OutlineModelTest, ClickL0RequestsTopics) {
    outline_->click(node("l0-1-0-1"));
    EXPECT_TRUE(outline_->isExpanded("l0-1-0-1"));
    EXPECT_TRUE(cache_->contains("l0-1-0-1"));

    cache_->pump();
    EXPECT_EQ(cache_->entry("l0-1-0-1")->status, TopicStatus::Ready);

    outline_->click(node("l1-1-0"));
    EXPECT_FALSE(cache_->contains("l1-1-0"));
}

TEST_F(OutlineModelTest, ClickWithSyncDrivesMap) {
    store_->setSyncMode(true);
    outline_->click(node("l1-2-0"));

    EXPECT_EQ(store_->state().currentRootId, "l1-2-0");
    EXPECT_TRUE(outline_->isExpanded("l2-2"));
    EXPECT_TRUE(outline_->isExpanded("l1-2-0"));
}

TEST_F(OutlineModelTest, SyncMergesWithoutCollapsing) {
    outline_->setExpanded("l2-2", true);
    store_->setSyncMode(true);

    store_->navigateToNodeById("l0-1-0-1");
    EXPECT_TRUE(outline_->isExpanded("l2-2"));
    EXPECT_TRUE(outline_->isExpanded("l2-1"));
    EXPECT_TRUE(outline_->isExpanded("l1-1-0"));
    EXPECT_TRUE(outline_->isExpanded("l0-1-0-1"));
    EXPECT_TRUE(cache_->contains("l0-1-0-1"));

    // Going back up never collapses
    store_->navigateBreadcrumb(-1);
    EXPECT_TRUE(outline_->isExpanded("l1-1-0"));
}

TEST_F(OutlineModelTest, IndependentModeIgnoresMap) {
    store_->selectAndDrill(node("l1-1-0"));
    EXPECT_TRUE(outline_->expandedIds().empty());
    EXPECT_TRUE(outline_->scrollTarget().empty());
}

TEST_F(OutlineModelTest, ScrollFollowsSyncedSelection) {
    store_->setSyncMode(true);
    uint64_t serial = outline_->scrollSerial();

    store_->selectAndDrill(node("l2-2"));
    EXPECT_EQ(outline_->scrollTarget(), "l2-2");
    EXPECT_EQ(outline_->scrollSerial(), serial + 1);

    // Same selection: no new scroll request
    store_->toggleL0Expansion("l0-2-0-0");
    EXPECT_EQ(outline_->scrollSerial(), serial + 1);
}

TEST_F(OutlineModelTest, KeyboardNavigation) {
    outline_->handleKey(OutlineKey::Down);
    EXPECT_EQ(outline_->focusedId(), "l2-1");

    outline_->handleKey(OutlineKey::Down);
    EXPECT_EQ(outline_->focusedId(), "l2-2");
    outline_->handleKey(OutlineKey::Down);
    EXPECT_EQ(outline_->focusedId(), "l2-2");

    outline_->handleKey(OutlineKey::Up);
    EXPECT_EQ(outline_->focusedId(), "l2-1");
    outline_->handleKey(OutlineKey::Up);
    EXPECT_EQ(outline_->focusedId(), "l2-1");

    outline_->handleKey(OutlineKey::Right);
    EXPECT_TRUE(outline_->isExpanded("l2-1"));
    EXPECT_EQ(store_->state().selectedNodeId, std::optional<std::string>("l2-1"));

    // Right on an open row does nothing more
    outline_->handleKey(OutlineKey::Right);
    EXPECT_TRUE(outline_->isExpanded("l2-1"));

    outline_->handleKey(OutlineKey::Down);
    EXPECT_EQ(outline_->focusedId(), "l1-1-0");

    outline_->handleKey(OutlineKey::Up);
    outline_->handleKey(OutlineKey::Left);
    EXPECT_FALSE(outline_->isExpanded("l2-1"));

    outline_->handleKey(OutlineKey::Enter);
    EXPECT_TRUE(outline_->isExpanded("l2-1"));
}

TEST_F(OutlineModelTest, FocusFirst) {
    outline_->focusFirst();
    EXPECT_EQ(outline_->focusedId(), "l2-1");
}

TEST_F(OutlineModelTest, GoHome) {
    store_->selectAndDrill(node("l1-1-0"));
    outline_->setExpanded("l2-1", true);

    outline_->goHome();
    EXPECT_TRUE(outline_->expandedIds().empty());
    EXPECT_TRUE(store_->state().isRoot());
    EXPECT_FALSE(store_->state().selectedNodeId.has_value());
}

TEST_F(OutlineModelTest, ResetState) {
    outline_->setExpanded("l2-1", true);
    outline_->setFocusedId("l2-1");
    outline_->setHoveredId("l2-2");
    uint64_t serial = outline_->scrollSerial();

    outline_->resetState();
    EXPECT_TRUE(outline_->expandedIds().empty());
    EXPECT_TRUE(outline_->focusedId().empty());
    EXPECT_TRUE(outline_->hoveredId().empty());
    EXPECT_GT(outline_->scrollSerial(), serial);
}

TEST(OutlineOrbTest, SizeScalesWithTraceCount) {
    EXPECT_FLOAT_EQ(OutlineModel::orbSize(ClusterLevel::L2, 0), 12.0f);
    EXPECT_FLOAT_EQ(OutlineModel::orbSize(ClusterLevel::L2, 99), 16.0f);
    EXPECT_FLOAT_EQ(OutlineModel::orbSize(ClusterLevel::L2, 100000), 16.0f);
    EXPECT_FLOAT_EQ(OutlineModel::orbSize(ClusterLevel::L1, 0), 10.0f);
    EXPECT_FLOAT_EQ(OutlineModel::orbSize(ClusterLevel::L0, 9), 10.0f);
    EXPECT_FLOAT_EQ(OutlineModel::orbSize(ClusterLevel::L0, -5), 8.0f);
}
