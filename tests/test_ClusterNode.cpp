#include <gtest/gtest.h>
#include "core/ClusterNode.h"

using namespace clustermap;

static std::unique_ptr<ClusterNode> makeNode(const std::string& id, ClusterLevel level,
                                             int64_t weight = 0) {
    auto node = std::make_unique<ClusterNode>();
    node->id = id;
    node->name = id;
    node->level = level;
    node->weight = weight;
    node->hasWeight = weight > 0;
    return node;
}

TEST(ClusterNodeTest, AddChildSetsParent) {
    auto root = makeNode("l2-1", ClusterLevel::L2);
    ClusterNode* child = root->addChild(makeNode("l1-1-0", ClusterLevel::L1));

    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->parent, root.get());
    EXPECT_EQ(root->childCount(), 1u);
    EXPECT_TRUE(root->hasChildren());
    EXPECT_TRUE(child->isLeaf());
}

TEST(ClusterNodeTest, Depth) {
    auto root = makeNode("l2-1", ClusterLevel::L2);
    ClusterNode* l1 = root->addChild(makeNode("l1-1-0", ClusterLevel::L1));
    ClusterNode* l0 = l1->addChild(makeNode("l0-1-0-0", ClusterLevel::L0));

    EXPECT_EQ(root->depth(), 0);
    EXPECT_EQ(l1->depth(), 1);
    EXPECT_EQ(l0->depth(), 2);
}

TEST(ClusterNodeTest, PackWeightDefaultsToOne) {
    auto zero = makeNode("a", ClusterLevel::L0, 0);
    auto some = makeNode("b", ClusterLevel::L0, 42);

    EXPECT_EQ(zero->packWeight(), 1);
    EXPECT_EQ(some->packWeight(), 42);
}

TEST(ClusterNodeTest, LeafWeightSum) {
    auto root = makeNode("l2-1", ClusterLevel::L2, 999);
    ClusterNode* l1 = root->addChild(makeNode("l1-1-0", ClusterLevel::L1, 500));
    l1->addChild(makeNode("l0-1-0-0", ClusterLevel::L0, 10));
    l1->addChild(makeNode("l0-1-0-1", ClusterLevel::L0, 5));
    root->addChild(makeNode("l1-1-1", ClusterLevel::L1, 7));

    // Inner weights are ignored in favour of their leaves
    EXPECT_EQ(root->leafWeightSum(), 22);
    EXPECT_EQ(l1->leafWeightSum(), 15);
}

TEST(ClusterNodeTest, SyntheticRootId) {
    auto node = makeNode(SYNTHETIC_ROOT_ID, ClusterLevel::L2);
    EXPECT_TRUE(node->isSyntheticRoot());

    auto other = makeNode("l2-0", ClusterLevel::L2);
    EXPECT_FALSE(other->isSyntheticRoot());
    EXPECT_FALSE(other->isL0());
}
