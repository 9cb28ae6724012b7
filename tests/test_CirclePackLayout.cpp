#include <gtest/gtest.h>
#include "core/Errors.h"
#include "geometry/CirclePackLayout.h"

#include <cmath>

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

// root > {a (2 children), b (3 children), c (leaf)}
static std::unique_ptr<ClusterNode> sampleTree() {
    auto root = makeNode("root", ClusterLevel::L2);
    ClusterNode* a = root->addChild(makeNode("a", ClusterLevel::L1));
    a->addChild(makeNode("a0", ClusterLevel::L0, 40));
    a->addChild(makeNode("a1", ClusterLevel::L0, 10));
    ClusterNode* b = root->addChild(makeNode("b", ClusterLevel::L1));
    b->addChild(makeNode("b0", ClusterLevel::L0, 100));
    b->addChild(makeNode("b1", ClusterLevel::L0, 25));
    b->addChild(makeNode("b2", ClusterLevel::L0, 5));
    root->addChild(makeNode("c", ClusterLevel::L1, 3));
    return root;
}

static double dist(const PackedNode& a, const PackedNode& b) {
    return std::sqrt((a.x - b.x) * (a.x - b.x) + (a.y - b.y) * (a.y - b.y));
}

TEST(CirclePackLayoutTest, NullRootOrEmptyBoxGivesEmptyLayout) {
    auto root = sampleTree();
    EXPECT_TRUE(CirclePackLayout::compute(nullptr, 800, 600).empty());
    EXPECT_TRUE(CirclePackLayout::compute(root.get(), 0, 600).empty());
    EXPECT_TRUE(CirclePackLayout::compute(root.get(), 800, -1).empty());
}

TEST(CirclePackLayoutTest, SingleNodeFillsShorterSide) {
    auto root = makeNode("only", ClusterLevel::L0, 7);
    PackedLayout layout = CirclePackLayout::compute(root.get(), 800, 600);

    ASSERT_EQ(layout.size(), 1u);
    EXPECT_NEAR(layout.nodes[0].x, 400.0, 1e-9);
    EXPECT_NEAR(layout.nodes[0].y, 300.0, 1e-9);
    EXPECT_NEAR(layout.nodes[0].r, 300.0, 1e-9);
    EXPECT_EQ(layout.nodes[0].depth, 0);
    EXPECT_EQ(layout.nodes[0].parent, -1);
}

TEST(CirclePackLayoutTest, PreOrderWithRootFirst) {
    auto root = sampleTree();
    PackedLayout layout = CirclePackLayout::compute(root.get(), 800, 600);

    ASSERT_EQ(layout.size(), 9u);
    EXPECT_EQ(layout.nodes[0].node, root.get());
    EXPECT_NEAR(layout.nodes[0].x, 400.0, 1e-9);
    EXPECT_NEAR(layout.nodes[0].y, 300.0, 1e-9);
    EXPECT_NEAR(layout.nodes[0].r, 300.0, 1e-9);

    for (size_t i = 1; i < layout.size(); ++i) {
        const PackedNode& pn = layout.nodes[i];
        ASSERT_GE(pn.parent, 0);
        EXPECT_LT(pn.parent, static_cast<int>(i));
        EXPECT_EQ(pn.depth, layout.nodes[pn.parent].depth + 1);
        EXPECT_EQ(pn.node->parent, layout.nodes[pn.parent].node);
    }
}

TEST(CirclePackLayoutTest, ValuesSumOwnWeightAndDescendants) {
    auto root = sampleTree();
    PackedLayout layout = CirclePackLayout::compute(root.get(), 800, 600);

    // Internal nodes without a weight pack as 1 on top of their children
    EXPECT_EQ(layout.find("a")->value, 1 + 40 + 10);
    EXPECT_EQ(layout.find("b")->value, 1 + 100 + 25 + 5);
    EXPECT_EQ(layout.find("c")->value, 3);
    EXPECT_EQ(layout.nodes[0].value, 1 + 51 + 131 + 3);
}

TEST(CirclePackLayoutTest, ChildrenOrderedByDescendingValue) {
    auto root = sampleTree();
    PackedLayout layout = CirclePackLayout::compute(root.get(), 800, 600);

    for (const PackedNode& pn : layout.nodes) {
        for (size_t c = 1; c < pn.children.size(); ++c) {
            EXPECT_GE(layout.nodes[pn.children[c - 1]].value,
                      layout.nodes[pn.children[c]].value);
        }
    }
    const PackedNode& top = layout.nodes[0];
    ASSERT_EQ(top.children.size(), 3u);
    EXPECT_EQ(layout.nodes[top.children[0]].node->id, "b");
    EXPECT_EQ(layout.nodes[top.children[1]].node->id, "a");
    EXPECT_EQ(layout.nodes[top.children[2]].node->id, "c");
}

TEST(CirclePackLayoutTest, ChildrenInsideParent) {
    auto root = sampleTree();
    PackedLayout layout = CirclePackLayout::compute(root.get(), 1000, 1000);

    for (size_t i = 1; i < layout.size(); ++i) {
        const PackedNode& pn = layout.nodes[i];
        const PackedNode& parent = layout.nodes[pn.parent];
        EXPECT_LE(dist(pn, parent) + pn.r, parent.r + 1e-6) << pn.node->id;
        EXPECT_GT(pn.r, 0.0);
    }
}

TEST(CirclePackLayoutTest, SiblingsDoNotOverlap) {
    auto root = sampleTree();
    PackedLayout layout = CirclePackLayout::compute(root.get(), 1000, 1000);

    for (const PackedNode& pn : layout.nodes) {
        for (size_t i = 0; i < pn.children.size(); ++i) {
            for (size_t j = i + 1; j < pn.children.size(); ++j) {
                const PackedNode& a = layout.nodes[pn.children[i]];
                const PackedNode& b = layout.nodes[pn.children[j]];
                EXPECT_GE(dist(a, b), a.r + b.r - 1e-6)
                    << a.node->id << " vs " << b.node->id;
            }
        }
    }
}

TEST(CirclePackLayoutTest, HeavierLeafGetsLargerCircle) {
    auto root = sampleTree();
    PackedLayout layout = CirclePackLayout::compute(root.get(), 1000, 1000);

    EXPECT_GT(layout.find("b0")->r, layout.find("b1")->r);
    EXPECT_GT(layout.find("b1")->r, layout.find("b2")->r);
    EXPECT_GT(layout.find("a0")->r, layout.find("a1")->r);
}

TEST(CirclePackLayoutTest, RaisingOneWeightNeverShrinksItsCircle) {
    auto root = makeNode("root", ClusterLevel::L1);
    ClusterNode* grown = root->addChild(makeNode("grown", ClusterLevel::L0, 1));
    root->addChild(makeNode("s20", ClusterLevel::L0, 20));
    root->addChild(makeNode("s35", ClusterLevel::L0, 35));
    root->addChild(makeNode("s50", ClusterLevel::L0, 50));

    double previous = 0.0;
    for (int64_t w = 1; w <= 200; ++w) {
        grown->weight = w;
        PackedLayout layout = CirclePackLayout::compute(root.get(), 800, 600);
        double r = layout.find("grown")->r;
        EXPECT_GE(r, previous - 1e-9) << "weight " << w;
        previous = r;
    }
}

TEST(CirclePackLayoutTest, Deterministic) {
    auto root = sampleTree();
    PackedLayout first = CirclePackLayout::compute(root.get(), 900, 700);
    PackedLayout second = CirclePackLayout::compute(root.get(), 900, 700);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first.nodes[i].node, second.nodes[i].node);
        EXPECT_DOUBLE_EQ(first.nodes[i].x, second.nodes[i].x);
        EXPECT_DOUBLE_EQ(first.nodes[i].y, second.nodes[i].y);
        EXPECT_DOUBLE_EQ(first.nodes[i].r, second.nodes[i].r);
    }
}

TEST(CirclePackLayoutTest, IndexOfAndFind) {
    auto root = sampleTree();
    PackedLayout layout = CirclePackLayout::compute(root.get(), 800, 600);

    EXPECT_EQ(layout.indexOf("root"), 0);
    int b = layout.indexOf("b");
    ASSERT_GE(b, 0);
    EXPECT_EQ(layout.nodes[b].node->id, "b");
    EXPECT_EQ(layout.find("b"), &layout.nodes[b]);
    EXPECT_EQ(layout.indexOf("missing"), -1);
    EXPECT_EQ(layout.find("missing"), nullptr);
}

TEST(CirclePackLayoutTest, SubtreeLayoutStartsAtDepthZero) {
    auto root = sampleTree();
    ClusterNode* b = root->children[1].get();
    PackedLayout layout = CirclePackLayout::compute(b, 800, 600);

    ASSERT_EQ(layout.size(), 4u);
    EXPECT_EQ(layout.nodes[0].node, b);
    EXPECT_EQ(layout.nodes[0].depth, 0);
    EXPECT_EQ(layout.indexOf("a"), -1);
}

TEST(CirclePackLayoutTest, TooDeepThrows) {
    auto root = makeNode("d0", ClusterLevel::L2);
    ClusterNode* cur = root.get();
    for (int i = 1; i <= MAX_HIERARCHY_DEPTH + 1; ++i) {
        cur = cur->addChild(makeNode("d" + std::to_string(i), ClusterLevel::L1));
    }
    EXPECT_THROW(CirclePackLayout::compute(root.get(), 800, 600), LayoutError);
}

TEST(CirclePackLayoutTest, PackSiblingsPlacesFirstTwoTangent) {
    CirclePackLayout::Lcg random;
    std::vector<Circle> circles{{0, 0, 10}, {0, 0, 5}};
    double e = CirclePackLayout::packSiblings(circles, random);

    double d = std::hypot(circles[0].x - circles[1].x, circles[0].y - circles[1].y);
    EXPECT_NEAR(d, 15.0, 1e-9);
    EXPECT_NEAR(e, 15.0, 1e-9);
}

TEST(CirclePackLayoutTest, PackSiblingsSingleCircleAtOrigin) {
    CirclePackLayout::Lcg random;
    std::vector<Circle> circles{{3, 4, 2}};
    double e = CirclePackLayout::packSiblings(circles, random);

    EXPECT_NEAR(circles[0].x, 0.0, 1e-12);
    EXPECT_NEAR(circles[0].y, 0.0, 1e-12);
    EXPECT_NEAR(e, 2.0, 1e-12);
}

TEST(CirclePackLayoutTest, PackSiblingsManyStayDisjoint) {
    CirclePackLayout::Lcg random;
    std::vector<Circle> circles;
    for (int i = 0; i < 12; ++i) {
        circles.push_back(Circle{0, 0, 1.0 + (i % 4)});
    }
    double e = CirclePackLayout::packSiblings(circles, random);

    for (size_t i = 0; i < circles.size(); ++i) {
        EXPECT_LE(std::hypot(circles[i].x, circles[i].y) + circles[i].r, e + 1e-6);
        for (size_t j = i + 1; j < circles.size(); ++j) {
            double d = std::hypot(circles[i].x - circles[j].x, circles[i].y - circles[j].y);
            EXPECT_GE(d, circles[i].r + circles[j].r - 1e-6);
        }
    }
}

TEST(CirclePackLayoutTest, EncloseTwoCircles) {
    CirclePackLayout::Lcg random;
    Circle c = CirclePackLayout::encloseCircles({{-5, 0, 1}, {5, 0, 1}}, random);
    EXPECT_NEAR(c.x, 0.0, 1e-9);
    EXPECT_NEAR(c.y, 0.0, 1e-9);
    EXPECT_NEAR(c.r, 6.0, 1e-9);
}

TEST(CirclePackLayoutTest, EncloseContainedCircle) {
    CirclePackLayout::Lcg random;
    Circle c = CirclePackLayout::encloseCircles({{0, 0, 10}, {2, 1, 1}}, random);
    EXPECT_NEAR(c.x, 0.0, 1e-9);
    EXPECT_NEAR(c.y, 0.0, 1e-9);
    EXPECT_NEAR(c.r, 10.0, 1e-9);
}

TEST(CirclePackLayoutTest, LcgIsRepeatable) {
    CirclePackLayout::Lcg a;
    CirclePackLayout::Lcg b;
    for (int i = 0; i < 5; ++i) {
        double v = a.next();
        EXPECT_DOUBLE_EQ(v, b.next());
        EXPECT_GE(v, 0.0);
        EXPECT_LT(v, 1.0);
    }
}
