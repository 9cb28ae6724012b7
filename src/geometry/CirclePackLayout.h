#pragma once

#include "core/ClusterNode.h"

#include <string>
#include <vector>

namespace clustermap {

// One positioned circle, in view units (the layout's W x H box)
struct PackedNode {
    ClusterNode* node = nullptr;
    double x = 0.0;
    double y = 0.0;
    double r = 0.0;
    int depth = 0;              // 0 = view root
    int64_t value = 0;          // own packing weight plus all descendants
    int parent = -1;            // index into PackedLayout::nodes, -1 for the root
    std::vector<int> children;  // indices, in packing order (descending value)
};

// Flat pre-order sequence; nodes[0] is the view root when non-empty
struct PackedLayout {
    std::vector<PackedNode> nodes;
    double width = 0.0;
    double height = 0.0;

    bool empty() const { return nodes.empty(); }
    size_t size() const { return nodes.size(); }

    // Index of the packed circle for a node id, -1 if not laid out
    int indexOf(const std::string& id) const;
    const PackedNode* find(const std::string& id) const;
};

// Minimal circle used by the sibling packer and the enclosure routine
struct Circle {
    double x = 0.0;
    double y = 0.0;
    double r = 0.0;
};

// ============================================================================
// CirclePackLayout - nested circle packing (front-chain siblings, randomized
// smallest enclosing circle), deterministic for identical input
// ============================================================================

class CirclePackLayout {
public:
    static constexpr double PADDING = 6.0;

    // Lay out the subtree under root into a W x H box centred at (W/2, H/2).
    // Throws LayoutError on excessive depth or a degenerate enclosure.
    static PackedLayout compute(ClusterNode* root, double width, double height,
                                double padding = PADDING);

    // --- Building blocks, public for tests ---

    // Deterministic [0,1) generator; one instance per compute() call
    class Lcg {
    public:
        double next();
    private:
        uint64_t state_ = 1;
    };

    // Pack circles (radii given) tangent to each other around the origin.
    // Returns the radius of the enclosing circle, centred on the origin.
    static double packSiblings(std::vector<Circle>& circles, Lcg& random);

    // Smallest circle enclosing all the given circles.
    static Circle encloseCircles(std::vector<Circle> circles, Lcg& random);
};

} // namespace clustermap
