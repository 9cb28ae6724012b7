#include "renderer/NodePicker.h"

#include <algorithm>
#include <vector>

namespace clustermap {

int NodePicker::pickIndex(const PackedLayout& layout, const ZoomCamera& camera,
                          double width, double height, const XYvec& screenPoint) {
    if (layout.empty() || width <= 0.0 || height <= 0.0) {
        return -1;
    }

    XYvec p = camera.toView(screenPoint, width, height);

    // Ascending radius, so nested circles are found before their parents
    std::vector<int> order;
    order.reserve(layout.nodes.size());
    for (size_t i = 0; i < layout.nodes.size(); ++i) {
        if (layout.nodes[i].depth > 0) {
            order.push_back(static_cast<int>(i));
        }
    }
    std::stable_sort(order.begin(), order.end(), [&layout](int a, int b) {
        return layout.nodes[a].r < layout.nodes[b].r;
    });

    for (int idx : order) {
        const PackedNode& pn = layout.nodes[idx];
        if (xyDist(p, XYvec{pn.x, pn.y}) <= pn.r) {
            return idx;
        }
    }
    return -1;
}

const PackedNode* NodePicker::pick(const PackedLayout& layout, const ZoomCamera& camera,
                                   double width, double height, const XYvec& screenPoint) {
    int idx = pickIndex(layout, camera, width, height, screenPoint);
    return idx < 0 ? nullptr : &layout.nodes[idx];
}

} // namespace clustermap
