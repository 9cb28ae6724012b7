#pragma once

#include "camera/ZoomCamera.h"
#include "core/Types.h"
#include "geometry/CirclePackLayout.h"

namespace clustermap {

// ============================================================================
// NodePicker - screen point to packed circle
// ============================================================================

class NodePicker {
public:
    // Innermost circle under the point: the view root is never returned and
    // the smallest containing circle wins. -1 when nothing is hit.
    static int pickIndex(const PackedLayout& layout, const ZoomCamera& camera,
                         double width, double height, const XYvec& screenPoint);

    // Same, returning the packed node or nullptr
    static const PackedNode* pick(const PackedLayout& layout, const ZoomCamera& camera,
                                  double width, double height, const XYvec& screenPoint);
};

} // namespace clustermap
