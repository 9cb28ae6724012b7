#pragma once

namespace clustermap {

enum class MorphType {
    Linear,
    Quadratic,
    InvQuadratic,
    Sigmoid,
    SigmoidAccel,
    EaseOutCubic
};

// Remap progress p in [0,1] through the given curve. p is clamped first.
double ease(MorphType type, double p);

} // namespace clustermap
