#include "animation/Easing.h"
#include "core/Types.h"

#include <algorithm>
#include <cmath>

namespace clustermap {

double ease(MorphType type, double p) {
    p = std::clamp(p, 0.0, 1.0);

    switch (type) {
        case MorphType::Linear:
            // No remapping
            return p;

        case MorphType::Quadratic:
            // Parabolic curve
            return p * p;

        case MorphType::InvQuadratic:
            // Inverted parabolic curve
            return 1.0 - (1.0 - p) * (1.0 - p);

        case MorphType::Sigmoid:
            // Sigmoidal (S-like) remapping
            return 0.5 * (1.0 - std::cos(PI * p));

        case MorphType::SigmoidAccel:
            // Sigmoidal, with acceleration
            return 0.5 * (1.0 - std::cos(PI * p * p));

        case MorphType::EaseOutCubic: {
            double q = 1.0 - p;
            return 1.0 - q * q * q;
        }
    }
    return p;
}

} // namespace clustermap
