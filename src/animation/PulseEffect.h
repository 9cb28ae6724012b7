#pragma once

#include "animation/Scheduler.h"

#include <functional>

namespace clustermap {

// ============================================================================
// PulseEffect - breathing halo around the selected circle
// ============================================================================
//
// The curve is a pure function of wall-clock time. The scheduled loop only
// exists to keep frames coming while something is selected.

class PulseEffect {
public:
    static constexpr double PERIOD = 2.0;   // seconds per breath

    // Raised-cosine weight in [0,1]: 0 at t = 0, 1 at t = PERIOD/2
    static double weightAt(double t);

    // Halo radius multiplier, 1.05 .. 1.35
    static double scaleAt(double t);

    // Halo opacity, 0.55 .. 0.15
    static double alphaAt(double t);

    explicit PulseEffect(Scheduler& scheduler);
    ~PulseEffect();

    PulseEffect(const PulseEffect&) = delete;
    PulseEffect& operator=(const PulseEffect&) = delete;

    // Called once per pulse frame
    void setRedrawCallback(std::function<void()> cb) { redrawCb_ = std::move(cb); }

    // Start or stop the per-frame loop. Idempotent.
    void setRunning(bool running);
    bool isRunning() const;

private:
    Scheduler& scheduler_;
    TaskHandle task_ = 0;
    std::function<void()> redrawCb_;
};

} // namespace clustermap
