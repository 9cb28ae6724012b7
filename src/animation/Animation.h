#pragma once

#include "animation/Scheduler.h"

#include <deque>

namespace clustermap {

// ============================================================================
// Animation - frame driver
// ============================================================================
//
// Runs the scheduler once per frame and decides whether the main loop must
// render or may block waiting for input.

class Animation {
public:
    explicit Animation(Scheduler& scheduler);

    // Driver bound to Scheduler::instance()
    static Animation& instance();

    void init();

    // Called every frame from the main loop
    void tick(double now);

    // Something changed on screen; render at least one more frame
    void requestRedraw();

    // True while tasks are pending or a redraw is outstanding
    bool isActive() const { return active_; }

    float getFramerate() const { return framerate_; }
    bool needsRedraw() const { return needRedraw_; }
    void clearRedrawFlag() { needRedraw_ = false; }

private:
    void framerateIteration(bool frameRendered, double now);

    Scheduler& scheduler_;

    bool active_ = false;
    bool needRedraw_ = true;
    float framerate_ = 0.0f;

    // Timestamps of recently rendered frames, spanning FRAMERATE_AVERAGE_TIME
    std::deque<double> frameTimes_;

    static constexpr double FRAMERATE_AVERAGE_TIME = 4.0;
};

} // namespace clustermap
